#include "ComponentCollection.hpp"
#include <set>
#include "MultiLogger.hpp"





////////////////////////////////////////////////////////////////////////////////
// ComponentCollection:

ComponentCollection::ComponentCollection():
	mIsStarted(false)
{
}





void ComponentCollection::start()
{
	if (mIsStarted)
	{
		throw LogicError("The ComponentCollection is already started.");
	}
	mStartOrder = componentsInStartOrder();
	mIsStarted = true;
	for (const auto & component: mStartOrder)
	{
		component->start();
	}
}





ComponentCollection::~ComponentCollection()
{
	mComponents.clear();
	while (!mStartOrder.empty())
	{
		mStartOrder.pop_back();
	}
}





Logger & ComponentCollection::logger(const QString & aName)
{
	return get<MultiLogger>()->logger(aName);
}





void ComponentCollection::addComponent(
	ComponentCollection::ComponentKind aKind,
	ComponentCollection::ComponentBasePtr aComponent
)
{
	auto itr = mComponents.find(aKind);
	if (itr != mComponents.end())
	{
		throw LogicError("Duplicate component in collection: %1", aKind);
	}
	mComponents[aKind] = aComponent;
}





ComponentCollection::ComponentBasePtr ComponentCollection::get(ComponentCollection::ComponentKind aKind)
{
	auto itr = mComponents.find(aKind);
	if (itr != mComponents.end())
	{
		return itr->second;
	}
	throw LogicError("Component not present in the collection: %1", aKind);
}




void ComponentCollection::requireForStart(ComponentCollection::ComponentKind aThisComponent, ComponentCollection::ComponentKind aRequiredComponent)
{
	if (mIsStarted)
	{
		throw LogicError("The ComponentCollection is already started.");
	}
	if (aThisComponent == aRequiredComponent)
	{
		throw LogicError("Component %1 cannot require itself for start.", aThisComponent);
	}
	mStartRequirements[aThisComponent].push_back(aRequiredComponent);
}





std::vector<ComponentCollection::ComponentBasePtr> ComponentCollection::componentsInStartOrder()
{
	// All required components must be present:
	for (const auto & req: mStartRequirements)
	{
		for (const auto kind: req.second)
		{
			if (mComponents.find(kind) == mComponents.end())
			{
				throw LogicError("Component %1 requires component %2, which is not in the collection", req.first, kind);
			}
		}
	}

	std::vector<ComponentCollection::ComponentBasePtr> res;
	std::set<ComponentCollection::ComponentKind> kinds;
	while (res.size() < mComponents.size())
	{
		bool hasAdded = false;
		for (const auto & componentPair: mComponents)
		{
			auto kind = componentPair.first;
			// If the component is already present in res, skip it:
			if (kinds.find(kind) != kinds.end())
			{
				continue;
			}

			// If the component has all its requirements met, add it:
			const auto & required = mStartRequirements[kind];
			bool canAdd = true;
			for (const auto req: required)
			{
				if (kinds.find(req) == kinds.end())
				{
					canAdd = false;
					break;
				}
			}
			if (!canAdd)
			{
				continue;
			}

			// Add the component:
			res.push_back(componentPair.second);
			kinds.insert(kind);
			hasAdded = true;
		}
		if (!hasAdded)
		{
			throw LogicError("Failed to calculate component start order");
		}
	}
	return res;
}
