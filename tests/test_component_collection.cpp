#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "ComponentCollection.hpp"





/** Records the starts and destructions of the TracingComponent instances. */
using Trace = std::vector<std::string>;





template <ComponentCollection::ComponentKind tKind>
class TracingComponent:
	public ComponentCollection::Component<tKind>
{
	using Super = ComponentCollection::Component<tKind>;

public:

	TracingComponent(ComponentCollection & aComponents, const std::string & aName, Trace & aTrace):
		Super(aComponents),
		mName(aName),
		mTrace(aTrace)
	{
	}

	~TracingComponent() override
	{
		mTrace.push_back("~" + mName);
	}

	void start() override
	{
		mTrace.push_back(mName);
	}


protected:

	std::string mName;
	Trace & mTrace;
};

using ToolchainComponent = TracingComponent<ComponentCollection::ckAdbToolchain>;
using DiscoveryComponent = TracingComponent<ComponentCollection::ckConnectionDiscovery>;
using ConnectionComponent = TracingComponent<ComponentCollection::ckDeviceConnection>;





/** A different class sharing the kind with DiscoveryComponent. */
class OtherDiscoveryComponent:
	public ComponentCollection::Component<ComponentCollection::ckConnectionDiscovery>
{
public:
	using Component::Component;
	void start() override {}
};





TEST(ComponentCollectionTest, StartsInRequiredOrderAndReleasesInReverse)
{
	Trace trace;
	{
		ComponentCollection cc;
		cc.addNew<ConnectionComponent>("conn", trace)->requireForStart(ComponentCollection::ckConnectionDiscovery);
		cc.addNew<DiscoveryComponent>("disc", trace)->requireForStart(ComponentCollection::ckAdbToolchain);
		cc.addNew<ToolchainComponent>("adb", trace);
		EXPECT_FALSE(cc.isStarted());
		cc.start();
		EXPECT_TRUE(cc.isStarted());
		EXPECT_EQ(trace, Trace({"adb", "disc", "conn"}));
		trace.clear();
	}
	EXPECT_EQ(trace, Trace({"~conn", "~disc", "~adb"}));
}





TEST(ComponentCollectionTest, DuplicateKindThrows)
{
	Trace trace;
	ComponentCollection cc;
	cc.addNew<ToolchainComponent>("adb", trace);
	EXPECT_THROW(cc.addNew<ToolchainComponent>("adb2", trace), LogicError);
}





TEST(ComponentCollectionTest, GetChecksPresenceAndClass)
{
	Trace trace;
	ComponentCollection cc;
	EXPECT_THROW(cc.get<DiscoveryComponent>(), LogicError);
	auto disc = cc.addNew<DiscoveryComponent>("disc", trace);
	EXPECT_EQ(cc.get<DiscoveryComponent>(), disc);
	EXPECT_THROW(cc.get<OtherDiscoveryComponent>(), LogicError);
}





TEST(ComponentCollectionTest, MissingRequirementThrowsOnStart)
{
	Trace trace;
	ComponentCollection cc;
	cc.addNew<DiscoveryComponent>("disc", trace)->requireForStart(ComponentCollection::ckAdbToolchain);
	EXPECT_THROW(cc.start(), LogicError);
	EXPECT_TRUE(trace.empty());
}





TEST(ComponentCollectionTest, CyclicRequirementsThrowOnStart)
{
	Trace trace;
	ComponentCollection cc;
	cc.addNew<DiscoveryComponent>("disc", trace)->requireForStart(ComponentCollection::ckAdbToolchain);
	cc.addNew<ToolchainComponent>("adb", trace)->requireForStart(ComponentCollection::ckConnectionDiscovery);
	EXPECT_THROW(cc.start(), LogicError);
}





TEST(ComponentCollectionTest, StartTwiceAndLateRequirementsThrow)
{
	Trace trace;
	ComponentCollection cc;
	auto adb = cc.addNew<ToolchainComponent>("adb", trace);
	cc.start();
	EXPECT_THROW(cc.start(), LogicError);
	EXPECT_THROW(adb->requireForStart(ComponentCollection::ckMultiLogger), LogicError);
	EXPECT_EQ(trace, Trace({"adb"}));
}
