#include "AdbMdnsBrowser.hpp"
#include <set>





AdbMdnsBrowser::AdbMdnsBrowser(Logger & aLogger, const QString & aAdbServerHost, quint16 aAdbServerPort, int aQueryIntervalMsec):
	mLogger(aLogger),
	mAdbServerHost(aAdbServerHost),
	mAdbServerPort(aAdbServerPort),
	mQueryIntervalMsec(aQueryIntervalMsec)
{
	connect(&mQueryTimer, &QTimer::timeout, this, &AdbMdnsBrowser::queryServices);
}





AdbMdnsBrowser::~AdbMdnsBrowser()
{
	stop();
}





void AdbMdnsBrowser::start(const QString & aServiceType, ServiceBrowserBackend::EventSink aEventSink)
{
	mServiceType = aServiceType;
	mEventSink = std::move(aEventSink);
	mKnownServices.clear();
	mRequests = std::make_unique<QObject>();
	mLogger.log("Browsing for %1 through the ADB server at %2:%3", mServiceType, mAdbServerHost, mAdbServerPort);
	queryServices();
	mQueryTimer.start(mQueryIntervalMsec);
}





void AdbMdnsBrowser::stop()
{
	mQueryTimer.stop();
	mEventSink = nullptr;
	mRequests.reset();
}





void AdbMdnsBrowser::processServiceList(const QList<AdbCommunicator::MdnsService> & aServices)
{
	if (!mEventSink)
	{
		return;
	}
	auto wantedType = normalizedServiceType(mServiceType);
	std::set<QString> seen;
	for (const auto & svc: aServices)
	{
		if (normalizedServiceType(svc.mServiceType) != wantedType)
		{
			continue;
		}
		seen.insert(svc.mInstanceName);
		auto itr = mKnownServices.find(svc.mInstanceName);
		auto kind = (itr == mKnownServices.end()) ? ServiceEvent::ekAdded : ServiceEvent::ekUpdated;
		mKnownServices[svc.mInstanceName] = svc;
		mEventSink(ServiceEvent(kind, svc.mInstanceName, mServiceType, svc.mAddress, svc.mPort));
	}

	for (auto itr = mKnownServices.begin(); itr != mKnownServices.end();)
	{
		if (seen.find(itr->first) != seen.end())
		{
			++itr;
			continue;
		}
		mLogger.log("Service %1 is no longer listed by the ADB server", itr->first);
		mEventSink(ServiceEvent(ServiceEvent::ekRemoved, itr->first, mServiceType, itr->second.mAddress, itr->second.mPort));
		itr = mKnownServices.erase(itr);
	}
}





QString AdbMdnsBrowser::normalizedServiceType(const QString & aServiceType)
{
	auto res = aServiceType.trimmed().toLower();
	if (res.endsWith('.'))
	{
		res.chop(1);
	}
	if (res.endsWith(".local"))
	{
		res.chop(6);
	}
	return res;
}





void AdbMdnsBrowser::queryServices()
{
	if (mRequests == nullptr)
	{
		return;
	}
	auto lister = new AdbCommunicator(mLogger, mAdbServerHost, mAdbServerPort, mRequests.get());
	connect(lister, &AdbCommunicator::connected,            lister, &AdbCommunicator::listMdnsServices);
	connect(lister, &AdbCommunicator::mdnsServicesReceived, this,   &AdbMdnsBrowser::processServiceList);
	connect(lister, &AdbCommunicator::disconnected,         lister, &QObject::deleteLater);
	connect(lister, &AdbCommunicator::error, this,
		[this, lister](const QString & aErrorText)
		{
			mLogger.log("Cannot list the ADB server's mDNS services: %1", aErrorText);
			lister->deleteLater();
		}
	);
	lister->start();
}
