#include "AdbConnectionDiscovery.hpp"
#include <QMutexLocker>
#include "../Settings.hpp"





const QString AdbConnectionDiscovery::SERVICE_TYPE = QString::fromUtf8("_adb-tls-connect._tcp");





AdbConnectionDiscovery::AdbConnectionDiscovery(ComponentCollection & aComponents):
	Super(aComponents),
	mLogger(aComponents.logger("AdbConnectionDiscovery")),
	mServiceFilter(Settings::loadValue("Discovery", "ConnectServiceFilter", "adb-(\\w+)-\\w+").toString())
{
	requireForStart(ComponentCollection::ckMultiLogger);
	requireForStart(ComponentCollection::ckServiceBrowserBackendFactory);
	if (!mServiceFilter.isValid())
	{
		throw RuntimeError(mLogger, "Invalid connection service filter \"%1\": %2",
			mServiceFilter.pattern(), mServiceFilter.errorString()
		);
	}
}





AdbConnectionDiscovery::~AdbConnectionDiscovery()
{
	stopDiscoveryListener();
}





void AdbConnectionDiscovery::start()
{
	// The listener is started on demand (by DeviceConnection or explicitly)
}





void AdbConnectionDiscovery::startDiscoveryListener()
{
	QMutexLocker lock(&mMtx);
	if (mBrowser != nullptr)
	{
		throw ServiceBrowserSession::DiscoveryError(mLogger, "The discovery listener is already running");
	}
	auto browser = std::make_unique<ServiceBrowserSession>(
		mLogger,
		mComponents.get<ServiceBrowserBackendFactory>(),
		mRegistry,
		SERVICE_TYPE,
		mServiceFilter
	);
	browser->start();  // Throws DiscoveryError, the browser is then destroyed here
	mBrowser = std::move(browser);
}





void AdbConnectionDiscovery::stopDiscoveryListener()
{
	std::unique_ptr<ServiceBrowserSession> browser;
	{
		QMutexLocker lock(&mMtx);
		browser = std::move(mBrowser);
	}
	if (browser == nullptr)
	{
		return;
	}
	mRegistry.interruptWaits();
	browser->stop();
}





bool AdbConnectionDiscovery::isListening() const
{
	QMutexLocker lock(&mMtx);
	return (mBrowser != nullptr);
}





std::map<QString, ServiceInfo> AdbConnectionDiscovery::onlineDevices() const
{
	return mRegistry.snapshot().mOnline;
}





std::map<QString, ServiceInfo> AdbConnectionDiscovery::offlineDevices() const
{
	return mRegistry.snapshot().mOffline;
}





Optional<ServiceInfo> AdbConnectionDiscovery::serviceInfoFor(const QString & aSerialNumber) const
{
	auto snapshot = mRegistry.snapshot();
	auto itr = snapshot.mOnline.find(aSerialNumber);
	if (itr == snapshot.mOnline.end())
	{
		return Optional<ServiceInfo>();
	}
	return itr->second;
}





AdbConnectionDiscovery::AdvertisementStatus AdbConnectionDiscovery::connectionStatusForDevice(const QString & aSerialNumber) const
{
	auto snapshot = mRegistry.snapshot();
	if (snapshot.mOnline.find(aSerialNumber) != snapshot.mOnline.end())
	{
		return asOnline;
	}
	if (snapshot.mOffline.find(aSerialNumber) != snapshot.mOffline.end())
	{
		return asOffline;
	}
	return asUnknown;
}





AdbConnectionDiscovery::ServiceInfoStatus AdbConnectionDiscovery::connectionStatusForService(const ServiceInfo & aInfo) const
{
	auto snapshot = mRegistry.snapshot();
	auto itr = snapshot.mOnline.find(aInfo.mSerialNumber);
	if (itr != snapshot.mOnline.end())
	{
		return (itr->second.mAddress == aInfo.mAddress) ? sisUpdated : sisChanged;
	}
	if (snapshot.mOffline.find(aInfo.mSerialNumber) != snapshot.mOffline.end())
	{
		return sisDown;
	}
	return sisUnknown;
}





Optional<ServiceInfo> AdbConnectionDiscovery::waitForDevice(const QString & aSerialNumber, int aTimeoutMsec)
{
	return mRegistry.waitForOnline(aSerialNumber, aTimeoutMsec);
}





void AdbConnectionDiscovery::cancelWaits()
{
	mRegistry.interruptWaits();
}
