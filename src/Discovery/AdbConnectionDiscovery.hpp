#pragma once

#include <map>
#include <memory>
#include <QMutex>
#include "ServiceBrowserSession.hpp"
#include "ServiceRegistry.hpp"
#include "../ComponentCollection.hpp"
#include "../Optional.hpp"





/** Listens for the connection advertisements ("_adb-tls-connect._tcp") of the already-paired devices
and keeps track of which devices are currently reachable, and where.
The registry is owned by this component; consumers only ever receive copies of its entries.
Stopping the listener retains the last known state. */
class AdbConnectionDiscovery:
	public ComponentCollection::Component<ComponentCollection::ckConnectionDiscovery>
{
	using Super = ComponentCollection::Component<ComponentCollection::ckConnectionDiscovery>;


public:

	/** The mDNS service type advertised by the paired devices that accept connections. */
	static const QString SERVICE_TYPE;


	/** The advertisement-level status of a device. */
	enum AdvertisementStatus
	{
		asOnline,   ///< The device's connection advertisement is currently visible
		asOffline,  ///< The device has been seen before, but its advertisement has been withdrawn
		asUnknown,  ///< The device has never been seen
	};


	/** The status of a remembered ServiceInfo, compared to the current advertisement of the same device. */
	enum ServiceInfoStatus
	{
		sisUpdated,  ///< The device is online at the same address
		sisChanged,  ///< The device is online, but at a different address
		sisDown,     ///< The device is offline
		sisUnknown,  ///< The device has never been seen
	};


	AdbConnectionDiscovery(ComponentCollection & aComponents);

	virtual ~AdbConnectionDiscovery() override;

	// ComponentCollection::ComponentBase override:
	virtual void start() override;

	/** Starts listening for the connection advertisements.
	Throws a ServiceBrowserSession::DiscoveryError if already listening, or if the listener cannot be started;
	in either case no second listener is created. */
	void startDiscoveryListener();

	/** Stops listening. The registry entries are retained.
	Unblocks any waitForDevice() in progress. Does nothing if not listening. */
	void stopDiscoveryListener();

	/** Returns true if the listener is running. */
	bool isListening() const;

	/** Returns the currently advertised devices, map of SerialNumber -> ServiceInfo. */
	std::map<QString, ServiceInfo> onlineDevices() const;

	/** Returns the devices seen before whose advertisement is currently not visible. */
	std::map<QString, ServiceInfo> offlineDevices() const;

	/** Returns the location of the specified device, if it is currently online. */
	Optional<ServiceInfo> serviceInfoFor(const QString & aSerialNumber) const;

	/** Returns the advertisement-level status of the specified device. */
	AdvertisementStatus connectionStatusForDevice(const QString & aSerialNumber) const;

	/** Compares the remembered aInfo against the current advertisement of the same device. */
	ServiceInfoStatus connectionStatusForService(const ServiceInfo & aInfo) const;

	/** Blocks until the specified device is online, the timeout elapses, or cancelWaits() / stopDiscoveryListener()
	is called. Returns the device's location if it is online. */
	Optional<ServiceInfo> waitForDevice(const QString & aSerialNumber, int aTimeoutMsec);

	/** Unblocks all waitForDevice() calls in progress. */
	void cancelWaits();

	/** Returns the registry of the advertised devices, for read-only queries. */
	const ServiceRegistry & registry() const { return mRegistry; }


protected:

	/** The logger used for all the messages. */
	Logger & mLogger;

	/** The discovered devices. */
	ServiceRegistry mRegistry;

	/** The regular expression extracting the serial number from the instance names. */
	QRegularExpression mServiceFilter;

	/** Protects mBrowser against multithreaded access. */
	mutable QMutex mMtx;

	/** The browser session, nullptr when not listening. */
	std::unique_ptr<ServiceBrowserSession> mBrowser;
};
