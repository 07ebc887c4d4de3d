#pragma once

#include <functional>
#include <memory>
#include "ServiceEvent.hpp"
#include "../ComponentCollection.hpp"





/** The network listener behind a ServiceBrowserSession.
A backend is created, started, stopped and destroyed on the session's own thread, so it may use
thread-bound Qt objects (sockets, timers). It reports the service changes through the event sink given to start(). */
class ServiceBrowserBackend
{
public:

	/** The callback through which the backend reports the service changes. */
	using EventSink = std::function<void (const ServiceEvent &)>;


	virtual ~ServiceBrowserBackend() {}

	/** Starts browsing for the specified service type ("_adb-tls-connect._tcp").
	Throws a RuntimeError descendant if the listener cannot be set up (such as the port cannot be bound). */
	virtual void start(const QString & aServiceType, EventSink aEventSink) = 0;

	/** Stops browsing and releases all network resources.
	No events may be sent to the sink after this returns. */
	virtual void stop() = 0;
};

using ServiceBrowserBackendPtr = std::unique_ptr<ServiceBrowserBackend>;





/** Creates the backends for the ServiceBrowserSession instances.
The kind of backend is selected by the "Discovery/Backend" setting:
"mdns" (default) uses the built-in multicast DNS browser (MdnsBrowser),
"adb" delegates the browsing to the ADB server's own mDNS discovery (AdbMdnsBrowser). */
class ServiceBrowserBackendFactory:
	public ComponentCollection::Component<ComponentCollection::ckServiceBrowserBackendFactory>
{
	using Super = ComponentCollection::Component<ComponentCollection::ckServiceBrowserBackendFactory>;


public:

	ServiceBrowserBackendFactory(ComponentCollection & aComponents);

	// ComponentCollection::ComponentBase override:
	virtual void start() override;

	/** Creates a new backend of the configured kind.
	Called from the session's thread. */
	virtual ServiceBrowserBackendPtr createBackend(Logger & aLogger);


protected:

	/** The kind of backend to create ("mdns" or "adb"). */
	QString mBackendKind;

	/** The interval between the consecutive queries sent by the backends. */
	int mQueryIntervalMsec;
};
