#pragma once

#include <map>
#include <QTimer>
#include "AdbCommunicator.hpp"
#include "../Discovery/ServiceBrowserBackend.hpp"





/** A browser backend that delegates the mDNS browsing to the ADB server itself.
Periodically asks the ADB server for its list of discovered services ("host:mdns:services")
and reports the differences between the consecutive lists as the service events.
Useful where the local mDNS port is taken by a system daemon that doesn't share it.
Lives in the thread of the ServiceBrowserSession that created it. */
class AdbMdnsBrowser:
	public QObject,
	public ServiceBrowserBackend
{
	using Super = QObject;

	Q_OBJECT


public:

	AdbMdnsBrowser(Logger & aLogger, const QString & aAdbServerHost, quint16 aAdbServerPort, int aQueryIntervalMsec);

	virtual ~AdbMdnsBrowser() override;

	// ServiceBrowserBackend overrides:
	virtual void start(const QString & aServiceType, EventSink aEventSink) override;
	virtual void stop() override;

	/** Processes a complete list of services received from the ADB server.
	New services are reported as added, the already known ones as updated, and the missing ones as removed.
	Services of other types than the browsed one are ignored. */
	void processServiceList(const QList<AdbCommunicator::MdnsService> & aServices);


protected:

	/** The logger used for all the messages. */
	Logger & mLogger;

	/** The host where the ADB server is listening. */
	QString mAdbServerHost;

	/** The port where the ADB server is listening. */
	quint16 mAdbServerPort;

	/** The interval between the service list queries. */
	int mQueryIntervalMsec;

	/** The timer for the periodic queries. */
	QTimer mQueryTimer;

	/** The browsed service type ("_adb-tls-connect._tcp"). */
	QString mServiceType;

	/** The sink where the events are reported, empty when stopped. */
	EventSink mEventSink;

	/** The services reported in the previous list, map of InstanceName -> service. */
	std::map<QString, AdbCommunicator::MdnsService> mKnownServices;

	/** Parent of the in-flight AdbCommunicator instances, so that they are all deleted when stopping. */
	std::unique_ptr<QObject> mRequests;


	/** Returns the service type normalized for comparison (no trailing dot, no ".local" domain). */
	static QString normalizedServiceType(const QString & aServiceType);


protected Q_SLOTS:

	/** Sends a single "host:mdns:services" request to the ADB server. */
	void queryServices();
};
