#pragma once

#include <map>
#include <QUdpSocket>
#include <QTimer>
#include <QDateTime>
#include "../Discovery/ServiceBrowserBackend.hpp"





// fwd:
namespace DnsMessage
{
	struct Record;
}





/** A minimal DNS-SD browser over multicast DNS.
Joins the mDNS multicast group, periodically sends PTR queries for the browsed service type and
follows the PTR -> SRV -> A chain in the responses to resolve each service instance to an address and port.
Instances are reported removed when a goodbye (TTL zero) PTR is received, or when their PTR record expires.
Lives in the thread of the ServiceBrowserSession that created it. */
class MdnsBrowser:
	public QObject,
	public ServiceBrowserBackend
{
	using Super = QObject;

	Q_OBJECT


public:

	/** The mDNS UDP port. */
	static const quint16 MDNS_PORT = 5353;

	/** The IPv4 mDNS multicast group. */
	static const char * MDNS_GROUP;


	/** Creates a new browser that logs into aLogger and re-sends its queries every aQueryIntervalMsec. */
	MdnsBrowser(Logger & aLogger, int aQueryIntervalMsec);

	virtual ~MdnsBrowser() override;

	// ServiceBrowserBackend overrides:
	virtual void start(const QString & aServiceType, EventSink aEventSink) override;
	virtual void stop() override;

	/** Sets the browsed service type and the event sink, and forgets all the known instances.
	Doesn't touch the network; start() calls this before binding the socket. */
	void attach(const QString & aServiceType, EventSink aEventSink);

	/** Processes a single received mDNS datagram.
	Exposed so that the resolution logic can be exercised without the network. */
	void processDatagram(const QByteArray & aDatagram);

	/** Reports as removed all the instances whose PTR record has expired by the specified time.
	Also forgets the host addresses that have expired or are no longer used by any instance. */
	void expireInstances(const QDateTime & aNow);

	/** Returns the number of host names whose address is currently remembered. */
	size_t numKnownHosts() const { return mHostAddresses.size(); }


protected:

	/** The resolution state of a single service instance. */
	struct Instance
	{
		/** The instance name without the service type ("adb-R58M123ABC-x2YzAb"). */
		QString mName;

		/** The host name from the SRV record, empty if not received yet. */
		QString mHostName;

		/** The port from the SRV record, 0 if not received yet. */
		quint16 mPort;

		/** The address last reported in an event, null if not reported yet. */
		QHostAddress mReportedAddress;

		/** The port last reported in an event. */
		quint16 mReportedPort;

		/** When the instance's PTR record expires. */
		QDateTime mExpiry;

		/** Set when a fresh PTR has been received and the instance should be re-announced. */
		bool mIsRefreshed;

		Instance():
			mPort(0),
			mReportedPort(0),
			mIsRefreshed(false)
		{
		}
	};


	/** The address of a single host, from its A record. */
	struct HostAddress
	{
		QHostAddress mAddress;

		/** When the A record expires. */
		QDateTime mExpiry;
	};


	/** The logger used for all the messages. */
	Logger & mLogger;

	/** The interval between the PTR queries. */
	int mQueryIntervalMsec;

	/** The UDP socket bound to the mDNS port. */
	QUdpSocket mSocket;

	/** Sends the periodic PTR queries. */
	QTimer mQueryTimer;

	/** Checks for the expired instances. */
	QTimer mExpiryTimer;

	/** The browsed service type, including the domain ("_adb-tls-connect._tcp.local"). */
	QString mServiceFqdn;

	/** The browsed service type, as reported in the events ("_adb-tls-connect._tcp"). */
	QString mServiceType;

	/** The sink where the events are reported, empty when stopped. */
	EventSink mEventSink;

	/** The known instances, map of lowercased instance FQDN -> Instance. */
	std::map<QString, Instance> mInstances;

	/** The addresses of the hosts referenced by the known instances, map of lowercased host name -> address.
	A records for any other hosts are not stored. */
	std::map<QString, HostAddress> mHostAddresses;


	/** Applies a single decoded record to mInstances / mHostAddresses. */
	void applyRecord(const DnsMessage::Record & aRecord, const QDateTime & aNow);

	/** Returns true if any known instance's SRV record points to the specified (lowercased) host name. */
	bool isHostReferenced(const QString & aHostName) const;

	/** Forgets the host addresses that have expired by aNow, or that no instance references. */
	void pruneHosts(const QDateTime & aNow);

	/** Reports the instances that became resolved or changed since the last call. */
	void reportChanges();

	/** Sends the query for the specified name and type to the multicast group. */
	void sendQuery(const QString & aName, quint16 aType);

	/** Reports the event into the sink, if there is one. */
	void report(const ServiceEvent & aEvent);


protected Q_SLOTS:

	/** Reads and processes all the pending datagrams from mSocket. */
	void onReadyRead();

	/** Sends the PTR query for the service type, and SRV / A queries for the incompletely resolved instances. */
	void onQueryTimer();
};
