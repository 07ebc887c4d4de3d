#pragma once

#include <QString>
#include <QHostAddress>





/** A single change in the advertised services, as reported by a ServiceBrowserBackend.
The backend pushes these into its session's event queue; the session applies them to a ServiceRegistry
in the order of arrival. */
struct ServiceEvent
{
	enum Kind
	{
		ekAdded,    ///< A new service instance has been resolved
		ekUpdated,  ///< A known service instance has been re-announced, possibly with a new address
		ekRemoved,  ///< The service instance has been withdrawn (goodbye packet) or its record expired
	};


	Kind mKind;

	/** The service instance name, without the service type and domain ("adb-R58M123ABC-x2YzAb"). */
	QString mInstanceName;

	/** The service type, without the domain ("_adb-tls-connect._tcp"). */
	QString mServiceType;

	/** The address of the device. May be null for ekRemoved. */
	QHostAddress mAddress;

	/** The port on which the service listens. May be zero for ekRemoved. */
	quint16 mPort;


	ServiceEvent():
		mKind(ekAdded),
		mPort(0)
	{
	}

	ServiceEvent(
		Kind aKind,
		const QString & aInstanceName,
		const QString & aServiceType,
		const QHostAddress & aAddress = QHostAddress(),
		quint16 aPort = 0
	):
		mKind(aKind),
		mInstanceName(aInstanceName),
		mServiceType(aServiceType),
		mAddress(aAddress),
		mPort(aPort)
	{
	}
};
