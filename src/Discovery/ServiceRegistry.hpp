#pragma once

#include <map>
#include <vector>
#include <QString>
#include <QHostAddress>
#include <QDateTime>
#include <QMutex>
#include <QWaitCondition>
#include "../Optional.hpp"





/** The network location of a single device, as resolved from its service advertisement.
Never modified once stored in a ServiceRegistry; re-discovery replaces the whole value. */
struct ServiceInfo
{
	/** The device's serial number, as extracted from the service instance name. */
	QString mSerialNumber;

	QHostAddress mAddress;
	quint16 mPort;

	/** When the advertisement was last seen. Stamped by the registry upon upsert(). */
	QDateTime mLastSeen;

	/** The service instance name from which the serial number was derived. */
	QString mInstanceName;


	ServiceInfo():
		mPort(0)
	{
	}

	ServiceInfo(const QString & aSerialNumber, const QHostAddress & aAddress, quint16 aPort, const QString & aInstanceName = QString()):
		mSerialNumber(aSerialNumber),
		mAddress(aAddress),
		mPort(aPort),
		mInstanceName(aInstanceName)
	{
	}

	/** Returns the "ip:port" endpoint used by the ADB toolchain to address the device. */
	QString endpoint() const
	{
		return QString::fromUtf8("%1:%2").arg(mAddress.toString()).arg(mPort);
	}
};





/** A thread-safe store of the discovered devices, keyed by the serial number.
Each device is either online (its advertisement is currently visible) or offline (seen before,
but the advertisement has been withdrawn); never both.
The registry is written by a single ServiceBrowserSession thread and read from any thread;
readers only ever get copies of the values. */
class ServiceRegistry
{
public:

	/** A copy of the whole registry contents, partitioned into the online and offline devices. */
	struct Snapshot
	{
		std::map<QString, ServiceInfo> mOnline;
		std::map<QString, ServiceInfo> mOffline;
	};


	ServiceRegistry();

	/** Inserts or replaces the entry for aInfo.mSerialNumber, moving it into the online partition.
	The entry's mLastSeen is set to the current time. */
	void upsert(const ServiceInfo & aInfo);

	/** Moves the entry for the specified serial number into the offline partition, keeping its last known location.
	Returns false if there's no such entry. */
	bool markOffline(const QString & aSerialNumber);

	/** Deletes the entry for the specified serial number from either partition.
	Does nothing if there's no such entry. */
	void remove(const QString & aSerialNumber);

	/** Removes all the entries. */
	void clear();

	/** Returns a copy of all the entries, partitioned into online and offline. */
	Snapshot snapshot() const;

	/** Returns the entry for the specified serial number, regardless of its partition. */
	Optional<ServiceInfo> lookup(const QString & aSerialNumber) const;

	/** Returns true if the specified device is in the online partition. */
	bool isOnline(const QString & aSerialNumber) const;

	/** Returns the online entries that have been seen within the last aMaxAgeSec seconds. */
	std::vector<ServiceInfo> freshOnline(qint64 aMaxAgeSec) const;

	/** Blocks until the specified device is online, the timeout elapses, or interruptWaits() is called.
	Returns the device's entry if it is online. */
	Optional<ServiceInfo> waitForOnline(const QString & aSerialNumber, int aTimeoutMsec);

	/** Blocks until there is at least one online entry seen within the last aMaxAgeSec seconds,
	the timeout elapses, or interruptWaits() is called.
	Returns true if there is such an entry. */
	bool waitForFreshOnline(qint64 aMaxAgeSec, int aTimeoutMsec);

	/** As above, but also returns if interruptWaits() has been called at any time since interruptGeneration()
	returned aGeneration, even before this call started waiting. */
	bool waitForFreshOnline(qint64 aMaxAgeSec, int aTimeoutMsec, quint64 aGeneration);

	/** Returns the number of interruptWaits() calls so far. */
	quint64 interruptGeneration() const;

	/** Wakes up all the threads blocked in the waitFor...() functions, making them return immediately. */
	void interruptWaits();


protected:

	/** A single stored device. */
	struct Entry
	{
		ServiceInfo mInfo;
		bool mIsOnline;
	};


	/** Protects all the member variables against multithreaded access. */
	mutable QMutex mMtx;

	/** Signalled whenever the contents change or interruptWaits() is called. */
	QWaitCondition mCvChanged;

	/** All the stored devices, map of SerialNumber -> Entry. */
	std::map<QString, Entry> mEntries;

	/** Incremented by each interruptWaits() call; a waiter returns once it sees the value change. */
	quint64 mInterruptGeneration;


	/** Implements freshOnline(), assumes mMtx is locked by the caller. */
	std::vector<ServiceInfo> freshOnlineLocked(qint64 aMaxAgeSec) const;
};
