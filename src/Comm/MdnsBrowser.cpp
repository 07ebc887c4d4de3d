#include "MdnsBrowser.hpp"
#include <QNetworkDatagram>
#include "DnsMessage.hpp"





const quint16 MdnsBrowser::MDNS_PORT;
const char * MdnsBrowser::MDNS_GROUP = "224.0.0.251";





MdnsBrowser::MdnsBrowser(Logger & aLogger, int aQueryIntervalMsec):
	mLogger(aLogger),
	mQueryIntervalMsec(aQueryIntervalMsec)
{
	connect(&mSocket,      &QUdpSocket::readyRead, this, &MdnsBrowser::onReadyRead);
	connect(&mQueryTimer,  &QTimer::timeout,       this, &MdnsBrowser::onQueryTimer);
	connect(&mExpiryTimer, &QTimer::timeout,       this,
		[this]()
		{
			expireInstances(QDateTime::currentDateTimeUtc());
		}
	);
}





MdnsBrowser::~MdnsBrowser()
{
	stop();
}





void MdnsBrowser::start(const QString & aServiceType, ServiceBrowserBackend::EventSink aEventSink)
{
	attach(aServiceType, std::move(aEventSink));
	if (!mSocket.bind(QHostAddress::AnyIPv4, MDNS_PORT, QUdpSocket::ShareAddress | QUdpSocket::ReuseAddressHint))
	{
		throw RuntimeError(mLogger, "Cannot bind the mDNS port %1: %2", MDNS_PORT, mSocket.errorString());
	}
	if (!mSocket.joinMulticastGroup(QHostAddress(QString::fromUtf8(MDNS_GROUP))))
	{
		auto err = mSocket.errorString();
		mSocket.close();
		throw RuntimeError(mLogger, "Cannot join the mDNS multicast group: %1", err);
	}

	mLogger.log("Browsing for %1", mServiceFqdn);
	onQueryTimer();
	mQueryTimer.start(mQueryIntervalMsec);
	mExpiryTimer.start(1000);
}





void MdnsBrowser::attach(const QString & aServiceType, ServiceBrowserBackend::EventSink aEventSink)
{
	mServiceType = aServiceType;
	mServiceFqdn = aServiceType + ".local";
	mEventSink = std::move(aEventSink);
	mInstances.clear();
	mHostAddresses.clear();
}





void MdnsBrowser::stop()
{
	mQueryTimer.stop();
	mExpiryTimer.stop();
	mEventSink = nullptr;
	if (mSocket.state() != QAbstractSocket::UnconnectedState)
	{
		mSocket.leaveMulticastGroup(QHostAddress(QString::fromUtf8(MDNS_GROUP)));
		mSocket.close();
		mLogger.log("Stopped browsing for %1", mServiceFqdn);
	}
}





void MdnsBrowser::processDatagram(const QByteArray & aDatagram)
{
	QList<DnsMessage::Record> records;
	try
	{
		records = DnsMessage::decodeResponse(aDatagram);
	}
	catch (const DnsMessage::ParseError & exc)
	{
		mLogger.logHex(aDatagram, "Ignoring a malformed mDNS datagram (%1):", exc.message());
		return;
	}
	if (records.isEmpty())
	{
		return;
	}

	// The A records are applied last, so that the SRV records in the same datagram decide which hosts are kept:
	auto now = QDateTime::currentDateTimeUtc();
	for (const auto & rec: records)
	{
		if (rec.mType != DnsMessage::rtA)
		{
			applyRecord(rec, now);
		}
	}
	for (const auto & rec: records)
	{
		if (rec.mType == DnsMessage::rtA)
		{
			applyRecord(rec, now);
		}
	}
	reportChanges();
}





void MdnsBrowser::expireInstances(const QDateTime & aNow)
{
	for (auto itr = mInstances.begin(); itr != mInstances.end();)
	{
		if (itr->second.mExpiry > aNow)
		{
			++itr;
			continue;
		}
		mLogger.log("Instance %1 has expired", itr->second.mName);
		if (!itr->second.mReportedAddress.isNull())
		{
			report(ServiceEvent(ServiceEvent::ekRemoved, itr->second.mName, mServiceType, itr->second.mReportedAddress, itr->second.mReportedPort));
		}
		itr = mInstances.erase(itr);
	}
	pruneHosts(aNow);
}





void MdnsBrowser::applyRecord(const DnsMessage::Record & aRecord, const QDateTime & aNow)
{
	auto name = aRecord.mName.toLower();
	switch (aRecord.mType)
	{
		case DnsMessage::rtPtr:
		{
			if (name != mServiceFqdn.toLower())
			{
				return;
			}
			auto instanceKey = aRecord.mTarget.toLower();
			auto suffix = "." + mServiceFqdn.toLower();
			if (!instanceKey.endsWith(suffix))
			{
				mLogger.log("Ignoring PTR with foreign target %1", aRecord.mTarget);
				return;
			}
			if (aRecord.mTtl == 0)
			{
				// Goodbye packet
				auto itr = mInstances.find(instanceKey);
				if (itr == mInstances.end())
				{
					return;
				}
				mLogger.log("Instance %1 has been withdrawn", itr->second.mName);
				if (!itr->second.mReportedAddress.isNull())
				{
					report(ServiceEvent(ServiceEvent::ekRemoved, itr->second.mName, mServiceType, itr->second.mReportedAddress, itr->second.mReportedPort));
				}
				mInstances.erase(itr);
				pruneHosts(aNow);
				return;
			}
			auto & inst = mInstances[instanceKey];
			if (inst.mName.isEmpty())
			{
				inst.mName = aRecord.mTarget.left(aRecord.mTarget.size() - suffix.size());
				mLogger.log("New instance %1", inst.mName);
			}
			inst.mExpiry = aNow.addSecs(aRecord.mTtl);
			inst.mIsRefreshed = true;
			return;
		}

		case DnsMessage::rtSrv:
		{
			auto itr = mInstances.find(name);
			if (itr == mInstances.end())
			{
				return;
			}
			if (aRecord.mTtl == 0)
			{
				return;
			}
			itr->second.mHostName = aRecord.mTarget.toLower();
			itr->second.mPort = aRecord.mPort;
			return;
		}

		case DnsMessage::rtA:
		{
			if (aRecord.mTtl == 0)
			{
				mHostAddresses.erase(name);
				return;
			}
			if (!isHostReferenced(name))
			{
				return;
			}
			auto & host = mHostAddresses[name];
			host.mAddress = aRecord.mAddress;
			host.mExpiry = aNow.addSecs(aRecord.mTtl);
			return;
		}

		case DnsMessage::rtTxt:
		{
			if (mInstances.find(name) != mInstances.end())
			{
				mLogger.log("TXT for %1: %2", aRecord.mName, aRecord.mTexts);
			}
			return;
		}

		default:
		{
			// Not interested
			return;
		}
	}
}





bool MdnsBrowser::isHostReferenced(const QString & aHostName) const
{
	for (const auto & instPair: mInstances)
	{
		if (instPair.second.mHostName == aHostName)
		{
			return true;
		}
	}
	return false;
}





void MdnsBrowser::pruneHosts(const QDateTime & aNow)
{
	for (auto itr = mHostAddresses.begin(); itr != mHostAddresses.end();)
	{
		if ((itr->second.mExpiry > aNow) && isHostReferenced(itr->first))
		{
			++itr;
			continue;
		}
		itr = mHostAddresses.erase(itr);
	}
}





void MdnsBrowser::reportChanges()
{
	for (auto & instPair: mInstances)
	{
		auto & inst = instPair.second;
		if (inst.mHostName.isEmpty() || (inst.mPort == 0))
		{
			continue;
		}
		auto addrItr = mHostAddresses.find(inst.mHostName);
		if (addrItr == mHostAddresses.end())
		{
			continue;
		}
		const auto & addr = addrItr->second.mAddress;
		if (inst.mReportedAddress.isNull())
		{
			inst.mReportedAddress = addr;
			inst.mReportedPort = inst.mPort;
			inst.mIsRefreshed = false;
			report(ServiceEvent(ServiceEvent::ekAdded, inst.mName, mServiceType, addr, inst.mPort));
		}
		else if ((inst.mReportedAddress != addr) || (inst.mReportedPort != inst.mPort) || inst.mIsRefreshed)
		{
			inst.mReportedAddress = addr;
			inst.mReportedPort = inst.mPort;
			inst.mIsRefreshed = false;
			report(ServiceEvent(ServiceEvent::ekUpdated, inst.mName, mServiceType, addr, inst.mPort));
		}
	}
}





void MdnsBrowser::sendQuery(const QString & aName, quint16 aType)
{
	auto query = DnsMessage::encodeQuery(aName, aType);
	auto written = mSocket.writeDatagram(query, QHostAddress(QString::fromUtf8(MDNS_GROUP)), MDNS_PORT);
	if (written != query.size())
	{
		mLogger.log("Failed to send the mDNS query for %1: %2", aName, mSocket.errorString());
	}
}





void MdnsBrowser::report(const ServiceEvent & aEvent)
{
	if (mEventSink)
	{
		mEventSink(aEvent);
	}
}





void MdnsBrowser::onReadyRead()
{
	while (mSocket.hasPendingDatagrams())
	{
		auto datagram = mSocket.receiveDatagram();
		processDatagram(datagram.data());
	}
}





void MdnsBrowser::onQueryTimer()
{
	sendQuery(mServiceFqdn, DnsMessage::rtPtr);

	// Ask for the missing parts of the instances' resolution:
	for (const auto & instPair: mInstances)
	{
		const auto & inst = instPair.second;
		if (inst.mHostName.isEmpty())
		{
			sendQuery(instPair.first, DnsMessage::rtSrv);
		}
		else if (mHostAddresses.find(inst.mHostName) == mHostAddresses.end())
		{
			sendQuery(inst.mHostName, DnsMessage::rtA);
		}
	}
}
