#include "AdbCommunicator.hpp"
#include <limits>
#include <QDebug>





/** Returns the numerical value represented by the specified hex character.
Unknown characters are considered to be zero. */
static quint8 hexValue(char aChar)
{
	switch (aChar)
	{
		case '0': return 0x00;
		case '1': return 0x01;
		case '2': return 0x02;
		case '3': return 0x03;
		case '4': return 0x04;
		case '5': return 0x05;
		case '6': return 0x06;
		case '7': return 0x07;
		case '8': return 0x08;
		case '9': return 0x09;
		case 'a': return 0x0a;
		case 'b': return 0x0b;
		case 'c': return 0x0c;
		case 'd': return 0x0d;
		case 'e': return 0x0e;
		case 'f': return 0x0f;
		case 'A': return 0x0a;
		case 'B': return 0x0b;
		case 'C': return 0x0c;
		case 'D': return 0x0d;
		case 'E': return 0x0e;
		case 'F': return 0x0f;
	}
	return 0;
}





/** Converts the hex4-encoded number at the start of aData (such as "000c") to the number it represents.
Characters that are invalid are considered to be zeroes. The caller guarantees at least 4 bytes of data. */
static quint16 hex4ToNumber(const char * aData)
{
	quint16 res = 0;
	for (int i = 0; i < 4; ++i)
	{
		res = static_cast<quint16>(res * 16 + hexValue(aData[i]));
	}
	return res;
}





/** Returns the specified number as a hex4-encoded string. */
static QByteArray numberToHex4(quint16 aNumber)
{
	static const char hexChars[] = "0123456789ABCDEF";
	QByteArray res;
	res.resize(4);
	for (int i = 0; i < 4; ++i)
	{
		auto v = aNumber % 16;
		aNumber = aNumber >> 4;
		res[3 - i] = hexChars[v];
	}
	return res;
}





////////////////////////////////////////////////////////////////////////////////
// AdbCommunicator:

AdbCommunicator::AdbCommunicator(
	Logger & aLogger,
	const QString & aServerHost,
	quint16 aServerPort,
	QObject * aParent
):
	Super(aParent),
	mLogger(aLogger),
	mServerHost(aServerHost),
	mServerPort(aServerPort),
	mState(csCreated)
{
}





void AdbCommunicator::parseDeviceList(
	const QByteArray & aMessage,
	QList<QByteArray> & aOnlineIDs,
	QList<QByteArray> & aUnauthIDs,
	QList<QByteArray> & aOtherIDs
)
{
	auto lines = aMessage.split('\n');
	for (const auto & line: lines)
	{
		if (line.isEmpty())
		{
			continue;
		}
		auto parts = line.split('\t');
		if (parts.size() < 2)
		{
			qDebug() << "Bad DeviceList line received: " << line;
			continue;
		}
		if (parts[0].size() < 8)
		{
			// Suspiciously short ID
			qDebug() << "Bad DeviceList ID received in line " << line;
			continue;
		}
		const auto status = parts[1].trimmed();
		if (status == "device")
		{
			aOnlineIDs.push_back(parts[0]);
		}
		else if ((status == "authorizing") || (status == "unauthorized"))
		{
			aUnauthIDs.push_back(parts[0]);
		}
		else
		{
			aOtherIDs.push_back(parts[0]);
		}
	}
}





QList<AdbCommunicator::MdnsService> AdbCommunicator::parseMdnsServices(const QByteArray & aMessage)
{
	QList<MdnsService> res;
	auto lines = aMessage.split('\n');
	for (const auto & line: lines)
	{
		if (line.trimmed().isEmpty())
		{
			continue;
		}
		auto parts = line.split('\t');
		if (parts.size() < 3)
		{
			qDebug() << "Bad mDNS service line received: " << line;
			continue;
		}
		auto endpoint = parts[2].trimmed();
		auto colonIdx = endpoint.lastIndexOf(':');
		if (colonIdx <= 0)
		{
			qDebug() << "Bad mDNS service endpoint received: " << line;
			continue;
		}
		bool isOk = false;
		auto port = endpoint.mid(colonIdx + 1).toUShort(&isOk);
		QHostAddress addr;
		if (!isOk || !addr.setAddress(QString::fromUtf8(endpoint.left(colonIdx))))
		{
			qDebug() << "Bad mDNS service endpoint received: " << line;
			continue;
		}
		MdnsService svc;
		svc.mInstanceName = QString::fromUtf8(parts[0].trimmed());
		svc.mServiceType = QString::fromUtf8(parts[1].trimmed());
		svc.mAddress = addr;
		svc.mPort = port;
		res.push_back(svc);
	}
	return res;
}





void AdbCommunicator::start()
{
	if ((mState != csCreated) && (mState != csBroken))
	{
		return;
	}
	mState = csConnecting;
	connect(&mSocket, &QTcpSocket::errorOccurred, this, &AdbCommunicator::onSocketError);
	connect(&mSocket, &QTcpSocket::connected,     this, &AdbCommunicator::onSocketConnected);
	connect(&mSocket, &QTcpSocket::disconnected,  this, &AdbCommunicator::onSocketDisconnected);
	connect(&mSocket, &QTcpSocket::readyRead,     this, &AdbCommunicator::onSocketReadyRead);
	mSocket.connectToHost(mServerHost, mServerPort);
}





void AdbCommunicator::listDevices()
{
	mLogger.log("Requesting device list");
	sendRequest("host:devices", csListingDevicesStart);
	/*
	Expected response:
	OKAY
	<len><ID>\t<status>\n<ID>\t<status>...
	(socket close)
	*/
}





void AdbCommunicator::pairDevice(const QByteArray & aAddress, const QByteArray & aPassword)
{
	mLogger.log("Requesting pairing with %1", aAddress);
	sendRequest("host:pair:" + aPassword + ":" + aAddress, csHostQueryStart);
	/*
	Expected response:
	OKAY
	<len>Successfully paired to <addr> [guid=...]
	or
	<len>Failed: <reason>
	*/
}





void AdbCommunicator::connectDevice(const QByteArray & aAddress)
{
	mLogger.log("Requesting connection to %1", aAddress);
	sendRequest("host:connect:" + aAddress, csHostQueryStart);
	/*
	Expected response:
	OKAY
	<len>connected to <addr>
	or
	<len>already connected to <addr>
	or
	<len>failed to connect to <addr>
	*/
}





void AdbCommunicator::disconnectDevice(const QByteArray & aAddress)
{
	mLogger.log("Requesting disconnection of %1", aAddress);
	sendRequest("host:disconnect:" + aAddress, csHostQueryStart);
}





void AdbCommunicator::listMdnsServices()
{
	sendRequest("host:mdns:services", csListingMdnsServicesStart);
	/*
	Expected response:
	OKAY
	<len><name>\t<type>\t<ip>:<port>\n...
	*/
}





void AdbCommunicator::writeHex4(const QByteArray & aMessage)
{
	auto len = aMessage.length();
	if (len > std::numeric_limits<quint16>::max())
	{
		throw LogicError(mLogger, "ADB request too long: %1 bytes", len);
	}
	auto hex4 = numberToHex4(static_cast<quint16>(len));
	mSocket.write(hex4);
	mSocket.write(aMessage);
}





void AdbCommunicator::sendRequest(const QByteArray & aRequest, AdbCommunicator::EState aNextState)
{
	if (mState != csReady)
	{
		mLogger.log("Cannot send a request, the communicator is in state %1", mState);
		Q_EMIT error(tr("The connection to the ADB server is not ready"));
		return;
	}
	mState = aNextState;
	writeHex4(aRequest);
}





bool AdbCommunicator::extractOkayOrFail()
{
	if (mIncomingData.size() < 4)
	{
		// Too small to be a full packet
		return false;
	}
	if (mIncomingData.startsWith("FAIL"))
	{
		if (mIncomingData.size() < 8)
		{
			// Need more data
			return false;
		}
		auto length = hex4ToNumber(mIncomingData.constData() + 4);
		if (mIncomingData.size() < length + 8)
		{
			// Need more data
			return false;
		}
		auto err = mIncomingData.mid(8, length);
		mIncomingData = mIncomingData.mid(length + 8);
		mState = csFinished;
		mLogger.log("ADB server responded with FAIL: %1", err);
		Q_EMIT error(QString::fromUtf8(err));
		return false;
	}
	else if (mIncomingData.startsWith("OKAY"))
	{
		mIncomingData = mIncomingData.mid(4);
		return true;
	}
	else
	{
		mState = csBroken;
		mSocket.abort();
		mLogger.logHex(mIncomingData, "Malformed response received from ADB server:");
		Q_EMIT error(tr("Malformed response received from ADB server"));
		return false;
	}
}





std::pair<bool, QByteArray> AdbCommunicator::extractHex4Packet()
{
	if (mIncomingData.size() < 4)
	{
		// Too small to be a full packet
		return {false, {}};
	}

	auto length = hex4ToNumber(mIncomingData.constData());
	if (mIncomingData.size() < length + 4)
	{
		// Need more data
		return {false, {}};
	}
	auto pkt = mIncomingData.mid(4, length);
	mIncomingData = mIncomingData.mid(4 + length);
	return {true, pkt};
}





void AdbCommunicator::onSocketConnected()
{
	if (mState != csConnecting)
	{
		mLogger.log("Unexpected socket connection in state %1", mState);
		return;
	}
	mState = csReady;
	Q_EMIT connected();
}





void AdbCommunicator::onSocketError(QAbstractSocket::SocketError aError)
{
	if (aError == QAbstractSocket::RemoteHostClosedError)
	{
		// This is an expected state, don't log or emit anything
		return;
	}

	mLogger.log("Socket error: %1", mSocket.errorString());
	mState = csBroken;
	mSocket.abort();
	Q_EMIT error(tr("Error on the underlying TCP socket: %1").arg(mSocket.errorString()));
}





void AdbCommunicator::onSocketDisconnected()
{
	mState = csBroken;
	mSocket.abort();
	Q_EMIT disconnected();
}





void AdbCommunicator::onSocketReadyRead()
{
	// Append the incoming data:
	while (true)
	{
		auto dataRead = mSocket.read(3000);
		if (dataRead.isEmpty())
		{
			break;
		}
		mIncomingData.append(dataRead);
	}

	// Try parsing packets:
	int prevBytesLeft = -1;
	while (!mIncomingData.isEmpty() && (mIncomingData.size() != prevBytesLeft))
	{
		prevBytesLeft = mIncomingData.size();
		switch (mState)
		{
			case csCreated:
			case csConnecting:
			case csReady:
			{
				// Invalid state, break the connection
				mState = csBroken;
				mLogger.logHex(mIncomingData, "Unexpected data received on the socket:");
				Q_EMIT error(tr("Unexpected data received on the socket"));
				break;
			}

			case csBroken:
			case csFinished:
			{
				// Ignore the data, close socket not to handle any more
				mIncomingData.clear();
				mSocket.close();
				break;
			}

			case csListingDevicesStart:
			{
				if (extractOkayOrFail())
				{
					mState = csListingDevices;
				}
				break;
			}

			case csListingDevices:
			{
				auto packet = extractHex4Packet();
				if (packet.first)
				{
					mState = csFinished;
					QList<QByteArray> onlineIDs, unauthIDs, otherIDs;
					parseDeviceList(packet.second, onlineIDs, unauthIDs, otherIDs);
					Q_EMIT updateDeviceList(onlineIDs, unauthIDs, otherIDs);
				}
				break;
			}

			case csHostQueryStart:
			{
				if (extractOkayOrFail())
				{
					mState = csHostQuery;
				}
				break;
			}

			case csHostQuery:
			{
				auto packet = extractHex4Packet();
				if (packet.first)
				{
					mState = csFinished;
					mLogger.log("ADB server responded: %1", packet.second);
					Q_EMIT hostResponse(packet.second);
				}
				break;
			}

			case csListingMdnsServicesStart:
			{
				if (extractOkayOrFail())
				{
					mState = csListingMdnsServices;
				}
				break;
			}

			case csListingMdnsServices:
			{
				auto packet = extractHex4Packet();
				if (packet.first)
				{
					mState = csFinished;
					Q_EMIT mdnsServicesReceived(parseMdnsServices(packet.second));
				}
				break;
			}
		}
	}
}
