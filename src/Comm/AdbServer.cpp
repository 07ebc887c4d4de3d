#include "AdbServer.hpp"
#include <QDir>
#include <QEventLoop>
#include <QTimer>
#include "AdbCommunicator.hpp"
#include "../Settings.hpp"
#include "../Utils.hpp"





AdbServer::AdbServer(ComponentCollection & aComponents):
	Super(aComponents),
	mLogger(aComponents.logger("AdbServer")),
	mServerHost(Settings::loadValue("Adb", "ServerHost", "localhost").toString()),
	mServerPort(static_cast<quint16>(Settings::loadValue("Adb", "ServerPort", 5037).toUInt())),
	mRequestTimeoutMsec(Settings::loadValue("Adb", "RequestTimeoutMsec", 5000).toInt()),
	mPairTimeoutMsec(Settings::loadValue("Adb", "PairTimeoutMsec", 15000).toInt()),
	mKnownHostsFile(Settings::loadValue(
		"Adb", "KnownHostsFile", QDir::home().absoluteFilePath(".android/adb_known_hosts.pb")
	).toString())
{
	requireForStart(ComponentCollection::ckMultiLogger);
}





void AdbServer::start()
{
	mLogger.log("Using the ADB server at %1:%2", mServerHost, mServerPort);
}





bool AdbServer::pair(const QString & aAddress, const QString & aPassword)
{
	auto addr = aAddress.toUtf8();
	auto pw = aPassword.toUtf8();
	auto res = query(
		[addr, pw](AdbCommunicator & aComm)
		{
			aComm.pairDevice(addr, pw);
		},
		mPairTimeoutMsec
	);
	if (!res.mIsSuccess)
	{
		mLogger.log("Pairing with %1 failed: %2", aAddress, res.mMessage);
		return false;
	}
	if (!res.mMessage.contains("Successfully paired to"))
	{
		mLogger.log("Pairing with %1 was rejected: %2", aAddress, res.mMessage);
		return false;
	}
	mLogger.log("Paired with %1", aAddress);
	return true;
}





bool AdbServer::connect(const QString & aAddress)
{
	auto addr = aAddress.toUtf8();
	auto res = query(
		[addr](AdbCommunicator & aComm)
		{
			aComm.connectDevice(addr);
		},
		mRequestTimeoutMsec
	);
	if (!res.mIsSuccess)
	{
		mLogger.log("Connecting to %1 failed: %2", aAddress, res.mMessage);
		return false;
	}
	if (res.mMessage.contains("failed to connect") || res.mMessage.contains("cannot connect"))
	{
		mLogger.log("Connecting to %1 was refused: %2", aAddress, res.mMessage);
		return false;
	}
	return true;
}





bool AdbServer::disconnect(const QString & aAddress)
{
	auto addr = aAddress.toUtf8();
	auto res = query(
		[addr](AdbCommunicator & aComm)
		{
			aComm.disconnectDevice(addr);
		},
		mRequestTimeoutMsec
	);
	if (!res.mIsSuccess)
	{
		mLogger.log("Disconnecting %1 failed: %2", aAddress, res.mMessage);
		return false;
	}
	return true;
}





bool AdbServer::isConnected(const QString & aAddress)
{
	auto res = query(
		[](AdbCommunicator & aComm)
		{
			aComm.listDevices();
		},
		mRequestTimeoutMsec
	);
	if (!res.mIsSuccess)
	{
		mLogger.log("Cannot query the device list: %1", res.mMessage);
		return false;
	}
	return res.mOnlineDeviceIDs.contains(aAddress.toUtf8());
}





bool AdbServer::isPaired(const QString & aSerialNumber)
{
	// The known hosts file is a protobuf of the paired devices' GUIDs, which embed the serial number
	// ("adb-<serial>-<suffix>"); a raw scan is enough to find them:
	QByteArray knownHosts;
	try
	{
		knownHosts = Utils::readWholeFile(mKnownHostsFile);
	}
	catch (const RuntimeError & exc)
	{
		mLogger.log("Cannot read the ADB known hosts: %1", exc.message());
		return false;
	}
	return knownHosts.contains("adb-" + aSerialNumber.toUtf8() + "-");
}





AdbServer::QueryResult AdbServer::query(const std::function<void (AdbCommunicator &)> & aRequest, int aTimeoutMsec)
{
	QueryResult res;
	res.mIsSuccess = false;
	bool isFinished = false;

	AdbCommunicator comm(mLogger, mServerHost, mServerPort);
	QEventLoop loop;
	QTimer timeout;
	timeout.setSingleShot(true);

	auto finish = [&](bool aIsSuccess, const QString & aMessage)
	{
		if (isFinished)
		{
			return;
		}
		isFinished = true;
		res.mIsSuccess = aIsSuccess;
		res.mMessage = aMessage;
		loop.quit();
	};

	QObject::connect(&comm, &AdbCommunicator::connected, &loop,
		[&]()
		{
			aRequest(comm);
		}
	);
	QObject::connect(&comm, &AdbCommunicator::hostResponse, &loop,
		[&](const QByteArray & aResponse)
		{
			finish(true, QString::fromUtf8(aResponse));
		}
	);
	QObject::connect(&comm, &AdbCommunicator::updateDeviceList, &loop,
		[&](const QList<QByteArray> & aOnlineIDs, const QList<QByteArray> & aUnauthIDs, const QList<QByteArray> & aOtherIDs)
		{
			Q_UNUSED(aUnauthIDs);
			Q_UNUSED(aOtherIDs);
			res.mOnlineDeviceIDs = aOnlineIDs;
			finish(true, QString());
		}
	);
	QObject::connect(&comm, &AdbCommunicator::error, &loop,
		[&](const QString & aErrorText)
		{
			finish(false, aErrorText);
		}
	);
	QObject::connect(&comm, &AdbCommunicator::disconnected, &loop,
		[&]()
		{
			finish(false, QString::fromUtf8("The ADB server closed the connection"));
		}
	);
	QObject::connect(&timeout, &QTimer::timeout, &loop,
		[&]()
		{
			finish(false, QString::fromUtf8("Timed out after %1 msec").arg(aTimeoutMsec));
		}
	);

	timeout.start(aTimeoutMsec);
	comm.start();
	if (!isFinished)
	{
		loop.exec();
	}
	return res;
}
