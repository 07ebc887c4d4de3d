#include "DeviceConnection.hpp"
#include <algorithm>
#include <QMutexLocker>
#include <QDeadlineTimer>
#include <QThread>
#include <QThreadPool>
#include <QFuture>
#include <QtConcurrent>
#include "Comm/AdbToolchain.hpp"
#include "Settings.hpp"





/** How often the toolchain is asked whether a freshly connected device is online. */
static const int CONNECTED_POLL_INTERVAL_MSEC = 200;

/** How often close() repeats the cancellation while waiting for the connection attempts in progress. */
static const int CLOSE_CANCEL_INTERVAL_MSEC = 50;





////////////////////////////////////////////////////////////////////////////////
// DeviceConnection::ConnectionBatchResult:

bool DeviceConnection::ConnectionBatchResult::isAllSuccess() const
{
	for (const auto & res: mResults)
	{
		if (!res.isSuccess())
		{
			return false;
		}
	}
	return true;
}





QStringList DeviceConnection::ConnectionBatchResult::failedDevices() const
{
	QStringList res;
	for (const auto & r: mResults)
	{
		if (!r.isSuccess())
		{
			res.append(r.mSerialNumber);
		}
	}
	return res;
}





const DeviceConnection::ConnectionResult * DeviceConnection::ConnectionBatchResult::resultFor(const QString & aSerialNumber) const
{
	for (const auto & res: mResults)
	{
		if (res.mSerialNumber == aSerialNumber)
		{
			return &res;
		}
	}
	return nullptr;
}





////////////////////////////////////////////////////////////////////////////////
// DeviceConnection::InFlightGuard:

DeviceConnection::InFlightGuard::InFlightGuard(DeviceConnection & aParent, const QString & aSerialNumber):
	mParent(aParent)
{
	QMutexLocker lock(&mParent.mMtx);
	mParent.throwIfClosed(aSerialNumber);
	mParent.mNumInFlight += 1;
}





DeviceConnection::InFlightGuard::~InFlightGuard()
{
	QMutexLocker lock(&mParent.mMtx);
	mParent.mNumInFlight -= 1;
	mParent.mCvInFlight.wakeAll();
}





////////////////////////////////////////////////////////////////////////////////
// DeviceConnection:

DeviceConnection::DeviceConnection(ComponentCollection & aComponents):
	ComponentSuper(aComponents),
	mLogger(aComponents.logger("DeviceConnection")),
	mIsClosed(false),
	mNumInFlight(0),
	mHasStartedDiscovery(false),
	mConnectTimeoutMsec(Settings::loadValue("Connection", "ConnectTimeoutMsec", 10000).toInt()),
	mResolveTimeoutMsec(Settings::loadValue("Connection", "ResolveTimeoutMsec", 10000).toInt()),
	mPairCandidateTimeoutMsec(Settings::loadValue("Pairing", "CandidateTimeoutMsec", 60000).toInt()),
	mConnectAttempts(std::max(1, Settings::loadValue("Connection", "ConnectAttempts", 3).toInt())),
	mIsParallel(Settings::loadValue("Connection", "Parallel", true).toBool())
{
	qRegisterMetaType<DeviceConnection::ConnectionStatus>();
	requireForStart(ComponentCollection::ckMultiLogger);
	requireForStart(ComponentCollection::ckAdbToolchain);
	requireForStart(ComponentCollection::ckServiceBrowserBackendFactory);
	requireForStart(ComponentCollection::ckConnectionDiscovery);
}





DeviceConnection::~DeviceConnection()
{
	close();
}





void DeviceConnection::start()
{
	mToolchain = mComponents.get<AdbToolchain>();
	mDiscovery = mComponents.get<AdbConnectionDiscovery>();
	mPairing.reset(new AdbPairing(mComponents));
	if (!mDiscovery->isListening())
	{
		mDiscovery->startDiscoveryListener();
		mHasStartedDiscovery = true;
	}
}





void DeviceConnection::setQrPresenter(QrPresenter aPresenter)
{
	QMutexLocker lock(&mMtx);
	mQrPresenter = std::move(aPresenter);
}





std::map<QString, ServiceInfo> DeviceConnection::visibleDevices() const
{
	return mDiscovery->onlineDevices();
}





bool DeviceConnection::checkPairing(const QString & aSerialNumber)
{
	{
		QMutexLocker lock(&mMtx);
		if (mPairedDevices.find(aSerialNumber) != mPairedDevices.end())
		{
			return true;
		}
	}
	return mToolchain->isPaired(aSerialNumber);
}





QString DeviceConnection::buildCommUri(const QString & aSerialNumber) const
{
	auto info = mDiscovery->serviceInfoFor(aSerialNumber);
	if (!info.isPresent())
	{
		throw AddressResolutionError(mLogger, "Device %1 is not advertising its connection service", aSerialNumber);
	}
	return info.value().endpoint();
}





QString DeviceConnection::establishFirstConnection(const QString & aSerialNumber)
{
	InFlightGuard inFlight(*this, aSerialNumber);
	try
	{
		if (mDiscovery->connectionStatusForDevice(aSerialNumber) == AdbConnectionDiscovery::asOnline)
		{
			setStatus(aSerialNumber, csDiscovered);
		}
		ensurePaired(aSerialNumber);

		// A freshly paired device may take a while to advertise its connection service:
		if (!mDiscovery->serviceInfoFor(aSerialNumber).isPresent())
		{
			mLogger.log("Waiting up to %1 msec for device %2 to advertise", mResolveTimeoutMsec, aSerialNumber);
			mDiscovery->waitForDevice(aSerialNumber, mResolveTimeoutMsec);
			throwIfClosed(aSerialNumber);
		}
		auto info = mDiscovery->serviceInfoFor(aSerialNumber);
		if (!info.isPresent())
		{
			throw AddressResolutionError(mLogger, "Device %1 is not advertising its connection service", aSerialNumber);
		}
		auto endpoint = info.value().endpoint();

		setStatus(aSerialNumber, csConnecting);
		connectEndpoint(aSerialNumber, endpoint);

		// close() may have run while connecting; it has already disconnected everything it knew about:
		bool isRecorded = false;
		{
			QMutexLocker lock(&mMtx);
			if (!mIsClosed)
			{
				mConnections[aSerialNumber] = info.value();
				isRecorded = true;
			}
		}
		if (!isRecorded)
		{
			mToolchain->disconnect(endpoint);
			throwIfClosed(aSerialNumber);
		}
		setStatus(aSerialNumber, csConnected);
		mLogger.log("Device %1 is connected at %2", aSerialNumber, endpoint);
		return endpoint;
	}
	catch (const RuntimeError &)
	{
		setStatus(aSerialNumber, csFailed);
		throw;
	}
}





bool DeviceConnection::validateConnection(const QString & aSerialNumber)
{
	ServiceInfo info;
	{
		QMutexLocker lock(&mMtx);
		auto itr = mConnections.find(aSerialNumber);
		if (itr == mConnections.end())
		{
			return false;
		}
		info = itr->second;
	}
	auto serviceStatus = mDiscovery->connectionStatusForService(info);
	if (serviceStatus != AdbConnectionDiscovery::sisUpdated)
	{
		mLogger.log("Device %1 is no longer advertised at %2 (%3)", aSerialNumber, info.endpoint(), static_cast<int>(serviceStatus));
		return false;
	}
	return mToolchain->isConnected(info.endpoint());
}





DeviceConnection::ConnectionBatchResult DeviceConnection::connectAllDevices(const QStringList & aSerialNumbers)
{
	ConnectionBatchResult res;
	if (!mIsParallel || (aSerialNumbers.size() < 2))
	{
		for (const auto & serial: aSerialNumbers)
		{
			res.mResults.push_back(connectSingleDevice(serial));
		}
		return res;
	}

	// One worker per device, all joined before returning:
	QThreadPool pool;
	pool.setMaxThreadCount(aSerialNumbers.size());
	std::vector<QFuture<ConnectionResult>> futures;
	for (const auto & serial: aSerialNumbers)
	{
		futures.push_back(QtConcurrent::run(&pool,
			[this, serial]()
			{
				return connectSingleDevice(serial);
			}
		));
	}
	for (auto & f: futures)
	{
		res.mResults.push_back(f.result());
	}
	pool.waitForDone();
	return res;
}





DeviceConnection::ConnectionResult DeviceConnection::startConnection(const QString & aSerialNumber)
{
	if ((status(aSerialNumber) == csConnected) && validateConnection(aSerialNumber))
	{
		return ConnectionResult(aSerialNumber, csConnected);
	}
	return connectSingleDevice(aSerialNumber);
}





DeviceConnection::ConnectionResult DeviceConnection::stopConnection(const QString & aSerialNumber)
{
	if (!disconnect(aSerialNumber))
	{
		return ConnectionResult(aSerialNumber, status(aSerialNumber), "The toolchain has failed to disconnect the device");
	}
	QMutexLocker lock(&mMtx);
	mStatuses.erase(aSerialNumber);
	return ConnectionResult(aSerialNumber, csDisconnected);
}





bool DeviceConnection::disconnect(const QString & aSerialNumber)
{
	QString endpoint;
	{
		QMutexLocker lock(&mMtx);
		auto itr = mConnections.find(aSerialNumber);
		if (itr == mConnections.end())
		{
			// Not connected through us, nothing to do
			return true;
		}
		endpoint = itr->second.endpoint();
	}
	if (!mToolchain->disconnect(endpoint))
	{
		mLogger.log("Failed to disconnect device %1 at %2", aSerialNumber, endpoint);
		return false;
	}
	{
		QMutexLocker lock(&mMtx);
		mConnections.erase(aSerialNumber);
	}
	setStatus(aSerialNumber, csDisconnected);
	mLogger.log("Device %1 at %2 has been disconnected", aSerialNumber, endpoint);
	return true;
}





DeviceConnection::ConnectionBatchResult DeviceConnection::checkConnections()
{
	std::vector<QString> connected;
	{
		QMutexLocker lock(&mMtx);
		for (const auto & s: mStatuses)
		{
			if (s.second == csConnected)
			{
				connected.push_back(s.first);
			}
		}
	}

	ConnectionBatchResult res;
	for (const auto & serial: connected)
	{
		if (validateConnection(serial))
		{
			res.mResults.emplace_back(serial, csConnected);
			continue;
		}
		mLogger.log("Device %1 is no longer connected", serial);
		{
			QMutexLocker lock(&mMtx);
			mConnections.erase(serial);
		}
		setStatus(serial, csFailed);
		res.mResults.emplace_back(serial, csFailed, QString::fromUtf8("The device is no longer connected"));
	}
	return res;
}





void DeviceConnection::close()
{
	if (mIsClosed.exchange(true))
	{
		return;
	}
	mLogger.log("Closing");

	// Unblock the workers and wait for them to finish. A worker may enter a wait right after it has been
	// cancelled, so keep cancelling until all of them are gone:
	{
		QMutexLocker lock(&mMtx);
		while (true)
		{
			lock.unlock();
			cancelInFlight();
			lock.relock();
			if (mNumInFlight == 0)
			{
				break;
			}
			mCvInFlight.wait(&mMtx, CLOSE_CANCEL_INTERVAL_MSEC);
		}
	}

	if (mToolchain != nullptr)
	{
		QStringList serials;
		{
			QMutexLocker lock(&mMtx);
			for (const auto & ep: mConnections)
			{
				serials.append(ep.first);
			}
		}
		for (const auto & serial: serials)
		{
			disconnect(serial);
		}
	}

	if (mHasStartedDiscovery && (mDiscovery != nullptr))
	{
		mDiscovery->stopDiscoveryListener();
		mHasStartedDiscovery = false;
	}
}





DeviceConnection::ConnectionStatus DeviceConnection::status(const QString & aSerialNumber) const
{
	QMutexLocker lock(&mMtx);
	auto itr = mStatuses.find(aSerialNumber);
	if (itr == mStatuses.end())
	{
		return csUnknown;
	}
	return itr->second;
}





QStringList DeviceConnection::trackedDevices() const
{
	QMutexLocker lock(&mMtx);
	QStringList res;
	for (const auto & s: mStatuses)
	{
		res.append(s.first);
	}
	return res;
}





void DeviceConnection::setStatus(const QString & aSerialNumber, ConnectionStatus aStatus)
{
	{
		QMutexLocker lock(&mMtx);
		auto & status = mStatuses[aSerialNumber];
		if (status == aStatus)
		{
			return;
		}
		status = aStatus;
	}
	Q_EMIT deviceStatusChanged(aSerialNumber, aStatus);
}





void DeviceConnection::ensurePaired(const QString & aSerialNumber)
{
	if (checkPairing(aSerialNumber))
	{
		return;
	}

	QMutexLocker pairingLock(&mMtxPairing);
	// Another worker may have paired the device while we were waiting:
	if (checkPairing(aSerialNumber))
	{
		return;
	}
	throwIfClosed(aSerialNumber);

	setStatus(aSerialNumber, csPairing);
	QrPresenter presenter;
	{
		QMutexLocker lock(&mMtx);
		presenter = mQrPresenter;
	}
	if (!presenter)
	{
		presenter = [this, aSerialNumber](const QString & aPayload)
		{
			mLogger.log("Scan this QR code payload on device %1 to pair it: %2", aSerialNumber, aPayload);
		};
	}
	if (!mPairing->runPairing(mPairCandidateTimeoutMsec, presenter))
	{
		throw AdbPairing::PairingFailure(mLogger, "Device %1 could not be paired", aSerialNumber);
	}
	{
		QMutexLocker lock(&mMtx);
		mPairedDevices.insert(aSerialNumber);
	}
	setStatus(aSerialNumber, csPaired);
}





bool DeviceConnection::waitForConnected(const QString & aEndpoint, int aTimeoutMsec)
{
	QDeadlineTimer deadline(aTimeoutMsec);
	while (true)
	{
		if (mIsClosed)
		{
			return false;
		}
		if (mToolchain->isConnected(aEndpoint))
		{
			return true;
		}
		if (deadline.hasExpired())
		{
			return false;
		}
		QThread::msleep(static_cast<unsigned long>(std::min<qint64>(CONNECTED_POLL_INTERVAL_MSEC, deadline.remainingTime())));
	}
}





void DeviceConnection::connectEndpoint(const QString & aSerialNumber, const QString & aEndpoint)
{
	for (int attempt = 1;; ++attempt)
	{
		throwIfClosed(aSerialNumber);
		QString reason;
		if (mToolchain->connect(aEndpoint))
		{
			if (waitForConnected(aEndpoint, mConnectTimeoutMsec))
			{
				return;
			}
			if (mIsClosed)
			{
				mToolchain->disconnect(aEndpoint);
				throwIfClosed(aSerialNumber);
			}
			reason = QString::fromUtf8("the device hasn't come online within %1 msec").arg(mConnectTimeoutMsec);
		}
		else
		{
			reason = QString::fromUtf8("the connection was rejected");
		}
		if (attempt >= mConnectAttempts)
		{
			throw ConnectionFailure(mLogger, "Cannot connect device %1 at %2 after %3 attempt(s), %4",
				aSerialNumber, aEndpoint, attempt, reason
			);
		}
		mLogger.log("Connection attempt %1 of %2 to device %3 at %4 failed (%5), retrying",
			attempt, mConnectAttempts, aSerialNumber, aEndpoint, reason
		);
	}
}





void DeviceConnection::cancelInFlight()
{
	if (mPairing != nullptr)
	{
		mPairing->close();
	}
	if (mDiscovery != nullptr)
	{
		mDiscovery->cancelWaits();
	}
}





DeviceConnection::ConnectionResult DeviceConnection::connectSingleDevice(const QString & aSerialNumber)
{
	try
	{
		establishFirstConnection(aSerialNumber);
		return ConnectionResult(aSerialNumber, csConnected);
	}
	catch (const std::exception & exc)
	{
		setStatus(aSerialNumber, csFailed);
		return ConnectionResult(aSerialNumber, csFailed, QString::fromUtf8(exc.what()));
	}
}





void DeviceConnection::throwIfClosed(const QString & aSerialNumber) const
{
	if (mIsClosed)
	{
		throw ConnectionFailure(mLogger, "Cannot connect device %1, the connection manager has been closed", aSerialNumber);
	}
}
