#include "AdbPairing.hpp"
#include <cerrno>
#include <QMutexLocker>
#include <qrencode.h>
#include "../Comm/AdbToolchain.hpp"
#include "../Settings.hpp"
#include "../Utils.hpp"





/** Length of the generated pairing codes. */
static const int PASSWORD_LENGTH = 8;

/** Length of the random suffix of the generated service names. */
static const int SERVICE_NAME_SUFFIX_LENGTH = 6;

/** Number of blank modules around the rendered QR codes. */
static const int QR_QUIET_ZONE = 2;





const QString AdbPairing::SERVICE_TYPE = QString::fromUtf8("_adb-tls-pairing._tcp");





/** Encodes the payload into a QR code.
Throws a RuntimeError if the payload cannot be encoded. */
static std::shared_ptr<QRcode> encodeQrCode(const QString & aPayload)
{
	auto code = QRcode_encodeString(aPayload.toUtf8().constData(), 0, QR_ECLEVEL_L, QR_MODE_8, 1);
	if (code == nullptr)
	{
		throw RuntimeError("Cannot encode the QR code payload (errno %1)", errno);
	}
	return std::shared_ptr<QRcode>(code, QRcode_free);
}





/** Returns true if the specified module of the QR code is dark.
Coordinates outside of the code (in the quiet zone) are light. */
static bool isDarkModule(const QRcode & aCode, int aX, int aY)
{
	if ((aX < 0) || (aY < 0) || (aX >= aCode.width) || (aY >= aCode.width))
	{
		return false;
	}
	return ((aCode.data[aY * aCode.width + aX] & 0x01) != 0);
}





////////////////////////////////////////////////////////////////////////////////
// ScopedPairing:

ScopedPairing::ScopedPairing(AdbPairing & aPairing):
	mPairing(&aPairing)
{
}





ScopedPairing::ScopedPairing(ScopedPairing && aOther):
	mPairing(aOther.mPairing)
{
	aOther.mPairing = nullptr;
}





ScopedPairing & ScopedPairing::operator = (ScopedPairing && aOther)
{
	if (&aOther != this)
	{
		stop();
		mPairing = aOther.mPairing;
		aOther.mPairing = nullptr;
	}
	return *this;
}





ScopedPairing::~ScopedPairing()
{
	stop();
}





QString ScopedPairing::qrCodeString() const
{
	return pairing().qrCodeString();
}





AdbPairing & ScopedPairing::pairing() const
{
	if (mPairing == nullptr)
	{
		throw LogicError("The scoped pairing has already been stopped");
	}
	return *mPairing;
}





void ScopedPairing::stop()
{
	if (mPairing == nullptr)
	{
		return;
	}
	auto pairing = mPairing;
	mPairing = nullptr;
	pairing->stopPairListener();
}





////////////////////////////////////////////////////////////////////////////////
// AdbPairing:

AdbPairing::AdbPairing(ComponentCollection & aComponents):
	mLogger(aComponents.logger("AdbPairing")),
	mToolchain(aComponents.get<AdbToolchain>()),
	mBackendFactory(aComponents.get<ServiceBrowserBackendFactory>()),
	mState(psIdle),
	mIsClosed(false),
	mFreshnessSec(Settings::loadValue("Pairing", "FreshnessSec", 60).toLongLong()),
	mServiceNamePrefix(Settings::loadValue("Pairing", "ServiceNamePrefix", "adbmesh").toString()),
	mMaxAttempts(Settings::loadValue("Pairing", "MaxAttempts", 3).toInt())
{
}





AdbPairing::~AdbPairing()
{
	stopPairListener();
}





QString AdbPairing::qrCodeString(const QString & aServiceName, const QString & aPassword)
{
	return QString::fromUtf8("WIFI:T:ADB;S:%1;P:%2;;").arg(aServiceName, aPassword);
}





void AdbPairing::start(const QString & aPassword, const QString & aServiceName)
{
	QMutexLocker lock(&mMtx);
	if (mIsClosed)
	{
		throw PairingFailure(mLogger, "Cannot start a pairing session, the pairing coordinator has been closed");
	}
	if (mBrowser != nullptr)
	{
		return;
	}

	Session session;
	session.mPassword = aPassword.isEmpty() ? Utils::randomAlnumString(PASSWORD_LENGTH) : aPassword;
	session.mServiceName = aServiceName.isEmpty() ?
		mServiceNamePrefix + "-" + Utils::randomAlnumString(SERVICE_NAME_SUFFIX_LENGTH) :
		aServiceName;

	mRegistry.clear();
	auto browser = std::make_unique<ServiceBrowserSession>(mLogger, mBackendFactory, mRegistry, SERVICE_TYPE);
	try
	{
		browser->start();
	}
	catch (const ServiceBrowserSession::DiscoveryError &)
	{
		mState = psIdle;
		throw;
	}
	mBrowser = std::move(browser);
	mSession = session;
	mState = psBrowsing;
	mLogger.log("Pairing session %1 started", session.mServiceName);
}





QString AdbPairing::qrCodeString() const
{
	auto session = currentSession();
	return qrCodeString(session.mServiceName, session.mPassword);
}





QImage AdbPairing::renderQrCodeImage(const QString & aPayload, int aModuleSize)
{
	auto code = encodeQrCode(aPayload);
	const int size = (code->width + 2 * QR_QUIET_ZONE) * aModuleSize;
	QImage img(size, size, QImage::Format_RGB32);
	img.fill(Qt::white);
	const auto black = qRgb(0, 0, 0);
	for (int y = 0; y < code->width; ++y)
	{
		for (int x = 0; x < code->width; ++x)
		{
			if (!isDarkModule(*code, x, y))
			{
				continue;
			}
			const int left = (x + QR_QUIET_ZONE) * aModuleSize;
			const int top = (y + QR_QUIET_ZONE) * aModuleSize;
			for (int py = top; py < top + aModuleSize; ++py)
			{
				auto line = reinterpret_cast<QRgb *>(img.scanLine(py));
				for (int px = left; px < left + aModuleSize; ++px)
				{
					line[px] = black;
				}
			}
		}
	}
	return img;
}





QString AdbPairing::renderQrCodeText(const QString & aPayload)
{
	auto code = encodeQrCode(aPayload);
	// Each character covers two module rows, dark modules are drawn as spaces on a light background
	// so that the code reads correctly on dark terminals:
	static const QChar upperHalf(0x2580);
	static const QChar lowerHalf(0x2584);
	static const QChar fullBlock(0x2588);
	QString res;
	const int first = -QR_QUIET_ZONE;
	const int last = code->width + QR_QUIET_ZONE;
	for (int y = first; y < last; y += 2)
	{
		for (int x = first; x < last; ++x)
		{
			auto isTopLight = !isDarkModule(*code, x, y);
			auto isBottomLight = (y + 1 < last) && !isDarkModule(*code, x, y + 1);
			if (isTopLight && isBottomLight)
			{
				res.append(fullBlock);
			}
			else if (isTopLight)
			{
				res.append(upperHalf);
			}
			else if (isBottomLight)
			{
				res.append(lowerHalf);
			}
			else
			{
				res.append(' ');
			}
		}
		res.append('\n');
	}
	return res;
}





QImage AdbPairing::qrCodeImage(int aModuleSize) const
{
	return renderQrCodeImage(qrCodeString(), aModuleSize);
}





QString AdbPairing::qrCodeText() const
{
	return renderQrCodeText(qrCodeString());
}





QString AdbPairing::password() const
{
	return currentSession().mPassword;
}





QString AdbPairing::serviceName() const
{
	return currentSession().mServiceName;
}





bool AdbPairing::hasDeviceToPairing() const
{
	return !mRegistry.freshOnline(mFreshnessSec).empty();
}





std::vector<PairingAttempt> AdbPairing::pairDevicesDetailed()
{
	// Take the snapshot of the session under the lock, but don't hold the lock while pairing:
	Session session;
	{
		QMutexLocker lock(&mMtx);
		if (!mSession.isPresent())
		{
			throw NotStartedError(mLogger, "Cannot pair devices, the pairing session has not been started");
		}
		session = mSession.value();
		mState = psPairingInProgress;
	}

	std::vector<PairingAttempt> res;
	auto candidates = mRegistry.freshOnline(mFreshnessSec);
	mLogger.log("Pairing with %1 candidate(s)", candidates.size());
	bool hasPaired = false;
	for (const auto & candidate: candidates)
	{
		PairingAttempt attempt;
		attempt.mCandidateName = candidate.mSerialNumber;
		attempt.mAddress = candidate.endpoint();
		attempt.mIsSuccess = mToolchain->pair(attempt.mAddress, session.mPassword);
		attempt.mMessage = attempt.mIsSuccess ?
			QString::fromUtf8("Paired") :
			QString::fromUtf8("The pairing handshake with %1 failed").arg(attempt.mAddress);
		mLogger.log("Pairing with %1 at %2: %3", attempt.mCandidateName, attempt.mAddress, attempt.mMessage);
		hasPaired = hasPaired || attempt.mIsSuccess;
		res.push_back(attempt);
	}

	QMutexLocker lock(&mMtx);
	if (candidates.empty())
	{
		// Nothing was attempted, keep waiting for candidates
		mState = (mBrowser != nullptr) ? psBrowsing : psIdle;
	}
	else
	{
		mState = hasPaired ? psPaired : psFailed;
	}
	return res;
}





bool AdbPairing::pairDevices()
{
	auto attempts = pairDevicesDetailed();
	for (const auto & attempt: attempts)
	{
		if (attempt.mIsSuccess)
		{
			return true;
		}
	}
	return false;
}





void AdbPairing::stopPairListener()
{
	std::unique_ptr<ServiceBrowserSession> browser;
	{
		QMutexLocker lock(&mMtx);
		if (mBrowser == nullptr)
		{
			return;
		}
		browser = std::move(mBrowser);
		mSession.reset();
		if ((mState == psBrowsing) || (mState == psPairingInProgress))
		{
			mState = psIdle;
		}
	}
	mRegistry.interruptWaits();
	browser->stop();
	mLogger.log("Pairing session stopped");
}





ScopedPairing AdbPairing::pair(const QString & aPassword, const QString & aServiceName)
{
	start(aPassword, aServiceName);
	return ScopedPairing(*this);
}





bool AdbPairing::waitForCandidate(int aTimeoutMsec)
{
	// Take the generation while the session is known to be active, so that a stopPairListener()
	// racing with this call is never missed:
	quint64 generation;
	{
		QMutexLocker lock(&mMtx);
		if (mBrowser == nullptr)
		{
			return false;
		}
		generation = mRegistry.interruptGeneration();
	}
	return mRegistry.waitForFreshOnline(mFreshnessSec, aTimeoutMsec, generation);
}





void AdbPairing::cancel()
{
	mRegistry.interruptWaits();
}





void AdbPairing::close()
{
	{
		QMutexLocker lock(&mMtx);
		mIsClosed = true;
	}
	cancel();
	stopPairListener();
}





bool AdbPairing::runPairing(int aCandidateTimeoutMsec, const std::function<void (const QString &)> & aPresenter)
{
	auto guard = pair();
	if (aPresenter)
	{
		aPresenter(guard.qrCodeString());
	}
	for (int attempt = 0; attempt < mMaxAttempts; ++attempt)
	{
		if (!waitForCandidate(aCandidateTimeoutMsec))
		{
			mLogger.log("No pairing candidate has shown up within %1 msec", aCandidateTimeoutMsec);
			return false;
		}
		if (pairDevices())
		{
			return true;
		}
	}
	mLogger.log("Pairing has failed after %1 attempt(s)", mMaxAttempts);
	return false;
}





AdbPairing::State AdbPairing::state() const
{
	QMutexLocker lock(&mMtx);
	return mState;
}





bool AdbPairing::isListening() const
{
	QMutexLocker lock(&mMtx);
	return (mBrowser != nullptr);
}





AdbPairing::Session AdbPairing::currentSession() const
{
	QMutexLocker lock(&mMtx);
	if (!mSession.isPresent())
	{
		throw NotStartedError(mLogger, "The pairing session has not been started");
	}
	return mSession.value();
}
