#pragma once

#include <memory>
#include <vector>
#include <functional>
#include <QImage>
#include <QMutex>
#include "ServiceBrowserSession.hpp"
#include "ServiceRegistry.hpp"
#include "../ComponentCollection.hpp"
#include "../Optional.hpp"





// fwd:
class AdbToolchain;
class AdbPairing;





/** The outcome of pairing with a single candidate device. */
struct PairingAttempt
{
	/** The name under which the candidate advertised its pairing service. */
	QString mCandidateName;

	/** The "ip:port" of the candidate's pairing service. */
	QString mAddress;

	bool mIsSuccess;

	/** Human-readable outcome description. */
	QString mMessage;
};





/** Keeps a pairing session of an AdbPairing open for as long as it lives.
Returned by AdbPairing::pair(); stops the pairing listener exactly once, when destroyed or when stop() is called,
whichever comes first. Movable, not copyable. */
class ScopedPairing
{
public:

	explicit ScopedPairing(AdbPairing & aPairing);
	ScopedPairing(ScopedPairing && aOther);
	ScopedPairing(const ScopedPairing &) = delete;
	ScopedPairing & operator = (const ScopedPairing &) = delete;
	ScopedPairing & operator = (ScopedPairing && aOther);

	~ScopedPairing();

	/** Returns the QR code payload of the held session. */
	QString qrCodeString() const;

	/** Returns the underlying pairing coordinator. */
	AdbPairing & pairing() const;

	/** Stops the pairing listener now, if not already stopped through this guard. */
	void stop();


protected:

	/** The coordinator whose session is being held, nullptr once stopped or moved-from. */
	AdbPairing * mPairing;
};





/** Coordinates the QR-code based ADB wireless pairing.
start() creates a new pairing session (a random pairing code and service name) and starts browsing for the
devices advertising the pairing service (a phone shows it after scanning the QR code).
pairDevices() then performs the pairing handshake with each such device, using the session's pairing code.
The session is destroyed by stopPairListener(); a new start() generates a new code, so a stale QR code
is never valid again.
Can be used from multiple threads. */
class AdbPairing
{
public:

	/** The mDNS service type advertised by the devices waiting for pairing. */
	static const QString SERVICE_TYPE;


	/** Thrown when accessing the session artifacts (QR code) before start(). */
	class NotStartedError:
		public RuntimeError
	{
	public:
		using RuntimeError::RuntimeError;
	};


	/** Thrown when the pairing handshake is rejected or times out, and the operation cannot continue. */
	class PairingFailure:
		public RuntimeError
	{
	public:
		using RuntimeError::RuntimeError;
	};


	/** The state of the pairing coordinator. */
	enum State
	{
		psIdle,               ///< No session yet, or the last session has been stopped
		psBrowsing,           ///< A session is active, waiting for the devices to show up
		psPairingInProgress,  ///< pairDevices() is running
		psPaired,             ///< The last pairDevices() has paired at least one device
		psFailed,             ///< The last pairDevices() has failed to pair any device
	};


	/** Creates a new coordinator, using the components' AdbToolchain and ServiceBrowserBackendFactory.
	The settings (freshness window, timeouts, service name prefix) are read upon construction. */
	AdbPairing(ComponentCollection & aComponents);

	~AdbPairing();

	/** Returns the QR code payload for the specified service name and pairing code. */
	static QString qrCodeString(const QString & aServiceName, const QString & aPassword);

	/** Renders the QR code of the specified payload into an image, with each module aModuleSize pixels big.
	Throws a RuntimeError if the payload cannot be encoded. */
	static QImage renderQrCodeImage(const QString & aPayload, int aModuleSize);

	/** Renders the QR code of the specified payload as text, two module rows per line,
	suitable for printing into a terminal.
	Throws a RuntimeError if the payload cannot be encoded. */
	static QString renderQrCodeText(const QString & aPayload);

	/** Starts a new pairing session and starts browsing for the pairing candidates.
	If aPassword or aServiceName is empty, a random one is generated.
	Does nothing if a session is already active.
	Throws a ServiceBrowserSession::DiscoveryError if the browser cannot be started, leaving the coordinator idle.
	Throws a PairingFailure if close() has been called. */
	void start(const QString & aPassword = QString(), const QString & aServiceName = QString());

	/** Returns the QR code payload for the current session.
	Throws a NotStartedError if there's no active session. */
	QString qrCodeString() const;

	/** Returns the QR code of the current session rendered into an image, with each module aModuleSize pixels big.
	Throws a NotStartedError if there's no active session. */
	QImage qrCodeImage(int aModuleSize = 8) const;

	/** Returns the QR code of the current session rendered as text (renderQrCodeText()).
	Throws a NotStartedError if there's no active session. */
	QString qrCodeText() const;

	/** Returns the pairing code of the current session.
	Throws a NotStartedError if there's no active session. */
	QString password() const;

	/** Returns the service name of the current session.
	Throws a NotStartedError if there's no active session. */
	QString serviceName() const;

	/** Returns true if there's at least one pairing candidate seen within the freshness window. */
	bool hasDeviceToPairing() const;

	/** Attempts to pair with each candidate seen within the freshness window.
	Returns one PairingAttempt per candidate.
	Throws a NotStartedError if there's no active session. */
	std::vector<PairingAttempt> pairDevicesDetailed();

	/** Attempts to pair with each fresh candidate.
	Returns true if at least one candidate has been paired.
	Throws a NotStartedError if there's no active session. */
	bool pairDevices();

	/** Stops browsing for the candidates and destroys the current session.
	Unblocks any waitForCandidate() in progress. Does nothing if there's no active session. */
	void stopPairListener();

	/** Starts a session (as in start()) and returns a guard that stops it when destroyed. */
	ScopedPairing pair(const QString & aPassword = QString(), const QString & aServiceName = QString());

	/** Blocks until there's a fresh pairing candidate, the timeout elapses, or cancel() / stopPairListener() is called.
	Returns true if there is a candidate. */
	bool waitForCandidate(int aTimeoutMsec);

	/** Unblocks all waitForCandidate() calls in progress. */
	void cancel();

	/** Stops the current session (if any) and makes all further start() calls fail.
	Unblocks all waitForCandidate() calls in progress. Safe to call multiple times. */
	void close();

	/** Runs the whole pairing flow: starts a session, hands the QR code payload to aPresenter, waits for
	the candidates and tries pairing them, up to the configured number of attempts, then stops the session.
	Returns true if a device has been paired. */
	bool runPairing(int aCandidateTimeoutMsec, const std::function<void (const QString &)> & aPresenter);

	/** Returns the current state. */
	State state() const;

	/** Returns true if a session is active. */
	bool isListening() const;

	/** Returns the registry of the pairing candidates. */
	const ServiceRegistry & registry() const { return mRegistry; }


protected:

	/** A single pairing session. */
	struct Session
	{
		QString mPassword;
		QString mServiceName;
	};


	/** The logger used for all the messages. */
	Logger & mLogger;

	/** The toolchain performing the pairing handshake. */
	std::shared_ptr<AdbToolchain> mToolchain;

	/** The factory for the browser backends. */
	std::shared_ptr<ServiceBrowserBackendFactory> mBackendFactory;

	/** The pairing candidates. */
	ServiceRegistry mRegistry;

	/** Protects mSession, mBrowser, mState and mIsClosed. */
	mutable QMutex mMtx;

	/** The current session, not present if not started. */
	Optional<Session> mSession;

	/** The browser for the pairing candidates, nullptr if not started. */
	std::unique_ptr<ServiceBrowserSession> mBrowser;

	/** The current state. */
	State mState;

	/** Set by close(), no more sessions can be started. */
	bool mIsClosed;

	/** Only the candidates seen within this many seconds are paired. */
	qint64 mFreshnessSec;

	/** The prefix of the generated service names. */
	QString mServiceNamePrefix;

	/** The maximum number of pairDevices() rounds in runPairing(). */
	int mMaxAttempts;


	/** Returns the current session, throws a NotStartedError if there's none. */
	Session currentSession() const;
};
