#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <vector>
#include <QObject>
#include <QMutex>
#include <QWaitCondition>
#include <QStringList>
#include "ComponentCollection.hpp"
#include "Discovery/AdbConnectionDiscovery.hpp"
#include "Discovery/AdbPairing.hpp"





// fwd:
class AdbToolchain;





/** Turns the requested serial numbers into live ADB connections.
Resolves each device's address through AdbConnectionDiscovery, runs the QR pairing flow (AdbPairing)
for the devices that are not paired yet, and then connects and validates through the AdbToolchain.
Keeps a ConnectionStatus for each tracked device; each change is announced through deviceStatusChanged().
The per-device operations can be called from multiple threads; the pairing flow is single-flight. */
class DeviceConnection:
	public QObject,
	public ComponentCollection::Component<ComponentCollection::ckDeviceConnection>
{
	using ComponentSuper = ComponentCollection::Component<ComponentCollection::ckDeviceConnection>;

	Q_OBJECT


public:

	/** The connection-level status of a single device. */
	enum ConnectionStatus
	{
		csUnknown,       ///< Not tracked
		csDiscovered,    ///< The device's connection advertisement has been seen
		csPairing,       ///< The pairing flow is running for the device
		csPaired,        ///< The device has been paired, not connected yet
		csConnecting,    ///< The connect request has been issued, waiting for the device to come online
		csConnected,     ///< The device is connected and online
		csFailed,        ///< The last operation on the device has failed
		csDisconnected,  ///< The device has been disconnected on request
	};
	Q_ENUM(ConnectionStatus)


	/** Thrown when the device has no current discovery entry, so its address cannot be resolved. */
	class AddressResolutionError:
		public RuntimeError
	{
	public:
		using RuntimeError::RuntimeError;
	};


	/** Thrown when the connect request is rejected, or the device doesn't come online in time. */
	class ConnectionFailure:
		public RuntimeError
	{
	public:
		using RuntimeError::RuntimeError;
	};


	/** The outcome of an operation on a single device. */
	struct ConnectionResult
	{
		QString mSerialNumber;
		ConnectionStatus mStatus;

		/** The failure description, empty on success. */
		QString mErrorDetail;

		ConnectionResult():
			mStatus(csUnknown)
		{
		}

		ConnectionResult(const QString & aSerialNumber, ConnectionStatus aStatus, const QString & aErrorDetail = QString()):
			mSerialNumber(aSerialNumber),
			mStatus(aStatus),
			mErrorDetail(aErrorDetail)
		{
		}

		bool isSuccess() const { return mErrorDetail.isEmpty(); }
	};


	/** The outcome of a multi-device operation, one result per requested device, in the request order. */
	struct ConnectionBatchResult
	{
		std::vector<ConnectionResult> mResults;

		/** Returns true if all the devices have succeeded. */
		bool isAllSuccess() const;

		/** Returns the serial numbers of the devices that have failed. */
		QStringList failedDevices() const;

		/** Returns the result for the specified device, or nullptr if not part of the batch. */
		const ConnectionResult * resultFor(const QString & aSerialNumber) const;
	};


	/** The callback that gets the QR code payload to present to the user when pairing is needed. */
	using QrPresenter = std::function<void (const QString & aQrCodePayload)>;


	DeviceConnection(ComponentCollection & aComponents);

	virtual ~DeviceConnection() override;

	// ComponentCollection::ComponentBase override:
	virtual void start() override;

	/** Sets the callback that presents the QR code when pairing is needed.
	An empty callback restores the default one, which logs the payload. */
	void setQrPresenter(QrPresenter aPresenter);

	/** Returns the currently advertised devices. */
	std::map<QString, ServiceInfo> visibleDevices() const;

	/** Returns true if the device is paired, either by this process, or according to the ADB keystore. */
	bool checkPairing(const QString & aSerialNumber);

	/** Returns the "ip:port" endpoint of the device, based on its current advertisement.
	Throws an AddressResolutionError if the device is not advertised. */
	QString buildCommUri(const QString & aSerialNumber) const;

	/** Connects to the device: pairs it first if needed, resolves its address (waiting for its advertisement
	up to the resolve timeout), requests the connection and waits until the device reports connected.
	Returns the endpoint at which the device is connected.
	Throws an AdbPairing::PairingFailure, AddressResolutionError or ConnectionFailure; the device is then csFailed. */
	QString establishFirstConnection(const QString & aSerialNumber);

	/** Returns true if the previously connected device is still connected.
	The device must still be advertised at the address it was connected to, and the toolchain must list it.
	Returns false for devices that are not connected through this object. */
	bool validateConnection(const QString & aSerialNumber);

	/** Runs establishFirstConnection() on each of the devices, in parallel if configured so.
	A failure on one device never affects the others. Returns after all the devices have been processed. */
	ConnectionBatchResult connectAllDevices(const QStringList & aSerialNumbers);

	/** Makes sure the device is connected, reusing the existing connection if it is still valid. */
	ConnectionResult startConnection(const QString & aSerialNumber);

	/** Disconnects the device and stops tracking it. */
	ConnectionResult stopConnection(const QString & aSerialNumber);

	/** Disconnects the device. Disconnecting a device that is not connected succeeds without doing anything.
	Returns false only if the toolchain fails to disconnect a connected device. */
	bool disconnect(const QString & aSerialNumber);

	/** Validates all the connected devices. The ones no longer connected transition to csFailed;
	they are reported, but not reconnected. */
	ConnectionBatchResult checkConnections();

	/** Disconnects all the devices, stops the pairing flow and the discovery listener (if started by this object).
	Waits for the connection attempts in progress to finish; none of them records a connection after close().
	Further connection attempts fail. Safe to call multiple times. */
	void close();

	/** Returns the status of the specified device (csUnknown if not tracked). */
	ConnectionStatus status(const QString & aSerialNumber) const;

	/** Returns the serial numbers of all the tracked devices. */
	QStringList trackedDevices() const;


protected:

	/** Counts a connection attempt as in progress for its lifetime, so that close() can wait for it.
	The constructor throws a ConnectionFailure if close() has already been called. */
	class InFlightGuard
	{
	public:
		InFlightGuard(DeviceConnection & aParent, const QString & aSerialNumber);
		~InFlightGuard();

	protected:
		DeviceConnection & mParent;
	};


	/** The logger used for all the messages. */
	Logger & mLogger;

	/** The toolchain doing the actual network operations. */
	std::shared_ptr<AdbToolchain> mToolchain;

	/** The listener for the connection advertisements. */
	std::shared_ptr<AdbConnectionDiscovery> mDiscovery;

	/** The pairing flow, created in start(). */
	std::unique_ptr<AdbPairing> mPairing;

	/** Protects mStatuses, mConnections, mPairedDevices, mQrPresenter and mNumInFlight against multithreaded access. */
	mutable QMutex mMtx;

	/** The status of each tracked device. */
	std::map<QString, ConnectionStatus> mStatuses;

	/** The advertisement through which each connected device has been connected. */
	std::map<QString, ServiceInfo> mConnections;

	/** The devices paired by this process. */
	std::set<QString> mPairedDevices;

	/** The callback presenting the QR code. */
	QrPresenter mQrPresenter;

	/** Serializes the pairing flows. */
	QMutex mMtxPairing;

	/** Set by close(). */
	std::atomic<bool> mIsClosed;

	/** The number of establishFirstConnection() calls in progress. */
	int mNumInFlight;

	/** Signalled when an establishFirstConnection() call finishes. */
	QWaitCondition mCvInFlight;

	/** True if start() has started the discovery listener, so close() should stop it. */
	bool mHasStartedDiscovery;

	int mConnectTimeoutMsec;
	int mResolveTimeoutMsec;
	int mPairCandidateTimeoutMsec;

	/** How many times a rejected or unanswered connection request is sent before giving up. */
	int mConnectAttempts;

	/** If true, connectAllDevices() processes the devices in parallel. */
	bool mIsParallel;


	/** Sets the device's status and emits deviceStatusChanged() if it differs from the previous one. */
	void setStatus(const QString & aSerialNumber, ConnectionStatus aStatus);

	/** Runs the pairing flow for the device, unless it is already paired.
	Only one pairing flow runs at a time; the device's pairing is re-checked once the flow is acquired.
	Throws an AdbPairing::PairingFailure if the device cannot be paired. */
	void ensurePaired(const QString & aSerialNumber);

	/** Waits up to aTimeoutMsec for the toolchain to report aEndpoint as connected.
	Returns false as soon as close() is called. */
	bool waitForConnected(const QString & aEndpoint, int aTimeoutMsec);

	/** Requests the connection to aEndpoint and waits for it to come online, up to mConnectAttempts times.
	Throws a ConnectionFailure if all the attempts fail, or if close() is called meanwhile. */
	void connectEndpoint(const QString & aSerialNumber, const QString & aEndpoint);

	/** Unblocks the pairing and discovery waits of the connection attempts in progress. */
	void cancelInFlight();

	/** Runs establishFirstConnection() and converts the outcome to a ConnectionResult. */
	ConnectionResult connectSingleDevice(const QString & aSerialNumber);

	/** Throws a ConnectionFailure if close() has been called. */
	void throwIfClosed(const QString & aSerialNumber) const;


Q_SIGNALS:

	/** Emitted whenever a device's status changes. May be emitted from any thread. */
	void deviceStatusChanged(const QString & aSerialNumber, DeviceConnection::ConnectionStatus aStatus);
};
