#pragma once

#include <deque>
#include <memory>
#include <QThread>
#include <QMutex>
#include <QWaitCondition>
#include <QRegularExpression>
#include "ServiceBrowserBackend.hpp"
#include "ServiceRegistry.hpp"





/** Runs a single service browser (ServiceBrowserBackend) for one service type in its own thread,
and applies the browser's events to a ServiceRegistry.
The backend's events are queued (postEvent()) and applied in their arrival order on the session thread:
added / updated events upsert the device, removed events move it to the offline partition.
The service instance names are mapped to the serial numbers using an optional regular expression filter;
its first capture group is the serial number, names not matching the filter are ignored.
Once stop() returns, the session is guaranteed not to touch the registry anymore. */
class ServiceBrowserSession:
	public QThread
{
	using Super = QThread;

	Q_OBJECT


public:

	/** Thrown when the session cannot start its browser. */
	class DiscoveryError:
		public RuntimeError
	{
	public:
		using RuntimeError::RuntimeError;
	};


	/** The lifecycle status of the session. */
	enum Status
	{
		ssStopped,   ///< Not running (initial state, or after stop())
		ssStarting,  ///< start() is waiting for the browser to come up
		ssRunning,   ///< The browser is running and events are being applied
		ssError,     ///< The browser failed to start, nothing is running
	};


	/** Creates a new session that will browse for aServiceType and apply the events to aRegistry.
	aBackendFactory is used to create the backend once the session thread starts.
	If aFilter is a non-empty pattern, it is used to extract the serial number from the instance names. */
	ServiceBrowserSession(
		Logger & aLogger,
		std::shared_ptr<ServiceBrowserBackendFactory> aBackendFactory,
		ServiceRegistry & aRegistry,
		const QString & aServiceType,
		const QRegularExpression & aFilter = QRegularExpression()
	);

	virtual ~ServiceBrowserSession() override;

	/** Starts the browser thread and waits for the browser to come up.
	Does nothing if already running.
	Throws a DiscoveryError if the browser cannot be started; in such a case nothing is left running. */
	void start();

	/** Stops the browser and waits for the thread to terminate.
	Events queued but not yet applied are dropped; no registry mutation happens after this returns.
	Does nothing if not running. */
	void stop();

	/** Returns the current status. */
	Status status() const;

	/** Returns true if the browser is running. */
	bool isBrowsing() const { return (status() == ssRunning); }

	/** Returns the browsed service type. */
	const QString & serviceType() const { return mServiceType; }

	/** Queues the event to be applied to the registry on the session thread.
	Can be called from any thread. Events posted while the session is not running are dropped. */
	void postEvent(const ServiceEvent & aEvent);

	/** Returns the serial number for the specified instance name, based on the filter.
	Returns an empty string if the name doesn't match the filter. */
	QString serialFromInstanceName(const QString & aInstanceName) const;


protected:

	/** The logger used for all the messages. */
	Logger & mLogger;

	/** The factory creating the backend on the session thread. */
	std::shared_ptr<ServiceBrowserBackendFactory> mBackendFactory;

	/** The registry to which the events are applied. */
	ServiceRegistry & mRegistry;

	/** The browsed service type ("_adb-tls-connect._tcp"). */
	const QString mServiceType;

	/** The filter used to extract the serial number from the instance names. Empty pattern = no filter. */
	const QRegularExpression mFilter;

	/** Protects mStatus and mStartError. */
	mutable QMutex mMtxStatus;

	/** Signalled by the session thread once the backend start has finished (either way). */
	QWaitCondition mCvStarted;

	/** The current status. */
	Status mStatus;

	/** The description of the backend start failure, if any. */
	QString mStartError;

	/** Protects mEvents and mIsAccepting.
	Also held while applying the events to the registry, so that stop() can wait for the application to finish. */
	QMutex mMtxEvents;

	/** The events waiting to be applied, in their arrival order. */
	std::deque<ServiceEvent> mEvents;

	/** True while the session accepts new events. */
	bool mIsAccepting;


	// QThread override:
	virtual void run() override;

	/** Applies the single event to the registry. Assumes mMtxEvents is locked by the caller. */
	void applyEvent(const ServiceEvent & aEvent);


protected Q_SLOTS:

	/** Applies all the queued events to the registry. Runs on the session thread. */
	void processEvents();
};
