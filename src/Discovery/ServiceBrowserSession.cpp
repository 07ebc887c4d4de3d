#include "ServiceBrowserSession.hpp"
#include <QMutexLocker>





ServiceBrowserSession::ServiceBrowserSession(
	Logger & aLogger,
	std::shared_ptr<ServiceBrowserBackendFactory> aBackendFactory,
	ServiceRegistry & aRegistry,
	const QString & aServiceType,
	const QRegularExpression & aFilter
):
	mLogger(aLogger),
	mBackendFactory(std::move(aBackendFactory)),
	mRegistry(aRegistry),
	mServiceType(aServiceType),
	mFilter(aFilter),
	mStatus(ssStopped),
	mIsAccepting(false)
{
	setObjectName("ServiceBrowserSession " + aServiceType);
	moveToThread(this);
}





ServiceBrowserSession::~ServiceBrowserSession()
{
	stop();
}





void ServiceBrowserSession::start()
{
	QMutexLocker lock(&mMtxStatus);
	if ((mStatus == ssRunning) || (mStatus == ssStarting))
	{
		return;
	}
	mStatus = ssStarting;
	mStartError.clear();
	{
		QMutexLocker lockEvents(&mMtxEvents);
		mEvents.clear();
		mIsAccepting = true;
	}

	Super::start();
	while (mStatus == ssStarting)
	{
		mCvStarted.wait(&mMtxStatus);
	}
	if (mStatus == ssRunning)
	{
		mLogger.log("Browser for %1 is running", mServiceType);
		return;
	}

	// The backend failed to start, the thread is finishing on its own:
	auto err = mStartError;
	lock.unlock();
	{
		QMutexLocker lockEvents(&mMtxEvents);
		mIsAccepting = false;
		mEvents.clear();
	}
	Super::wait();
	throw DiscoveryError(mLogger, "Cannot start browsing for %1: %2", mServiceType, err);
}





void ServiceBrowserSession::stop()
{
	{
		QMutexLocker lock(&mMtxStatus);
		if (mStatus != ssRunning)
		{
			return;
		}
	}

	// Drop any further events; waits for any in-progress application to finish:
	{
		QMutexLocker lockEvents(&mMtxEvents);
		mIsAccepting = false;
		mEvents.clear();
	}

	Super::quit();
	Super::wait();
	{
		QMutexLocker lock(&mMtxStatus);
		mStatus = ssStopped;
	}
	mLogger.log("Browser for %1 has stopped", mServiceType);
}





ServiceBrowserSession::Status ServiceBrowserSession::status() const
{
	QMutexLocker lock(&mMtxStatus);
	return mStatus;
}





void ServiceBrowserSession::postEvent(const ServiceEvent & aEvent)
{
	{
		QMutexLocker lock(&mMtxEvents);
		if (!mIsAccepting)
		{
			return;
		}
		mEvents.push_back(aEvent);
	}
	QMetaObject::invokeMethod(this, "processEvents", Qt::QueuedConnection);
}





QString ServiceBrowserSession::serialFromInstanceName(const QString & aInstanceName) const
{
	if (mFilter.pattern().isEmpty())
	{
		return aInstanceName;
	}
	auto match = mFilter.match(aInstanceName);
	if (!match.hasMatch())
	{
		return QString();
	}
	if (mFilter.captureCount() < 1)
	{
		return match.captured(0);
	}
	return match.captured(1);
}





void ServiceBrowserSession::run()
{
	ServiceBrowserBackendPtr backend;
	try
	{
		backend = mBackendFactory->createBackend(mLogger);
		backend->start(mServiceType,
			[this](const ServiceEvent & aEvent)
			{
				postEvent(aEvent);
			}
		);
	}
	catch (const std::exception & exc)
	{
		backend.reset();
		QMutexLocker lock(&mMtxStatus);
		mStatus = ssError;
		mStartError = QString::fromUtf8(exc.what());
		mCvStarted.wakeAll();
		return;
	}

	{
		QMutexLocker lock(&mMtxStatus);
		mStatus = ssRunning;
		mCvStarted.wakeAll();
	}

	exec();

	backend->stop();
	backend.reset();
}





void ServiceBrowserSession::applyEvent(const ServiceEvent & aEvent)
{
	auto serial = serialFromInstanceName(aEvent.mInstanceName);
	if (serial.isEmpty())
	{
		mLogger.log("Ignoring %1 instance %2, it doesn't match the filter", mServiceType, aEvent.mInstanceName);
		return;
	}
	switch (aEvent.mKind)
	{
		case ServiceEvent::ekAdded:
		case ServiceEvent::ekUpdated:
		{
			if (aEvent.mKind == ServiceEvent::ekAdded)
			{
				mLogger.log("Device %1 is advertising %2 at %3:%4", serial, mServiceType, aEvent.mAddress.toString(), aEvent.mPort);
			}
			mRegistry.upsert(ServiceInfo(serial, aEvent.mAddress, aEvent.mPort, aEvent.mInstanceName));
			break;
		}
		case ServiceEvent::ekRemoved:
		{
			mLogger.log("Device %1 has withdrawn %2", serial, mServiceType);
			mRegistry.markOffline(serial);
			break;
		}
	}
}





void ServiceBrowserSession::processEvents()
{
	QMutexLocker lock(&mMtxEvents);
	while (mIsAccepting && !mEvents.empty())
	{
		auto evt = mEvents.front();
		mEvents.pop_front();
		applyEvent(evt);
	}
}
