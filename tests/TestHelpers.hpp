#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <set>
#include <QCoreApplication>
#include <QElapsedTimer>
#include <QMutex>
#include <QMutexLocker>
#include <QTemporaryDir>
#include <QThread>
#include "ComponentCollection.hpp"
#include "MultiLogger.hpp"
#include "Settings.hpp"
#include "Comm/AdbToolchain.hpp"
#include "Discovery/ServiceBrowserBackend.hpp"





namespace TestHelpers
{





/** Polls aPredicate (processing the events in between) until it returns true or the timeout elapses.
Returns the last value of the predicate. */
inline bool waitUntil(const std::function<bool ()> & aPredicate, int aTimeoutMsec = 2000)
{
	QElapsedTimer timer;
	timer.start();
	while (!aPredicate())
	{
		if (timer.elapsed() > aTimeoutMsec)
		{
			return aPredicate();
		}
		QCoreApplication::processEvents();
		QThread::msleep(5);
	}
	return true;
}





/** An AdbToolchain that performs no network operations.
Each endpoint's outcome is configurable; endpoints not configured succeed.
A successful connect() makes the endpoint report connected. */
class FakeAdbToolchain:
	public AdbToolchain
{
public:

	FakeAdbToolchain(ComponentCollection & aComponents):
		AdbToolchain(aComponents),
		mIsPairedByDefault(true),
		mNumPairCalls(0),
		mNumConnectCalls(0),
		mNumDisconnectCalls(0)
	{
	}

	virtual void start() override {}

	virtual bool pair(const QString & aAddress, const QString & aPassword) override
	{
		QMutexLocker lock(&mMtx);
		mNumPairCalls += 1;
		mPairPasswords.push_back(aPassword);
		auto itr = mPairResults.find(aAddress);
		return (itr == mPairResults.end()) || itr->second;
	}

	virtual bool connect(const QString & aAddress) override
	{
		std::function<void (const QString &)> hook;
		{
			QMutexLocker lock(&mMtx);
			hook = mConnectHook;
		}
		if (hook)
		{
			hook(aAddress);
		}

		QMutexLocker lock(&mMtx);
		mNumConnectCalls += 1;
		auto itr = mConnectResults.find(aAddress);
		if ((itr != mConnectResults.end()) && !itr->second)
		{
			return false;
		}
		auto failures = mConnectFailures.find(aAddress);
		if ((failures != mConnectFailures.end()) && (failures->second > 0))
		{
			failures->second -= 1;
			return false;
		}
		if (mSilentEndpoints.find(aAddress) == mSilentEndpoints.end())
		{
			mConnected.insert(aAddress);
		}
		return true;
	}

	virtual bool disconnect(const QString & aAddress) override
	{
		QMutexLocker lock(&mMtx);
		mNumDisconnectCalls += 1;
		mConnected.erase(aAddress);
		return true;
	}

	virtual bool isConnected(const QString & aAddress) override
	{
		QMutexLocker lock(&mMtx);
		return (mConnected.find(aAddress) != mConnected.end());
	}

	virtual bool isPaired(const QString & aSerialNumber) override
	{
		QMutexLocker lock(&mMtx);
		auto itr = mPaired.find(aSerialNumber);
		return (itr == mPaired.end()) ? mIsPairedByDefault : itr->second;
	}

	void setPairResult(const QString & aAddress, bool aResult)
	{
		QMutexLocker lock(&mMtx);
		mPairResults[aAddress] = aResult;
	}

	void setConnectResult(const QString & aAddress, bool aResult)
	{
		QMutexLocker lock(&mMtx);
		mConnectResults[aAddress] = aResult;
	}

	/** The next aNumFailures connect() calls to the endpoint are rejected, the later ones succeed. */
	void setConnectFailures(const QString & aAddress, int aNumFailures)
	{
		QMutexLocker lock(&mMtx);
		mConnectFailures[aAddress] = aNumFailures;
	}

	/** The hook is called at the start of each connect(), on the connecting thread, without any lock held.
	Used to hold a connect() in progress. */
	void setConnectHook(std::function<void (const QString &)> aHook)
	{
		QMutexLocker lock(&mMtx);
		mConnectHook = std::move(aHook);
	}

	/** The endpoint accepts connect() but never reports connected. */
	void setSilent(const QString & aAddress)
	{
		QMutexLocker lock(&mMtx);
		mSilentEndpoints.insert(aAddress);
	}

	void setPaired(const QString & aSerialNumber, bool aIsPaired)
	{
		QMutexLocker lock(&mMtx);
		mPaired[aSerialNumber] = aIsPaired;
	}

	void setPairedByDefault(bool aIsPaired)
	{
		QMutexLocker lock(&mMtx);
		mIsPairedByDefault = aIsPaired;
	}

	/** Simulates the device dropping its connection. */
	void dropConnection(const QString & aAddress)
	{
		QMutexLocker lock(&mMtx);
		mConnected.erase(aAddress);
	}

	int numPairCalls() const { QMutexLocker lock(&mMtx); return mNumPairCalls; }
	int numConnectCalls() const { QMutexLocker lock(&mMtx); return mNumConnectCalls; }
	int numDisconnectCalls() const { QMutexLocker lock(&mMtx); return mNumDisconnectCalls; }
	QStringList pairPasswords() const { QMutexLocker lock(&mMtx); return mPairPasswords; }


protected:

	mutable QMutex mMtx;
	std::map<QString, bool> mPairResults;
	std::map<QString, bool> mConnectResults;
	std::map<QString, int> mConnectFailures;
	std::function<void (const QString &)> mConnectHook;
	std::map<QString, bool> mPaired;
	std::set<QString> mSilentEndpoints;
	std::set<QString> mConnected;
	bool mIsPairedByDefault;
	int mNumPairCalls;
	int mNumConnectCalls;
	int mNumDisconnectCalls;
	QStringList mPairPasswords;
};





class FakeBackendFactory;





/** A browser backend that binds nothing; the test injects the events through its FakeBackendFactory. */
class FakeBackend:
	public ServiceBrowserBackend
{
public:

	explicit FakeBackend(FakeBackendFactory & aFactory):
		mFactory(aFactory)
	{
	}

	virtual void start(const QString & aServiceType, EventSink aEventSink) override;
	virtual void stop() override;


protected:

	FakeBackendFactory & mFactory;
};





/** Creates FakeBackend instances and keeps the event sink of the most recently started backend
of each service type, so that the tests can inject the events from any thread.
The sinks are kept even after the backend stops, so that late events can be injected too. */
class FakeBackendFactory:
	public ServiceBrowserBackendFactory
{
	friend class FakeBackend;

public:

	FakeBackendFactory(ComponentCollection & aComponents):
		ServiceBrowserBackendFactory(aComponents),
		mShouldFailStart(false),
		mNumStarted(0),
		mNumStopped(0)
	{
	}

	virtual void start() override {}

	virtual ServiceBrowserBackendPtr createBackend(Logger & aLogger) override
	{
		Q_UNUSED(aLogger);
		return std::make_unique<FakeBackend>(*this);
	}

	/** Sends the event into the sink of the most recent backend browsing for the event's service type.
	Returns false if there has been no such backend. */
	bool inject(const ServiceEvent & aEvent)
	{
		ServiceBrowserBackend::EventSink sink;
		{
			QMutexLocker lock(&mMtx);
			auto itr = mSinks.find(aEvent.mServiceType);
			if (itr == mSinks.end())
			{
				return false;
			}
			sink = itr->second;
		}
		sink(aEvent);
		return true;
	}

	/** Makes the subsequent backend starts fail, as if the mDNS port couldn't be bound. */
	void setShouldFailStart(bool aShouldFail) { mShouldFailStart = aShouldFail; }

	int numStarted() const { return mNumStarted; }
	int numStopped() const { return mNumStopped; }


protected:

	QMutex mMtx;
	std::map<QString, ServiceBrowserBackend::EventSink> mSinks;
	std::atomic<bool> mShouldFailStart;
	std::atomic<int> mNumStarted;
	std::atomic<int> mNumStopped;
};





inline void FakeBackend::start(const QString & aServiceType, EventSink aEventSink)
{
	if (mFactory.mShouldFailStart)
	{
		throw RuntimeError("Cannot bind the mDNS socket: %1", "address in use");
	}
	{
		QMutexLocker lock(&mFactory.mMtx);
		mFactory.mSinks[aServiceType] = std::move(aEventSink);
	}
	mFactory.mNumStarted += 1;
}





inline void FakeBackend::stop()
{
	mFactory.mNumStopped += 1;
}





/** A ComponentCollection with a MultiLogger writing into a temporary folder,
a FakeAdbToolchain and a FakeBackendFactory. Further components may be added before start(). */
class TestComponents
{
public:

	TestComponents()
	{
		mCC.addNew<MultiLogger>(mLogsDir.path());
		mToolchain = mCC.addNew<FakeAdbToolchain>();
		mBackendFactory = mCC.addNew<FakeBackendFactory>();
	}

	ComponentCollection & cc() { return mCC; }
	FakeAdbToolchain & toolchain() { return *mToolchain; }
	FakeBackendFactory & backendFactory() { return *mBackendFactory; }
	std::shared_ptr<FakeBackendFactory> backendFactoryPtr() { return mBackendFactory; }
	Logger & logger() { return mCC.logger("test"); }


protected:

	QTemporaryDir mLogsDir;
	ComponentCollection mCC;
	std::shared_ptr<FakeAdbToolchain> mToolchain;
	std::shared_ptr<FakeBackendFactory> mBackendFactory;
};





/** Overrides the timeouts so that the failing paths finish quickly. */
inline void useShortTimeouts()
{
	Settings::overrideValue("Connection", "ConnectTimeoutMsec", 300);
	Settings::overrideValue("Connection", "ResolveTimeoutMsec", 200);
	Settings::overrideValue("Connection", "ConnectAttempts", 2);
	Settings::overrideValue("Pairing", "CandidateTimeoutMsec", 300);
	Settings::overrideValue("Pairing", "MaxAttempts", 2);
}





}  // namespace TestHelpers
