#include "ServiceRegistry.hpp"
#include <QDeadlineTimer>
#include <QMutexLocker>





ServiceRegistry::ServiceRegistry():
	mInterruptGeneration(0)
{
}





void ServiceRegistry::upsert(const ServiceInfo & aInfo)
{
	Entry entry{aInfo, true};
	entry.mInfo.mLastSeen = QDateTime::currentDateTimeUtc();
	QMutexLocker lock(&mMtx);
	mEntries[aInfo.mSerialNumber] = entry;
	mCvChanged.wakeAll();
}





bool ServiceRegistry::markOffline(const QString & aSerialNumber)
{
	QMutexLocker lock(&mMtx);
	auto itr = mEntries.find(aSerialNumber);
	if (itr == mEntries.end())
	{
		return false;
	}
	itr->second = Entry{itr->second.mInfo, false};
	mCvChanged.wakeAll();
	return true;
}





void ServiceRegistry::remove(const QString & aSerialNumber)
{
	QMutexLocker lock(&mMtx);
	if (mEntries.erase(aSerialNumber) > 0)
	{
		mCvChanged.wakeAll();
	}
}





void ServiceRegistry::clear()
{
	QMutexLocker lock(&mMtx);
	mEntries.clear();
	mCvChanged.wakeAll();
}





ServiceRegistry::Snapshot ServiceRegistry::snapshot() const
{
	Snapshot res;
	QMutexLocker lock(&mMtx);
	for (const auto & entry: mEntries)
	{
		if (entry.second.mIsOnline)
		{
			res.mOnline[entry.first] = entry.second.mInfo;
		}
		else
		{
			res.mOffline[entry.first] = entry.second.mInfo;
		}
	}
	return res;
}





Optional<ServiceInfo> ServiceRegistry::lookup(const QString & aSerialNumber) const
{
	QMutexLocker lock(&mMtx);
	auto itr = mEntries.find(aSerialNumber);
	if (itr == mEntries.end())
	{
		return {};
	}
	return itr->second.mInfo;
}





bool ServiceRegistry::isOnline(const QString & aSerialNumber) const
{
	QMutexLocker lock(&mMtx);
	auto itr = mEntries.find(aSerialNumber);
	return ((itr != mEntries.end()) && itr->second.mIsOnline);
}





std::vector<ServiceInfo> ServiceRegistry::freshOnline(qint64 aMaxAgeSec) const
{
	QMutexLocker lock(&mMtx);
	return freshOnlineLocked(aMaxAgeSec);
}





Optional<ServiceInfo> ServiceRegistry::waitForOnline(const QString & aSerialNumber, int aTimeoutMsec)
{
	QDeadlineTimer deadline(aTimeoutMsec);
	QMutexLocker lock(&mMtx);
	auto generation = mInterruptGeneration;
	while (true)
	{
		auto itr = mEntries.find(aSerialNumber);
		if ((itr != mEntries.end()) && itr->second.mIsOnline)
		{
			return itr->second.mInfo;
		}
		if ((generation != mInterruptGeneration) || deadline.hasExpired())
		{
			return {};
		}
		mCvChanged.wait(&mMtx, deadline);
	}
}





bool ServiceRegistry::waitForFreshOnline(qint64 aMaxAgeSec, int aTimeoutMsec)
{
	return waitForFreshOnline(aMaxAgeSec, aTimeoutMsec, interruptGeneration());
}





bool ServiceRegistry::waitForFreshOnline(qint64 aMaxAgeSec, int aTimeoutMsec, quint64 aGeneration)
{
	QDeadlineTimer deadline(aTimeoutMsec);
	QMutexLocker lock(&mMtx);
	while (true)
	{
		if (!freshOnlineLocked(aMaxAgeSec).empty())
		{
			return true;
		}
		if ((aGeneration != mInterruptGeneration) || deadline.hasExpired())
		{
			return false;
		}
		mCvChanged.wait(&mMtx, deadline);
	}
}





quint64 ServiceRegistry::interruptGeneration() const
{
	QMutexLocker lock(&mMtx);
	return mInterruptGeneration;
}





void ServiceRegistry::interruptWaits()
{
	QMutexLocker lock(&mMtx);
	mInterruptGeneration += 1;
	mCvChanged.wakeAll();
}





std::vector<ServiceInfo> ServiceRegistry::freshOnlineLocked(qint64 aMaxAgeSec) const
{
	std::vector<ServiceInfo> res;
	auto now = QDateTime::currentDateTimeUtc();
	for (const auto & entry: mEntries)
	{
		if (!entry.second.mIsOnline)
		{
			continue;
		}
		if (entry.second.mInfo.mLastSeen.secsTo(now) <= aMaxAgeSec)
		{
			res.push_back(entry.second.mInfo);
		}
	}
	return res;
}
