#include "MultiLogger.hpp"

#include <QDir>





MultiLogger::MultiLogger(ComponentCollection & aComponents, const QString & aLogsFolder):
	Super(aComponents),
	mLogsFolder(aLogsFolder)
{
	QObject::connect(&mTimer, &QTimer::timeout, &mTimer,
		[this]()
		{
			flushAllLogs();
		}
	);

	QDir dir;
	if (!dir.mkpath(aLogsFolder))
	{
		throw RuntimeError("Cannot create the logs folder %1", aLogsFolder);
	}
}





void MultiLogger::start()
{
	mTimer.start(1000);
	mainLogger().log("Logging into folder %1", QDir(mLogsFolder).absolutePath());
}





Logger & MultiLogger::logger(const QString & aLoggerName)
{
	QMutexLocker locker(&mMtxLoggers);
	auto itr = mLoggers.find(aLoggerName);
	if (itr != mLoggers.end())
	{
		return *(itr->second.get());
	}
	auto res = mLoggers.insert({aLoggerName, std::make_unique<Logger>(loggerFileName(aLoggerName))});
	return *(res.first->second.get());
}





void MultiLogger::flushAllLogs()
{
	QMutexLocker locker(&mMtxLoggers);
	for (auto & logger: mLoggers)
	{
		logger.second->flush();
	}
}





QString MultiLogger::loggerFileName(QString aLoggerName)
{
	// Sanitize the logger name, device IDs contain colons ("192.168.1.10:5555"):
	static const QString illegal("/\\\"\':;&%*?|<>");
	for (auto & ch: aLoggerName)
	{
		if (ch.unicode() < 32)
		{
			ch = '_';
		}
		else if (illegal.contains(ch))
		{
			ch = '_';
		}
	}

	return mLogsFolder + "/" + aLoggerName + ".log";
}
