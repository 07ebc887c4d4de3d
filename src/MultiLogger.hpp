#pragma once

#include <map>
#include <memory>
#include <QMutex>
#include <QTimer>

#include "ComponentCollection.hpp"
#include "Logger.hpp"





/** Manages multiple loggers by-device and by-subsystem.
Each logger writes into its own file in the logs folder, named after the logger.
All loggers are flushed periodically from the thread that started the component. */
class MultiLogger:
	public ComponentCollection::Component<ComponentCollection::ckMultiLogger>
{
	using Super = ComponentCollection::Component<ComponentCollection::ckMultiLogger>;


public:

	/** Creates the MultiLogger that stores its log files in the specified folder.
	The folder is created if it doesn't exist. */
	MultiLogger(ComponentCollection & aComponents, const QString & aLogsFolder);

	// ComponentCollection::ComponentBase override:
	virtual void start() override;

	/** Returns the main logger. */
	Logger & mainLogger() { return logger("main"); }

	/** Returns the logger for the specified name (device / subsystem).
	If there's no such logger yet, creates one and starts its logfile. */
	Logger & logger(const QString & aLoggerName);

	/** Flushes all the loggers. */
	void flushAllLogs();


protected:

	/** The folder where to store the log files. */
	QString mLogsFolder;

	/** All the loggers currently known.
	Protected against multithreaded access by mMtxLoggers. */
	std::map<QString, std::unique_ptr<Logger>> mLoggers;

	/** Protects mLoggers against multithreaded access. */
	QMutex mMtxLoggers;

	/** The timer used for periodic flushing of all the logs. */
	QTimer mTimer;


	/** Returns the name of the file to which the specified logger should write. */
	QString loggerFileName(QString aLoggerName);
};
