#pragma once

#include <QString>
#include <QByteArray>
#include <QMutex>
#include <QFile>
#include "StringFormatter.hpp"





/** A logger that writes its output to a single file.
The log-writing can be called simultaneously from multiple threads (discovery listeners, connection workers).
Note that there's a MultiLogger class / component managing multiple instances of this class.
The logger forces a flush on the log file after every FLUSH_AFTER_N_MESSAGES number of messages written,
and always after a hex dump. */
class Logger
{
protected:

	/** After writing this many messages, the log file is flushed. */
	static const int FLUSH_AFTER_N_MESSAGES = 4;


	/** The file where the log data is actually written. */
	QFile mLogFile;

	/** The mutex protecting mLogFile and mNumMessagesUntilFlush from multithreaded access. */
	QMutex mMtxLogFile;

	/** Number of log messages to be yet written until a flush is forced on the log file. */
	int mNumMessagesUntilFlush;


	/** Returns the current timestamp as a string, to be prepended to each log line. */
	static QString currentTimestamp();

	/** Writes the specified log data into the output file, pre-pending it with the current timestamp. */
	void logInternal(const QByteArray & aLogData);

	/** Writes the specified log data along with a formatted hex dump into the output file,
	pre-pending it with the current timestamp. */
	void logHexInternal(const QByteArray & aHexData, const QByteArray & aLogData);

	/** Flushes the file if enough messages have been written since the last flush.
	Assumes mMtxLogFile is locked by the caller. */
	void flushIfNeeded();


public:

	/** Creates an instance that appends to the specified file.
	Throws a std::runtime_error if the file cannot be opened. */
	explicit Logger(const QString & aFileName);

	/** Writes a formatted string to the log.
	The format string follows QString::arg()'s formatting, aArgs can be anything serializable by QDebug. */
	template <size_t N, typename... T>
	void log(const char (&aFormatString)[N], const T &... aArgs)
	{
		log(QString::fromUtf8(aFormatString, N - 1), aArgs...);
	}

	/** Writes a formatted string to the log.
	The format string follows QString::arg()'s formatting, aArgs can be anything serializable by QDebug. */
	template <typename... T>
	void log(const QString & aFormatString, const T &... aArgs)
	{
		logInternal(StringFormatter::format(aFormatString, aArgs...).toUtf8());
	}

	/** Logs the formatted label, followed by a hex dump of the data.
	The format string follows QString::arg()'s formatting, aArgs can be anything serializable by QDebug. */
	template <size_t N, typename... T>
	void logHex(const QByteArray & aData, const char (&aFormatString)[N], const T &... aArgs)
	{
		logHex(aData, QString::fromUtf8(aFormatString, N - 1), aArgs...);
	}

	/** Logs the formatted label, followed by a hex dump of the data.
	The format string follows QString::arg()'s formatting, aArgs can be anything serializable by QDebug. */
	template <typename... T>
	void logHex(const QByteArray & aData, const QString & aFormatString, const T &... aArgs)
	{
		logHexInternal(aData, StringFormatter::format(aFormatString, aArgs...).toUtf8());
	}

	/** Flushes the log file.
	Can be called from any thread, is thread-safe also in regard to all the logging functions.
	Called periodically by MultiLogger. */
	void flush();
};
