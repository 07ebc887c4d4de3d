#pragma once

#include <stdexcept>

#include <QString>
#include <QDebug>

#include "Logger.hpp"





/** The base of all exceptions thrown by AdbMesh.
The description is formatted by StringFormatter (QString::arg()-style placeholders), and optionally also
written to a logger at the moment the exception is constructed.
Usage:
throw Exception(logger, "Cannot bind to port %1", port);
throw Exception("Cannot bind to port %1", port);
*/
class Exception:
	public std::runtime_error
{
public:

	/** Creates an exception with the specified values formatted (as in QString.arg()) as the description.
	Logs the exception text to the specified logger. */
	template <typename... OtherTs>
	Exception(Logger & aLogger, const QString & aFormatString, const OtherTs &... aArgValues):
		std::runtime_error(formatAndLog(aLogger, aFormatString, aArgValues...).toStdString())
	{
	}


	/** Creates an exception with the specified values formatted (as in QString.arg()) as the description. */
	template <typename... OtherTs>
	Exception(const QString & aFormatString, const OtherTs &... aArgValues):
		std::runtime_error(StringFormatter::format(aFormatString, aArgValues...).toStdString())
	{
	}


	/** Returns the description as a QString, for relaying into results and signals. */
	QString message() const
	{
		return QString::fromStdString(what());
	}


protected:


	/** Formats the message, sends it to the specified logger and returns it. */
	template <typename... OtherTs>
	static QString formatAndLog(Logger & aLogger, const QString & aFormatString, const OtherTs &... aValues)
	{
		auto res = StringFormatter::format(aFormatString, aValues...);
		aLogger.log("ERROR: %1", res);
		return res;
	}
};





/** Descendant to be used for errors in the runtime (network, remote peer, environment). */
class RuntimeError: public Exception
{
public:
	using Exception::Exception;
};





/** Descendant to be used for errors that indicate a bug in the program (API misuse). */
class LogicError: public Exception
{
public:
	using Exception::Exception;
};
