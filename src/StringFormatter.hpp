#pragma once

#include <string>
#include <QString>
#include <QDebug>





/** Allow sending (an Utf-8-encoded) std::string directly to QDebug. */
inline QDebug operator << (QDebug aDebug, const std::string & aStr)
{
	return (aDebug << QString::fromStdString(aStr));
}





/** Provides functions for formatting string using QString::arg(),
but the arguments are stringified using QDebug.
This enables us to output many more custom types very simply (QHostAddress, QByteArray, enums...).
All arguments are substituted in a single pass, so an argument that itself contains "%1" is not expanded again. */
namespace StringFormatter
{





/** Simple wrapper over QDebug that requires an output string and sets the underlying QDebug to nospace, noquote. */
class Debug:
	public QDebug
{
	using Super = QDebug;


public:

	Debug(QString * aOutput):
		Super(aOutput)
	{
		nospace();
		noquote();
	}
};





/** Returns the QDebug representation of the single value. */
template <typename ArgType>
inline QString stringify(const ArgType & aArg)
{
	QString res;
	Debug(&res) << aArg;
	return res;
}





/** Returns the format string unchanged (no arguments to substitute). */
inline QString format(const QString & aFormatString)
{
	return aFormatString;
}





/** Returns the format string with the %1 placeholder replaced by the stringified argument. */
template <typename ArgType>
inline QString format(const QString & aFormatString, const ArgType & aArg)
{
	return aFormatString.arg(stringify(aArg));
}





/** Returns the format string with all the %N placeholders replaced by the stringified arguments. */
template <typename ArgType1, typename ArgType2, typename... OtherArgTypes>
inline QString format(
	const QString & aFormatString,
	const ArgType1 & aArg1,
	const ArgType2 & aArg2,
	const OtherArgTypes &... aOtherArgs
)
{
	return aFormatString.arg(stringify(aArg1), stringify(aArg2), stringify(aOtherArgs)...);
}

}  // namespace StringFormatter
