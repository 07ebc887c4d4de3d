#include "Utils.hpp"
#include <QFile>
#include <QRandomGenerator>
#include "Exception.hpp"





namespace Utils
{





void writeBE16(QByteArray & aDest, quint16 aValue)
{
	aDest.push_back(static_cast<char>((aValue >> 8) & 0xff));
	aDest.push_back(static_cast<char>(aValue        & 0xff));
}





void writeBE32(QByteArray & aDest, quint32 aValue)
{
	aDest.push_back(static_cast<char>((aValue >> 24) & 0xff));
	aDest.push_back(static_cast<char>((aValue >> 16) & 0xff));
	aDest.push_back(static_cast<char>((aValue >> 8)  & 0xff));
	aDest.push_back(static_cast<char>(aValue         & 0xff));
}





quint16 readBE16(const QByteArray & aData, int aIndex)
{
	if ((aIndex < 0) || (aData.size() < aIndex + 2))
	{
		throw RuntimeError("Cannot read BE16 at index %1, only %2 bytes available", aIndex, aData.size());
	}
	return readBE16(reinterpret_cast<const quint8 *>(aData.constData()) + aIndex);
}





quint32 readBE32(const QByteArray & aData, int aIndex)
{
	if ((aIndex < 0) || (aData.size() < aIndex + 4))
	{
		throw RuntimeError("Cannot read BE32 at index %1, only %2 bytes available", aIndex, aData.size());
	}
	return readBE32(reinterpret_cast<const quint8 *>(aData.constData()) + aIndex);
}





QByteArray readWholeFile(const QString & aFileName)
{
	QFile f(aFileName);
	if (!f.open(QFile::ReadOnly))
	{
		throw RuntimeError("Cannot open file %1", aFileName);
	}
	return f.readAll();
}





QString randomAlnumString(int aLength)
{
	static const char alphabet[] =
		"ABCDEFGHIJKLMNOPQRSTUVWXYZ"
		"abcdefghijklmnopqrstuvwxyz"
		"0123456789";
	static const int alphabetSize = static_cast<int>(sizeof(alphabet) - 1);
	QString res;
	res.reserve(aLength);
	auto rng = QRandomGenerator::system();
	for (int i = 0; i < aLength; ++i)
	{
		res.append(QChar::fromLatin1(alphabet[rng->bounded(alphabetSize)]));
	}
	return res;
}





}  // namespace Utils
