#pragma once

#include <QByteArray>
#include <QString>





namespace Utils
{





/** Writes to aDest the two-byte number (MSB first). */
void writeBE16(QByteArray & aDest, quint16 aValue);

/** Writes to aDest the four-byte number (MSB first). */
void writeBE32(QByteArray & aDest, quint32 aValue);

/** Reads 2 bytes out of aData starting at the specified index and returns the big-endian value they represent.
Throws a RuntimeError if there's not enough data. */
quint16 readBE16(const QByteArray & aData, int aIndex = 0);

/** Reads 4 bytes out of aData starting at the specified index and returns the big-endian value they represent.
Throws a RuntimeError if there's not enough data. */
quint32 readBE32(const QByteArray & aData, int aIndex = 0);

/** Returns the entire contents of the specified file.
Throws a RuntimeError if the file cannot be opened. */
QByteArray readWholeFile(const QString & aFileName);

/** Returns a string of the specified length consisting of random ASCII letters and digits.
Uses the system (cryptographically secure) random generator. */
QString randomAlnumString(int aLength);





}  // namespace Utils
