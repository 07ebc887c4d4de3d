#pragma once

#include <QByteArray>
#include <QHostAddress>
#include <QList>
#include <QString>
#include <QStringList>
#include "../Exception.hpp"





/** Encoding of the multicast DNS queries and decoding of the mDNS responses (RFC 1035, RFC 6762).
Only the record types needed for DNS-SD browsing are decoded (PTR, SRV, A, AAAA, TXT);
other records are skipped. */
namespace DnsMessage
{





/** Thrown when the received datagram is not a valid DNS message. */
class ParseError:
	public RuntimeError
{
public:
	using RuntimeError::RuntimeError;
};





/** The DNS record types that are of interest. */
enum RecordType
{
	rtA    = 1,
	rtPtr  = 12,
	rtTxt  = 16,
	rtAaaa = 28,
	rtSrv  = 33,
	rtAny  = 255,
};





/** A single decoded resource record. */
struct Record
{
	/** The owner name of the record, dot-separated, without the trailing dot. */
	QString mName;

	/** The record type, one of RecordType for the records that are decoded. */
	quint16 mType;

	/** The record class, with the mDNS cache-flush bit removed. */
	quint16 mClass;

	/** The time-to-live, in seconds. Zero means the record is being withdrawn (goodbye). */
	quint32 mTtl;

	/** The target name of a PTR or SRV record. */
	QString mTarget;

	/** The port of a SRV record. */
	quint16 mPort;

	/** The address of an A or AAAA record. */
	QHostAddress mAddress;

	/** The strings of a TXT record. */
	QStringList mTexts;


	Record():
		mType(0),
		mClass(0),
		mTtl(0),
		mPort(0)
	{
	}
};





/** Returns a complete DNS query message asking for aType records of aName (class IN).
aName is dot-separated ("_adb-tls-connect._tcp.local"). */
QByteArray encodeQuery(const QString & aName, quint16 aType);

/** Writes aName to aDest as a sequence of DNS labels terminated by the root label.
Throws a LogicError if any label is longer than 63 bytes. */
void writeName(QByteArray & aDest, const QString & aName);

/** Reads a (possibly compressed) name from aMessage starting at aPos.
Advances aPos past the name as it is stored at that position (a compression pointer takes 2 bytes).
Throws a ParseError on malformed data, including compression pointer loops. */
QString readName(const QByteArray & aMessage, int & aPos);

/** Decodes all the resource records (answers, authority and additional) in the specified response.
Queries (messages without the response flag) yield no records.
Throws a ParseError if the message is malformed. */
QList<Record> decodeResponse(const QByteArray & aMessage);





}  // namespace DnsMessage
