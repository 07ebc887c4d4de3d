#include "DnsMessage.hpp"
#include "../Utils.hpp"





/** Size of the fixed DNS message header. */
static const int HEADER_SIZE = 12;

/** The "response" flag in the header flags field. */
static const quint16 FLAG_RESPONSE = 0x8000;

/** The mDNS cache-flush bit, stored in the class field of the resource records. */
static const quint16 CLASS_CACHE_FLUSH = 0x8000;

/** The DNS "IN" class. */
static const quint16 CLASS_IN = 1;

/** Maximum number of compression pointers followed while reading a single name. */
static const int MAX_COMPRESSION_JUMPS = 32;





namespace DnsMessage
{





QByteArray encodeQuery(const QString & aName, quint16 aType)
{
	QByteArray res;
	Utils::writeBE16(res, 0);  // ID, mDNS uses zero
	Utils::writeBE16(res, 0);  // Flags: standard query
	Utils::writeBE16(res, 1);  // QDCOUNT
	Utils::writeBE16(res, 0);  // ANCOUNT
	Utils::writeBE16(res, 0);  // NSCOUNT
	Utils::writeBE16(res, 0);  // ARCOUNT
	writeName(res, aName);
	Utils::writeBE16(res, aType);
	Utils::writeBE16(res, CLASS_IN);
	return res;
}





void writeName(QByteArray & aDest, const QString & aName)
{
	for (const auto & label: aName.split('.', Qt::SkipEmptyParts))
	{
		auto utf8 = label.toUtf8();
		if (utf8.size() > 63)
		{
			throw LogicError("DNS label too long: %1", label);
		}
		aDest.push_back(static_cast<char>(utf8.size()));
		aDest.append(utf8);
	}
	aDest.push_back('\0');
}





QString readName(const QByteArray & aMessage, int & aPos)
{
	QStringList labels;
	int pos = aPos;
	int numJumps = 0;
	bool hasJumped = false;
	while (true)
	{
		if (pos >= aMessage.size())
		{
			throw ParseError("DNS name runs past the end of the message at offset %1", pos);
		}
		auto len = static_cast<quint8>(aMessage[pos]);
		if (len == 0)
		{
			pos += 1;
			break;
		}
		if ((len & 0xc0) == 0xc0)
		{
			// Compression pointer
			if (pos + 1 >= aMessage.size())
			{
				throw ParseError("Truncated DNS compression pointer at offset %1", pos);
			}
			if (++numJumps > MAX_COMPRESSION_JUMPS)
			{
				throw ParseError("Too many DNS compression pointers in a name at offset %1", aPos);
			}
			auto target = static_cast<int>(Utils::readBE16(aMessage, pos) & 0x3fff);
			if (!hasJumped)
			{
				aPos = pos + 2;
				hasJumped = true;
			}
			pos = target;
			continue;
		}
		if ((len & 0xc0) != 0)
		{
			throw ParseError("Unsupported DNS label type 0x%1 at offset %2", QString::number(len, 16), pos);
		}
		if (pos + 1 + len > aMessage.size())
		{
			throw ParseError("DNS label runs past the end of the message at offset %1", pos);
		}
		labels.append(QString::fromUtf8(aMessage.constData() + pos + 1, len));
		pos += 1 + len;
	}
	if (!hasJumped)
	{
		aPos = pos;
	}
	return labels.join('.');
}





/** Decodes the RDATA of the record, based on its type.
aPos points to the start of the RDATA, aLength is its length. */
static void decodeRecordData(const QByteArray & aMessage, int aPos, int aLength, Record & aRecord)
{
	switch (aRecord.mType)
	{
		case rtPtr:
		{
			int pos = aPos;
			aRecord.mTarget = readName(aMessage, pos);
			break;
		}
		case rtSrv:
		{
			if (aLength < 7)
			{
				throw ParseError("SRV record too short: %1 bytes", aLength);
			}
			// Priority and weight are not used
			aRecord.mPort = Utils::readBE16(aMessage, aPos + 4);
			int pos = aPos + 6;
			aRecord.mTarget = readName(aMessage, pos);
			break;
		}
		case rtA:
		{
			if (aLength != 4)
			{
				throw ParseError("A record has invalid length: %1 bytes", aLength);
			}
			aRecord.mAddress = QHostAddress(Utils::readBE32(aMessage, aPos));
			break;
		}
		case rtAaaa:
		{
			if (aLength != 16)
			{
				throw ParseError("AAAA record has invalid length: %1 bytes", aLength);
			}
			aRecord.mAddress = QHostAddress(reinterpret_cast<const quint8 *>(aMessage.constData() + aPos));
			break;
		}
		case rtTxt:
		{
			int pos = aPos;
			const int end = aPos + aLength;
			while (pos < end)
			{
				auto len = static_cast<quint8>(aMessage[pos]);
				if (pos + 1 + len > end)
				{
					throw ParseError("TXT record string runs past the record end at offset %1", pos);
				}
				if (len > 0)
				{
					aRecord.mTexts.append(QString::fromUtf8(aMessage.constData() + pos + 1, len));
				}
				pos += 1 + len;
			}
			break;
		}
		default:
		{
			// Not interested in other record types
			break;
		}
	}
}





QList<Record> decodeResponse(const QByteArray & aMessage)
{
	if (aMessage.size() < HEADER_SIZE)
	{
		throw ParseError("DNS message too short: %1 bytes", aMessage.size());
	}
	auto flags = Utils::readBE16(aMessage, 2);
	if ((flags & FLAG_RESPONSE) == 0)
	{
		// A query from another host, nothing to decode
		return {};
	}
	auto numQuestions = Utils::readBE16(aMessage, 4);
	auto numRecords =
		static_cast<int>(Utils::readBE16(aMessage, 6)) +
		static_cast<int>(Utils::readBE16(aMessage, 8)) +
		static_cast<int>(Utils::readBE16(aMessage, 10));

	// Skip the questions:
	int pos = HEADER_SIZE;
	for (int i = 0; i < numQuestions; ++i)
	{
		readName(aMessage, pos);
		pos += 4;  // QTYPE, QCLASS
	}

	// Decode the records:
	QList<Record> res;
	for (int i = 0; i < numRecords; ++i)
	{
		Record rec;
		rec.mName = readName(aMessage, pos);
		if (pos + 10 > aMessage.size())
		{
			throw ParseError("DNS record header runs past the end of the message at offset %1", pos);
		}
		rec.mType = Utils::readBE16(aMessage, pos);
		rec.mClass = static_cast<quint16>(Utils::readBE16(aMessage, pos + 2) & ~CLASS_CACHE_FLUSH);
		rec.mTtl = Utils::readBE32(aMessage, pos + 4);
		auto dataLength = static_cast<int>(Utils::readBE16(aMessage, pos + 8));
		pos += 10;
		if (pos + dataLength > aMessage.size())
		{
			throw ParseError("DNS record data runs past the end of the message at offset %1", pos);
		}
		decodeRecordData(aMessage, pos, dataLength, rec);
		pos += dataLength;
		res.append(rec);
	}
	return res;
}





}  // namespace DnsMessage
