#include <gtest/gtest.h>
#include "Comm/DnsMessage.hpp"
#include "Utils.hpp"





/** Writes the DNS header of a response with the specified number of answers. */
static QByteArray responseHeader(quint16 aNumAnswers)
{
	QByteArray res;
	Utils::writeBE16(res, 0);
	Utils::writeBE16(res, 0x8400);  // Response, authoritative
	Utils::writeBE16(res, 0);
	Utils::writeBE16(res, aNumAnswers);
	Utils::writeBE16(res, 0);
	Utils::writeBE16(res, 0);
	return res;
}





TEST(DnsMessageTest, EncodeQuery)
{
	auto query = DnsMessage::encodeQuery("_adb._tcp.local", DnsMessage::rtPtr);
	QByteArray expected(
		"\x00\x00" "\x00\x00" "\x00\x01" "\x00\x00" "\x00\x00" "\x00\x00"
		"\x04_adb" "\x04_tcp" "\x05local" "\x00"
		"\x00\x0c" "\x00\x01",
		12 + 17 + 4
	);
	EXPECT_EQ(query, expected);
}





TEST(DnsMessageTest, WriteNameRejectsLongLabels)
{
	QByteArray dest;
	EXPECT_THROW(DnsMessage::writeName(dest, QString(64, 'a') + ".local"), LogicError);
	QByteArray ok;
	DnsMessage::writeName(ok, QString(63, 'a') + ".local");
	EXPECT_EQ(ok.size(), 1 + 63 + 1 + 5 + 1);
}





TEST(DnsMessageTest, ReadNameFollowsCompression)
{
	QByteArray msg;
	DnsMessage::writeName(msg, "_adb-tls-connect._tcp.local");
	auto secondStart = msg.size();
	msg.append("\x04host", 5);
	msg.append("\xc0\x00", 2);  // Pointer to the first name
	auto afterSecond = msg.size();

	int pos = 0;
	EXPECT_EQ(DnsMessage::readName(msg, pos), "_adb-tls-connect._tcp.local");
	EXPECT_EQ(pos, secondStart);
	EXPECT_EQ(DnsMessage::readName(msg, pos), "host._adb-tls-connect._tcp.local");
	EXPECT_EQ(pos, afterSecond);
}





TEST(DnsMessageTest, ReadNameDetectsPointerLoop)
{
	QByteArray msg("\x01" "a" "\xc0\x00", 4);
	int pos = 0;
	EXPECT_THROW(DnsMessage::readName(msg, pos), DnsMessage::ParseError);
}





TEST(DnsMessageTest, ReadNameDetectsTruncation)
{
	QByteArray msg("\x05" "ab", 3);
	int pos = 0;
	EXPECT_THROW(DnsMessage::readName(msg, pos), DnsMessage::ParseError);
}





TEST(DnsMessageTest, DecodeResponseRecords)
{
	auto msg = responseHeader(2);

	// SRV with cache-flush class:
	DnsMessage::writeName(msg, "dev._adb-tls-connect._tcp.local");
	Utils::writeBE16(msg, DnsMessage::rtSrv);
	Utils::writeBE16(msg, 0x8001);
	Utils::writeBE32(msg, 120);
	QByteArray srvData;
	Utils::writeBE16(srvData, 0);
	Utils::writeBE16(srvData, 0);
	Utils::writeBE16(srvData, 41234);
	DnsMessage::writeName(srvData, "android.local");
	Utils::writeBE16(msg, static_cast<quint16>(srvData.size()));
	msg.append(srvData);

	// A:
	DnsMessage::writeName(msg, "android.local");
	Utils::writeBE16(msg, DnsMessage::rtA);
	Utils::writeBE16(msg, 1);
	Utils::writeBE32(msg, 120);
	Utils::writeBE16(msg, 4);
	Utils::writeBE32(msg, QHostAddress("192.168.1.33").toIPv4Address());

	auto records = DnsMessage::decodeResponse(msg);
	ASSERT_EQ(records.size(), 2);
	EXPECT_EQ(records[0].mType, DnsMessage::rtSrv);
	EXPECT_EQ(records[0].mClass, 1);
	EXPECT_EQ(records[0].mPort, 41234);
	EXPECT_EQ(records[0].mTarget, "android.local");
	EXPECT_EQ(records[1].mName, "android.local");
	EXPECT_EQ(records[1].mAddress, QHostAddress("192.168.1.33"));
}





TEST(DnsMessageTest, QueriesYieldNoRecords)
{
	auto query = DnsMessage::encodeQuery("_adb-tls-pairing._tcp.local", DnsMessage::rtPtr);
	EXPECT_TRUE(DnsMessage::decodeResponse(query).isEmpty());
}





TEST(DnsMessageTest, TruncatedResponseThrows)
{
	EXPECT_THROW(DnsMessage::decodeResponse(QByteArray("\x00\x00\x84", 3)), DnsMessage::ParseError);

	auto msg = responseHeader(1);
	DnsMessage::writeName(msg, "android.local");
	Utils::writeBE16(msg, DnsMessage::rtA);
	Utils::writeBE16(msg, 1);
	Utils::writeBE32(msg, 120);
	Utils::writeBE16(msg, 4);
	msg.append("\xc0\xa8", 2);  // Only half of the address
	EXPECT_THROW(DnsMessage::decodeResponse(msg), DnsMessage::ParseError);
}
