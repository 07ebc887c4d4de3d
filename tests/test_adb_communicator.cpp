#include <gtest/gtest.h>
#include "Comm/AdbCommunicator.hpp"





TEST(AdbCommunicatorTest, ParseDeviceListSortsByStatus)
{
	QList<QByteArray> online, unauth, other;
	AdbCommunicator::parseDeviceList(
		"R58M123ABC\tdevice\n"
		"192.168.1.20:40111\tdevice\n"
		"ZY2233XXQQ\tunauthorized\n"
		"AB12CD34EF\tauthorizing\n"
		"0123456789\toffline\n"
		"FASTBOOT01\tbootloader\n",
		online, unauth, other
	);
	EXPECT_EQ(online, QList<QByteArray>({"R58M123ABC", "192.168.1.20:40111"}));
	EXPECT_EQ(unauth, QList<QByteArray>({"ZY2233XXQQ", "AB12CD34EF"}));
	EXPECT_EQ(other, QList<QByteArray>({"0123456789", "FASTBOOT01"}));
}





TEST(AdbCommunicatorTest, ParseDeviceListSkipsBadLines)
{
	QList<QByteArray> online, unauth, other;
	AdbCommunicator::parseDeviceList(
		"\n"
		"no-tab-in-this-line\n"
		"short\tdevice\n"
		"R58M123ABC\tdevice\r\n",
		online, unauth, other
	);
	EXPECT_EQ(online, QList<QByteArray>({"R58M123ABC"}));
	EXPECT_TRUE(unauth.isEmpty());
	EXPECT_TRUE(other.isEmpty());
}





TEST(AdbCommunicatorTest, ParseMdnsServices)
{
	auto services = AdbCommunicator::parseMdnsServices(
		"adb-R58M123ABC-x2YzAb\t_adb-tls-connect._tcp\t192.168.1.20:40111\n"
		"adb-R58M123ABC-x2YzAb\t_adb-tls-pairing._tcp\t192.168.1.20:37099\n"
	);
	ASSERT_EQ(services.size(), 2);
	EXPECT_EQ(services[0].mInstanceName, "adb-R58M123ABC-x2YzAb");
	EXPECT_EQ(services[0].mServiceType, "_adb-tls-connect._tcp");
	EXPECT_EQ(services[0].mAddress, QHostAddress("192.168.1.20"));
	EXPECT_EQ(services[0].mPort, 40111);
	EXPECT_EQ(services[1].mServiceType, "_adb-tls-pairing._tcp");
	EXPECT_EQ(services[1].mPort, 37099);
}





TEST(AdbCommunicatorTest, ParseMdnsServicesSkipsMalformed)
{
	auto services = AdbCommunicator::parseMdnsServices(
		"only-a-name\n"
		"name\t_adb-tls-connect._tcp\tnoport\n"
		"name\t_adb-tls-connect._tcp\t192.168.1.20:notaport\n"
		"name\t_adb-tls-connect._tcp\tnot.an.ip.address:5555\n"
		"\n"
		"good\t_adb-tls-connect._tcp\t10.0.0.1:5555\n"
	);
	ASSERT_EQ(services.size(), 1);
	EXPECT_EQ(services[0].mInstanceName, "good");
	EXPECT_EQ(services[0].mAddress, QHostAddress("10.0.0.1"));
	EXPECT_EQ(services[0].mPort, 5555);
}
