#include <gtest/gtest.h>
#include <thread>
#include "TestHelpers.hpp"
#include "Discovery/AdbConnectionDiscovery.hpp"

using namespace TestHelpers;





class AdbConnectionDiscoveryTest:
	public ::testing::Test
{
protected:

	TestComponents mComponents;
	std::shared_ptr<AdbConnectionDiscovery> mDiscovery;

	void SetUp() override
	{
		mDiscovery = mComponents.cc().addNew<AdbConnectionDiscovery>();
		mComponents.cc().start();
	}

	void TearDown() override
	{
		mDiscovery->stopDiscoveryListener();
	}

	void advertise(ServiceEvent::Kind aKind, const QString & aSerialNumber, const char * aAddress = "10.0.0.20", quint16 aPort = 41000)
	{
		ASSERT_TRUE(mComponents.backendFactory().inject(ServiceEvent(
			aKind, "adb-" + aSerialNumber + "-Zq3x9a", AdbConnectionDiscovery::SERVICE_TYPE, QHostAddress(QString::fromUtf8(aAddress)), aPort
		)));
	}
};





TEST_F(AdbConnectionDiscoveryTest, SecondStartThrowsWithoutSecondListener)
{
	mDiscovery->startDiscoveryListener();
	EXPECT_TRUE(mDiscovery->isListening());
	EXPECT_THROW(mDiscovery->startDiscoveryListener(), ServiceBrowserSession::DiscoveryError);
	EXPECT_EQ(mComponents.backendFactory().numStarted(), 1);
	EXPECT_TRUE(mDiscovery->isListening());

	// No duplicate entries:
	advertise(ServiceEvent::ekAdded, "SERIAL01");
	advertise(ServiceEvent::ekUpdated, "SERIAL01");
	ASSERT_TRUE(waitUntil([this]() { return mDiscovery->serviceInfoFor("SERIAL01").isPresent(); }));
	EXPECT_EQ(mDiscovery->onlineDevices().size(), 1u);
}





TEST_F(AdbConnectionDiscoveryTest, BindFailureSurfacesAndLeavesNothingRunning)
{
	mComponents.backendFactory().setShouldFailStart(true);
	EXPECT_THROW(mDiscovery->startDiscoveryListener(), ServiceBrowserSession::DiscoveryError);
	EXPECT_FALSE(mDiscovery->isListening());

	mComponents.backendFactory().setShouldFailStart(false);
	mDiscovery->startDiscoveryListener();
	EXPECT_TRUE(mDiscovery->isListening());
}





TEST_F(AdbConnectionDiscoveryTest, StatusFollowsAdvertisements)
{
	mDiscovery->startDiscoveryListener();
	EXPECT_EQ(mDiscovery->connectionStatusForDevice("SERIAL01"), AdbConnectionDiscovery::asUnknown);

	advertise(ServiceEvent::ekAdded, "SERIAL01");
	ASSERT_TRUE(waitUntil([this]() { return mDiscovery->connectionStatusForDevice("SERIAL01") == AdbConnectionDiscovery::asOnline; }));
	auto info = mDiscovery->serviceInfoFor("SERIAL01");
	ASSERT_TRUE(info.isPresent());
	EXPECT_EQ(info.value().endpoint(), "10.0.0.20:41000");

	advertise(ServiceEvent::ekRemoved, "SERIAL01");
	ASSERT_TRUE(waitUntil([this]() { return mDiscovery->connectionStatusForDevice("SERIAL01") == AdbConnectionDiscovery::asOffline; }));
	EXPECT_FALSE(mDiscovery->serviceInfoFor("SERIAL01").isPresent());
	EXPECT_EQ(mDiscovery->offlineDevices().size(), 1u);
	EXPECT_TRUE(mDiscovery->onlineDevices().empty());
}





TEST_F(AdbConnectionDiscoveryTest, ForeignInstanceNamesIgnored)
{
	mDiscovery->startDiscoveryListener();
	mComponents.backendFactory().inject(ServiceEvent(
		ServiceEvent::ekAdded, "SomePrinter", AdbConnectionDiscovery::SERVICE_TYPE, QHostAddress("10.0.0.50"), 631
	));
	advertise(ServiceEvent::ekAdded, "SERIAL02");
	ASSERT_TRUE(waitUntil([this]() { return mDiscovery->serviceInfoFor("SERIAL02").isPresent(); }));
	EXPECT_EQ(mDiscovery->onlineDevices().size(), 1u);
}





TEST_F(AdbConnectionDiscoveryTest, ServiceInfoStatusComparesAddresses)
{
	mDiscovery->startDiscoveryListener();
	advertise(ServiceEvent::ekAdded, "SERIAL01", "10.0.0.20");
	ASSERT_TRUE(waitUntil([this]() { return mDiscovery->serviceInfoFor("SERIAL01").isPresent(); }));
	auto remembered = mDiscovery->serviceInfoFor("SERIAL01").value();
	EXPECT_EQ(mDiscovery->connectionStatusForService(remembered), AdbConnectionDiscovery::sisUpdated);

	advertise(ServiceEvent::ekUpdated, "SERIAL01", "10.0.0.21");
	ASSERT_TRUE(waitUntil([&]() { return mDiscovery->connectionStatusForService(remembered) == AdbConnectionDiscovery::sisChanged; }));

	advertise(ServiceEvent::ekRemoved, "SERIAL01");
	ASSERT_TRUE(waitUntil([&]() { return mDiscovery->connectionStatusForService(remembered) == AdbConnectionDiscovery::sisDown; }));

	ServiceInfo stranger("NOBODY", QHostAddress("10.0.0.99"), 1);
	EXPECT_EQ(mDiscovery->connectionStatusForService(stranger), AdbConnectionDiscovery::sisUnknown);
}





TEST_F(AdbConnectionDiscoveryTest, StopRetainsEntries)
{
	mDiscovery->startDiscoveryListener();
	advertise(ServiceEvent::ekAdded, "SERIAL01");
	ASSERT_TRUE(waitUntil([this]() { return mDiscovery->serviceInfoFor("SERIAL01").isPresent(); }));
	mDiscovery->stopDiscoveryListener();
	EXPECT_FALSE(mDiscovery->isListening());
	EXPECT_EQ(mDiscovery->onlineDevices().size(), 1u);
	EXPECT_EQ(mDiscovery->connectionStatusForDevice("SERIAL01"), AdbConnectionDiscovery::asOnline);

	// Stopping twice is fine, and the listener can be started again:
	mDiscovery->stopDiscoveryListener();
	mDiscovery->startDiscoveryListener();
	EXPECT_TRUE(mDiscovery->isListening());
}





TEST_F(AdbConnectionDiscoveryTest, WaitForDeviceWakesOnAdvertisement)
{
	mDiscovery->startDiscoveryListener();
	std::thread device([this]()
	{
		QThread::msleep(50);
		advertise(ServiceEvent::ekAdded, "SERIAL03");
	});
	auto info = mDiscovery->waitForDevice("SERIAL03", 5000);
	device.join();
	ASSERT_TRUE(info.isPresent());
	EXPECT_EQ(info.value().mSerialNumber, "SERIAL03");
}





TEST_F(AdbConnectionDiscoveryTest, CancelWaitsUnblocksPromptly)
{
	mDiscovery->startDiscoveryListener();
	std::thread canceller([this]()
	{
		QThread::msleep(50);
		mDiscovery->cancelWaits();
	});
	QElapsedTimer timer;
	timer.start();
	EXPECT_FALSE(mDiscovery->waitForDevice("SERIAL04", 10000).isPresent());
	canceller.join();
	EXPECT_LT(timer.elapsed(), 5000);
}
