#include <gtest/gtest.h>
#include <chrono>
#include <random>
#include <thread>
#include <set>
#include "Discovery/ServiceRegistry.hpp"





static ServiceInfo makeInfo(const QString & aSerialNumber, const char * aAddress = "192.168.1.10", quint16 aPort = 37001)
{
	return ServiceInfo(aSerialNumber, QHostAddress(QString::fromUtf8(aAddress)), aPort, "adb-" + aSerialNumber + "-abc");
}





TEST(ServiceRegistryTest, UpsertMakesOnlineAndStampsLastSeen)
{
	ServiceRegistry reg;
	auto before = QDateTime::currentDateTimeUtc();
	reg.upsert(makeInfo("A"));
	auto snap = reg.snapshot();
	ASSERT_EQ(snap.mOnline.size(), 1u);
	EXPECT_TRUE(snap.mOffline.empty());
	const auto & info = snap.mOnline.at("A");
	EXPECT_EQ(info.endpoint(), "192.168.1.10:37001");
	EXPECT_GE(info.mLastSeen, before.addSecs(-1));
	EXPECT_TRUE(reg.isOnline("A"));
}





TEST(ServiceRegistryTest, UpsertReplacesWholeEntry)
{
	ServiceRegistry reg;
	reg.upsert(makeInfo("A", "10.0.0.1", 1000));
	reg.upsert(makeInfo("A", "10.0.0.2", 2000));
	auto info = reg.lookup("A");
	ASSERT_TRUE(info.isPresent());
	EXPECT_EQ(info.value().mAddress, QHostAddress("10.0.0.2"));
	EXPECT_EQ(info.value().mPort, 2000);
	EXPECT_EQ(reg.snapshot().mOnline.size(), 1u);
}





TEST(ServiceRegistryTest, MarkOfflineKeepsLastKnownLocation)
{
	ServiceRegistry reg;
	reg.upsert(makeInfo("A", "10.0.0.1", 1000));
	EXPECT_TRUE(reg.markOffline("A"));
	EXPECT_FALSE(reg.markOffline("nonexistent"));

	auto snap = reg.snapshot();
	EXPECT_TRUE(snap.mOnline.empty());
	ASSERT_EQ(snap.mOffline.size(), 1u);
	EXPECT_EQ(snap.mOffline.at("A").endpoint(), "10.0.0.1:1000");
	EXPECT_FALSE(reg.isOnline("A"));

	// Re-discovery brings it back online:
	reg.upsert(makeInfo("A", "10.0.0.1", 1001));
	snap = reg.snapshot();
	EXPECT_EQ(snap.mOnline.size(), 1u);
	EXPECT_TRUE(snap.mOffline.empty());
}





TEST(ServiceRegistryTest, RemoveAbsentIsNoop)
{
	ServiceRegistry reg;
	reg.remove("nothing");
	reg.upsert(makeInfo("A"));
	reg.remove("A");
	EXPECT_FALSE(reg.lookup("A").isPresent());
	auto snap = reg.snapshot();
	EXPECT_TRUE(snap.mOnline.empty());
	EXPECT_TRUE(snap.mOffline.empty());
}





/** Random sequences of upsert / markOffline / remove keep the partitions disjoint,
and their union is exactly the set of keys not removed last. */
TEST(ServiceRegistryTest, PartitionsStayDisjointUnderRandomOperations)
{
	std::mt19937 rng(12345);
	const QStringList keys = {"A", "B", "C", "D", "E"};
	ServiceRegistry reg;
	std::set<QString> expectedPresent;
	for (int i = 0; i < 2000; ++i)
	{
		const auto & key = keys[static_cast<int>(rng() % static_cast<unsigned>(keys.size()))];
		switch (rng() % 3)
		{
			case 0: reg.upsert(makeInfo(key)); expectedPresent.insert(key); break;
			case 1: reg.markOffline(key); break;
			case 2: reg.remove(key); expectedPresent.erase(key); break;
		}
		auto snap = reg.snapshot();
		std::set<QString> all;
		for (const auto & e: snap.mOnline)
		{
			ASSERT_EQ(snap.mOffline.count(e.first), 0u) << "Key in both partitions: " << e.first.toStdString();
			all.insert(e.first);
		}
		for (const auto & e: snap.mOffline)
		{
			all.insert(e.first);
		}
		ASSERT_EQ(all, expectedPresent);
	}
}





TEST(ServiceRegistryTest, FreshOnlineFiltersOffline)
{
	ServiceRegistry reg;
	reg.upsert(makeInfo("A"));
	reg.upsert(makeInfo("B"));
	reg.markOffline("B");
	auto fresh = reg.freshOnline(60);
	ASSERT_EQ(fresh.size(), 1u);
	EXPECT_EQ(fresh[0].mSerialNumber, "A");
}





TEST(ServiceRegistryTest, WaitForOnlineWakesOnUpsert)
{
	ServiceRegistry reg;
	std::thread writer([&reg]()
	{
		std::this_thread::sleep_for(std::chrono::milliseconds(50));
		reg.upsert(makeInfo("A"));
	});
	auto res = reg.waitForOnline("A", 5000);
	writer.join();
	ASSERT_TRUE(res.isPresent());
	EXPECT_EQ(res.value().mSerialNumber, "A");
}





TEST(ServiceRegistryTest, WaitForOnlineTimesOut)
{
	ServiceRegistry reg;
	reg.upsert(makeInfo("B"));
	EXPECT_FALSE(reg.waitForOnline("A", 50).isPresent());
}





TEST(ServiceRegistryTest, InterruptWaitsUnblocksPromptly)
{
	ServiceRegistry reg;
	std::thread canceller([&reg]()
	{
		std::this_thread::sleep_for(std::chrono::milliseconds(50));
		reg.interruptWaits();
	});
	auto start = std::chrono::steady_clock::now();
	auto res = reg.waitForFreshOnline(60, 10000);
	auto elapsed = std::chrono::steady_clock::now() - start;
	canceller.join();
	EXPECT_FALSE(res);
	EXPECT_LT(elapsed, std::chrono::seconds(5));
}





TEST(ServiceRegistryTest, InterruptBeforeWaitIsNotMissed)
{
	ServiceRegistry reg;
	auto generation = reg.interruptGeneration();
	reg.interruptWaits();
	auto start = std::chrono::steady_clock::now();
	EXPECT_FALSE(reg.waitForFreshOnline(60, 10000, generation));
	EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));

	// A fresh entry still wins over the interruption:
	reg.upsert(makeInfo("A"));
	EXPECT_TRUE(reg.waitForFreshOnline(60, 10000, generation));
}
