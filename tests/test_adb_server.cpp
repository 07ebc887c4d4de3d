#include <gtest/gtest.h>
#include <functional>
#include <QElapsedTimer>
#include <QFile>
#include <QTcpServer>
#include <QTcpSocket>
#include <QTemporaryDir>
#include "ComponentCollection.hpp"
#include "MultiLogger.hpp"
#include "Settings.hpp"
#include "Comm/AdbServer.hpp"





/** Returns the message prefixed with its hex4 length, as the ADB host protocol frames it. */
static QByteArray hex4Framed(const QByteArray & aMessage)
{
	return QString::fromUtf8("%1").arg(aMessage.size(), 4, 16, QChar('0')).toUtf8() + aMessage;
}





/** A local TCP server speaking the ADB host protocol.
Each received request is answered with whatever the responder returns for it; an empty answer means no response.
Runs in the test's thread; the blocking AdbServer calls spin their own event loop, which serves this server too. */
class FakeAdbHostServer
{
public:

	using Responder = std::function<QByteArray (const QByteArray &)>;


	FakeAdbHostServer()
	{
		QObject::connect(&mServer, &QTcpServer::newConnection,
			[this]()
			{
				while (mServer.hasPendingConnections())
				{
					accept(mServer.nextPendingConnection());
				}
			}
		);
		EXPECT_TRUE(mServer.listen(QHostAddress::LocalHost, 0));
	}

	quint16 port() const { return mServer.serverPort(); }

	void setResponder(Responder aResponder) { mResponder = std::move(aResponder); }

	/** The requests received so far, without their length prefix. */
	const QList<QByteArray> & requests() const { return mRequests; }


protected:

	QTcpServer mServer;
	Responder mResponder;
	QList<QByteArray> mRequests;


	void accept(QTcpSocket * aSocket)
	{
		auto buffer = std::make_shared<QByteArray>();
		QObject::connect(aSocket, &QTcpSocket::readyRead, aSocket,
			[this, aSocket, buffer]()
			{
				buffer->append(aSocket->readAll());
				if (buffer->size() < 4)
				{
					return;
				}
				bool isOk = false;
				auto length = buffer->left(4).toInt(&isOk, 16);
				if (!isOk || (buffer->size() < 4 + length))
				{
					return;
				}
				auto request = buffer->mid(4, length);
				buffer->remove(0, 4 + length);
				mRequests.append(request);
				auto response = mResponder ? mResponder(request) : QByteArray();
				if (!response.isEmpty())
				{
					aSocket->write(response);
				}
			}
		);
	}
};





class AdbServerTest:
	public ::testing::Test
{
protected:

	static const int REQUEST_TIMEOUT_MSEC = 500;
	static const int PAIR_TIMEOUT_MSEC = 800;

	QTemporaryDir mTempDir;
	FakeAdbHostServer mFakeServer;
	std::unique_ptr<ComponentCollection> mComponents;
	std::shared_ptr<AdbServer> mAdb;

	void SetUp() override
	{
		ASSERT_TRUE(mTempDir.isValid());
		Settings::overrideValue("Adb", "ServerHost", "127.0.0.1");
		Settings::overrideValue("Adb", "ServerPort", mFakeServer.port());
		Settings::overrideValue("Adb", "RequestTimeoutMsec", REQUEST_TIMEOUT_MSEC);
		Settings::overrideValue("Adb", "PairTimeoutMsec", PAIR_TIMEOUT_MSEC);
		Settings::overrideValue("Adb", "KnownHostsFile", mTempDir.filePath("adb_known_hosts.pb"));
		mComponents.reset(new ComponentCollection);
		mComponents->addNew<MultiLogger>(mTempDir.filePath("logs"));
		mAdb = mComponents->addNew<AdbServer>();
		mComponents->start();
	}

	void TearDown() override
	{
		mAdb.reset();
		mComponents.reset();
		Settings::reset();
	}

	/** Makes the fake server answer every request with OKAY and the specified text. */
	void respondWith(const QByteArray & aText)
	{
		mFakeServer.setResponder([aText](const QByteArray &)
		{
			return "OKAY" + hex4Framed(aText);
		});
	}
};

const int AdbServerTest::REQUEST_TIMEOUT_MSEC;
const int AdbServerTest::PAIR_TIMEOUT_MSEC;





TEST_F(AdbServerTest, PairAccepted)
{
	respondWith("Successfully paired to 10.0.0.5:37099 [guid=adb-R58M123ABC-x2YzAb]");
	EXPECT_TRUE(mAdb->pair("10.0.0.5:37099", "pw123456"));
	ASSERT_EQ(mFakeServer.requests().size(), 1);
	EXPECT_EQ(mFakeServer.requests()[0], "host:pair:pw123456:10.0.0.5:37099");
}





TEST_F(AdbServerTest, PairRejected)
{
	respondWith("Failed: Wrong password or connection was dropped.");
	EXPECT_FALSE(mAdb->pair("10.0.0.5:37099", "badpass1"));
}





TEST_F(AdbServerTest, ConnectAcceptedAndRefused)
{
	respondWith("connected to 10.0.0.5:5555");
	EXPECT_TRUE(mAdb->connect("10.0.0.5:5555"));
	ASSERT_EQ(mFakeServer.requests().size(), 1);
	EXPECT_EQ(mFakeServer.requests()[0], "host:connect:10.0.0.5:5555");

	respondWith("failed to connect to 10.0.0.6:5555");
	EXPECT_FALSE(mAdb->connect("10.0.0.6:5555"));
}





TEST_F(AdbServerTest, FailReplyIsFailure)
{
	mFakeServer.setResponder([](const QByteArray &)
	{
		return "FAIL" + hex4Framed("no such device '10.0.0.5:5555'");
	});
	EXPECT_FALSE(mAdb->disconnect("10.0.0.5:5555"));
	EXPECT_FALSE(mAdb->connect("10.0.0.5:5555"));
	EXPECT_FALSE(mAdb->isConnected("10.0.0.5:5555"));
	EXPECT_EQ(mFakeServer.requests().size(), 3);
}





TEST_F(AdbServerTest, DeviceListDecidesIsConnected)
{
	respondWith("R58M123ABC\tdevice\n10.0.0.5:5555\tdevice\n10.0.0.6:5555\toffline\n");
	EXPECT_TRUE(mAdb->isConnected("10.0.0.5:5555"));
	EXPECT_FALSE(mAdb->isConnected("10.0.0.6:5555"));
	EXPECT_FALSE(mAdb->isConnected("10.0.0.7:5555"));
	EXPECT_EQ(mFakeServer.requests()[0], "host:devices");
}





TEST_F(AdbServerTest, SilentServerTimesOut)
{
	// The server accepts the connection and reads the requests, but never answers:
	mFakeServer.setResponder(nullptr);

	QElapsedTimer timer;
	timer.start();
	EXPECT_FALSE(mAdb->connect("10.0.0.5:5555"));
	auto elapsed = timer.elapsed();
	EXPECT_GE(elapsed, REQUEST_TIMEOUT_MSEC - 50);
	EXPECT_LT(elapsed, REQUEST_TIMEOUT_MSEC + 2000);

	timer.restart();
	EXPECT_FALSE(mAdb->pair("10.0.0.5:37099", "pw123456"));
	elapsed = timer.elapsed();
	EXPECT_GE(elapsed, PAIR_TIMEOUT_MSEC - 50);
	EXPECT_LT(elapsed, PAIR_TIMEOUT_MSEC + 2000);
	EXPECT_EQ(mFakeServer.requests().size(), 2);
}





TEST_F(AdbServerTest, UnreachableServerFails)
{
	// Find a port where nobody listens:
	quint16 deadPort = 0;
	{
		QTcpServer placeholder;
		ASSERT_TRUE(placeholder.listen(QHostAddress::LocalHost, 0));
		deadPort = placeholder.serverPort();
	}
	Settings::overrideValue("Adb", "ServerPort", deadPort);
	ComponentCollection cc;
	cc.addNew<MultiLogger>(mTempDir.filePath("logs2"));
	auto adb = cc.addNew<AdbServer>();
	cc.start();

	QElapsedTimer timer;
	timer.start();
	EXPECT_FALSE(adb->connect("10.0.0.5:5555"));
	EXPECT_FALSE(adb->isConnected("10.0.0.5:5555"));
	EXPECT_LT(timer.elapsed(), 2 * REQUEST_TIMEOUT_MSEC + 2000);
}





TEST_F(AdbServerTest, IsPairedScansKnownHosts)
{
	// No known hosts file yet:
	EXPECT_FALSE(mAdb->isPaired("R58M123ABC"));

	QFile f(mTempDir.filePath("adb_known_hosts.pb"));
	ASSERT_TRUE(f.open(QIODevice::WriteOnly));
	f.write(QByteArray("\x0a\x1c", 2) + "adb-R58M123ABC-x2YzAb" + QByteArray("\x12\x04", 2) + "abcd");
	f.close();

	EXPECT_TRUE(mAdb->isPaired("R58M123ABC"));
	EXPECT_FALSE(mAdb->isPaired("R58M123"));
	EXPECT_FALSE(mAdb->isPaired("ZY2233XXQQ"));
}
