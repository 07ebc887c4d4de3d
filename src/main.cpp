#include <memory>
#include <QCoreApplication>
#include <QCommandLineParser>
#include <QTextStream>
#include <QTimer>
#include <QThread>
#include "ComponentCollection.hpp"
#include "DeviceConnection.hpp"
#include "MultiLogger.hpp"
#include "Settings.hpp"
#include "Comm/AdbServer.hpp"
#include "Discovery/AdbConnectionDiscovery.hpp"
#include "Discovery/ServiceBrowserBackend.hpp"





/** Prints the QR code payload and its rendering, so that it can be scanned from the terminal. */
static void presentQrCode(const QString & aPayload)
{
	QTextStream out(stdout);
	out << QCoreApplication::tr("Scan this QR code from the device's Wireless debugging / Pair with QR code screen:") << "\n";
	out << AdbPairing::renderQrCodeText(aPayload) << "\n";
	out << aPayload << "\n";
	out.flush();
}





/** Prints the currently advertised devices. */
static void printVisibleDevices(DeviceConnection & aDevConn)
{
	QTextStream out(stdout);
	auto devices = aDevConn.visibleDevices();
	if (devices.empty())
	{
		out << QCoreApplication::tr("No devices are advertising their connection service.") << "\n";
		return;
	}
	for (const auto & dev: devices)
	{
		out << dev.first << "\t" << dev.second.endpoint() << "\n";
	}
}





/** Prints the per-device results of a batch operation.
Returns the number of failed devices. */
static int printBatchResult(const DeviceConnection::ConnectionBatchResult & aResult)
{
	QTextStream out(stdout);
	int numFailed = 0;
	for (const auto & res: aResult.mResults)
	{
		if (res.isSuccess())
		{
			out << res.mSerialNumber << "\t" << QCoreApplication::tr("connected") << "\n";
		}
		else
		{
			out << res.mSerialNumber << "\t" << QCoreApplication::tr("FAILED: %1").arg(res.mErrorDetail) << "\n";
			numFailed += 1;
		}
	}
	return numFailed;
}





int main(int argc, char *argv[])
{
	QCoreApplication app(argc, argv);
	QCoreApplication::setApplicationName("adbmesh");

	QCommandLineParser parser;
	parser.setApplicationDescription(QCoreApplication::tr("Discovers, pairs and connects Android devices over wireless ADB."));
	parser.addHelpOption();
	parser.addPositionalArgument("serials", QCoreApplication::tr("Serial numbers of the devices to connect."), "[serials...]");
	QCommandLineOption configOption("config", QCoreApplication::tr("The settings INI file."), "file", "adbmesh.ini");
	QCommandLineOption pairOption("pair", QCoreApplication::tr("Run the QR code pairing flow, then exit."));
	QCommandLineOption listOption("list", QCoreApplication::tr("List the advertised devices."));
	QCommandLineOption waitOption("wait", QCoreApplication::tr("Wait this long for the advertisements before acting."), "msec", "3000");
	QCommandLineOption checkOption("check", QCoreApplication::tr("Re-check the connections after connecting."));
	QCommandLineOption disconnectOption("disconnect", QCoreApplication::tr("Disconnect the devices before exiting."));
	parser.addOptions({configOption, pairOption, listOption, waitOption, checkOption, disconnectOption});
	parser.process(app);

	try
	{
		Settings::init(parser.value(configOption));

		// Create the components:
		ComponentCollection cc;
		auto multiLogger = cc.addNew<MultiLogger>(Settings::loadValue("Logging", "Folder", "logs").toString());
		cc.addNew<AdbServer>();
		cc.addNew<ServiceBrowserBackendFactory>();
		cc.addNew<AdbConnectionDiscovery>();
		auto devConn = cc.addNew<DeviceConnection>();
		auto & logger = multiLogger->mainLogger();
		devConn->setQrPresenter(presentQrCode);
		QObject::connect(devConn.get(), &DeviceConnection::deviceStatusChanged,
			[&logger](const QString & aSerialNumber, DeviceConnection::ConnectionStatus aStatus)
			{
				logger.log("Device %1 status: %2", aSerialNumber, aStatus);
			}
		);

		cc.start();

		// Run the requested operations once the event loop is running:
		QTimer::singleShot(0, [&]()
			{
				int res = 0;
				try
				{
					auto serials = parser.positionalArguments();
					if (parser.isSet(pairOption))
					{
						AdbPairing pairing(cc);
						auto timeout = Settings::loadValue("Pairing", "CandidateTimeoutMsec", 60000).toInt();
						res = pairing.runPairing(timeout, presentQrCode) ? 0 : 1;
					}
					else
					{
						QThread::msleep(static_cast<unsigned long>(parser.value(waitOption).toUInt()));
						if (parser.isSet(listOption) || serials.isEmpty())
						{
							printVisibleDevices(*devConn);
						}
						if (!serials.isEmpty())
						{
							res = (printBatchResult(devConn->connectAllDevices(serials)) == 0) ? 0 : 1;
							if (parser.isSet(checkOption))
							{
								printBatchResult(devConn->checkConnections());
							}
							if (parser.isSet(disconnectOption))
							{
								for (const auto & serial: serials)
								{
									devConn->stopConnection(serial);
								}
							}
						}
					}
				}
				catch (const std::exception & exc)
				{
					logger.log("Fatal error: %1", exc.what());
					QTextStream(stderr) << QCoreApplication::tr("adbmesh: fatal error: %1").arg(exc.what()) << "\n";
					res = 2;
				}
				devConn->close();
				QCoreApplication::exit(res);
			}
		);

		logger.log("Running the app...");
		auto res = app.exec();
		logger.log("Done.");
		multiLogger->flushAllLogs();
		return res;
	}
	catch (const std::exception & exc)
	{
		QTextStream(stderr) << QCoreApplication::tr("adbmesh has detected a fatal error:\n\n%1").arg(exc.what()) << "\n";
		return -1;
	}
}
