#pragma once

#include <QTcpSocket>
#include <QHostAddress>
#include <QList>
#include "../Exception.hpp"





/** Implements the ADB host protocol, as spoken to the ADB server.
Connects to the ADB server (localhost:5037 by default) and issues the host requests according to the functions called.
All operations are performed asynchronously, the results are reported back using signals.
Note that each operation takes exclusive ownership of the connection and it is then no longer possible to
request another operation. You need to create a new instance in order to request a different operation. */
class AdbCommunicator:
	public QObject
{
	using Super = QObject;

	Q_OBJECT


public:

	/** A single service discovered by the ADB server's own mDNS browser ("host:mdns:services"). */
	struct MdnsService
	{
		/** The mDNS instance name, such as "adb-R58M123ABC-x2YzAb". */
		QString mInstanceName;

		/** The service type, such as "_adb-tls-connect._tcp". */
		QString mServiceType;

		QHostAddress mAddress;
		quint16 mPort;

		bool operator == (const MdnsService & aOther) const
		{
			return (
				(mInstanceName == aOther.mInstanceName) &&
				(mServiceType == aOther.mServiceType) &&
				(mAddress == aOther.mAddress) &&
				(mPort == aOther.mPort)
			);
		}
	};


	/** Creates a new instance of a communicator that will talk to the ADB server at the specified endpoint.
	All the communication is logged into aLogger. */
	AdbCommunicator(
		Logger & aLogger,
		const QString & aServerHost = QString::fromUtf8("localhost"),
		quint16 aServerPort = 5037,
		QObject * aParent = nullptr
	);

	/** Parses the device list (as received from "host:devices" or "host:track-devices") into the three lists.
	The aOnlineIDs receives devices that are online and may be communicated with.
	The aUnauthIDs receives devices that require ADB authentication before communication.
	The aOtherIDs receives devices that are known but unavailable (ADB "offline", "bootloader" etc.) */
	static void parseDeviceList(
		const QByteArray & aMessage,
		QList<QByteArray> & aOnlineIDs,
		QList<QByteArray> & aUnauthIDs,
		QList<QByteArray> & aOtherIDs
	);

	/** Parses the "host:mdns:services" response, one "<name>\t<type>\t<ip>:<port>" line per service.
	Malformed lines are skipped. */
	static QList<MdnsService> parseMdnsServices(const QByteArray & aMessage);


public Q_SLOTS:

	/** Starts connecting to the ADB server.
	A connected() signal is emitted once connected. The error() signal is emitted on error. */
	void start();

	/** Asks ADB for the list of devices.
	The devices are reported back using the updateDeviceList() signal.
	ADB closes the connection after sending the whole device list. */
	void listDevices();

	/** Asks ADB to pair with the device advertising the pairing service on aAddress ("ip:port"),
	using the specified pairing code.
	The ADB server's textual response ("Successfully paired to ...", "Failed: ...") is reported back
	using the hostResponse() signal. */
	void pairDevice(const QByteArray & aAddress, const QByteArray & aPassword);

	/** Asks ADB to connect to the device at aAddress ("ip:port").
	The ADB server's textual response ("connected to ...", "failed to connect to ...") is reported back
	using the hostResponse() signal. */
	void connectDevice(const QByteArray & aAddress);

	/** Asks ADB to disconnect the device at aAddress ("ip:port").
	The ADB server's response ("disconnected ...") is reported using the hostResponse() signal,
	an unknown device results in the error() signal. */
	void disconnectDevice(const QByteArray & aAddress);

	/** Asks ADB for the list of services discovered by its mDNS browser.
	The services are reported back using the mdnsServicesReceived() signal. */
	void listMdnsServices();


Q_SIGNALS:

	/** Emitted once the socket conntects to the ADB server port. */
	void connected();

	/** Emitted once the socket is disconnected, either by the ADB server, or by us. */
	void disconnected();

	/** Emitted whenever an error occurs, either while connecting, or while communicating,
	or when the ADB server responds with a FAIL. */
	void error(const QString & aErrorText);

	/** Emitted when the ADB sends the device list after "host:devices". */
	void updateDeviceList(
		const QList<QByteArray> & aOnlineDeviceIDs,
		const QList<QByteArray> & aUnauthDeviceIDs,
		const QList<QByteArray> & aOtherDeviceIDs
	);

	/** Emitted when the ADB server sends the textual response to a pair, connect or disconnect request. */
	void hostResponse(const QByteArray & aResponse);

	/** Emitted when the ADB server sends the list of its mDNS-discovered services. */
	void mdnsServicesReceived(const QList<AdbCommunicator::MdnsService> & aServices);


protected:

	/** The communicator state. */
	enum EState
	{
		csCreated,     ///< Freshly created, not connecting yet.
		csConnecting,  ///< Waiting for connection to the ADB server.
		csReady,       ///< Connected to the ADB server, ready for any command.
		csBroken,      ///< An irrecoverable error has been detected on the socket, communication cannot continue.

		csListingDevicesStart,  ///< after listDevices() has been called, waiting for the OKAY response
		csListingDevices,       ///< after listDevices() has been called, waiting for the device list.

		csHostQueryStart,  ///< after a pair / connect / disconnect request, waiting for the OKAY response
		csHostQuery,       ///< after a pair / connect / disconnect request, waiting for the textual response

		csListingMdnsServicesStart,  ///< after listMdnsServices() has been called, waiting for the OKAY response
		csListingMdnsServices,       ///< after listMdnsServices() has been called, waiting for the service list

		csFinished,  ///< The response has been delivered, no more data expected.
	};

	/** The TCP socket to the ADB server, used for communication. */
	QTcpSocket mSocket;

	/** The logger used for all the communication. */
	Logger & mLogger;

	/** The host where the ADB server is listening. */
	QString mServerHost;

	/** The port where the ADB server is listening. */
	quint16 mServerPort;

	/** Buffer for the incoming data until it is parsed into a full packet. */
	QByteArray mIncomingData;

	/** The current state of the connection. */
	EState mState;


	/** Writes the hex4-formatted length and then the message to the connection. */
	void writeHex4(const QByteArray & aMessage);

	/** Sends the request and moves into the specified state, if the communicator is ready.
	If not ready, emits error() instead. */
	void sendRequest(const QByteArray & aRequest, EState aNextState);

	/** Looks into mIncomingData if there's an OKAY or FAIL<len><reason> response in there.
	If so, removes it from mIncomingData and in case of failure, emits the error() signal.
	Returns true if an OKAY was extracted, false otherwise. */
	bool extractOkayOrFail();

	/** Looks into mIncomingData if there's an entire hex4-lengthed packet available.
	Returns a composite value, the first field specifies if the packet was found,
	and if so, the packet itself is returned as the second field. */
	std::pair<bool, QByteArray> extractHex4Packet();


protected Q_SLOTS:

	/** Emitted by mSocket when it succeeds connecting. */
	void onSocketConnected();

	/** Emitted by mSocket when it encounters an error. */
	void onSocketError(QAbstractSocket::SocketError aError);

	/** Emitted by mSocket when it disconnects from the remote endpoint. */
	void onSocketDisconnected();

	/** Emitted by mSocket when there's incoming data available for reading. */
	void onSocketReadyRead();
};

Q_DECLARE_METATYPE(AdbCommunicator::MdnsService);
