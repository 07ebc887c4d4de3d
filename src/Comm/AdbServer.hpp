#pragma once

#include <functional>
#include "AdbToolchain.hpp"





// fwd:
class AdbCommunicator;
class Logger;





/** The AdbToolchain implementation that talks to the ADB server over its host protocol.
Each operation creates a fresh AdbCommunicator in the calling thread and spins a local event loop
until the ADB server responds, or the timeout elapses.
The configuration (server endpoint, timeouts, known hosts file) is read from Settings upon construction. */
class AdbServer:
	public AdbToolchain
{
	using Super = AdbToolchain;


public:

	AdbServer(ComponentCollection & aComponents);

	// ComponentCollection::ComponentBase override:
	virtual void start() override;

	// AdbToolchain overrides:
	virtual bool pair(const QString & aAddress, const QString & aPassword) override;
	virtual bool connect(const QString & aAddress) override;
	virtual bool disconnect(const QString & aAddress) override;
	virtual bool isConnected(const QString & aAddress) override;

	/** Scans the ADB known hosts file (adb_known_hosts.pb) for the raw substring "adb-<serial>-".
	The file is not parsed as a protobuf; this relies on ADB storing each paired device's mDNS GUID
	("adb-<serial>-<suffix>") verbatim in it. A serial number that is a prefix of another device's serial
	followed by '-' could match falsely. Returns false if the file cannot be read. */
	virtual bool isPaired(const QString & aSerialNumber) override;


protected:

	/** The outcome of a single request to the ADB server. */
	struct QueryResult
	{
		/** True if the server delivered its response, false on FAIL, socket error or timeout. */
		bool mIsSuccess;

		/** The server's response text (on success) or the error description (on failure). */
		QString mMessage;

		/** The online device IDs, filled only for the device list request. */
		QList<QByteArray> mOnlineDeviceIDs;
	};


	/** The logger used for all the ADB requests. */
	Logger & mLogger;

	/** The host where the ADB server is listening. */
	QString mServerHost;

	/** The port where the ADB server is listening. */
	quint16 mServerPort;

	/** The timeout for the quick requests (connect, disconnect, device list). */
	int mRequestTimeoutMsec;

	/** The timeout for the pairing handshake. */
	int mPairTimeoutMsec;

	/** The file where ADB stores the known (paired) hosts. */
	QString mKnownHostsFile;


	/** Runs a single request on a new AdbCommunicator and blocks until it finishes or times out.
	aRequest is called once the communicator connects to the server, it is expected to issue the request. */
	QueryResult query(const std::function<void (AdbCommunicator &)> & aRequest, int aTimeoutMsec);
};
