#pragma once

#include <QString>
#include "../ComponentCollection.hpp"





/** The interface to the ADB toolchain that performs the actual network operations on the devices:
the wireless pairing handshake, connecting and disconnecting.
All the operations are blocking and bounded by a timeout; they report failure by returning false,
so that batch operations can collect per-device outcomes.
The calls may come from multiple threads simultaneously (parallel connection workers).
The addresses are in the "ip:port" form. */
class AdbToolchain:
	public ComponentCollection::Component<ComponentCollection::ckAdbToolchain>
{
	using Super = ComponentCollection::Component<ComponentCollection::ckAdbToolchain>;


public:

	AdbToolchain(ComponentCollection & aComponents):
		Super(aComponents)
	{
	}

	/** Performs the wireless pairing handshake with the device advertising the pairing service on aAddress,
	using the specified pairing code. Returns true if the device accepted the pairing. */
	virtual bool pair(const QString & aAddress, const QString & aPassword) = 0;

	/** Requests a connection to the device at aAddress.
	Returns true if the toolchain reports the connection as made (or already present). */
	virtual bool connect(const QString & aAddress) = 0;

	/** Requests disconnecting the device at aAddress.
	Returns true if the toolchain reports the device disconnected. */
	virtual bool disconnect(const QString & aAddress) = 0;

	/** Returns true if the toolchain currently lists the device at aAddress as connected and online. */
	virtual bool isConnected(const QString & aAddress) = 0;

	/** Returns true if the device with the specified serial number is known to the toolchain's keystore,
	meaning that it has been paired before and can be connected to without pairing. */
	virtual bool isPaired(const QString & aSerialNumber) = 0;
};
