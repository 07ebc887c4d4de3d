#include "ServiceBrowserBackend.hpp"
#include "../Settings.hpp"
#include "../Comm/MdnsBrowser.hpp"
#include "../Comm/AdbMdnsBrowser.hpp"





ServiceBrowserBackendFactory::ServiceBrowserBackendFactory(ComponentCollection & aComponents):
	Super(aComponents),
	mBackendKind(Settings::loadValue("Discovery", "Backend", "mdns").toString().toLower()),
	mQueryIntervalMsec(Settings::loadValue("Discovery", "QueryIntervalMsec", 2000).toInt())
{
	requireForStart(ComponentCollection::ckMultiLogger);
}





void ServiceBrowserBackendFactory::start()
{
	if ((mBackendKind != "mdns") && (mBackendKind != "adb"))
	{
		throw RuntimeError(mComponents.logger("main"), "Unknown discovery backend: %1", mBackendKind);
	}
	mComponents.logger("main").log("Using the \"%1\" discovery backend", mBackendKind);
}





ServiceBrowserBackendPtr ServiceBrowserBackendFactory::createBackend(Logger & aLogger)
{
	if (mBackendKind == "adb")
	{
		return std::make_unique<AdbMdnsBrowser>(
			aLogger,
			Settings::loadValue("Adb", "ServerHost", "localhost").toString(),
			static_cast<quint16>(Settings::loadValue("Adb", "ServerPort", 5037).toUInt()),
			mQueryIntervalMsec
		);
	}
	return std::make_unique<MdnsBrowser>(aLogger, mQueryIntervalMsec);
}
