#include "Settings.hpp"
#include <QSettings>
#include <QMutexLocker>





std::unique_ptr<QSettings> Settings::mSettings;
QVariantMap Settings::mOverrides;
QMutex Settings::mMtx;





void Settings::init(const QString & aIniFileName)
{
	QMutexLocker lock(&mMtx);
	mSettings = std::make_unique<QSettings>(aIniFileName, QSettings::IniFormat);
}





void Settings::reset()
{
	QMutexLocker lock(&mMtx);
	mSettings.reset();
	mOverrides.clear();
}





QVariant Settings::loadValue(const QString & aSection, const QString & aKey, const QVariant & aDefault)
{
	auto key = fullKey(aSection, aKey);
	QMutexLocker lock(&mMtx);
	auto itr = mOverrides.constFind(key);
	if (itr != mOverrides.constEnd())
	{
		return itr.value();
	}
	if (mSettings == nullptr)
	{
		return aDefault;
	}
	return mSettings->value(key, aDefault);
}





void Settings::overrideValue(const QString & aSection, const QString & aKey, const QVariant & aValue)
{
	QMutexLocker lock(&mMtx);
	mOverrides[fullKey(aSection, aKey)] = aValue;
}





QString Settings::fullKey(const QString & aSection, const QString & aKey)
{
	return aSection + "/" + aKey;
}
