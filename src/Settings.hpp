#pragma once

#include <memory>
#include <QString>
#include <QVariant>
#include <QMutex>





// fwd:
class QSettings;





/** Provides access to the persistent settings (an INI file).
The settings are process-global, initialized once upon app startup by calling init().
If init() has not been called, loadValue() returns the defaults, which is what the tests rely on.
Can be used from any thread. */
class Settings
{
public:

	/** Initializes the settings to use the specified INI file.
	Any previously used file is closed. */
	static void init(const QString & aIniFileName);

	/** Drops the backing INI file, all subsequent loads return the defaults. */
	static void reset();

	/** Returns the value stored in the specified section under the specified key.
	If there's no such value stored, returns aDefault. */
	static QVariant loadValue(const QString & aSection, const QString & aKey, const QVariant & aDefault = QVariant());

	/** Overrides the value in memory only, without touching the INI file.
	The override takes precedence over the file contents until reset() is called. */
	static void overrideValue(const QString & aSection, const QString & aKey, const QVariant & aValue);


protected:

	/** The QSettings object backing the INI file, nullptr if not initialized. */
	static std::unique_ptr<QSettings> mSettings;

	/** In-memory overrides, map of "section/key" -> value. */
	static QVariantMap mOverrides;

	/** Protects mSettings and mOverrides against multithreaded access. */
	static QMutex mMtx;


	/** Returns the full key used for the section and key, in the QSettings' group notation. */
	static QString fullKey(const QString & aSection, const QString & aKey);
};
