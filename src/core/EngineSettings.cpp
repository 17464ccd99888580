#include "routine/core/EngineSettings.hpp"

#include "routine/Errors.hpp"
#include "routine/Logging.hpp"

#include <QFileInfo>
#include <QTimeZone>

namespace routine {
namespace core {

namespace {
int positiveInt(QSettings &settings, const QString &key, int fallback)
{
    const QVariant value = settings.value(key, fallback);
    bool ok = false;
    const int number = value.toInt(&ok);
    if (!ok || number <= 0) {
        throw ConfigurationError(QStringLiteral("%1 must be a positive number, got \"%2\"").arg(key, value.toString()));
    }
    return number;
}

bool boolValue(QSettings &settings, const QString &key, bool fallback)
{
    const QString value = settings.value(key, fallback).toString().trimmed().toLower();
    if (value == QLatin1String("true") || value == QLatin1String("1") || value == QLatin1String("yes")) {
        return true;
    }
    if (value == QLatin1String("false") || value == QLatin1String("0") || value == QLatin1String("no")) {
        return false;
    }
    throw ConfigurationError(QStringLiteral("%1 must be true or false, got \"%2\"").arg(key, value));
}
} // namespace

EngineSettings EngineSettings::load(const QString &iniPath)
{
    const QFileInfo info(iniPath);
    if (info.exists() && !info.isReadable()) {
        throw ConfigurationError(QStringLiteral("Cannot read settings file %1").arg(iniPath));
    }
    QSettings settings(iniPath, QSettings::IniFormat);
    if (settings.status() == QSettings::FormatError) {
        throw ConfigurationError(QStringLiteral("Settings file %1 is malformed").arg(iniPath));
    }
    EngineSettings loaded = fromSettings(settings, info.absoluteDir());
    qCInfo(lcConfig) << "Settings from" << iniPath << "calendar" << loaded.store.calendarId
                     << "zone" << loaded.store.timeZone.id();
    return loaded;
}

EngineSettings EngineSettings::fromSettings(QSettings &settings, const QDir &baseDir)
{
    EngineSettings result;

    result.store.calendarId = settings.value(QStringLiteral("store/calendarId"), result.store.calendarId).toString().trimmed();
    if (result.store.calendarId.isEmpty()) {
        throw ConfigurationError(QStringLiteral("store/calendarId must not be empty"));
    }

    const QString zoneId = settings.value(QStringLiteral("store/timeZone")).toString().trimmed();
    if (!zoneId.isEmpty()) {
        const QTimeZone zone(zoneId.toUtf8());
        if (!zone.isValid()) {
            throw ConfigurationError(QStringLiteral("Unknown time zone \"%1\"").arg(zoneId));
        }
        result.store.timeZone = zone;
    }

    const QString directory = settings.value(QStringLiteral("store/directory"), QStringLiteral(".")).toString();
    result.store.directory = QDir::cleanPath(baseDir.absoluteFilePath(directory));

    const QString tasksFile = settings.value(QStringLiteral("tasks/file"), QStringLiteral("daily-fixed-tasks.json")).toString();
    result.tasksFile = QDir::cleanPath(baseDir.absoluteFilePath(tasksFile));

    const QString dayEnd = settings.value(QStringLiteral("scheduler/dayEnd"), QStringLiteral("22:00")).toString().trimmed();
    result.slotSearch.dayEnd = QTime::fromString(dayEnd, QStringLiteral("H:mm"));
    if (!result.slotSearch.dayEnd.isValid()) {
        throw ConfigurationError(QStringLiteral("scheduler/dayEnd must be HH:MM, got \"%1\"").arg(dayEnd));
    }
    result.slotSearch.stepMinutes = positiveInt(settings, QStringLiteral("scheduler/stepMinutes"), result.slotSearch.stepMinutes);
    result.allowReschedule = boolValue(settings, QStringLiteral("scheduler/allowReschedule"), result.allowReschedule);
    result.defaultDays = positiveInt(settings, QStringLiteral("scheduler/defaultDays"), result.defaultDays);

    return result;
}

} // namespace core
} // namespace routine
