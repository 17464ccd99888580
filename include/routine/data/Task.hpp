#pragma once

#include <QDate>
#include <QDateTime>
#include <QString>
#include <QStringList>
#include <QTime>

namespace routine {
namespace data {

struct RoutineTask
{
    QString name;
    QStringList days; // "Mon" .. "Sun"
    QTime startTime;
    int durationMinutes = 0;

    bool runsOn(const QDate &date) const;
    QDateTime nominalStart(const QDate &date) const;
    QDateTime nominalEnd(const QDate &date) const;
};

// Locale independent short weekday code of a date, e.g. "Mon".
QString weekdayCode(const QDate &date);

// Canonical spelling of a weekday code ("mon" -> "Mon"), or an empty string.
QString normalizeWeekdayCode(const QString &code);

} // namespace data
} // namespace routine
