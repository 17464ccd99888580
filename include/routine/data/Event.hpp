#pragma once

#include <QDate>
#include <QDateTime>
#include <QString>
#include <QTime>

namespace routine {
namespace data {

struct CalendarEvent
{
    QString id;
    QString title;
    QString description;
    QString location;
    QDateTime start;
    QDateTime end;
    bool allDay = false; // end date is exclusive, as in iCalendar
};

// Stores hand out naive wall-clock times in the calendar's zone. They carry Qt::UTC
// only so that comparisons never shift across DST transitions.
QDateTime wallClock(const QDate &date, const QTime &time);
QDateTime wallClock(const QDateTime &zoned);

// True if the event covers any part of [from, to). All-day events cover whole dates.
bool overlapsWindow(const CalendarEvent &event, const QDateTime &from, const QDateTime &to);

} // namespace data
} // namespace routine
