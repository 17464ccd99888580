#include "routine/data/Event.hpp"

namespace routine {
namespace data {

QDateTime wallClock(const QDate &date, const QTime &time)
{
    return QDateTime(date, time, Qt::UTC);
}

QDateTime wallClock(const QDateTime &zoned)
{
    if (!zoned.isValid()) {
        return {};
    }
    return QDateTime(zoned.date(), zoned.time(), Qt::UTC);
}

bool overlapsWindow(const CalendarEvent &event, const QDateTime &from, const QDateTime &to)
{
    QDateTime start = event.start;
    QDateTime end = event.end;
    if (event.allDay) {
        const QDate firstDay = event.start.date();
        const QDate endDay = event.end.date() > firstDay ? event.end.date() : firstDay.addDays(1);
        start = wallClock(firstDay, QTime(0, 0));
        end = wallClock(endDay, QTime(0, 0));
    }
    return start < to && from < end;
}

} // namespace data
} // namespace routine
