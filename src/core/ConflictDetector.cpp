#include "routine/core/ConflictDetector.hpp"

namespace routine {
namespace core {

bool intervalsOverlap(const QDateTime &s1, const QDateTime &e1, const QDateTime &s2, const QDateTime &e2)
{
    return s1 < e2 && s2 < e1;
}

TimeSlot blockedInterval(const data::CalendarEvent &event)
{
    if (!event.allDay) {
        return { event.start, event.end };
    }
    const QDate firstDay = event.start.date();
    // DTEND of an all-day event is exclusive.
    const QDate lastDay = event.end.date() > firstDay ? event.end.date().addDays(-1) : firstDay;
    return { data::wallClock(firstDay, QTime(0, 0)), data::wallClock(lastDay, QTime(23, 59, 59)) };
}

bool conflicts(const std::vector<data::CalendarEvent> &events,
               const QDateTime &start,
               const QDateTime &end,
               const QSet<QString> &ownedNames)
{
    for (const auto &event : events) {
        if (ownedNames.contains(event.title)) {
            continue;
        }
        const TimeSlot blocked = blockedInterval(event);
        if (intervalsOverlap(start, end, blocked.start, blocked.end)) {
            return true;
        }
    }
    return false;
}

} // namespace core
} // namespace routine
