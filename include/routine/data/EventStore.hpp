#pragma once

#include <optional>
#include <vector>

#include "routine/data/Event.hpp"

namespace routine {
namespace data {

// Narrow view on an external calendar. Implementations report read and write
// failures by throwing StoreUnavailable.
class EventStore
{
public:
    virtual ~EventStore() = default;

    // Every event overlapping [from, to), complete, in wall-clock time.
    virtual std::vector<CalendarEvent> listEvents(const QDateTime &from, const QDateTime &to) const = 0;
    virtual std::optional<CalendarEvent> findById(const QString &id) const = 0;
    virtual CalendarEvent createEvent(const QString &title, const QDateTime &start, const QDateTime &end) = 0;
    virtual bool removeEvent(const QString &id) = 0;

    // The wall-clock start an event created for `wallClock` ends up with. Differs
    // only for times the calendar's zone skips when clocks move forward.
    virtual QDateTime storedWallClock(const QDateTime &wallClock) const { return wallClock; }
};

} // namespace data
} // namespace routine
