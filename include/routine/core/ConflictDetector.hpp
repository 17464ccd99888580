#pragma once

#include <vector>

#include <QDateTime>
#include <QSet>
#include <QString>

#include "routine/data/Event.hpp"

namespace routine {
namespace core {

struct TimeSlot
{
    QDateTime start;
    QDateTime end;
};

// Half-open intervals [s1, e1) and [s2, e2). Touching intervals do not overlap.
bool intervalsOverlap(const QDateTime &s1, const QDateTime &e1, const QDateTime &s2, const QDateTime &e2);

// Interval an event blocks. All-day events cover 00:00:00 of their first date up to
// 23:59:59 of their last date.
TimeSlot blockedInterval(const data::CalendarEvent &event);

// True if any event not owned by the routine overlaps [start, end). Events whose
// title is one of ownedNames never block.
bool conflicts(const std::vector<data::CalendarEvent> &events,
               const QDateTime &start,
               const QDateTime &end,
               const QSet<QString> &ownedNames);

} // namespace core
} // namespace routine
