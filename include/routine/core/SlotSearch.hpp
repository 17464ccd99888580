#pragma once

#include <optional>
#include <vector>

#include <QDate>
#include <QSet>
#include <QString>
#include <QTime>

#include "routine/core/ConflictDetector.hpp"
#include "routine/data/Event.hpp"

namespace routine {
namespace core {

struct SlotSearchOptions
{
    QTime dayEnd = QTime(22, 0);
    int stepMinutes = 15;
};

// Scans forward from nominalStart on the same day in stepMinutes increments and
// returns the first candidate that ends by dayEnd and does not conflict.
std::optional<TimeSlot> findSlot(const std::vector<data::CalendarEvent> &events,
                                 const QDate &day,
                                 const QTime &nominalStart,
                                 int durationMinutes,
                                 const QSet<QString> &ownedNames,
                                 const SlotSearchOptions &options = SlotSearchOptions());

} // namespace core
} // namespace routine
