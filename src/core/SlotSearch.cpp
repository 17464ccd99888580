#include "routine/core/SlotSearch.hpp"

#include "routine/Logging.hpp"

namespace routine {
namespace core {

std::optional<TimeSlot> findSlot(const std::vector<data::CalendarEvent> &events,
                                 const QDate &day,
                                 const QTime &nominalStart,
                                 int durationMinutes,
                                 const QSet<QString> &ownedNames,
                                 const SlotSearchOptions &options)
{
    if (durationMinutes <= 0 || options.stepMinutes <= 0 || !nominalStart.isValid() || !options.dayEnd.isValid()) {
        return std::nullopt;
    }

    const qint64 duration = static_cast<qint64>(durationMinutes) * 60;
    const qint64 step = static_cast<qint64>(options.stepMinutes) * 60;
    const QDateTime lastEnd = data::wallClock(day, options.dayEnd);

    QDateTime candidate = data::wallClock(day, nominalStart);
    while (candidate.addSecs(duration) <= lastEnd) {
        const QDateTime candidateEnd = candidate.addSecs(duration);
        if (!conflicts(events, candidate, candidateEnd, ownedNames)) {
            return TimeSlot{ candidate, candidateEnd };
        }
        qCDebug(lcScheduler) << "Slot" << candidate.time().toString(QStringLiteral("HH:mm")) << "taken";
        candidate = candidate.addSecs(step);
    }
    return std::nullopt;
}

} // namespace core
} // namespace routine
