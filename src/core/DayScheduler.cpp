#include "routine/core/DayScheduler.hpp"

#include "routine/Errors.hpp"
#include "routine/Logging.hpp"
#include "routine/core/ConflictDetector.hpp"
#include "routine/data/EventStore.hpp"
#include "routine/data/TaskRegistry.hpp"

#include <algorithm>

namespace routine {
namespace core {

namespace {
QString hhmm(const QDateTime &dt)
{
    return dt.time().toString(QStringLiteral("HH:mm"));
}

Decision placed(const data::RoutineTask &task, DecisionStatus status, DecisionReason reason,
                const data::CalendarEvent &event)
{
    Decision decision;
    decision.taskName = task.name;
    decision.status = status;
    decision.reason = reason;
    decision.scheduledStart = event.start;
    decision.scheduledEnd = event.end;
    decision.eventId = event.id;
    return decision;
}

Decision skipped(const data::RoutineTask &task, DecisionReason reason)
{
    Decision decision;
    decision.taskName = task.name;
    decision.status = DecisionStatus::Skipped;
    decision.reason = reason;
    return decision;
}
} // namespace

DayScheduler::DayScheduler(data::EventStore &store, const data::TaskRegistry &registry, SlotSearchOptions options)
    : m_store(store)
    , m_registry(registry)
    , m_options(options)
{
}

DayPlan DayScheduler::scheduleDay(const QDate &day, bool allowReschedule)
{
    DayPlan decisions;
    if (!day.isValid()) {
        return decisions;
    }

    const auto &tasks = m_registry.tasks();
    const bool anyTask = std::any_of(tasks.begin(), tasks.end(), [&day](const data::RoutineTask &task) {
        return task.runsOn(day);
    });
    if (!anyTask) {
        qCDebug(lcScheduler) << "No routine tasks on" << day.toString(Qt::ISODate);
        return decisions;
    }

    std::vector<data::CalendarEvent> working;
    try {
        working = m_store.listEvents(data::wallClock(day, QTime(0, 0)), data::wallClock(day.addDays(1), QTime(0, 0)));
    } catch (const StoreUnavailable &error) {
        qCWarning(lcScheduler) << "Reading events of" << day.toString(Qt::ISODate) << "failed:" << error.what();
        throw;
    }
    qCDebug(lcScheduler) << day.toString(Qt::ISODate) << "has" << working.size() << "events";

    const QSet<QString> owned = m_registry.ownedNames();
    for (const data::RoutineTask &task : tasks) {
        if (!task.runsOn(day)) {
            continue;
        }
        Decision decision = scheduleTask(task, day, allowReschedule, owned, working);
        if (decision.isPlaced()) {
            qCInfo(lcScheduler).noquote() << day.toString(Qt::ISODate) << task.name << statusToString(decision.status)
                                          << hhmm(decision.scheduledStart) << "-" << hhmm(decision.scheduledEnd);
        } else {
            qCInfo(lcScheduler).noquote() << day.toString(Qt::ISODate) << task.name << "skipped:"
                                          << reasonToString(decision.reason);
        }
        decisions.push_back(std::move(decision));
    }
    return decisions;
}

Decision DayScheduler::scheduleTask(const data::RoutineTask &task, const QDate &day, bool allowReschedule,
                                    const QSet<QString> &owned, std::vector<data::CalendarEvent> &working)
{
    const TimeSlot nominal{ task.nominalStart(day), task.nominalEnd(day) };

    if (!conflicts(working, nominal.start, nominal.end, owned)) {
        const data::CalendarEvent event = place(task.name, nominal, working);
        return placed(task, DecisionStatus::Scheduled, DecisionReason::OriginalSlot, event);
    }

    if (!allowReschedule) {
        return skipped(task, DecisionReason::ConflictAndRescheduleDisabled);
    }

    const auto slot = findSlot(working, day, task.startTime, task.durationMinutes, owned, m_options);
    if (!slot) {
        return skipped(task, DecisionReason::NoFreeSlotFound);
    }
    const data::CalendarEvent event = place(task.name, *slot, working);
    return placed(task, DecisionStatus::ScheduledRescheduled, DecisionReason::RescheduledDueToConflict, event);
}

data::CalendarEvent DayScheduler::place(const QString &title, const TimeSlot &slot,
                                        std::vector<data::CalendarEvent> &working)
{
    // Where the store will really put it; differs only inside a DST gap.
    const QDateTime start = m_store.storedWallClock(slot.start);
    const QDateTime end = start.addSecs(slot.start.secsTo(slot.end));

    // A previous run may already have put this task exactly here.
    for (const auto &event : working) {
        if (!event.allDay && event.title == title && event.start == start && event.end == end) {
            qCDebug(lcScheduler) << "Reusing" << event.id << "for" << title;
            return event;
        }
    }

    data::CalendarEvent created;
    try {
        created = m_store.createEvent(title, start, end);
    } catch (const StoreUnavailable &error) {
        qCWarning(lcScheduler) << "Creating" << title << "at" << start.toString(Qt::ISODate)
                               << "failed:" << error.what();
        throw;
    }
    working.push_back(created);
    return created;
}

} // namespace core
} // namespace routine
