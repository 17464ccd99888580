#pragma once

#include <vector>

#include <QDate>
#include <QSet>
#include <QString>

#include "routine/core/Decision.hpp"
#include "routine/core/SlotSearch.hpp"

namespace routine {
namespace data {
class EventStore;
class TaskRegistry;
struct CalendarEvent;
struct RoutineTask;
}

namespace core {

// Places every task of the registry that runs on a given day. The day's events are
// read once; events created during the run are added to that working set.
//
// Store failures propagate as StoreUnavailable. Events already created for earlier
// tasks of the day are kept.
class DayScheduler
{
public:
    DayScheduler(data::EventStore &store, const data::TaskRegistry &registry,
                 SlotSearchOptions options = SlotSearchOptions());

    DayPlan scheduleDay(const QDate &day, bool allowReschedule = true);

private:
    Decision scheduleTask(const data::RoutineTask &task, const QDate &day, bool allowReschedule,
                          const QSet<QString> &owned, std::vector<data::CalendarEvent> &working);
    data::CalendarEvent place(const QString &title, const TimeSlot &slot, std::vector<data::CalendarEvent> &working);

    data::EventStore &m_store;
    const data::TaskRegistry &m_registry;
    SlotSearchOptions m_options;
};

} // namespace core
} // namespace routine
