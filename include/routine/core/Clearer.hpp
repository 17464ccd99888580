#pragma once

#include <QDate>

namespace routine {
namespace data {
class EventStore;
class TaskRegistry;
}

namespace core {

// Removes every event in [startDate, startDate + numDays) whose title is a
// routine task name.
class Clearer
{
public:
    Clearer(data::EventStore &store, const data::TaskRegistry &registry);

    int clearOwnedEvents(const QDate &startDate, int numDays);

private:
    data::EventStore &m_store;
    const data::TaskRegistry &m_registry;
};

} // namespace core
} // namespace routine
