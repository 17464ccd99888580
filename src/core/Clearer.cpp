#include "routine/core/Clearer.hpp"

#include "routine/Logging.hpp"
#include "routine/data/EventStore.hpp"
#include "routine/data/TaskRegistry.hpp"

namespace routine {
namespace core {

Clearer::Clearer(data::EventStore &store, const data::TaskRegistry &registry)
    : m_store(store)
    , m_registry(registry)
{
}

int Clearer::clearOwnedEvents(const QDate &startDate, int numDays)
{
    if (!startDate.isValid() || numDays <= 0 || m_registry.isEmpty()) {
        return 0;
    }

    const QSet<QString> owned = m_registry.ownedNames();
    const auto events = m_store.listEvents(data::wallClock(startDate, QTime(0, 0)),
                                           data::wallClock(startDate.addDays(numDays), QTime(0, 0)));
    int deleted = 0;
    for (const auto &event : events) {
        if (!owned.contains(event.title)) {
            continue;
        }
        if (m_store.removeEvent(event.id)) {
            ++deleted;
            qCDebug(lcScheduler) << "Removed" << event.title << "at" << event.start.toString(Qt::ISODate);
        }
    }
    qCInfo(lcScheduler) << "Cleared" << deleted << "routine events from" << startDate.toString(Qt::ISODate)
                        << "over" << numDays << "days";
    return deleted;
}

} // namespace core
} // namespace routine
