#include "routine/data/DryRunEventStore.hpp"

#include "routine/Logging.hpp"

#include <algorithm>

namespace routine {
namespace data {

DryRunEventStore::DryRunEventStore(std::unique_ptr<EventStore> base)
    : m_base(std::move(base))
{
}

DryRunEventStore::~DryRunEventStore() = default;

std::vector<CalendarEvent> DryRunEventStore::listEvents(const QDateTime &from, const QDateTime &to) const
{
    std::vector<CalendarEvent> events = m_base->listEvents(from, to);
    events.erase(std::remove_if(events.begin(), events.end(),
                                [this](const CalendarEvent &event) { return m_removed.contains(event.id); }),
                 events.end());
    for (auto &event : m_created.listEvents(from, to)) {
        events.push_back(std::move(event));
    }
    std::sort(events.begin(), events.end(), [](const CalendarEvent &lhs, const CalendarEvent &rhs) {
        if (lhs.start == rhs.start) {
            return lhs.end < rhs.end;
        }
        return lhs.start < rhs.start;
    });
    return events;
}

std::optional<CalendarEvent> DryRunEventStore::findById(const QString &id) const
{
    if (m_removed.contains(id)) {
        return std::nullopt;
    }
    if (auto created = m_created.findById(id)) {
        return created;
    }
    return m_base->findById(id);
}

CalendarEvent DryRunEventStore::createEvent(const QString &title, const QDateTime &start, const QDateTime &end)
{
    qCDebug(lcStore) << "Dry run, not writing" << title << "at" << start.toString(Qt::ISODate);
    return m_created.createEvent(title, start, end);
}

bool DryRunEventStore::removeEvent(const QString &id)
{
    if (m_created.removeEvent(id)) {
        return true;
    }
    if (m_removed.contains(id) || !m_base->findById(id)) {
        return false;
    }
    qCDebug(lcStore) << "Dry run, not deleting" << id;
    m_removed.insert(id);
    return true;
}

QDateTime DryRunEventStore::storedWallClock(const QDateTime &wallClock) const
{
    return m_base->storedWallClock(wallClock);
}

} // namespace data
} // namespace routine
