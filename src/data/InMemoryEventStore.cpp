#include "routine/data/InMemoryEventStore.hpp"

#include <QUuid>
#include <algorithm>

namespace routine {
namespace data {

InMemoryEventStore::InMemoryEventStore() = default;

InMemoryEventStore::~InMemoryEventStore() = default;

std::vector<CalendarEvent> InMemoryEventStore::listEvents(const QDateTime &from, const QDateTime &to) const
{
    std::vector<CalendarEvent> events;
    for (const auto &event : m_events) {
        if (!overlapsWindow(event, from, to)) {
            continue;
        }
        events.push_back(event);
    }
    std::sort(events.begin(), events.end(), [](const CalendarEvent &lhs, const CalendarEvent &rhs) {
        if (lhs.start == rhs.start) {
            return lhs.end < rhs.end;
        }
        return lhs.start < rhs.start;
    });
    return events;
}

std::optional<CalendarEvent> InMemoryEventStore::findById(const QString &id) const
{
    if (m_events.contains(id)) {
        return m_events.value(id);
    }
    return std::nullopt;
}

CalendarEvent InMemoryEventStore::createEvent(const QString &title, const QDateTime &start, const QDateTime &end)
{
    CalendarEvent event;
    event.title = title;
    event.start = start;
    event.end = end;
    return insertEvent(std::move(event));
}

bool InMemoryEventStore::removeEvent(const QString &id)
{
    return m_events.remove(id) > 0;
}

CalendarEvent InMemoryEventStore::insertEvent(CalendarEvent event)
{
    if (event.id.isEmpty()) {
        event.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    }
    if (!event.allDay && (!event.end.isValid() || event.end <= event.start)) {
        event.end = event.start.addSecs(30 * 60);
    }
    m_events.insert(event.id, event);
    return event;
}

int InMemoryEventStore::count() const
{
    return m_events.size();
}

} // namespace data
} // namespace routine
