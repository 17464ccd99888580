#pragma once

#include <QHash>

#include "routine/data/EventStore.hpp"

namespace routine {
namespace data {

class InMemoryEventStore : public EventStore
{
public:
    InMemoryEventStore();
    ~InMemoryEventStore() override;

    std::vector<CalendarEvent> listEvents(const QDateTime &from, const QDateTime &to) const override;
    std::optional<CalendarEvent> findById(const QString &id) const override;
    CalendarEvent createEvent(const QString &title, const QDateTime &start, const QDateTime &end) override;
    bool removeEvent(const QString &id) override;

    // Adds a fully described event, e.g. an all-day one or a copy from another store.
    CalendarEvent insertEvent(CalendarEvent event);
    int count() const;

private:
    QHash<QString, CalendarEvent> m_events;
};

} // namespace data
} // namespace routine
