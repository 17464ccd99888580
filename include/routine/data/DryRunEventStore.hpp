#pragma once

#include <memory>

#include <QSet>

#include "routine/data/EventStore.hpp"
#include "routine/data/InMemoryEventStore.hpp"

namespace routine {
namespace data {

// Reads through to another store but keeps every change in memory, so the
// underlying calendar is never written.
class DryRunEventStore : public EventStore
{
public:
    explicit DryRunEventStore(std::unique_ptr<EventStore> base);
    ~DryRunEventStore() override;

    std::vector<CalendarEvent> listEvents(const QDateTime &from, const QDateTime &to) const override;
    std::optional<CalendarEvent> findById(const QString &id) const override;
    CalendarEvent createEvent(const QString &title, const QDateTime &start, const QDateTime &end) override;
    bool removeEvent(const QString &id) override;
    QDateTime storedWallClock(const QDateTime &wallClock) const override;

private:
    std::unique_ptr<EventStore> m_base;
    InMemoryEventStore m_created;
    QSet<QString> m_removed;
};

} // namespace data
} // namespace routine
