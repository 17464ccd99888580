#pragma once

#include "routine/data/EventStore.hpp"
#include "routine/data/FileCalendarStorage.hpp"
#include "routine/data/StoreConfig.hpp"

#include <memory>

namespace routine {
namespace data {

class FileEventStore : public EventStore
{
public:
    explicit FileEventStore(StoreConfig config);
    ~FileEventStore() override = default;

    std::vector<CalendarEvent> listEvents(const QDateTime &from, const QDateTime &to) const override;
    std::optional<CalendarEvent> findById(const QString &id) const override;
    CalendarEvent createEvent(const QString &title, const QDateTime &start, const QDateTime &end) override;
    bool removeEvent(const QString &id) override;
    QDateTime storedWallClock(const QDateTime &wallClock) const override;

    QString filePath() const;

private:
    QDateTime toZoned(const QDateTime &wallClock) const;
    CalendarEvent toWallClock(const CalendarEvent &stored) const;

    StoreConfig m_config;
    std::unique_ptr<FileCalendarStorage> m_storage;
};

} // namespace data
} // namespace routine
