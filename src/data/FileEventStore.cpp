#include "routine/data/FileEventStore.hpp"

#include "routine/Errors.hpp"
#include "routine/Logging.hpp"

#include <QDir>
#include <algorithm>

namespace routine {
namespace data {

namespace {
QString calendarFilePath(const StoreConfig &config)
{
    const QString id = config.calendarId.trimmed();
    if (id.isEmpty() || id.contains('/') || id.contains('\\') || id.startsWith('.')) {
        throw ConfigurationError(QStringLiteral("Invalid calendar id \"%1\"").arg(config.calendarId));
    }
    const QString directory = config.directory.isEmpty() ? QDir::currentPath() : config.directory;
    return QDir(directory).filePath(id + QStringLiteral(".ics"));
}
} // namespace

FileEventStore::FileEventStore(StoreConfig config)
    : m_config(std::move(config))
{
    if (!m_config.timeZone.isValid()) {
        m_config.timeZone = QTimeZone::systemTimeZone();
    }
    m_storage = std::make_unique<FileCalendarStorage>(calendarFilePath(m_config), m_config.timeZone);
    qCInfo(lcStore) << "Using calendar" << m_config.calendarId << "at" << m_storage->filePath()
                    << "in zone" << m_config.timeZone.id();
}

std::vector<CalendarEvent> FileEventStore::listEvents(const QDateTime &from, const QDateTime &to) const
{
    m_storage->refresh();

    // Zone offsets stay within a day, so this window holds every candidate instant.
    const QDateTime paddedFrom = QDateTime(from.date(), from.time(), Qt::UTC).addDays(-1);
    const QDateTime paddedTo = QDateTime(to.date(), to.time(), Qt::UTC).addDays(1);

    std::vector<CalendarEvent> result;
    for (const CalendarEvent &stored : m_storage->occurrences(paddedFrom, paddedTo)) {
        CalendarEvent event = toWallClock(stored);
        if (!overlapsWindow(event, from, to)) {
            continue;
        }
        result.push_back(std::move(event));
    }
    std::sort(result.begin(), result.end(), [](const CalendarEvent &lhs, const CalendarEvent &rhs) {
        if (lhs.start == rhs.start) {
            return lhs.end < rhs.end;
        }
        return lhs.start < rhs.start;
    });
    qCDebug(lcStore) << "Listed" << result.size() << "events in" << from.toString(Qt::ISODate) << "-"
                     << to.toString(Qt::ISODate);
    return result;
}

std::optional<CalendarEvent> FileEventStore::findById(const QString &id) const
{
    m_storage->refresh();
    const auto stored = m_storage->find(id);
    if (!stored) {
        return std::nullopt;
    }
    return toWallClock(*stored);
}

CalendarEvent FileEventStore::createEvent(const QString &title, const QDateTime &start, const QDateTime &end)
{
    CalendarEvent event;
    event.title = title;
    event.start = toZoned(start);
    event.end = event.start.addSecs(start.secsTo(end));
    const CalendarEvent stored = m_storage->addEvent(std::move(event));
    qCDebug(lcStore) << "Created" << stored.id << title << "at" << stored.start.toString(Qt::ISODate);
    return toWallClock(stored);
}

bool FileEventStore::removeEvent(const QString &id)
{
    const bool removed = m_storage->removeEvent(id);
    if (removed) {
        qCDebug(lcStore) << "Deleted" << id;
    }
    return removed;
}

QDateTime FileEventStore::storedWallClock(const QDateTime &wallClock) const
{
    return data::wallClock(toZoned(wallClock).toTimeZone(m_config.timeZone));
}

QString FileEventStore::filePath() const
{
    return m_storage->filePath();
}

QDateTime FileEventStore::toZoned(const QDateTime &wallClock) const
{
    const QDateTime zoned(wallClock.date(), wallClock.time(), m_config.timeZone);
    if (zoned.isValid() && data::wallClock(zoned.toTimeZone(m_config.timeZone)) == wallClock) {
        return zoned;
    }
    // The time lies in a gap where clocks jump forward. It moves forward by the
    // length of the gap, using the offset in effect a day earlier.
    const QDateTime asUtc(wallClock.date(), wallClock.time(), Qt::UTC);
    const int offsetBefore = m_config.timeZone.offsetFromUtc(asUtc.addDays(-1));
    const QDateTime shifted = asUtc.addSecs(-offsetBefore).toTimeZone(m_config.timeZone);
    qCInfo(lcStore) << wallClock.toString(Qt::ISODate) << "does not exist in" << m_config.timeZone.id()
                    << "and becomes" << shifted.toString(Qt::ISODate);
    return shifted;
}

CalendarEvent FileEventStore::toWallClock(const CalendarEvent &stored) const
{
    CalendarEvent event = stored;
    if (stored.allDay) {
        event.start = wallClock(stored.start.date(), QTime(0, 0));
        event.end = wallClock(stored.end.date(), QTime(0, 0));
        return event;
    }
    event.start = wallClock(stored.start.toTimeZone(m_config.timeZone));
    event.end = wallClock(stored.end.toTimeZone(m_config.timeZone));
    return event;
}

} // namespace data
} // namespace routine
