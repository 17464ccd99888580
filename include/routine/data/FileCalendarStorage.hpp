#pragma once

#include <optional>
#include <utility>
#include <vector>

#include <QDateTime>
#include <QHash>
#include <QList>
#include <QString>
#include <QStringList>
#include <QTimeZone>

#include "routine/data/Event.hpp"
#include "routine/data/Recurrence.hpp"

namespace routine {
namespace data {

// One iCalendar file. Timed events are kept as absolute instants; floating times in
// the file are read in floatingZone. All-day events keep their dates at midnight UTC.
//
// Events read from the file are written back line by line as they were read, and so
// is everything that is not a VEVENT (VTODO, VTIMEZONE, calendar properties). Only
// events added through addEvent are written from their fields.
//
// Recurring events are expanded on request. Each occurrence of a series gets the id
// "<UID>_<start>", with the start as UTC date-time or, for all-day series, as date.
// An overridden occurrence (RECURRENCE-ID) is stored under that same id.
//
// Read and write failures throw StoreUnavailable. A failed write leaves the
// in-memory state as it was before the call.
class FileCalendarStorage
{
public:
    FileCalendarStorage(QString filePath, QTimeZone floatingZone);
    ~FileCalendarStorage() = default;

    const QString &filePath() const;

    // Re-reads the file if somebody else changed it since the last load or save.
    void refresh();

    // Events and occurrences that may overlap [from, to).
    std::vector<CalendarEvent> occurrences(const QDateTime &from, const QDateTime &to) const;
    std::optional<CalendarEvent> find(const QString &id) const;

    CalendarEvent addEvent(CalendarEvent event);
    // Removing one occurrence of a series adds an EXDATE to the series.
    bool removeEvent(const QString &id);

private:
    struct StoredEvent
    {
        CalendarEvent event;
        QString uid;
        QDateTime recurrenceId;
        std::optional<RecurrenceRule> rule;
        QList<QDateTime> exceptions;
        QList<QDateTime> overridden;
        QStringList lines; // as read, empty for events added here
    };

    void load();
    void save();
    void rememberFileState();
    void linkOverrides();

    std::optional<std::pair<QString, QDateTime>> resolveOccurrence(const QString &id) const;
    CalendarEvent occurrenceAt(const StoredEvent &series, const QDateTime &start) const;
    QList<QDateTime> excludedStarts(const StoredEvent &series) const;

    static void addException(StoredEvent &series, const QDateTime &start);
    static QString instanceId(const QString &uid, const QDateTime &start, bool allDay);
    static QString encodeText(const QString &text);
    static QString decodeText(const QString &text);
    static QString formatDateTime(const QDateTime &dt);
    QDateTime parseDateTime(const QString &value, const QString &parameters) const;

    QString m_filePath;
    QTimeZone m_floatingZone;
    QHash<QString, StoredEvent> m_events;
    QStringList m_calendarLines;
    QDateTime m_lastModified;
    qint64 m_lastSize = -1;
};

} // namespace data
} // namespace routine
