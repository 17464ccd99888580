#include "routine/data/FileCalendarStorage.hpp"

#include "routine/Errors.hpp"
#include "routine/Logging.hpp"

#include <QDate>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QRegularExpression>
#include <QSaveFile>
#include <QTextStream>
#include <QTime>
#include <QUuid>
#include <algorithm>

namespace routine {
namespace data {

namespace {
constexpr auto DATE_FORMAT = "yyyyMMdd";
constexpr auto DATE_TIME_FORMAT = "yyyyMMdd'T'hhmmss'Z'";
constexpr auto FLOATING_DATE_TIME_FORMAT = "yyyyMMdd'T'hhmmss";

// A logical content line and the physical lines it was folded into.
struct ContentLine
{
    QString text;
    QStringList physical;
};

QString newUid()
{
    return QUuid::createUuid().toString(QUuid::WithoutBraces);
}

QString parameterValue(const QString &parameters, const QString &key)
{
    const QStringList parts = parameters.split(';', Qt::SkipEmptyParts);
    for (const QString &part : parts) {
        const int eq = part.indexOf('=');
        if (eq > 0 && part.left(eq).compare(key, Qt::CaseInsensitive) == 0) {
            return part.mid(eq + 1);
        }
    }
    return {};
}

// RFC 5545 DURATION in seconds, or -1.
qint64 parseDuration(const QString &value)
{
    static const QRegularExpression pattern(
        QStringLiteral("^\\+?P(?:(\\d+)W)?(?:(\\d+)D)?(?:T(?:(\\d+)H)?(?:(\\d+)M)?(?:(\\d+)S)?)?$"));
    const auto match = pattern.match(value.trimmed().toUpper());
    if (!match.hasMatch()) {
        return -1;
    }
    return match.captured(1).toLongLong() * 7 * 86400 + match.captured(2).toLongLong() * 86400
        + match.captured(3).toLongLong() * 3600 + match.captured(4).toLongLong() * 60 + match.captured(5).toLongLong();
}

QDateTime parseInstanceStart(const QString &suffix)
{
    if (suffix.size() == 8) {
        const QDate date = QDate::fromString(suffix, QLatin1String(DATE_FORMAT));
        return date.isValid() ? QDateTime(date, QTime(0, 0), Qt::UTC) : QDateTime();
    }
    QDateTime start = QDateTime::fromString(suffix, QLatin1String(DATE_TIME_FORMAT));
    start.setTimeSpec(Qt::UTC);
    return start;
}
} // namespace

FileCalendarStorage::FileCalendarStorage(QString filePath, QTimeZone floatingZone)
    : m_filePath(std::move(filePath))
    , m_floatingZone(std::move(floatingZone))
{
    if (!m_floatingZone.isValid()) {
        m_floatingZone = QTimeZone::systemTimeZone();
    }
    load();
}

const QString &FileCalendarStorage::filePath() const
{
    return m_filePath;
}

void FileCalendarStorage::refresh()
{
    const QFileInfo info(m_filePath);
    if (!info.exists() && m_lastSize < 0) {
        return;
    }
    if (info.exists() && info.lastModified() == m_lastModified && info.size() == m_lastSize) {
        return;
    }
    qCDebug(lcStore) << "Calendar file changed on disk, reloading" << m_filePath;
    load();
}

std::vector<CalendarEvent> FileCalendarStorage::occurrences(const QDateTime &from, const QDateTime &to) const
{
    std::vector<CalendarEvent> result;
    for (const StoredEvent &stored : m_events) {
        if (!stored.rule) {
            if (stored.event.start < to && from < stored.event.end) {
                result.push_back(stored.event);
            }
            continue;
        }
        const auto starts = occurrenceStarts(*stored.rule, stored.event.start, to, excludedStarts(stored));
        for (const QDateTime &start : starts) {
            CalendarEvent occurrence = occurrenceAt(stored, start);
            if (from < occurrence.end) {
                result.push_back(std::move(occurrence));
            }
        }
    }
    return result;
}

std::optional<CalendarEvent> FileCalendarStorage::find(const QString &id) const
{
    const auto it = m_events.constFind(id);
    if (it != m_events.constEnd() && !it->rule) {
        return it->event;
    }
    const auto occurrence = resolveOccurrence(id);
    if (!occurrence) {
        return std::nullopt;
    }
    return occurrenceAt(m_events.value(occurrence->first), occurrence->second);
}

CalendarEvent FileCalendarStorage::addEvent(CalendarEvent event)
{
    if (event.id.isEmpty() || m_events.contains(event.id)) {
        event.id = newUid();
    }
    if (!event.allDay && (!event.end.isValid() || event.end <= event.start)) {
        event.end = event.start.addSecs(30 * 60);
    }

    StoredEvent stored;
    stored.event = event;
    stored.uid = event.id;
    m_events.insert(event.id, stored);
    try {
        save();
    } catch (const StoreUnavailable &) {
        m_events.remove(event.id);
        throw;
    }
    return event;
}

bool FileCalendarStorage::removeEvent(const QString &id)
{
    const auto it = m_events.constFind(id);
    if (it != m_events.constEnd()) {
        const StoredEvent removed = it.value();
        std::optional<StoredEvent> seriesBefore;
        m_events.remove(id);
        if (removed.recurrenceId.isValid()) {
            // Without an EXDATE the series would bring the occurrence back.
            const auto series = m_events.find(removed.uid);
            if (series != m_events.end() && series->rule) {
                seriesBefore = series.value();
                addException(series.value(), removed.recurrenceId);
            }
        }
        try {
            save();
        } catch (const StoreUnavailable &) {
            m_events.insert(id, removed);
            if (seriesBefore) {
                m_events.insert(seriesBefore->event.id, *seriesBefore);
            }
            linkOverrides();
            throw;
        }
        linkOverrides();
        return true;
    }

    const auto occurrence = resolveOccurrence(id);
    if (!occurrence) {
        return false;
    }
    StoredEvent &series = m_events[occurrence->first];
    const StoredEvent before = series;
    addException(series, occurrence->second);
    try {
        save();
    } catch (const StoreUnavailable &) {
        m_events.insert(occurrence->first, before);
        throw;
    }
    return true;
}

std::optional<std::pair<QString, QDateTime>> FileCalendarStorage::resolveOccurrence(const QString &id) const
{
    const int separator = id.lastIndexOf('_');
    if (separator <= 0) {
        return std::nullopt;
    }
    const QString uid = id.left(separator);
    const auto series = m_events.constFind(uid);
    if (series == m_events.constEnd() || !series->rule) {
        return std::nullopt;
    }
    const QDateTime start = parseInstanceStart(id.mid(separator + 1));
    if (!start.isValid()) {
        return std::nullopt;
    }
    const auto starts = occurrenceStarts(*series->rule, series->event.start, start.addSecs(1), excludedStarts(*series));
    if (starts.isEmpty() || starts.last() != start) {
        return std::nullopt;
    }
    return std::make_pair(uid, starts.last());
}

CalendarEvent FileCalendarStorage::occurrenceAt(const StoredEvent &series, const QDateTime &start) const
{
    CalendarEvent occurrence = series.event;
    occurrence.id = instanceId(series.uid, start, series.event.allDay);
    occurrence.start = start;
    if (series.event.allDay) {
        occurrence.end = start.addDays(series.event.start.date().daysTo(series.event.end.date()));
    } else {
        occurrence.end = start.addSecs(series.event.start.secsTo(series.event.end));
    }
    return occurrence;
}

QList<QDateTime> FileCalendarStorage::excludedStarts(const StoredEvent &series) const
{
    return series.exceptions + series.overridden;
}

void FileCalendarStorage::linkOverrides()
{
    QList<std::pair<QString, QDateTime>> overrides;
    for (auto it = m_events.begin(); it != m_events.end(); ++it) {
        it->overridden.clear();
        if (it->recurrenceId.isValid()) {
            overrides.append(std::make_pair(it->uid, it->recurrenceId));
        }
    }
    for (const auto &entry : overrides) {
        const auto series = m_events.find(entry.first);
        if (series != m_events.end() && series->rule) {
            series->overridden.append(entry.second);
        }
    }
}

void FileCalendarStorage::load()
{
    m_events.clear();
    m_calendarLines.clear();
    m_lastSize = -1;
    m_lastModified = QDateTime();

    QFile file(m_filePath);
    if (!file.exists()) {
        return;
    }
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qCWarning(lcStore) << "Cannot open calendar file" << m_filePath << file.errorString();
        throw StoreUnavailable(QStringLiteral("Cannot read calendar file %1: %2").arg(m_filePath, file.errorString()));
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");

    QList<ContentLine> contentLines;
    while (!stream.atEnd()) {
        const QString line = stream.readLine();
        if (!line.isEmpty() && (line.startsWith(' ') || line.startsWith('\t')) && !contentLines.isEmpty()) {
            contentLines.last().text += line.mid(1);
            contentLines.last().physical.append(line);
        } else {
            contentLines.append(ContentLine{ line, QStringList{ line } });
        }
    }
    if (stream.status() != QTextStream::Ok) {
        throw StoreUnavailable(QStringLiteral("Failed reading calendar file %1").arg(m_filePath));
    }

    bool inEvent = false;
    int nestedDepth = 0;
    StoredEvent current;
    QString ruleText;
    qint64 durationSecs = -1;

    auto finalizeEvent = [&]() {
        if (!current.event.start.isValid()) {
            qCWarning(lcStore) << "Keeping event without DTSTART as is in" << m_filePath;
            m_calendarLines.append(current.lines);
            return;
        }
        if (current.uid.isEmpty()) {
            current.uid = newUid();
            current.lines.insert(1, QStringLiteral("UID:") + current.uid);
        }
        if (!current.event.end.isValid() && durationSecs >= 0) {
            current.event.end = current.event.allDay ? current.event.start.addDays(durationSecs / 86400)
                                                     : current.event.start.addSecs(durationSecs);
        }
        if (current.event.allDay) {
            if (!current.event.end.isValid() || current.event.end <= current.event.start) {
                current.event.end = current.event.start.addDays(1);
            }
        } else if (!current.event.end.isValid() || current.event.end <= current.event.start) {
            current.event.end = current.event.start.addSecs(30 * 60);
        }
        if (!ruleText.isEmpty() && !current.recurrenceId.isValid()) {
            current.rule = parseRecurrenceRule(ruleText, current.event.start);
        }

        current.event.id = current.recurrenceId.isValid()
            ? instanceId(current.uid, current.recurrenceId, current.event.allDay)
            : current.uid;
        if (m_events.contains(current.event.id)) {
            qCWarning(lcStore) << "Duplicate event" << current.event.id << "in" << m_filePath << "kept as is";
            m_calendarLines.append(current.lines);
            return;
        }
        m_events.insert(current.event.id, current);
    };

    auto handleProperty = [&](const QString &line) {
        const int colonIndex = line.indexOf(':');
        if (colonIndex <= 0) {
            return;
        }

        const QString property = line.left(colonIndex);
        const QString rawValue = line.mid(colonIndex + 1);
        const QString name = property.section(';', 0, 0).toUpper();
        const QString parameters = property.contains(';') ? property.section(';', 1) : QString();
        const QString value = decodeText(rawValue);

        const bool dateOnly = parameterValue(parameters, QStringLiteral("VALUE")).compare(QLatin1String("DATE"), Qt::CaseInsensitive) == 0
            || rawValue.size() == 8;

        if (name == QLatin1String("UID")) {
            current.uid = value;
        } else if (name == QLatin1String("SUMMARY")) {
            current.event.title = value;
        } else if (name == QLatin1String("DESCRIPTION")) {
            current.event.description = value;
        } else if (name == QLatin1String("LOCATION")) {
            current.event.location = value;
        } else if (name == QLatin1String("DTSTART")) {
            current.event.allDay = dateOnly;
            current.event.start = parseDateTime(rawValue, parameters);
        } else if (name == QLatin1String("DTEND")) {
            current.event.end = parseDateTime(rawValue, parameters);
        } else if (name == QLatin1String("DURATION")) {
            durationSecs = parseDuration(rawValue);
        } else if (name == QLatin1String("RRULE")) {
            ruleText = rawValue;
        } else if (name == QLatin1String("EXDATE")) {
            for (const QString &item : rawValue.split(',', Qt::SkipEmptyParts)) {
                const QDateTime excluded = parseDateTime(item.trimmed(), parameters);
                if (excluded.isValid()) {
                    current.exceptions.append(excluded);
                }
            }
        } else if (name == QLatin1String("RECURRENCE-ID")) {
            current.recurrenceId = parseDateTime(rawValue, parameters);
        }
    };

    for (const ContentLine &contentLine : contentLines) {
        const QString &line = contentLine.text;
        if (!inEvent) {
            if (line == QLatin1String("BEGIN:VCALENDAR") || line == QLatin1String("END:VCALENDAR")) {
                continue;
            }
            if (line == QLatin1String("BEGIN:VEVENT")) {
                inEvent = true;
                nestedDepth = 0;
                current = StoredEvent{};
                current.lines = contentLine.physical;
                ruleText.clear();
                durationSecs = -1;
                continue;
            }
            m_calendarLines.append(contentLine.physical);
            continue;
        }

        current.lines.append(contentLine.physical);
        if (nestedDepth == 0 && line == QLatin1String("END:VEVENT")) {
            finalizeEvent();
            inEvent = false;
        } else if (line.startsWith(QLatin1String("BEGIN:"))) {
            ++nestedDepth;
        } else if (line.startsWith(QLatin1String("END:"))) {
            nestedDepth = std::max(0, nestedDepth - 1);
        } else if (nestedDepth == 0) {
            // Properties of VALARM and other nested components stay untouched.
            handleProperty(line);
        }
    }
    if (inEvent) {
        qCWarning(lcStore) << "Unterminated VEVENT in" << m_filePath;
        m_calendarLines.append(current.lines);
    }

    linkOverrides();
    rememberFileState();
    qCDebug(lcStore) << "Loaded" << m_events.size() << "events from" << m_filePath;
}

void FileCalendarStorage::save()
{
    QFileInfo info(m_filePath);
    QDir dir = info.dir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        throw StoreUnavailable(QStringLiteral("Cannot create directory %1").arg(dir.path()));
    }

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        qCWarning(lcStore) << "Cannot write calendar file" << m_filePath << file.errorString();
        throw StoreUnavailable(QStringLiteral("Cannot write calendar file %1: %2").arg(m_filePath, file.errorString()));
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");

    auto hasProperty = [this](const QString &prefix) {
        return std::any_of(m_calendarLines.begin(), m_calendarLines.end(), [&prefix](const QString &line) {
            return line.startsWith(prefix);
        });
    };

    stream << "BEGIN:VCALENDAR\n";
    if (!hasProperty(QStringLiteral("VERSION:"))) {
        stream << "VERSION:2.0\n";
    }
    if (!hasProperty(QStringLiteral("PRODID:"))) {
        stream << "PRODID:-//Routine Planner//EN\n";
    }
    for (const QString &line : m_calendarLines) {
        stream << line << '\n';
    }

    auto events = m_events.values();
    std::sort(events.begin(), events.end(), [](const StoredEvent &lhs, const StoredEvent &rhs) {
        if (lhs.event.start == rhs.event.start) {
            return lhs.event.id < rhs.event.id;
        }
        return lhs.event.start < rhs.event.start;
    });
    for (const StoredEvent &stored : events) {
        if (!stored.lines.isEmpty()) {
            for (const QString &line : stored.lines) {
                stream << line << '\n';
            }
            continue;
        }
        const CalendarEvent &event = stored.event;
        stream << "BEGIN:VEVENT\n";
        stream << "UID:" << event.id << '\n';
        stream << "SUMMARY:" << encodeText(event.title) << '\n';
        if (!event.description.isEmpty()) {
            stream << "DESCRIPTION:" << encodeText(event.description) << '\n';
        }
        if (!event.location.isEmpty()) {
            stream << "LOCATION:" << encodeText(event.location) << '\n';
        }
        if (event.allDay) {
            stream << "DTSTART;VALUE=DATE:" << event.start.date().toString(DATE_FORMAT) << '\n';
            stream << "DTEND;VALUE=DATE:" << event.end.date().toString(DATE_FORMAT) << '\n';
        } else {
            stream << "DTSTART:" << formatDateTime(event.start) << '\n';
            stream << "DTEND:" << formatDateTime(event.end) << '\n';
        }
        stream << "END:VEVENT\n";
    }

    stream << "END:VCALENDAR\n";

    stream.flush();
    if (!file.commit()) {
        qCWarning(lcStore) << "Commit of calendar file failed" << m_filePath << file.errorString();
        throw StoreUnavailable(QStringLiteral("Cannot write calendar file %1: %2").arg(m_filePath, file.errorString()));
    }
    rememberFileState();
}

void FileCalendarStorage::rememberFileState()
{
    const QFileInfo info(m_filePath);
    m_lastModified = info.lastModified();
    m_lastSize = info.exists() ? info.size() : -1;
}

void FileCalendarStorage::addException(StoredEvent &series, const QDateTime &start)
{
    series.exceptions.append(start);
    if (series.lines.isEmpty()) {
        return;
    }
    const QString line = series.event.allDay
        ? QStringLiteral("EXDATE;VALUE=DATE:") + start.date().toString(QLatin1String(DATE_FORMAT))
        : QStringLiteral("EXDATE:") + formatDateTime(start);
    // Before END:VEVENT.
    series.lines.insert(series.lines.size() - 1, line);
}

QString FileCalendarStorage::instanceId(const QString &uid, const QDateTime &start, bool allDay)
{
    const QString suffix = allDay ? start.date().toString(QLatin1String(DATE_FORMAT)) : formatDateTime(start);
    return uid + '_' + suffix;
}

QString FileCalendarStorage::encodeText(const QString &text)
{
    QString encoded = text;
    encoded.replace('\\', "\\\\");
    encoded.replace('\n', "\\n");
    encoded.replace(',', "\\,");
    encoded.replace(';', "\\;");
    return encoded;
}

QString FileCalendarStorage::decodeText(const QString &text)
{
    QString decoded = text;
    decoded.replace("\\n", "\n", Qt::CaseInsensitive);
    decoded.replace("\\,", ",");
    decoded.replace("\\;", ";");
    decoded.replace("\\\\", "\\");
    return decoded;
}

QString FileCalendarStorage::formatDateTime(const QDateTime &dt)
{
    if (!dt.isValid()) {
        return {};
    }
    return dt.toUTC().toString(QLatin1String(DATE_TIME_FORMAT));
}

QDateTime FileCalendarStorage::parseDateTime(const QString &value, const QString &parameters) const
{
    if (value.length() == 8) {
        const QDate date = QDate::fromString(value, DATE_FORMAT);
        return QDateTime(date, QTime(0, 0), Qt::UTC);
    }
    if (value.endsWith('Z')) {
        QDateTime dt = QDateTime::fromString(value, DATE_TIME_FORMAT);
        dt.setTimeSpec(Qt::UTC);
        return dt;
    }
    QDateTime local = QDateTime::fromString(value, FLOATING_DATE_TIME_FORMAT);
    if (!local.isValid()) {
        local = QDateTime::fromString(value, Qt::ISODate);
        if (local.isValid() && local.timeSpec() != Qt::LocalTime) {
            return local;
        }
    }
    if (!local.isValid()) {
        return {};
    }
    QTimeZone zone = m_floatingZone;
    const QString tzid = parameterValue(parameters, QStringLiteral("TZID"));
    if (!tzid.isEmpty()) {
        const QTimeZone named(tzid.toUtf8());
        if (named.isValid()) {
            zone = named;
        }
    }
    return QDateTime(local.date(), local.time(), zone);
}

} // namespace data
} // namespace routine
