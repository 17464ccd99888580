#include "routine/data/Recurrence.hpp"

#include "routine/Logging.hpp"

#include <QDate>
#include <QRegularExpression>
#include <QTime>
#include <algorithm>

namespace routine {
namespace data {

namespace {
constexpr auto DATE_FORMAT = "yyyyMMdd";
constexpr auto UTC_DATE_TIME_FORMAT = "yyyyMMdd'T'hhmmss'Z'";
constexpr auto FLOATING_DATE_TIME_FORMAT = "yyyyMMdd'T'hhmmss";

const QStringList WEEKDAY_CODES = { QStringLiteral("MO"), QStringLiteral("TU"), QStringLiteral("WE"),
                                    QStringLiteral("TH"), QStringLiteral("FR"), QStringLiteral("SA"),
                                    QStringLiteral("SU") };

// Same clock time and time frame as the template, on another date.
QDateTime onDate(const QDateTime &templ, const QDate &date)
{
    QDateTime result = templ;
    result.setDate(date);
    return result;
}

QDateTime parseUntil(const QString &value, const QDateTime &firstStart)
{
    if (value.size() == 8) {
        QDateTime until = onDate(firstStart, QDate::fromString(value, QLatin1String(DATE_FORMAT)));
        until.setTime(QTime(23, 59, 59));
        return until;
    }
    if (value.endsWith('Z')) {
        QDateTime until = QDateTime::fromString(value, QLatin1String(UTC_DATE_TIME_FORMAT));
        until.setTimeSpec(Qt::UTC);
        return until;
    }
    const QDateTime floating = QDateTime::fromString(value, QLatin1String(FLOATING_DATE_TIME_FORMAT));
    if (!floating.isValid()) {
        return {};
    }
    QDateTime until = onDate(firstStart, floating.date());
    until.setTime(floating.time());
    return until;
}

// All dates of one month that fall on the weekday; ordinal picks one of them.
QList<QDate> weekdaysInMonth(const QDate &monthStart, const RecurrenceRule::WeekdayEntry &entry)
{
    QList<QDate> matches;
    for (QDate date = monthStart; date.month() == monthStart.month(); date = date.addDays(1)) {
        if (date.dayOfWeek() == entry.weekday) {
            matches.append(date);
        }
    }
    if (entry.ordinal == 0) {
        return matches;
    }
    const int index = entry.ordinal > 0 ? entry.ordinal - 1 : matches.size() + entry.ordinal;
    if (index < 0 || index >= matches.size()) {
        return {};
    }
    return { matches.at(index) };
}

bool matchesByDay(const RecurrenceRule &rule, const QDate &date)
{
    if (rule.byDay.isEmpty()) {
        return true;
    }
    return std::any_of(rule.byDay.begin(), rule.byDay.end(), [&date](const RecurrenceRule::WeekdayEntry &entry) {
        return entry.weekday == date.dayOfWeek();
    });
}

bool matchesByMonthDay(const RecurrenceRule &rule, const QDate &date)
{
    if (rule.byMonthDay.isEmpty()) {
        return true;
    }
    return std::any_of(rule.byMonthDay.begin(), rule.byMonthDay.end(), [&date](int day) {
        return day > 0 ? date.day() == day : date.daysInMonth() + day + 1 == date.day();
    });
}

// First date of the n-th period of the series.
QDate periodStart(const RecurrenceRule &rule, const QDate &firstDate, int period)
{
    const int step = period * rule.interval;
    switch (rule.frequency) {
    case RecurrenceRule::Frequency::Daily:
        return firstDate.addDays(step);
    case RecurrenceRule::Frequency::Weekly:
        return firstDate.addDays(1 - firstDate.dayOfWeek()).addDays(7 * static_cast<qint64>(step));
    case RecurrenceRule::Frequency::Monthly:
        return QDate(firstDate.year(), firstDate.month(), 1).addMonths(step);
    case RecurrenceRule::Frequency::Yearly:
        return QDate(firstDate.year() + step, 1, 1);
    }
    return {};
}

QList<QDate> candidateDates(const RecurrenceRule &rule, const QDate &firstDate, const QDate &start)
{
    QList<QDate> dates;
    switch (rule.frequency) {
    case RecurrenceRule::Frequency::Daily:
        if (matchesByDay(rule, start) && matchesByMonthDay(rule, start)) {
            dates.append(start);
        }
        break;
    case RecurrenceRule::Frequency::Weekly:
        if (rule.byDay.isEmpty()) {
            dates.append(start.addDays(firstDate.dayOfWeek() - 1));
        } else {
            for (const auto &entry : rule.byDay) {
                dates.append(start.addDays(entry.weekday - 1));
            }
        }
        break;
    case RecurrenceRule::Frequency::Monthly:
        if (!rule.byMonthDay.isEmpty()) {
            for (QDate date = start; date.month() == start.month(); date = date.addDays(1)) {
                if (matchesByMonthDay(rule, date) && matchesByDay(rule, date)) {
                    dates.append(date);
                }
            }
        } else if (!rule.byDay.isEmpty()) {
            for (const auto &entry : rule.byDay) {
                dates.append(weekdaysInMonth(start, entry));
            }
        } else if (firstDate.day() <= start.daysInMonth()) {
            // Months without that day have no occurrence.
            dates.append(QDate(start.year(), start.month(), firstDate.day()));
        }
        break;
    case RecurrenceRule::Frequency::Yearly: {
        const QDate date(start.year(), firstDate.month(), firstDate.day());
        if (date.isValid()) {
            dates.append(date);
        }
        break;
    }
    }
    std::sort(dates.begin(), dates.end());
    dates.erase(std::unique(dates.begin(), dates.end()), dates.end());
    return dates;
}
} // namespace

std::optional<RecurrenceRule> parseRecurrenceRule(const QString &value, const QDateTime &firstStart)
{
    static const QRegularExpression byDayPattern(QStringLiteral("^([+-]?\\d{1,2})?(MO|TU|WE|TH|FR|SA|SU)$"));

    RecurrenceRule rule;
    bool hasFrequency = false;
    const QStringList parts = value.trimmed().toUpper().split(';', Qt::SkipEmptyParts);
    for (const QString &part : parts) {
        const QString key = part.section('=', 0, 0);
        const QString argument = part.section('=', 1);
        if (key == QLatin1String("FREQ")) {
            if (argument == QLatin1String("DAILY")) {
                rule.frequency = RecurrenceRule::Frequency::Daily;
            } else if (argument == QLatin1String("WEEKLY")) {
                rule.frequency = RecurrenceRule::Frequency::Weekly;
            } else if (argument == QLatin1String("MONTHLY")) {
                rule.frequency = RecurrenceRule::Frequency::Monthly;
            } else if (argument == QLatin1String("YEARLY")) {
                rule.frequency = RecurrenceRule::Frequency::Yearly;
            } else {
                qCWarning(lcStore) << "Unsupported recurrence frequency" << argument;
                return std::nullopt;
            }
            hasFrequency = true;
        } else if (key == QLatin1String("INTERVAL")) {
            rule.interval = std::max(1, argument.toInt());
        } else if (key == QLatin1String("COUNT")) {
            rule.count = std::max(0, argument.toInt());
        } else if (key == QLatin1String("UNTIL")) {
            rule.until = parseUntil(argument, firstStart);
        } else if (key == QLatin1String("BYDAY")) {
            for (const QString &code : argument.split(',', Qt::SkipEmptyParts)) {
                const auto match = byDayPattern.match(code);
                if (!match.hasMatch()) {
                    continue;
                }
                RecurrenceRule::WeekdayEntry entry;
                entry.ordinal = match.captured(1).toInt();
                entry.weekday = WEEKDAY_CODES.indexOf(match.captured(2)) + 1;
                rule.byDay.append(entry);
            }
            std::sort(rule.byDay.begin(), rule.byDay.end(),
                      [](const RecurrenceRule::WeekdayEntry &lhs, const RecurrenceRule::WeekdayEntry &rhs) {
                          return lhs.weekday < rhs.weekday;
                      });
        } else if (key == QLatin1String("BYMONTHDAY")) {
            for (const QString &day : argument.split(',', Qt::SkipEmptyParts)) {
                const int number = day.toInt();
                if (number != 0 && number >= -31 && number <= 31) {
                    rule.byMonthDay.append(number);
                }
            }
        } else if (key != QLatin1String("WKST")) {
            qCDebug(lcStore) << "Ignoring recurrence part" << part;
        }
    }
    if (!hasFrequency) {
        return std::nullopt;
    }
    return rule;
}

QList<QDateTime> occurrenceStarts(const RecurrenceRule &rule, const QDateTime &firstStart, const QDateTime &before,
                                  const QList<QDateTime> &excluded)
{
    QList<QDateTime> starts;
    if (!firstStart.isValid() || !before.isValid() || !(firstStart < before)) {
        return starts;
    }

    const QDate firstDate = firstStart.date();
    const QDate lastDate = before.toTimeZone(firstStart.timeZone()).date().addDays(1);
    int generated = 0;
    for (int period = 0;; ++period) {
        const QDate start = periodStart(rule, firstDate, period);
        if (!start.isValid() || start > lastDate) {
            break;
        }
        for (const QDate &date : candidateDates(rule, firstDate, start)) {
            if (date < firstDate) {
                continue;
            }
            const QDateTime occurrence = onDate(firstStart, date);
            if (rule.until.isValid() && occurrence > rule.until) {
                return starts;
            }
            if (!(occurrence < before)) {
                return starts;
            }
            ++generated;
            if (rule.count > 0 && generated > rule.count) {
                return starts;
            }
            if (!excluded.contains(occurrence)) {
                starts.append(occurrence);
            }
        }
    }
    return starts;
}

} // namespace data
} // namespace routine
