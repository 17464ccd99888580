#pragma once

#include <optional>

#include <QDateTime>
#include <QList>
#include <QString>

namespace routine {
namespace data {

// The RRULE parts calendar applications write for ordinary series: FREQ, INTERVAL,
// COUNT, UNTIL, BYDAY and BYMONTHDAY. Other parts are ignored.
struct RecurrenceRule
{
    enum class Frequency {
        Daily,
        Weekly,
        Monthly,
        Yearly
    };

    struct WeekdayEntry
    {
        int weekday = 0; // Qt numbering, 1 = Monday
        int ordinal = 0; // 2MO = second Monday, -1FR = last Friday, 0 = every
    };

    Frequency frequency = Frequency::Weekly;
    int interval = 1;
    int count = 0; // 0 = unbounded
    QDateTime until; // inclusive, invalid = unbounded
    QList<WeekdayEntry> byDay;
    QList<int> byMonthDay;
};

// Parses an RRULE value. A floating or date-only UNTIL is read in the time frame of
// firstStart. Returns nullopt if FREQ is missing or not one of the supported ones.
std::optional<RecurrenceRule> parseRecurrenceRule(const QString &value, const QDateTime &firstStart);

// Start times of the series beginning at firstStart that lie before `before`, in
// order. COUNT includes the excluded occurrences.
QList<QDateTime> occurrenceStarts(const RecurrenceRule &rule, const QDateTime &firstStart, const QDateTime &before,
                                  const QList<QDateTime> &excluded);

} // namespace data
} // namespace routine
