#include "routine/data/Task.hpp"

#include "routine/data/Event.hpp"

namespace routine {
namespace data {

namespace {
const char *const WEEKDAY_CODES[] = { "Mon", "Tue", "Wed", "Thu", "Fri", "Sat", "Sun" };
} // namespace

bool RoutineTask::runsOn(const QDate &date) const
{
    return date.isValid() && days.contains(weekdayCode(date));
}

QDateTime RoutineTask::nominalStart(const QDate &date) const
{
    return wallClock(date, startTime);
}

QDateTime RoutineTask::nominalEnd(const QDate &date) const
{
    return nominalStart(date).addSecs(static_cast<qint64>(durationMinutes) * 60);
}

QString weekdayCode(const QDate &date)
{
    if (!date.isValid()) {
        return {};
    }
    return QString::fromLatin1(WEEKDAY_CODES[date.dayOfWeek() - 1]);
}

QString normalizeWeekdayCode(const QString &code)
{
    const QString trimmed = code.trimmed();
    for (const char *candidate : WEEKDAY_CODES) {
        if (trimmed.compare(QLatin1String(candidate), Qt::CaseInsensitive) == 0) {
            return QString::fromLatin1(candidate);
        }
    }
    return {};
}

} // namespace data
} // namespace routine
