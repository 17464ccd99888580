#include "routine/core/RangeScheduler.hpp"

#include "routine/Logging.hpp"
#include "routine/core/DayScheduler.hpp"

namespace routine {
namespace core {

RangeSchedulingError::RangeSchedulingError(const QDate &failedDay, RangePlan completedDays, const QString &cause)
    : StoreUnavailable(QStringLiteral("Scheduling stopped on %1: %2").arg(failedDay.toString(Qt::ISODate), cause))
    , m_failedDay(failedDay)
    , m_completedDays(std::move(completedDays))
{
}

const QDate &RangeSchedulingError::failedDay() const
{
    return m_failedDay;
}

const RangePlan &RangeSchedulingError::completedDays() const
{
    return m_completedDays;
}

RangeScheduler::RangeScheduler(DayScheduler &dayScheduler)
    : m_dayScheduler(dayScheduler)
{
}

RangePlan RangeScheduler::scheduleRange(const QDate &startDate, int numDays, bool allowReschedule)
{
    RangePlan result;
    if (!startDate.isValid()) {
        return result;
    }

    qCInfo(lcScheduler) << "Scheduling" << numDays << "days from" << startDate.toString(Qt::ISODate)
                        << (allowReschedule ? "with" : "without") << "rescheduling";
    for (int offset = 0; offset < numDays; ++offset) {
        const QDate day = startDate.addDays(offset);
        try {
            result[day] = m_dayScheduler.scheduleDay(day, allowReschedule);
        } catch (const StoreUnavailable &error) {
            throw RangeSchedulingError(day, std::move(result), QString::fromStdString(error.what()));
        }
    }
    return result;
}

} // namespace core
} // namespace routine
