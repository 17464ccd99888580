#pragma once

#include <QDate>
#include <QString>

#include "routine/Errors.hpp"
#include "routine/core/Decision.hpp"

namespace routine {
namespace core {

class DayScheduler;

// Thrown when a day of a range fails. Days before it were committed and their
// decisions are kept here; later days were not attempted.
class RangeSchedulingError : public StoreUnavailable
{
public:
    RangeSchedulingError(const QDate &failedDay, RangePlan completedDays, const QString &cause);

    const QDate &failedDay() const;
    const RangePlan &completedDays() const;

private:
    QDate m_failedDay;
    RangePlan m_completedDays;
};

class RangeScheduler
{
public:
    explicit RangeScheduler(DayScheduler &dayScheduler);

    // Schedules startDate .. startDate + numDays - 1, one day after the other.
    RangePlan scheduleRange(const QDate &startDate, int numDays, bool allowReschedule = true);

private:
    DayScheduler &m_dayScheduler;
};

} // namespace core
} // namespace routine
