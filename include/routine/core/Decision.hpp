#pragma once

#include <map>
#include <vector>

#include <QDate>
#include <QDateTime>
#include <QJsonArray>
#include <QJsonObject>
#include <QString>

namespace routine {
namespace core {

enum class DecisionStatus
{
    Scheduled,
    ScheduledRescheduled,
    Skipped,
};

enum class DecisionReason
{
    OriginalSlot,
    RescheduledDueToConflict,
    NoFreeSlotFound,
    ConflictAndRescheduleDisabled,
};

// Outcome of placing one task on one day. scheduledStart/End are invalid when skipped.
struct Decision
{
    QString taskName;
    DecisionStatus status = DecisionStatus::Skipped;
    DecisionReason reason = DecisionReason::NoFreeSlotFound;
    QDateTime scheduledStart;
    QDateTime scheduledEnd;
    QString eventId;

    bool isPlaced() const { return status != DecisionStatus::Skipped; }
};

using DayPlan = std::vector<Decision>;
using RangePlan = std::map<QDate, DayPlan>;

QString statusToString(DecisionStatus status);
QString reasonToString(DecisionReason reason);

QJsonObject toJson(const Decision &decision);
QJsonArray toJson(const DayPlan &plan);
QJsonObject toJson(const RangePlan &plan);

} // namespace core
} // namespace routine
