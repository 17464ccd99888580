#include "routine/core/Decision.hpp"

#include <QJsonValue>

namespace routine {
namespace core {

namespace {
QJsonValue timestampValue(const QDateTime &dt)
{
    if (!dt.isValid()) {
        return QJsonValue(QJsonValue::Null);
    }
    // Wall-clock value, printed without a zone designator.
    return dt.toString(QStringLiteral("yyyy-MM-dd'T'HH:mm:ss"));
}
} // namespace

QString statusToString(DecisionStatus status)
{
    switch (status) {
    case DecisionStatus::Scheduled:
        return QStringLiteral("scheduled");
    case DecisionStatus::ScheduledRescheduled:
        return QStringLiteral("scheduled_rescheduled");
    case DecisionStatus::Skipped:
    default:
        return QStringLiteral("skipped");
    }
}

QString reasonToString(DecisionReason reason)
{
    switch (reason) {
    case DecisionReason::OriginalSlot:
        return QStringLiteral("original_slot");
    case DecisionReason::RescheduledDueToConflict:
        return QStringLiteral("rescheduled_due_to_conflict");
    case DecisionReason::ConflictAndRescheduleDisabled:
        return QStringLiteral("conflict_and_reschedule_disabled");
    case DecisionReason::NoFreeSlotFound:
    default:
        return QStringLiteral("no_free_slot_found");
    }
}

QJsonObject toJson(const Decision &decision)
{
    QJsonObject object;
    object.insert(QStringLiteral("task_name"), decision.taskName);
    object.insert(QStringLiteral("status"), statusToString(decision.status));
    object.insert(QStringLiteral("scheduled_start"), timestampValue(decision.scheduledStart));
    object.insert(QStringLiteral("scheduled_end"), timestampValue(decision.scheduledEnd));
    object.insert(QStringLiteral("reason"), reasonToString(decision.reason));
    object.insert(QStringLiteral("event_id"), decision.eventId);
    return object;
}

QJsonArray toJson(const DayPlan &plan)
{
    QJsonArray array;
    for (const Decision &decision : plan) {
        array.append(toJson(decision));
    }
    return array;
}

QJsonObject toJson(const RangePlan &plan)
{
    QJsonObject object;
    for (const auto &entry : plan) {
        object.insert(entry.first.toString(Qt::ISODate), toJson(entry.second));
    }
    return object;
}

} // namespace core
} // namespace routine
