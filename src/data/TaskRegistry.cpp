#include "routine/data/TaskRegistry.hpp"

#include "routine/Errors.hpp"
#include "routine/Logging.hpp"

#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QRegularExpression>
#include <cmath>

namespace routine {
namespace data {

namespace {
constexpr int MINUTES_PER_DAY = 24 * 60;

QTime parseStartTime(const QString &value)
{
    static const QRegularExpression pattern(QStringLiteral("^(\\d{1,2}):(\\d{2})$"));
    const QRegularExpressionMatch match = pattern.match(value.trimmed());
    if (!match.hasMatch()) {
        return {};
    }
    return QTime(match.captured(1).toInt(), match.captured(2).toInt());
}

RoutineTask parseTask(const QJsonValue &value, int index)
{
    const QString where = QStringLiteral("task #%1").arg(index + 1);
    if (!value.isObject()) {
        throw ConfigurationError(QStringLiteral("%1 is not an object").arg(where));
    }
    const QJsonObject object = value.toObject();

    RoutineTask task;

    const QJsonValue name = object.value(QStringLiteral("name"));
    if (!name.isString()) {
        throw ConfigurationError(QStringLiteral("%1: \"name\" must be a string").arg(where));
    }
    task.name = name.toString().trimmed();

    const QJsonValue days = object.value(QStringLiteral("days"));
    if (!days.isArray()) {
        throw ConfigurationError(QStringLiteral("%1 (%2): \"days\" must be an array").arg(where, task.name));
    }
    for (const QJsonValue &day : days.toArray()) {
        const QString code = normalizeWeekdayCode(day.toString());
        if (!day.isString() || code.isEmpty()) {
            throw ConfigurationError(QStringLiteral("%1 (%2): unknown weekday \"%3\"")
                                         .arg(where, task.name, day.toVariant().toString()));
        }
        if (!task.days.contains(code)) {
            task.days << code;
        }
    }

    const QJsonValue startTime = object.value(QStringLiteral("start_time"));
    task.startTime = parseStartTime(startTime.toString());
    if (!startTime.isString() || !task.startTime.isValid()) {
        throw ConfigurationError(QStringLiteral("%1 (%2): \"start_time\" must be HH:MM").arg(where, task.name));
    }

    const QJsonValue duration = object.value(QStringLiteral("duration_minutes"));
    const double minutes = duration.toDouble(-1.0);
    if (!duration.isDouble() || std::floor(minutes) != minutes || minutes <= 0 || minutes > MINUTES_PER_DAY) {
        throw ConfigurationError(QStringLiteral("%1 (%2): \"duration_minutes\" must be a positive whole number")
                                     .arg(where, task.name));
    }
    task.durationMinutes = static_cast<int>(minutes);

    return task;
}
} // namespace

TaskRegistry::TaskRegistry(std::vector<RoutineTask> tasks)
    : m_tasks(std::move(tasks))
{
    for (const RoutineTask &task : m_tasks) {
        if (task.name.trimmed().isEmpty()) {
            throw ConfigurationError(QStringLiteral("Routine task without a name"));
        }
        if (m_names.contains(task.name)) {
            throw ConfigurationError(QStringLiteral("Duplicate routine task \"%1\"").arg(task.name));
        }
        if (task.days.isEmpty()) {
            throw ConfigurationError(QStringLiteral("Routine task \"%1\" runs on no weekday").arg(task.name));
        }
        for (const QString &day : task.days) {
            if (normalizeWeekdayCode(day) != day) {
                throw ConfigurationError(QStringLiteral("Routine task \"%1\": unknown weekday \"%2\"").arg(task.name, day));
            }
        }
        if (!task.startTime.isValid()) {
            throw ConfigurationError(QStringLiteral("Routine task \"%1\" has no valid start time").arg(task.name));
        }
        if (task.durationMinutes <= 0) {
            throw ConfigurationError(QStringLiteral("Routine task \"%1\" needs a positive duration").arg(task.name));
        }
        m_names.insert(task.name);
    }
}

TaskRegistry TaskRegistry::fromJson(const QByteArray &json)
{
    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        throw ConfigurationError(QStringLiteral("Task registry is not valid JSON: %1 at offset %2")
                                     .arg(parseError.errorString())
                                     .arg(parseError.offset));
    }
    if (!document.isArray()) {
        throw ConfigurationError(QStringLiteral("Task registry must be a JSON array"));
    }

    const QJsonArray entries = document.array();
    std::vector<RoutineTask> tasks;
    tasks.reserve(static_cast<size_t>(entries.size()));
    for (int i = 0; i < entries.size(); ++i) {
        tasks.push_back(parseTask(entries.at(i), i));
    }
    return TaskRegistry(std::move(tasks));
}

TaskRegistry TaskRegistry::fromFile(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        throw ConfigurationError(QStringLiteral("Cannot read task registry %1: %2").arg(path, file.errorString()));
    }
    TaskRegistry registry = fromJson(file.readAll());
    qCInfo(lcConfig) << "Loaded" << registry.tasks().size() << "routine tasks from" << path;
    return registry;
}

const std::vector<RoutineTask> &TaskRegistry::tasks() const
{
    return m_tasks;
}

std::optional<RoutineTask> TaskRegistry::findByName(const QString &name) const
{
    for (const RoutineTask &task : m_tasks) {
        if (task.name == name) {
            return task;
        }
    }
    return std::nullopt;
}

QSet<QString> TaskRegistry::ownedNames() const
{
    return m_names;
}

bool TaskRegistry::isEmpty() const
{
    return m_tasks.empty();
}

QJsonArray TaskRegistry::toJson() const
{
    QJsonArray array;
    for (const RoutineTask &task : m_tasks) {
        QJsonObject object;
        object.insert(QStringLiteral("name"), task.name);
        object.insert(QStringLiteral("days"), QJsonArray::fromStringList(task.days));
        object.insert(QStringLiteral("start_time"), task.startTime.toString(QStringLiteral("HH:mm")));
        object.insert(QStringLiteral("duration_minutes"), task.durationMinutes);
        array.append(object);
    }
    return array;
}

} // namespace data
} // namespace routine
