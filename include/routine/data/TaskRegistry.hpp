#pragma once

#include <optional>
#include <vector>

#include <QByteArray>
#include <QJsonArray>
#include <QSet>
#include <QString>

#include "routine/data/Task.hpp"

namespace routine {
namespace data {

class TaskRegistry
{
public:
    TaskRegistry() = default;
    explicit TaskRegistry(std::vector<RoutineTask> tasks);

    // Both loaders throw ConfigurationError on malformed input.
    static TaskRegistry fromJson(const QByteArray &json);
    static TaskRegistry fromFile(const QString &path);

    const std::vector<RoutineTask> &tasks() const;
    std::optional<RoutineTask> findByName(const QString &name) const;
    QSet<QString> ownedNames() const;
    bool isEmpty() const;

    QJsonArray toJson() const;

private:
    std::vector<RoutineTask> m_tasks;
    QSet<QString> m_names;
};

} // namespace data
} // namespace routine
