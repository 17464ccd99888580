#pragma once

#include <QDate>
#include <QJsonObject>
#include <QStringList>
#include <QTextStream>

namespace routine {
namespace core {
class AppContext;
}

namespace cli {

enum ExitCode
{
    ExitSuccess = 0,
    ExitConfigurationError = 1,
    ExitStoreUnavailable = 2,
};

// Parses a routine-planner command line, runs it and prints the JSON result.
class CommandRunner
{
public:
    CommandRunner(QTextStream &out, QTextStream &err);

    int run(const QStringList &arguments, const QDate &today = QDate::currentDate());

    QJsonObject scheduleRange(core::AppContext &context, const QDate &start, int days, bool allowReschedule);
    QJsonObject scheduleToday(core::AppContext &context, const QDate &today, bool allowReschedule);
    QJsonObject clearRange(core::AppContext &context, const QDate &start, int days);
    QJsonObject listTasks(core::AppContext &context);

private:
    void print(const QJsonObject &object);

    QTextStream &m_out;
    QTextStream &m_err;
};

} // namespace cli
} // namespace routine
