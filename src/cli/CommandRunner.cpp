#include "routine/cli/CommandRunner.hpp"

#include "routine/Errors.hpp"
#include "routine/Logging.hpp"
#include "routine/core/AppContext.hpp"
#include "routine/core/Clearer.hpp"
#include "routine/core/DayScheduler.hpp"
#include "routine/core/RangeScheduler.hpp"

#include <QCommandLineParser>
#include <QJsonDocument>
#include <QLoggingCategory>

namespace routine {
namespace cli {

namespace {
const QString SCHEDULE = QStringLiteral("schedule");
const QString TODAY = QStringLiteral("today");
const QString CLEAR = QStringLiteral("clear");
const QString TASKS = QStringLiteral("tasks");
} // namespace

CommandRunner::CommandRunner(QTextStream &out, QTextStream &err)
    : m_out(out)
    , m_err(err)
{
}

int CommandRunner::run(const QStringList &arguments, const QDate &today)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Places a fixed daily routine into a calendar around existing events."));
    parser.addPositionalArgument(QStringLiteral("command"), QStringLiteral("schedule | today | clear | tasks"));
    const QCommandLineOption settingsOption(QStringLiteral("settings"), QStringLiteral("Settings file (INI)."),
                                            QStringLiteral("file"), QStringLiteral("routine-planner.ini"));
    const QCommandLineOption tasksOption(QStringLiteral("tasks"), QStringLiteral("Task registry (JSON), overrides the settings."),
                                         QStringLiteral("file"));
    const QCommandLineOption startOption(QStringLiteral("start"), QStringLiteral("First day, YYYY-MM-DD. Defaults to today."),
                                         QStringLiteral("date"));
    const QCommandLineOption daysOption(QStringLiteral("days"), QStringLiteral("Number of days."), QStringLiteral("n"));
    const QCommandLineOption noRescheduleOption(QStringLiteral("no-reschedule"),
                                                QStringLiteral("Skip conflicting tasks instead of moving them."));
    const QCommandLineOption dryRunOption(QStringLiteral("dry-run"), QStringLiteral("Work on an in-memory copy of the calendar."));
    const QCommandLineOption verboseOption(QStringLiteral("verbose"), QStringLiteral("Debug logging."));
    parser.addOptions({ settingsOption, tasksOption, startOption, daysOption, noRescheduleOption, dryRunOption, verboseOption });
    parser.addHelpOption();

    if (!parser.parse(arguments)) {
        m_err << parser.errorText() << '\n';
        m_err.flush();
        return ExitConfigurationError;
    }
    if (parser.isSet(QStringLiteral("help"))) {
        m_out << parser.helpText();
        m_out.flush();
        return ExitSuccess;
    }
    if (parser.isSet(verboseOption)) {
        QLoggingCategory::setFilterRules(QStringLiteral("routine.*.debug=true"));
    }

    const QStringList positional = parser.positionalArguments();
    const QString command = positional.isEmpty() ? QString() : positional.first();
    if (positional.size() != 1 || !(command == SCHEDULE || command == TODAY || command == CLEAR || command == TASKS)) {
        m_err << "Expected exactly one command: schedule, today, clear or tasks\n";
        m_err.flush();
        return ExitConfigurationError;
    }

    QDate start = today;
    if (parser.isSet(startOption)) {
        start = QDate::fromString(parser.value(startOption), Qt::ISODate);
        if (!start.isValid()) {
            m_err << "Invalid --start date: " << parser.value(startOption) << '\n';
            m_err.flush();
            return ExitConfigurationError;
        }
    }

    try {
        core::EngineSettings settings = core::EngineSettings::load(parser.value(settingsOption));
        if (parser.isSet(tasksOption)) {
            settings.tasksFile = parser.value(tasksOption);
        }

        int days = settings.defaultDays;
        if (parser.isSet(daysOption)) {
            bool ok = false;
            days = parser.value(daysOption).toInt(&ok);
            if (!ok || days <= 0) {
                throw ConfigurationError(QStringLiteral("--days must be a positive number"));
            }
        }
        const bool allowReschedule = settings.allowReschedule && !parser.isSet(noRescheduleOption);

        const auto context = core::AppContext::create(settings, parser.isSet(dryRunOption));
        qCDebug(lcCli) << "Running" << command;
        if (command == SCHEDULE) {
            print(scheduleRange(*context, start, days, allowReschedule));
        } else if (command == TODAY) {
            print(scheduleToday(*context, today, allowReschedule));
        } else if (command == CLEAR) {
            print(clearRange(*context, start, days));
        } else {
            print(listTasks(*context));
        }
    } catch (const ConfigurationError &error) {
        m_err << "Configuration error: " << error.what() << '\n';
        m_err.flush();
        return ExitConfigurationError;
    } catch (const core::RangeSchedulingError &error) {
        QJsonObject partial;
        partial.insert(QStringLiteral("failed_date"), error.failedDay().toString(Qt::ISODate));
        partial.insert(QStringLiteral("result"), core::toJson(error.completedDays()));
        print(partial);
        m_err << "Calendar unavailable: " << error.what() << '\n';
        m_err.flush();
        return ExitStoreUnavailable;
    } catch (const StoreUnavailable &error) {
        m_err << "Calendar unavailable: " << error.what() << '\n';
        m_err.flush();
        return ExitStoreUnavailable;
    }
    return ExitSuccess;
}

QJsonObject CommandRunner::scheduleRange(core::AppContext &context, const QDate &start, int days, bool allowReschedule)
{
    const core::RangePlan plan = context.rangeScheduler().scheduleRange(start, days, allowReschedule);
    QJsonObject object;
    object.insert(QStringLiteral("start_date"), start.toString(Qt::ISODate));
    object.insert(QStringLiteral("days"), days);
    object.insert(QStringLiteral("allow_reschedule"), allowReschedule);
    object.insert(QStringLiteral("result"), core::toJson(plan));
    return object;
}

QJsonObject CommandRunner::scheduleToday(core::AppContext &context, const QDate &today, bool allowReschedule)
{
    const core::DayPlan plan = context.dayScheduler().scheduleDay(today, allowReschedule);
    QJsonObject object;
    object.insert(QStringLiteral("date"), today.toString(Qt::ISODate));
    object.insert(QStringLiteral("allow_reschedule"), allowReschedule);
    object.insert(QStringLiteral("decisions"), core::toJson(plan));
    return object;
}

QJsonObject CommandRunner::clearRange(core::AppContext &context, const QDate &start, int days)
{
    const int deleted = context.clearer().clearOwnedEvents(start, days);
    QJsonObject object;
    object.insert(QStringLiteral("start_date"), start.toString(Qt::ISODate));
    object.insert(QStringLiteral("days"), days);
    object.insert(QStringLiteral("deleted"), deleted);
    return object;
}

QJsonObject CommandRunner::listTasks(core::AppContext &context)
{
    QJsonObject object;
    object.insert(QStringLiteral("tasks"), context.taskRegistry().toJson());
    return object;
}

void CommandRunner::print(const QJsonObject &object)
{
    m_out << QJsonDocument(object).toJson(QJsonDocument::Indented);
    m_out.flush();
}

} // namespace cli
} // namespace routine
