#include <QtTest/QtTest>

#include <memory>

#include "routine/cli/CommandRunner.hpp"

using namespace routine;

namespace {

const QDate MONDAY(2024, 1, 1);

bool writeAll(const QString &path, const QByteArray &content)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text)) {
        return false;
    }
    return file.write(content) == content.size();
}

} // namespace

class CommandRunnerTest : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void scheduleWritesCalendar();
    void clearRemovesScheduledEvents();
    void dryRunLeavesCalendarUntouched();
    void dryRunClearKeepsFile();
    void storeFailureReportsCompletedDays();
    void todayUsesCurrentDate();
    void tasksListsRegistry();
    void usageErrors();
    void missingRegistryIsConfigurationError();

private:
    int run(const QStringList &arguments, const QDate &today = MONDAY);
    QJsonObject output() const;
    QString calendarFile() const;

    std::unique_ptr<QTemporaryDir> m_dir;
    QString m_settingsPath;
    QString m_out;
    QString m_err;
};

void CommandRunnerTest::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
    m_settingsPath = m_dir->filePath(QStringLiteral("planner.ini"));
    QVERIFY(writeAll(m_settingsPath, "[store]\n"
                                     "calendarId=routine\n"
                                     "timeZone=UTC\n"
                                     "[tasks]\n"
                                     "file=tasks.json\n"));
    QVERIFY(writeAll(m_dir->filePath(QStringLiteral("tasks.json")), R"([
        {"name": "Standup", "days": ["Mon", "Tue", "Wed", "Thu", "Fri"], "start_time": "09:00", "duration_minutes": 30},
        {"name": "Long run", "days": ["Sun"], "start_time": "08:00", "duration_minutes": 90}
    ])"));
    m_out.clear();
    m_err.clear();
}

int CommandRunnerTest::run(const QStringList &arguments, const QDate &today)
{
    m_out.clear();
    m_err.clear();
    QTextStream out(&m_out);
    QTextStream err(&m_err);
    cli::CommandRunner runner(out, err);
    return runner.run(QStringList{ QStringLiteral("routine-planner") } + arguments, today);
}

QJsonObject CommandRunnerTest::output() const
{
    return QJsonDocument::fromJson(m_out.toUtf8()).object();
}

QString CommandRunnerTest::calendarFile() const
{
    return m_dir->filePath(QStringLiteral("routine.ics"));
}

void CommandRunnerTest::scheduleWritesCalendar()
{
    const int code = run({ "schedule", "--settings", m_settingsPath, "--start", "2024-01-05", "--days", "3" });
    QCOMPARE(code, static_cast<int>(cli::ExitSuccess));

    const QJsonObject json = output();
    QCOMPARE(json.value(QStringLiteral("start_date")).toString(), QStringLiteral("2024-01-05"));
    QCOMPARE(json.value(QStringLiteral("days")).toInt(), 3);
    QVERIFY(json.value(QStringLiteral("allow_reschedule")).toBool());

    const QJsonObject result = json.value(QStringLiteral("result")).toObject();
    QCOMPARE(result.keys(), QStringList({ "2024-01-05", "2024-01-06", "2024-01-07" }));
    const QJsonObject friday = result.value(QStringLiteral("2024-01-05")).toArray().at(0).toObject();
    QCOMPARE(friday.value(QStringLiteral("task_name")).toString(), QStringLiteral("Standup"));
    QCOMPARE(friday.value(QStringLiteral("status")).toString(), QStringLiteral("scheduled"));
    QCOMPARE(friday.value(QStringLiteral("scheduled_start")).toString(), QStringLiteral("2024-01-05T09:00:00"));
    QCOMPARE(friday.value(QStringLiteral("reason")).toString(), QStringLiteral("original_slot"));
    QVERIFY(result.value(QStringLiteral("2024-01-06")).toArray().isEmpty());
    QCOMPARE(result.value(QStringLiteral("2024-01-07")).toArray().size(), 1);

    QVERIFY(QFile::exists(calendarFile()));
}

void CommandRunnerTest::clearRemovesScheduledEvents()
{
    QCOMPARE(run({ "schedule", "--settings", m_settingsPath, "--start", "2024-01-01", "--days", "7" }),
             static_cast<int>(cli::ExitSuccess));
    QCOMPARE(run({ "clear", "--settings", m_settingsPath, "--start", "2024-01-01", "--days", "7" }),
             static_cast<int>(cli::ExitSuccess));
    QCOMPARE(output().value(QStringLiteral("deleted")).toInt(), 6);

    QCOMPARE(run({ "clear", "--settings", m_settingsPath, "--start", "2024-01-01", "--days", "7" }),
             static_cast<int>(cli::ExitSuccess));
    QCOMPARE(output().value(QStringLiteral("deleted")).toInt(), 0);
}

void CommandRunnerTest::dryRunLeavesCalendarUntouched()
{
    const int code = run({ "schedule", "--dry-run", "--settings", m_settingsPath, "--days", "2" });
    QCOMPARE(code, static_cast<int>(cli::ExitSuccess));
    QCOMPARE(output().value(QStringLiteral("result")).toObject().size(), 2);
    QVERIFY(!QFile::exists(calendarFile()));
}

void CommandRunnerTest::dryRunClearKeepsFile()
{
    QCOMPARE(run({ "schedule", "--settings", m_settingsPath, "--start", "2024-01-01", "--days", "7" }),
             static_cast<int>(cli::ExitSuccess));
    QFile before(calendarFile());
    QVERIFY(before.open(QIODevice::ReadOnly));
    const QByteArray content = before.readAll();
    before.close();

    QCOMPARE(run({ "clear", "--dry-run", "--settings", m_settingsPath, "--start", "2024-01-01", "--days", "7" }),
             static_cast<int>(cli::ExitSuccess));
    QCOMPARE(output().value(QStringLiteral("deleted")).toInt(), 6);

    QFile after(calendarFile());
    QVERIFY(after.open(QIODevice::ReadOnly));
    QCOMPARE(after.readAll(), content);
}

void CommandRunnerTest::storeFailureReportsCompletedDays()
{
    // A plain file where the calendar directory should be makes every write fail.
    QVERIFY(writeAll(m_dir->filePath(QStringLiteral("blocked")), "x"));
    QVERIFY(writeAll(m_settingsPath, "[store]\n"
                                     "calendarId=routine\n"
                                     "timeZone=UTC\n"
                                     "directory=blocked\n"
                                     "[tasks]\n"
                                     "file=tasks.json\n"));

    // Saturday has no routine task, Sunday's long run cannot be written.
    const int code = run({ "schedule", "--settings", m_settingsPath, "--start", "2024-01-06", "--days", "3" });
    QCOMPARE(code, static_cast<int>(cli::ExitStoreUnavailable));
    QVERIFY(m_err.contains(QStringLiteral("Calendar unavailable")));

    const QJsonObject json = output();
    QCOMPARE(json.value(QStringLiteral("failed_date")).toString(), QStringLiteral("2024-01-07"));
    const QJsonObject result = json.value(QStringLiteral("result")).toObject();
    QCOMPARE(result.keys(), QStringList({ "2024-01-06" }));
    QVERIFY(result.value(QStringLiteral("2024-01-06")).toArray().isEmpty());

    QCOMPARE(run({ "today", "--settings", m_settingsPath }, MONDAY), static_cast<int>(cli::ExitStoreUnavailable));
    QVERIFY(m_out.isEmpty());
}

void CommandRunnerTest::todayUsesCurrentDate()
{
    QVERIFY(writeAll(calendarFile(), "BEGIN:VCALENDAR\n"
                                     "BEGIN:VEVENT\n"
                                     "UID:bank\n"
                                     "SUMMARY:Call with bank\n"
                                     "DTSTART:20240101T090000Z\n"
                                     "DTEND:20240101T091500Z\n"
                                     "END:VEVENT\n"
                                     "END:VCALENDAR\n"));

    QCOMPARE(run({ "today", "--settings", m_settingsPath }, MONDAY), static_cast<int>(cli::ExitSuccess));
    QJsonObject json = output();
    QCOMPARE(json.value(QStringLiteral("date")).toString(), QStringLiteral("2024-01-01"));
    QJsonObject decision = json.value(QStringLiteral("decisions")).toArray().at(0).toObject();
    QCOMPARE(decision.value(QStringLiteral("status")).toString(), QStringLiteral("scheduled_rescheduled"));
    QCOMPARE(decision.value(QStringLiteral("scheduled_start")).toString(), QStringLiteral("2024-01-01T09:15:00"));

    QCOMPARE(run({ "today", "--no-reschedule", "--settings", m_settingsPath }, MONDAY.addDays(7)),
             static_cast<int>(cli::ExitSuccess));
    json = output();
    QVERIFY(!json.value(QStringLiteral("allow_reschedule")).toBool());
    decision = json.value(QStringLiteral("decisions")).toArray().at(0).toObject();
    QCOMPARE(decision.value(QStringLiteral("status")).toString(), QStringLiteral("scheduled"));
}

void CommandRunnerTest::tasksListsRegistry()
{
    QCOMPARE(run({ "tasks", "--settings", m_settingsPath }), static_cast<int>(cli::ExitSuccess));
    const QJsonArray tasks = output().value(QStringLiteral("tasks")).toArray();
    QCOMPARE(tasks.size(), 2);
    QCOMPARE(tasks.at(1).toObject().value(QStringLiteral("name")).toString(), QStringLiteral("Long run"));
}

void CommandRunnerTest::usageErrors()
{
    QCOMPARE(run({ "reschedule", "--settings", m_settingsPath }), static_cast<int>(cli::ExitConfigurationError));
    QCOMPARE(run({ "schedule", "--settings", m_settingsPath, "--start", "01/05/2024" }),
             static_cast<int>(cli::ExitConfigurationError));
    QCOMPARE(run({ "schedule", "--settings", m_settingsPath, "--days", "0" }),
             static_cast<int>(cli::ExitConfigurationError));
    QCOMPARE(run({ "schedule", "--bogus" }), static_cast<int>(cli::ExitConfigurationError));
    QVERIFY(!m_err.isEmpty());
}

void CommandRunnerTest::missingRegistryIsConfigurationError()
{
    const int code = run({ "schedule", "--settings", m_settingsPath, "--tasks", m_dir->filePath(QStringLiteral("nope.json")) });
    QCOMPARE(code, static_cast<int>(cli::ExitConfigurationError));
    QVERIFY(m_err.contains(QStringLiteral("nope.json")));
    QVERIFY(!QFile::exists(calendarFile()));
}

QTEST_GUILESS_MAIN(CommandRunnerTest)
#include "CommandRunnerTest.moc"
