#include <QtTest/QtTest>

#include "routine/Errors.hpp"
#include "routine/data/FileEventStore.hpp"

using namespace routine::data;

namespace {

QDateTime at(int day, int hour, int minute)
{
    return wallClock(QDate(2024, 1, day), QTime(hour, minute));
}

StoreConfig configFor(const QTemporaryDir &dir, const QByteArray &zone)
{
    StoreConfig config;
    config.calendarId = QStringLiteral("routine");
    config.timeZone = QTimeZone(zone);
    config.directory = dir.path();
    return config;
}

QString readAll(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return {};
    }
    return QString::fromUtf8(file.readAll());
}

bool writeAll(const QString &path, const QByteArray &content)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text)) {
        return false;
    }
    return file.write(content) == content.size();
}

QDateTime on(const QDate &date, int hour, int minute)
{
    return wallClock(date, QTime(hour, minute));
}

// A weekly Monday meeting with an alarm, one cancelled and one moved occurrence,
// next to a todo and a time zone definition.
const QByteArray SERIES_CALENDAR = "BEGIN:VCALENDAR\n"
                                   "VERSION:2.0\n"
                                   "PRODID:-//Example Corp//Calendar//EN\n"
                                   "BEGIN:VTIMEZONE\n"
                                   "TZID:Europe/Vienna\n"
                                   "BEGIN:STANDARD\n"
                                   "DTSTART:19701025T030000\n"
                                   "TZOFFSETFROM:+0200\n"
                                   "TZOFFSETTO:+0100\n"
                                   "END:STANDARD\n"
                                   "END:VTIMEZONE\n"
                                   "BEGIN:VEVENT\n"
                                   "UID:weekly-sync\n"
                                   "SUMMARY:Weekly sync\n"
                                   "DESCRIPTION:Agenda in the wiki\n"
                                   "DTSTART:20240101T090000Z\n"
                                   "DTEND:20240101T100000Z\n"
                                   "RRULE:FREQ=WEEKLY;BYDAY=MO\n"
                                   "EXDATE:20240115T090000Z\n"
                                   "ATTENDEE;CN=Alex:mailto:alex@example.com\n"
                                   "BEGIN:VALARM\n"
                                   "ACTION:DISPLAY\n"
                                   "DESCRIPTION:Sync starts soon\n"
                                   "TRIGGER:-PT10M\n"
                                   "END:VALARM\n"
                                   "END:VEVENT\n"
                                   "BEGIN:VEVENT\n"
                                   "UID:weekly-sync\n"
                                   "RECURRENCE-ID:20240122T090000Z\n"
                                   "SUMMARY:Weekly sync (moved)\n"
                                   "DTSTART:20240122T140000Z\n"
                                   "DTEND:20240122T150000Z\n"
                                   "END:VEVENT\n"
                                   "BEGIN:VTODO\n"
                                   "UID:buy-milk\n"
                                   "SUMMARY:Buy milk\n"
                                   "END:VTODO\n"
                                   "END:VCALENDAR\n";

} // namespace

class FileEventStoreTest : public QObject
{
    Q_OBJECT

private slots:
    void persistsAcrossInstances();
    void storesInstantsInUtc();
    void normalizesForeignEvents();
    void removalIsPersisted();
    void picksUpExternalChanges();
    void unwritableLocationThrows();
    void rejectsPathLikeCalendarId();
    void keepsForeignContentOnWrite();
    void expandsRecurringEvents();
    void recurringEventsFollowTheirZone();
    void removingOccurrenceAddsExdate();
    void createInDstGapMovesForward();
};

void FileEventStoreTest::persistsAcrossInstances()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    QString id;
    {
        FileEventStore store(configFor(dir, "Europe/Vienna"));
        const auto created = store.createEvent(QStringLiteral("Standup; daily, short"), at(1, 9, 0), at(1, 9, 30));
        id = created.id;
        QCOMPARE(created.start, at(1, 9, 0));
        QCOMPARE(store.filePath(), dir.filePath(QStringLiteral("routine.ics")));
    }

    FileEventStore reopened(configFor(dir, "Europe/Vienna"));
    const auto events = reopened.listEvents(at(1, 0, 0), at(2, 0, 0));
    QCOMPARE(events.size(), static_cast<size_t>(1));
    QCOMPARE(events.front().id, id);
    QCOMPARE(events.front().title, QStringLiteral("Standup; daily, short"));
    QCOMPARE(events.front().start, at(1, 9, 0));
    QCOMPARE(events.front().end, at(1, 9, 30));
}

void FileEventStoreTest::storesInstantsInUtc()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    FileEventStore store(configFor(dir, "Europe/Vienna"));
    store.createEvent(QStringLiteral("Standup"), at(1, 9, 0), at(1, 9, 30));

    const QString content = readAll(store.filePath());
    QVERIFY(content.contains(QStringLiteral("DTSTART:20240101T080000Z")));
    QVERIFY(content.contains(QStringLiteral("DTEND:20240101T083000Z")));

    // The same instant seen from another zone.
    FileEventStore newYork(configFor(dir, "America/New_York"));
    const auto events = newYork.listEvents(at(1, 0, 0), at(2, 0, 0));
    QCOMPARE(events.size(), static_cast<size_t>(1));
    QCOMPARE(events.front().start, at(1, 3, 0));
}

void FileEventStoreTest::normalizesForeignEvents()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QByteArray ics = "BEGIN:VCALENDAR\n"
                           "VERSION:2.0\n"
                           "BEGIN:VEVENT\n"
                           "UID:utc-event\n"
                           "SUMMARY:Dentist\n"
                           "DTSTART:20240102T170000Z\n"
                           "DTEND:20240102T180000Z\n"
                           "END:VEVENT\n"
                           "BEGIN:VEVENT\n"
                           "UID:tokyo-event\n"
                           "SUMMARY:Call with\n"
                           "  Tokyo office\n"
                           "DTSTART;TZID=Asia/Tokyo:20240103T090000\n"
                           "DTEND;TZID=Asia/Tokyo:20240103T100000\n"
                           "END:VEVENT\n"
                           "BEGIN:VEVENT\n"
                           "UID:floating-event\n"
                           "SUMMARY:Lunch\n"
                           "DTSTART:20240102T123000\n"
                           "DTEND:20240102T133000\n"
                           "END:VEVENT\n"
                           "BEGIN:VEVENT\n"
                           "UID:holiday\n"
                           "SUMMARY:Holiday\n"
                           "DTSTART;VALUE=DATE:20240102\n"
                           "DTEND;VALUE=DATE:20240103\n"
                           "END:VEVENT\n"
                           "END:VCALENDAR\n";
    QVERIFY(writeAll(dir.filePath(QStringLiteral("routine.ics")), ics));

    FileEventStore store(configFor(dir, "America/Los_Angeles"));

    const auto dentist = store.findById(QStringLiteral("utc-event"));
    QVERIFY(dentist.has_value());
    QCOMPARE(dentist->start, at(2, 9, 0));

    const auto tokyo = store.findById(QStringLiteral("tokyo-event"));
    QVERIFY(tokyo.has_value());
    QCOMPARE(tokyo->title, QStringLiteral("Call with Tokyo office"));
    QCOMPARE(tokyo->start, at(2, 16, 0));

    const auto lunch = store.findById(QStringLiteral("floating-event"));
    QVERIFY(lunch.has_value());
    QCOMPARE(lunch->start, at(2, 12, 30));

    const auto holiday = store.findById(QStringLiteral("holiday"));
    QVERIFY(holiday.has_value());
    QVERIFY(holiday->allDay);
    QCOMPARE(holiday->start, at(2, 0, 0));
    QCOMPARE(holiday->end, at(3, 0, 0));

    QCOMPARE(store.listEvents(at(2, 0, 0), at(3, 0, 0)).size(), static_cast<size_t>(4));
    QVERIFY(store.listEvents(at(3, 0, 0), at(4, 0, 0)).empty());
}

void FileEventStoreTest::removalIsPersisted()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    FileEventStore store(configFor(dir, "UTC"));
    const auto kept = store.createEvent(QStringLiteral("Gym"), at(1, 18, 0), at(1, 19, 0));
    const auto dropped = store.createEvent(QStringLiteral("Standup"), at(1, 9, 0), at(1, 9, 30));

    QVERIFY(store.removeEvent(dropped.id));
    QVERIFY(!store.removeEvent(dropped.id));

    FileEventStore reopened(configFor(dir, "UTC"));
    QVERIFY(reopened.findById(kept.id).has_value());
    QVERIFY(!reopened.findById(dropped.id).has_value());
}

void FileEventStoreTest::picksUpExternalChanges()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    FileEventStore store(configFor(dir, "UTC"));
    QVERIFY(store.listEvents(at(1, 0, 0), at(2, 0, 0)).empty());

    const QByteArray ics = "BEGIN:VCALENDAR\n"
                           "BEGIN:VEVENT\n"
                           "UID:user-added\n"
                           "SUMMARY:Haircut\n"
                           "DTSTART:20240101T100000Z\n"
                           "DTEND:20240101T110000Z\n"
                           "END:VEVENT\n"
                           "END:VCALENDAR\n";
    QVERIFY(writeAll(store.filePath(), ics));

    const auto events = store.listEvents(at(1, 0, 0), at(2, 0, 0));
    QCOMPARE(events.size(), static_cast<size_t>(1));
    QCOMPARE(events.front().title, QStringLiteral("Haircut"));
}

void FileEventStoreTest::unwritableLocationThrows()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString blocker = dir.filePath(QStringLiteral("not-a-directory"));
    QVERIFY(writeAll(blocker, "x"));

    StoreConfig config = configFor(dir, "UTC");
    config.directory = blocker;
    FileEventStore store(config);
    QVERIFY_EXCEPTION_THROWN(store.createEvent(QStringLiteral("Standup"), at(1, 9, 0), at(1, 9, 30)),
                             routine::StoreUnavailable);
    QVERIFY(store.listEvents(at(1, 0, 0), at(2, 0, 0)).empty());
}

void FileEventStoreTest::rejectsPathLikeCalendarId()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    StoreConfig config = configFor(dir, "UTC");
    config.calendarId = QStringLiteral("../elsewhere");
    QVERIFY_EXCEPTION_THROWN(FileEventStore{ config }, routine::ConfigurationError);
}

void FileEventStoreTest::keepsForeignContentOnWrite()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("routine.ics"));
    QVERIFY(writeAll(path, SERIES_CALENDAR));

    FileEventStore store(configFor(dir, "UTC"));
    store.createEvent(QStringLiteral("Standup"), at(2, 9, 0), at(2, 9, 30));

    const QString content = readAll(path);
    for (const char *line : { "PRODID:-//Example Corp//Calendar//EN", "BEGIN:VTIMEZONE", "TZOFFSETTO:+0100",
                              "RRULE:FREQ=WEEKLY;BYDAY=MO", "EXDATE:20240115T090000Z",
                              "ATTENDEE;CN=Alex:mailto:alex@example.com", "BEGIN:VALARM", "TRIGGER:-PT10M",
                              "RECURRENCE-ID:20240122T090000Z", "BEGIN:VTODO", "SUMMARY:Buy milk",
                              "SUMMARY:Standup" }) {
        QVERIFY2(content.contains(QLatin1String(line)), line);
    }
    QCOMPARE(content.count(QStringLiteral("PRODID:")), 1);
    QCOMPARE(content.count(QStringLiteral("BEGIN:VEVENT")), 3);

    // The alarm's description belongs to the alarm.
    FileEventStore reopened(configFor(dir, "UTC"));
    const auto monday = reopened.listEvents(at(1, 0, 0), at(2, 0, 0));
    QCOMPARE(monday.size(), static_cast<size_t>(1));
    QCOMPARE(monday.front().description, QStringLiteral("Agenda in the wiki"));
}

void FileEventStoreTest::expandsRecurringEvents()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QVERIFY(writeAll(dir.filePath(QStringLiteral("routine.ics")), SERIES_CALENDAR));
    FileEventStore store(configFor(dir, "UTC"));

    const auto second = store.listEvents(at(8, 0, 0), at(9, 0, 0));
    QCOMPARE(second.size(), static_cast<size_t>(1));
    QCOMPARE(second.front().id, QStringLiteral("weekly-sync_20240108T090000Z"));
    QCOMPARE(second.front().title, QStringLiteral("Weekly sync"));
    QCOMPARE(second.front().start, at(8, 9, 0));
    QCOMPARE(second.front().end, at(8, 10, 0));

    QVERIFY(store.listEvents(at(15, 0, 0), at(16, 0, 0)).empty());

    const auto moved = store.listEvents(at(22, 0, 0), at(23, 0, 0));
    QCOMPARE(moved.size(), static_cast<size_t>(1));
    QCOMPARE(moved.front().title, QStringLiteral("Weekly sync (moved)"));
    QCOMPARE(moved.front().start, at(22, 14, 0));
    QCOMPARE(moved.front().id, QStringLiteral("weekly-sync_20240122T090000Z"));

    QCOMPARE(store.listEvents(at(1, 0, 0), at(31, 0, 0)).size(), static_cast<size_t>(4));

    const auto found = store.findById(QStringLiteral("weekly-sync_20240129T090000Z"));
    QVERIFY(found.has_value());
    QCOMPARE(found->start, at(29, 9, 0));
    QVERIFY(!store.findById(QStringLiteral("weekly-sync_20240130T090000Z")).has_value());
    QVERIFY(!store.findById(QStringLiteral("weekly-sync_20240115T090000Z")).has_value());
}

void FileEventStoreTest::recurringEventsFollowTheirZone()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QByteArray ics = "BEGIN:VCALENDAR\n"
                           "BEGIN:VEVENT\n"
                           "UID:swim\n"
                           "SUMMARY:Swimming\n"
                           "DTSTART;TZID=Europe/Vienna:20240318T070000\n"
                           "DURATION:PT45M\n"
                           "RRULE:FREQ=WEEKLY;COUNT=3\n"
                           "END:VEVENT\n"
                           "END:VCALENDAR\n";
    QVERIFY(writeAll(dir.filePath(QStringLiteral("routine.ics")), ics));
    FileEventStore store(configFor(dir, "Europe/Vienna"));

    // Summer time starts on 2024-03-31; the series keeps its local time.
    const QDate afterSwitch(2024, 4, 1);
    const auto events = store.listEvents(on(afterSwitch, 0, 0), on(afterSwitch.addDays(1), 0, 0));
    QCOMPARE(events.size(), static_cast<size_t>(1));
    QCOMPARE(events.front().start, on(afterSwitch, 7, 0));
    QCOMPARE(events.front().end, on(afterSwitch, 7, 45));

    // COUNT=3 ends the series after 1 April.
    QVERIFY(store.listEvents(on(afterSwitch.addDays(7), 0, 0), on(afterSwitch.addDays(8), 0, 0)).empty());
}

void FileEventStoreTest::removingOccurrenceAddsExdate()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("routine.ics"));
    QVERIFY(writeAll(path, SERIES_CALENDAR));
    FileEventStore store(configFor(dir, "UTC"));

    QVERIFY(store.removeEvent(QStringLiteral("weekly-sync_20240108T090000Z")));
    QVERIFY(!store.removeEvent(QStringLiteral("weekly-sync_20240108T090000Z")));
    QVERIFY(readAll(path).contains(QStringLiteral("EXDATE:20240108T090000Z")));

    // Dropping the moved occurrence must not bring the original one back.
    QVERIFY(store.removeEvent(QStringLiteral("weekly-sync_20240122T090000Z")));

    FileEventStore reopened(configFor(dir, "UTC"));
    QVERIFY(reopened.listEvents(at(8, 0, 0), at(9, 0, 0)).empty());
    QVERIFY(reopened.listEvents(at(22, 0, 0), at(23, 0, 0)).empty());
    QCOMPARE(reopened.listEvents(at(29, 0, 0), at(30, 0, 0)).size(), static_cast<size_t>(1));
    QVERIFY(readAll(path).contains(QStringLiteral("RRULE:FREQ=WEEKLY;BYDAY=MO")));
}

void FileEventStoreTest::createInDstGapMovesForward()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    FileEventStore store(configFor(dir, "America/Los_Angeles"));

    // 02:00 to 03:00 does not exist on this day in Los Angeles.
    const QDate springForward(2024, 3, 10);
    QCOMPARE(store.storedWallClock(on(springForward, 2, 30)), on(springForward, 3, 30));
    QCOMPARE(store.storedWallClock(on(springForward, 9, 0)), on(springForward, 9, 0));

    const auto created = store.createEvent(QStringLiteral("Stretch"), on(springForward, 2, 30), on(springForward, 3, 0));
    QCOMPARE(created.start, on(springForward, 3, 30));
    QCOMPARE(created.end, on(springForward, 4, 0));
    QVERIFY(readAll(store.filePath()).contains(QStringLiteral("DTSTART:20240310T103000Z")));

    FileEventStore reopened(configFor(dir, "America/Los_Angeles"));
    const auto stored = reopened.findById(created.id);
    QVERIFY(stored.has_value());
    QCOMPARE(stored->start, on(springForward, 3, 30));
}

QTEST_GUILESS_MAIN(FileEventStoreTest)
#include "FileEventStoreTest.moc"
