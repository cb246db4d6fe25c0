#include <QtTest/QtTest>

#include "notify/message_formatter.hpp"

class MessageFormatterTests : public QObject
{
    Q_OBJECT
private slots:
    void testFormatDuration_data();
    void testFormatDuration();
    void testSuccessNotification();
    void testFailedNotificationCarriesReason();
    void testRunSummaryForError();
    void testRunSummaryForNoUpdate();
};

void MessageFormatterTests::testFormatDuration_data()
{
    QTest::addColumn<qint64>("seconds");
    QTest::addColumn<QString>("expected");

    QTest::newRow("seconds") << qint64(12) << QStringLiteral("12s");
    QTest::newRow("minutes") << qint64(2723) << QStringLiteral("45m 23s");
    QTest::newRow("hours") << qint64(3723) << QStringLiteral("1h 02m 03s");
    QTest::newRow("zero") << qint64(0) << QStringLiteral("0s");
    QTest::newRow("negative") << qint64(-5) << QStringLiteral("0s");
}

void MessageFormatterTests::testFormatDuration()
{
    QFETCH(qint64, seconds);
    QFETCH(QString, expected);
    QCOMPARE(updwatch::formatDuration(seconds), expected);
}

void MessageFormatterTests::testSuccessNotification()
{
    updwatch::UpdateResult result;
    result.status = updwatch::UpdateStatus::Success;
    result.errorId = updwatch::EventId::UpdateSucceeded;
    result.fromVersion = QStringLiteral("11.02.185");
    result.toVersion = QStringLiteral("11.02.186");
    result.updateTime = QDateTime(QDate(2025, 10, 23), QTime(5, 0, 0));
    result.updateStartTime = QDateTime(QDate(2025, 10, 23), QTime(5, 1, 0));
    result.updateEndTime = QDateTime(QDate(2025, 10, 23), QTime(5, 46, 23));
    result.durationSeconds = 2723;
    result.updateLogPath = QStringLiteral("/var/log/ezvit/update_2025-10-23.log");

    const QString text = updwatch::formatNotification(result, QStringLiteral("srv-01"));
    const QStringList lines = text.split('\n');

    QCOMPARE(lines.first(), QStringLiteral("[srv-01] Update succeeded"));
    QVERIFY(lines.contains(QStringLiteral("Version: 11.02.185 -> 11.02.186")));
    QVERIFY(lines.contains(QStringLiteral("Started: 23.10.2025 05:00:00")));
    QVERIFY(lines.contains(QStringLiteral("Update log: 23.10.2025 05:01:00 .. 23.10.2025 05:46:23")));
    QVERIFY(lines.contains(QStringLiteral("Duration: 45m 23s")));
    QVERIFY(lines.contains(QStringLiteral("Log: /var/log/ezvit/update_2025-10-23.log")));
}

void MessageFormatterTests::testFailedNotificationCarriesReason()
{
    updwatch::UpdateResult result;
    result.status = updwatch::UpdateStatus::Failed;
    result.fromVersion = QStringLiteral("11.02.185");
    result.toVersion = QStringLiteral("11.02.186");
    result.reason = QStringLiteral("missing completion marker");

    const QString text = updwatch::formatNotification(result, QStringLiteral("srv-01"));
    QVERIFY(text.startsWith(QStringLiteral("[srv-01] Update FAILED")));
    QVERIFY(text.contains(QStringLiteral("Reason: missing completion marker")));
    QVERIFY(!text.contains(QStringLiteral("Duration:")));
}

void MessageFormatterTests::testRunSummaryForError()
{
    updwatch::RunReport report;
    report.outcome = updwatch::Outcome::Error;
    report.eventId = updwatch::EventId::PrimaryLogMissing;
    report.message = QStringLiteral("primary log not found");

    QCOMPARE(updwatch::formatRunSummary(report, QStringLiteral("srv-01")),
             QStringLiteral("[srv-01] Update check error: primary log not found"));
}

void MessageFormatterTests::testRunSummaryForNoUpdate()
{
    updwatch::RunReport report;
    report.outcome = updwatch::Outcome::NoUpdate;
    report.eventId = updwatch::EventId::NoUpdateDetected;
    report.message = QStringLiteral("no new update trigger");

    QCOMPARE(updwatch::formatRunSummary(report, QStringLiteral("srv-01")),
             QStringLiteral("[srv-01] no new update trigger"));
}

QTEST_MAIN(MessageFormatterTests)
#include "test_message_formatter.moc"
