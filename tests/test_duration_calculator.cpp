#include <QtTest/QtTest>

#include <QStringList>

#include "detector/duration_calculator.hpp"

class DurationCalculatorTests : public QObject
{
    Q_OBJECT
private slots:
    void testFirstToLastLine();
    void testSingleLine();
    void testNoTimestampedLines();
};

void DurationCalculatorTests::testFirstToLastLine()
{
    const QStringList lines = {
        "header without timestamp",
        "23.10.25 10:00:00.120 4412 INFO Update operation started",
        "   continuation",
        "23.10.25 10:20:00 4412 DEBUG copying files",
        "23.10.25 10:45:23.999 4412 INFO Update operation completed",
        "trailer"
    };

    const auto duration = updwatch::computeUpdateDuration(lines);
    QVERIFY(duration.startTime.has_value());
    QVERIFY(duration.endTime.has_value());
    QCOMPARE(*duration.startTime, QDateTime(QDate(2025, 10, 23), QTime(10, 0, 0)));
    QCOMPARE(*duration.endTime, QDateTime(QDate(2025, 10, 23), QTime(10, 45, 23)));
    QVERIFY(duration.seconds.has_value());
    QCOMPARE(*duration.seconds, qint64(2723));
}

void DurationCalculatorTests::testSingleLine()
{
    const auto duration = updwatch::computeUpdateDuration(
        {"23.10.25 10:00:00.500 1 INFO only line"});
    QVERIFY(duration.seconds.has_value());
    QCOMPARE(*duration.seconds, qint64(0));
}

void DurationCalculatorTests::testNoTimestampedLines()
{
    const auto duration = updwatch::computeUpdateDuration({"no", "timestamps", "here"});
    QVERIFY(!duration.startTime.has_value());
    QVERIFY(!duration.endTime.has_value());
    QVERIFY(!duration.seconds.has_value());
}

QTEST_MAIN(DurationCalculatorTests)
#include "test_duration_calculator.moc"
