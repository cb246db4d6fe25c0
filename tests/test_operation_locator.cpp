#include <QtTest/QtTest>

#include "detector/marker_validator.hpp"
#include "detector/operation_locator.hpp"

class OperationLocatorTests : public QObject
{
    Q_OBJECT
private slots:
    void testNoEndMarker();
    void testEndWithoutStart();
    void testLastOperationIsSelected();
    void testStartAfterLastEndIsIgnored();
    void testVersionConfirmationSpacing();
    void testVersionWordBoundary();
    void testCompletionMarker();

private:
    updwatch::DetectionConfig m_detection;
};

void OperationLocatorTests::testNoEndMarker()
{
    const QString text =
        "23.10.25 05:01:00.120 4412 INFO Update operation started\n"
        "23.10.25 05:02:00.000 4412 ERROR Service did not stop\n";

    const auto block = updwatch::locateLastOperation(text, m_detection);
    QVERIFY(!block.found);
    QCOMPARE(block.state, updwatch::BlockState::NoEndMarker);
    QCOMPARE(block.endMarkerOffset, qsizetype(-1));
    QVERIFY(block.content.isEmpty());
}

void OperationLocatorTests::testEndWithoutStart()
{
    const QString text =
        "23.10.25 05:01:00.120 4412 INFO log rotated\n"
        "23.10.25 05:46:23.010 4412 INFO Update operation completed\n";

    const auto block = updwatch::locateLastOperation(text, m_detection);
    QVERIFY(!block.found);
    QCOMPARE(block.state, updwatch::BlockState::EndWithoutStart);
    QVERIFY(block.endMarkerOffset > 0);
}

void OperationLocatorTests::testLastOperationIsSelected()
{
    const QString text =
        "22.10.25 05:01:00.000 1 INFO Update operation started\n"
        "22.10.25 05:20:00.000 1 INFO program version - 185\n"
        "22.10.25 05:30:00.000 1 INFO Update operation completed\n"
        "23.10.25 05:01:00.000 2 INFO Update operation started\n"
        "23.10.25 05:40:00.000 2 INFO program version - 186\n"
        "23.10.25 05:46:23.000 2 INFO Update operation completed\n";

    const auto block = updwatch::locateLastOperation(text, m_detection);
    QVERIFY(block.found);
    QCOMPARE(block.state, updwatch::BlockState::Found);
    QVERIFY(block.startOffset < block.endOffset);
    QVERIFY(block.content.startsWith(m_detection.startMarker));
    QVERIFY(block.content.endsWith(m_detection.completionMarker));
    QVERIFY(block.content.contains("program version - 186"));
    QVERIFY(!block.content.contains("program version - 185"));
    QCOMPARE(block.content, text.mid(block.startOffset, block.endOffset - block.startOffset));
}

void OperationLocatorTests::testStartAfterLastEndIsIgnored()
{
    const QString text =
        "23.10.25 05:01:00.000 2 INFO Update operation started\n"
        "23.10.25 05:46:23.000 2 INFO Update operation completed\n"
        "23.10.25 06:00:00.000 3 INFO Update operation started\n";

    const auto block = updwatch::locateLastOperation(text, m_detection);
    QVERIFY(block.found);
    QCOMPARE(block.startOffset, text.indexOf(m_detection.startMarker));
}

void OperationLocatorTests::testVersionConfirmationSpacing()
{
    QVERIFY(updwatch::hasVersionConfirmation("program version - 186", "186", m_detection));
    QVERIFY(updwatch::hasVersionConfirmation("program version-186", "186", m_detection));
    QVERIFY(updwatch::hasVersionConfirmation("Program Version  -\t186 ready", "186", m_detection));
    QVERIFY(updwatch::hasVersionConfirmation("program version - 186.", "186", m_detection));
    QVERIFY(!updwatch::hasVersionConfirmation("program version 186", "186", m_detection));
    QVERIFY(!updwatch::hasVersionConfirmation("version - 186", "186", m_detection));
    QVERIFY(!updwatch::hasVersionConfirmation("program version - 186", "", m_detection));
}

void OperationLocatorTests::testVersionWordBoundary()
{
    QVERIFY(!updwatch::hasVersionConfirmation("program version - 1870", "187", m_detection));
    QVERIFY(!updwatch::hasVersionConfirmation("program version - 2187", "187", m_detection));
    QVERIFY(updwatch::hasVersionConfirmation("program version - 187 (build 2187)", "187",
                                             m_detection));
}

void OperationLocatorTests::testCompletionMarker()
{
    const auto both = updwatch::validateMarkers(
        "Update operation started\nprogram version - 186\nUpdate operation completed",
        "186", m_detection);
    QVERIFY(both.versionConfirmed);
    QVERIFY(both.completionConfirmed);

    const auto none = updwatch::validateMarkers("Update operation started\n", "186", m_detection);
    QVERIFY(!none.versionConfirmed);
    QVERIFY(!none.completionConfirmed);
}

QTEST_MAIN(OperationLocatorTests)
#include "test_operation_locator.moc"
