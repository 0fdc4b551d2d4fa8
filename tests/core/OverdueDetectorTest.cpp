#include <QtTest/QtTest>

#include "todome/core/OverdueDetector.hpp"
#include "todome/syntax/TreeBuilder.hpp"

using namespace todome::core;
using namespace todome::syntax;

class OverdueDetectorTest : public QObject
{
    Q_OBJECT

private slots:
    void reportsOpenTasksBeforeReference();
    void skipsClosedTasksAndHeaders();
    void dueOnReferenceIsNotOverdue();
    void invalidReferenceYieldsNothing();
    void classifiesDateDiagnostics();
    void respectsDiagnosticOptions();
};

namespace {
const QDate Reference(2024, 3, 10);
}

void OverdueDetectorTest::reportsOpenTasksBeforeReference()
{
    const Forest forest = parseForest(QStringLiteral("# plan\n(2024-03-01) file taxes\n* (2024-03-09) call mom\n"));
    const auto result = overdue(forest, resolve(forest), Reference);
    QCOMPARE(result.size(), 2);
    QCOMPARE(result.at(0).line, 1);
    QCOMPARE(result.at(0).dueDate, QDate(2024, 3, 1));
    QCOMPARE(result.at(0).daysOverdue, qint64(9));
    QCOMPARE(result.at(1).line, 2);
    QCOMPARE(result.at(1).daysOverdue, qint64(1));
}

void OverdueDetectorTest::skipsClosedTasksAndHeaders()
{
    const Forest forest = parseForest(QStringLiteral("(2024-01-01)\n"
                                                     "\t- paid rent\n"
                                                     "\t= skipped gym\n"
                                                     "\tbuy stamps\n"));
    const auto result = overdue(forest, resolve(forest), Reference);
    QCOMPARE(result.size(), 1);
    QCOMPARE(result.at(0).line, 3);
    QCOMPARE(result.at(0).dueDate, QDate(2024, 1, 1));
}

void OverdueDetectorTest::dueOnReferenceIsNotOverdue()
{
    const Forest forest = parseForest(QStringLiteral("(2024-03-10) today\n(2024-03-11) tomorrow\n"));
    QVERIFY(overdue(forest, resolve(forest), Reference).isEmpty());
}

void OverdueDetectorTest::invalidReferenceYieldsNothing()
{
    const Forest forest = parseForest(QStringLiteral("(2000-01-01) ancient\n"));
    QVERIFY(overdue(forest, resolve(forest), QDate()).isEmpty());
    QVERIFY(dateDiagnostics(forest, resolve(forest), QDate()).isEmpty());
}

void OverdueDetectorTest::classifiesDateDiagnostics()
{
    const Forest forest = parseForest(QStringLiteral("(2024-03-01) late\n"
                                                     "(2024-03-10) now\n"
                                                     "(2024-03-11) next\n"
                                                     "(2024-03-15) soon\n"
                                                     "(2024-04-30) later\n"
                                                     "- (2024-03-01) finished\n"));
    const auto diagnostics = dateDiagnostics(forest, resolve(forest), Reference);
    QCOMPARE(diagnostics.size(), 4);

    QCOMPARE(diagnostics.at(0).line, 0);
    QVERIFY(diagnostics.at(0).severity == Severity::Error);
    QCOMPARE(diagnostics.at(0).message, QStringLiteral("this task is OVERDUE!"));
    QCOMPARE(diagnostics.at(0).source, QStringLiteral("todome"));

    QCOMPARE(diagnostics.at(1).line, 1);
    QVERIFY(diagnostics.at(1).severity == Severity::Warning);
    QCOMPARE(diagnostics.at(1).message, QStringLiteral("this task is due today."));

    QCOMPARE(diagnostics.at(2).line, 2);
    QVERIFY(diagnostics.at(2).severity == Severity::Information);
    QCOMPARE(diagnostics.at(2).message, QStringLiteral("this task is due tomorrow."));

    QCOMPARE(diagnostics.at(3).line, 3);
    QCOMPARE(diagnostics.at(3).message, QStringLiteral("this task is due in 5 days."));

    QCOMPARE(severityName(Severity::Warning), QStringLiteral("warning"));
}

void OverdueDetectorTest::respectsDiagnosticOptions()
{
    const Forest forest = parseForest(QStringLiteral("(2024-03-01) late\n(2024-03-10) now\n(2024-03-12) soon\n"));
    const Resolution resolution = resolve(forest);

    DiagnosticOptions options;
    options.reportDueToday = false;
    options.dueSoonDays = 1;
    const auto diagnostics = dateDiagnostics(forest, resolution, Reference, options);
    QCOMPARE(diagnostics.size(), 1);
    QVERIFY(diagnostics.at(0).severity == Severity::Error);

    options.dueSoonDays = 2;
    QCOMPARE(dateDiagnostics(forest, resolution, Reference, options).size(), 2);

    options.reportDueSoon = false;
    QCOMPARE(dateDiagnostics(forest, resolution, Reference, options).size(), 1);
}

QTEST_GUILESS_MAIN(OverdueDetectorTest)
#include "OverdueDetectorTest.moc"
