#include <QtTest/QtTest>

#include "todome/core/QueryIndex.hpp"
#include "todome/syntax/LineClassifier.hpp"
#include "todome/syntax/TreeBuilder.hpp"

using namespace todome::core;
using namespace todome::syntax;

class QueryIndexTest : public QObject
{
    Q_OBJECT

private slots:
    void collectsCategoriesAndTags();
    void filtersByCaseSensitivePrefix();
    void countsOccurrencesPerLine();
    void ignoresCommentsAndBlanks();
};

void QueryIndexTest::collectsCategoriesAndTags()
{
    const Forest forest = parseForest(QStringLiteral("[work]\n"
                                                     "\t[Project X] [work] draft @alice\n"
                                                     "[home] fix sink @bob @alice\n"));
    const QueryIndex index = QueryIndex::fromForest(forest);
    QCOMPARE(index.candidates(CandidateKind::Category), QStringList({ "Project X", "home", "work" }));
    QCOMPARE(index.candidates(CandidateKind::Tag), QStringList({ "alice", "bob" }));
    QVERIFY(index.contains(CandidateKind::Tag, QStringLiteral("bob")));
    QVERIFY(!index.contains(CandidateKind::Category, QStringLiteral("bob")));
}

void QueryIndexTest::filtersByCaseSensitivePrefix()
{
    const QueryIndex index = QueryIndex::fromForest(parseForest(QStringLiteral("[Work] a\n[workshop] b\n[work] c\n")));
    QCOMPARE(index.candidates(CandidateKind::Category, QStringLiteral("work")), QStringList({ "work", "workshop" }));
    QCOMPARE(index.candidates(CandidateKind::Category, QStringLiteral("W")), QStringList({ "Work" }));
    QVERIFY(index.candidates(CandidateKind::Category, QStringLiteral("x")).isEmpty());
    // Repeated calls on an unchanged index agree.
    QCOMPARE(index.candidates(CandidateKind::Category), index.candidates(CandidateKind::Category));
}

void QueryIndexTest::countsOccurrencesPerLine()
{
    QueryIndex index;
    const ClassifiedLine first = classifyLine(QStringLiteral("[errands] post office @town"));
    const ClassifiedLine second = classifyLine(QStringLiteral("[errands] bakery"));
    index.addLine(first);
    index.addLine(second);
    QCOMPARE(index.occurrences(CandidateKind::Category, QStringLiteral("errands")), 2);

    index.removeLine(first);
    QCOMPARE(index.occurrences(CandidateKind::Category, QStringLiteral("errands")), 1);
    QVERIFY(!index.contains(CandidateKind::Tag, QStringLiteral("town")));

    index.removeLine(second);
    QVERIFY(index.candidates(CandidateKind::Category).isEmpty());
    QVERIFY(index == QueryIndex());
}

void QueryIndexTest::ignoresCommentsAndBlanks()
{
    const QueryIndex index = QueryIndex::fromForest(parseForest(QStringLiteral("# [not] @here\n\nbody # [nor] @this\n")));
    QVERIFY(index.candidates(CandidateKind::Category).isEmpty());
    QVERIFY(index.candidates(CandidateKind::Tag).isEmpty());
}

QTEST_GUILESS_MAIN(QueryIndexTest)
#include "QueryIndexTest.moc"
