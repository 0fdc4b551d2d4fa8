#include <QtTest/QtTest>

#include "todome/syntax/LineClassifier.hpp"
#include "todome/syntax/TreeBuilder.hpp"

using namespace todome::syntax;

class TreeBuilderTest : public QObject
{
    Q_OBJECT

private slots:
    void emptyDocument();
    void commentsAndBlanksHaveNoNodes();
    void buildsNestedForest();
    void clampsOverIndentedLines();
    void decidesHeadersByChildren();
    void startsFirstRootAtAnyDepth();
    void replaceLinesMatchesFullBuild();
};

namespace {
void compareForests(const Forest &actual, const Forest &expected)
{
    QCOMPARE(actual.lineCount(), expected.lineCount());
    QCOMPARE(actual.nodeCount(), expected.nodeCount());
    QCOMPARE(actual.roots(), expected.roots());
    for (NodeId id = 0; id < expected.nodeCount(); ++id) {
        const Node &a = actual.node(id);
        const Node &e = expected.node(id);
        QCOMPARE(a.line, e.line);
        QCOMPARE(a.depth, e.depth);
        QCOMPARE(a.parent, e.parent);
        QCOMPARE(a.children, e.children);
        QCOMPARE(a.subtreeEnd, e.subtreeEnd);
        QVERIFY(a.kind == e.kind);
    }
    for (int line = 0; line < expected.lineCount(); ++line) {
        QCOMPARE(actual.nodeAtLine(line), expected.nodeAtLine(line));
    }
}
} // namespace

void TreeBuilderTest::emptyDocument()
{
    const Forest forest = parseForest(QString());
    QVERIFY(forest.isEmpty());
    QCOMPARE(forest.lineCount(), 0);
    QVERIFY(forest.roots().isEmpty());
}

void TreeBuilderTest::commentsAndBlanksHaveNoNodes()
{
    const Forest forest = parseForest(QStringLiteral("# notes\n\n\t# more\n"));
    QVERIFY(forest.isEmpty());
    QCOMPARE(forest.lineCount(), 3);
    QVERIFY(forest.lineKind(0) == LineKind::CommentOnly);
    QVERIFY(forest.lineKind(1) == LineKind::Blank);
    QCOMPARE(forest.nodeAtLine(2), InvalidNode);
}

void TreeBuilderTest::buildsNestedForest()
{
    const Forest forest = parseForest(QStringLiteral("home\n"
                                                     "\tkitchen\n"
                                                     "\t\tdishes\n"
                                                     "\n"
                                                     "\tgarden\n"
                                                     "work\n"));
    QCOMPARE(forest.nodeCount(), 5);
    QCOMPARE(forest.roots(), QVector<NodeId>({ 0, 4 }));
    QCOMPARE(forest.node(0).children, QVector<NodeId>({ 1, 3 }));
    QCOMPARE(forest.node(1).children, QVector<NodeId>({ 2 }));
    QCOMPARE(forest.node(2).parent, 1);
    QCOMPARE(forest.node(3).line, 4);
    QCOMPARE(forest.node(0).subtreeEnd, 4);
    QCOMPARE(forest.node(4).subtreeEnd, 5);
    QCOMPARE(forest.nodeAtLine(3), InvalidNode);
    QCOMPARE(forest.item(2).body, QStringLiteral("dishes"));
}

void TreeBuilderTest::clampsOverIndentedLines()
{
    const Forest forest = parseForest(QStringLiteral("root\n\t\t\t\tdeep\n\t\t\t\tsibling\n\tshallow\n"));
    QCOMPARE(forest.node(1).depth, 1);
    QCOMPARE(forest.node(1).parent, 0);
    // The open ancestor now sits at depth 1, so the next deep line nests below it.
    QCOMPARE(forest.node(2).depth, 2);
    QCOMPARE(forest.node(2).parent, 1);
    QCOMPARE(forest.node(3).depth, 1);
    QCOMPARE(forest.node(3).parent, 0);
    QCOMPARE(forest.node(0).children, QVector<NodeId>({ 1, 3 }));
}

void TreeBuilderTest::decidesHeadersByChildren()
{
    const Forest forest = parseForest(QStringLiteral("[shopping]\n\t- Buy milk\n(A)\n"));
    QVERIFY(forest.node(0).kind == NodeKind::Header);
    QVERIFY(forest.lineKind(0) == LineKind::Header);
    QVERIFY(forest.node(1).kind == NodeKind::Task);
    // Attribute-only line without children stays a task with an empty body.
    QVERIFY(forest.node(2).kind == NodeKind::Task);
    QVERIFY(forest.lineKind(2) == LineKind::Task);
}

void TreeBuilderTest::startsFirstRootAtAnyDepth()
{
    const Forest forest = parseForest(QStringLiteral("\t\tindented\n\t\t\tchild\nnext\n"));
    QCOMPARE(forest.roots(), QVector<NodeId>({ 0, 2 }));
    QCOMPARE(forest.node(0).depth, 0);
    QCOMPARE(forest.node(1).depth, 1);
}

void TreeBuilderTest::replaceLinesMatchesFullBuild()
{
    const QStringList original = {
        QStringLiteral("\tloose"),
        QStringLiteral("a"),
        QStringLiteral("\tb"),
        QStringLiteral("\t\tc"),
        QStringLiteral("d"),
        QStringLiteral("\te"),
        QStringLiteral("f"),
    };

    struct Case
    {
        int first;
        int removed;
        QStringList inserted;
    };
    const QVector<Case> cases = {
        { 0, 0, { QStringLiteral("top") } },
        { 2, 1, { QStringLiteral("\t\tb") } },
        { 4, 1, { QStringLiteral("\td") } },
        { 1, 3, {} },
        { 7, 0, { QStringLiteral("\tg"), QStringLiteral("h") } },
        { 3, 2, { QStringLiteral("# gone") } },
        { 0, 7, {} },
    };

    for (const Case &c : cases) {
        QStringList expectedLines = original;
        for (int i = 0; i < c.removed; ++i) {
            expectedLines.removeAt(c.first);
        }
        for (int i = 0; i < c.inserted.size(); ++i) {
            expectedLines.insert(c.first + i, c.inserted.at(i));
        }

        Forest forest = buildForest(classifyLines(original));
        const BlockSplice splice = forest.replaceLines(c.first, c.removed, classifyLines(c.inserted));
        QVERIFY(splice.firstLine <= c.first);
        compareForests(forest, buildForest(classifyLines(expectedLines)));
    }
}

QTEST_GUILESS_MAIN(TreeBuilderTest)
#include "TreeBuilderTest.moc"
