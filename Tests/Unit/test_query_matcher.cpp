#include <QtTest/QtTest>
#include "core/match/query_matcher.h"

class TestQueryMatcher : public QObject {
    Q_OBJECT

private slots:
    void testNormalizeLowercasesAndStripsPunctuation();
    void testNormalizeDropsStopWords();
    void testNormalizeMapsSynonyms();
    void testNormalizeIsIdempotent_data();
    void testNormalizeIsIdempotent();
    void testNormalizeChineseSynonyms();
    void testHashIgnoresOrderAndSynonyms();
    void testHashDistinguishesCommands();
    void testHashFormat();
    void testHashOfStopWordOnlyQuery();
    void testSimilarityReflexive();
    void testSimilaritySymmetric_data();
    void testSimilaritySymmetric();
    void testSimilarityShowVersusList();
    void testSimilarityBlendWeight();
    void testSimilarityEmptyQueries();
    void testSequenceRatio();
    void testJaccard();
    void testAddSynonyms();
    void testCategories();
};

void TestQueryMatcher::testNormalizeLowercasesAndStripsPunctuation()
{
    cr::QueryMatcher matcher;
    const cr::NormalizedQuery n = matcher.normalize(QStringLiteral("  Files, FOLDERS; and: LOGS!! "));
    QCOMPARE(n.tokens, (QStringList{QStringLiteral("files"), QStringLiteral("folders"),
                                    QStringLiteral("logs")}));
    QCOMPARE(n.canonical, QStringLiteral("files folders logs"));
    QCOMPARE(n.original, QStringLiteral("  Files, FOLDERS; and: LOGS!! "));
}

void TestQueryMatcher::testNormalizeDropsStopWords()
{
    cr::QueryMatcher matcher;
    const cr::NormalizedQuery n = matcher.normalize(QStringLiteral("what is the size of my disk"));
    QCOMPARE(n.tokens, (QStringList{QStringLiteral("size"), QStringLiteral("disk")}));
}

void TestQueryMatcher::testNormalizeMapsSynonyms()
{
    cr::QueryMatcher matcher;
    const cr::NormalizedQuery n = matcher.normalize(QStringLiteral("Show ALL the files"));
    QCOMPARE(n.tokens, (QStringList{QStringLiteral("list"), QStringLiteral("all"),
                                    QStringLiteral("files")}));
    QCOMPARE(n.surfaceTokens, (QStringList{QStringLiteral("show"), QStringLiteral("all"),
                                           QStringLiteral("files")}));
    QCOMPARE(n.canonical, QStringLiteral("list all files"));

    QCOMPARE(matcher.normalize(QStringLiteral("rm old logs")).tokens.first(),
             QStringLiteral("delete"));
    QCOMPARE(matcher.normalize(QStringLiteral("launch server")).tokens.first(),
             QStringLiteral("start"));
}

void TestQueryMatcher::testNormalizeIsIdempotent_data()
{
    QTest::addColumn<QString>("query");
    QTest::newRow("plain") << QStringLiteral("list files");
    QTest::newRow("synonyms") << QStringLiteral("Display everything in the current dir");
    QTest::newRow("punctuation") << QStringLiteral("find *.log files, recursively!");
    QTest::newRow("stop words only") << QStringLiteral("the of and");
    QTest::newRow("mixed") << QStringLiteral("kill process on port 8080");
    QTest::newRow("empty") << QString();
    QTest::newRow("chinese") << QStringLiteral("显示 所有 文件");
}

void TestQueryMatcher::testNormalizeIsIdempotent()
{
    QFETCH(QString, query);
    cr::QueryMatcher matcher;
    const cr::NormalizedQuery once = matcher.normalize(query);
    const cr::NormalizedQuery twice = matcher.normalize(once.canonical);
    QVERIFY(twice == once);
    if (!once.tokens.isEmpty()) {
        QCOMPARE(matcher.hash(once.canonical), matcher.hash(once));
    }
}

void TestQueryMatcher::testNormalizeChineseSynonyms()
{
    cr::QueryMatcher matcher;
    const cr::NormalizedQuery n = matcher.normalize(QStringLiteral("显示 文件"));
    QCOMPARE(n.tokens.size(), 2);
    QCOMPARE(n.tokens.at(0), QStringLiteral("list"));
    QCOMPARE(n.tokens.at(1), QStringLiteral("文件"));
}

void TestQueryMatcher::testHashIgnoresOrderAndSynonyms()
{
    cr::QueryMatcher matcher;
    const QString base = matcher.hash(QStringLiteral("list files"));
    QCOMPARE(matcher.hash(QStringLiteral("show files")), base);
    QCOMPARE(matcher.hash(QStringLiteral("files list")), base);
    QCOMPARE(matcher.hash(QStringLiteral("Display the FILES?")), base);
}

void TestQueryMatcher::testHashDistinguishesCommands()
{
    cr::QueryMatcher matcher;
    QVERIFY(matcher.hash(QStringLiteral("list files")) != matcher.hash(QStringLiteral("delete files")));
    QVERIFY(matcher.hash(QStringLiteral("list files")) != matcher.hash(QStringLiteral("list all files")));
}

void TestQueryMatcher::testHashFormat()
{
    cr::QueryMatcher matcher;
    const QString hash = matcher.hash(QStringLiteral("list files"));
    QCOMPARE(hash.size(), 16);
    QVERIFY(QRegularExpression(QStringLiteral("^[0-9a-f]{16}$")).match(hash).hasMatch());

    // Stable across instances
    cr::QueryMatcher other;
    QCOMPARE(other.hash(QStringLiteral("list files")), hash);
}

void TestQueryMatcher::testHashOfStopWordOnlyQuery()
{
    cr::QueryMatcher matcher;
    QVERIFY(matcher.normalize(QStringLiteral("the")).tokens.isEmpty());
    QVERIFY(matcher.hash(QStringLiteral("the")) != matcher.hash(QStringLiteral("a")));
    QCOMPARE(matcher.hash(QStringLiteral("The")), matcher.hash(QStringLiteral(" the ")));
}

void TestQueryMatcher::testSimilarityReflexive()
{
    cr::QueryMatcher matcher;
    const QStringList queries = {
        QStringLiteral("list files"),
        QStringLiteral("show all hidden files in home"),
        QStringLiteral("the"),
        QString(),
        QStringLiteral("显示 文件"),
    };
    for (const QString& q : queries) {
        QCOMPARE(matcher.similarity(q, q), 1.0);
    }
}

void TestQueryMatcher::testSimilaritySymmetric_data()
{
    QTest::addColumn<QString>("a");
    QTest::addColumn<QString>("b");
    QTest::newRow("synonym") << QStringLiteral("show all files") << QStringLiteral("list all files");
    QTest::newRow("subset") << QStringLiteral("list files") << QStringLiteral("list hidden files recursively");
    QTest::newRow("disjoint") << QStringLiteral("compress folder") << QStringLiteral("kill process");
    QTest::newRow("one empty") << QString() << QStringLiteral("list files");
}

void TestQueryMatcher::testSimilaritySymmetric()
{
    QFETCH(QString, a);
    QFETCH(QString, b);
    cr::QueryMatcher matcher;
    QCOMPARE(matcher.similarity(a, b), matcher.similarity(b, a));
    QCOMPARE(matcher.similarity(a, b, 0.3), matcher.similarity(b, a, 0.3));
}

void TestQueryMatcher::testSimilarityShowVersusList()
{
    cr::QueryMatcher matcher;
    // Jaccard 1.0 (same canonical set); LCS("show all files", "list all files") = 11 of 28
    const double s = matcher.similarity(QStringLiteral("show all files"),
                                        QStringLiteral("list all files"));
    QVERIFY(qAbs(s - (0.5 + 0.5 * 22.0 / 28.0)) < 1e-9);
    QVERIFY(s > 0.6);
    QVERIFY(s < 0.95);
}

void TestQueryMatcher::testSimilarityBlendWeight()
{
    cr::QueryMatcher matcher;
    const QString a = QStringLiteral("show all files");
    const QString b = QStringLiteral("list all files");
    QCOMPARE(matcher.similarity(a, b, 1.0), 1.0);
    QVERIFY(qAbs(matcher.similarity(a, b, 0.0) - 22.0 / 28.0) < 1e-9);
}

void TestQueryMatcher::testSimilarityEmptyQueries()
{
    cr::QueryMatcher matcher;
    QCOMPARE(matcher.similarity(QString(), QString()), 1.0);
    QCOMPARE(matcher.similarity(QStringLiteral("the"), QStringLiteral("list files")), 0.0);
}

void TestQueryMatcher::testSequenceRatio()
{
    QCOMPARE(cr::QueryMatcher::sequenceRatio(QStringLiteral("abc"), QStringLiteral("abc")), 1.0);
    QCOMPARE(cr::QueryMatcher::sequenceRatio(QStringLiteral("abc"), QStringLiteral("xyz")), 0.0);
    QCOMPARE(cr::QueryMatcher::sequenceRatio(QString(), QString()), 1.0);
    QCOMPARE(cr::QueryMatcher::sequenceRatio(QStringLiteral("abcd"), QStringLiteral("acbd")), 0.75);
}

void TestQueryMatcher::testJaccard()
{
    const QStringList a = {QStringLiteral("list"), QStringLiteral("files")};
    const QStringList b = {QStringLiteral("list"), QStringLiteral("hidden"), QStringLiteral("files")};
    QVERIFY(qAbs(cr::QueryMatcher::jaccard(a, b) - 2.0 / 3.0) < 1e-12);
    QCOMPARE(cr::QueryMatcher::jaccard(a, a), 1.0);
    QCOMPARE(cr::QueryMatcher::jaccard({}, {}), 1.0);
    QCOMPARE(cr::QueryMatcher::jaccard(a, {QStringLiteral("kill")}), 0.0);
}

void TestQueryMatcher::testAddSynonyms()
{
    cr::QueryMatcher matcher;
    QCOMPARE(matcher.normalize(QStringLiteral("enumerate files")).tokens.first(),
             QStringLiteral("enumerate"));

    matcher.addSynonyms(QStringLiteral("list"), {QStringLiteral("Enumerate")});
    QCOMPARE(matcher.normalize(QStringLiteral("enumerate files")).tokens.first(),
             QStringLiteral("list"));
    QCOMPARE(matcher.hash(QStringLiteral("enumerate files")),
             matcher.hash(QStringLiteral("list files")));

    // Canonical words are never remapped
    matcher.addSynonyms(QStringLiteral("delete"), {QStringLiteral("list")});
    QCOMPARE(matcher.canonicalForm(QStringLiteral("list")), QStringLiteral("list"));
}

void TestQueryMatcher::testCategories()
{
    cr::QueryMatcher matcher;
    const QSet<QString> git = matcher.categories(QStringLiteral("git commit all changes"));
    QVERIFY(git.contains(QStringLiteral("git")));
    QVERIFY(git.contains(QStringLiteral("all")));

    const QSet<QString> docker = matcher.categories(QStringLiteral("show running docker containers"));
    QVERIFY(docker.contains(QStringLiteral("docker")));
    QVERIFY(docker.contains(QStringLiteral("list")));
    QVERIFY(!docker.contains(QStringLiteral("git")));

    QVERIFY(matcher.categories(QStringLiteral("compress photos")).isEmpty());
}

QTEST_MAIN(TestQueryMatcher)
#include "test_query_matcher.moc"
