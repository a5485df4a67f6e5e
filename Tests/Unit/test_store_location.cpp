#include <QtTest/QtTest>
#include <QTemporaryDir>
#include "core/store/store_location.h"

class TestStoreLocation : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();
    void testConfiguredDirectoryUsed();
    void testConfiguredDirectoryCreated();
    void testUnwritableConfiguredFallsBack();
    void testEmptyConfiguredUsesUserDefault();
    void testIsWritableDirectoryRejectsFile();
    void testIsWritableDirectoryLeavesNoScratchFile();
    void testSourceNames();
};

void TestStoreLocation::initTestCase()
{
    QStandardPaths::setTestModeEnabled(true);
}

void TestStoreLocation::testConfiguredDirectoryUsed()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    const auto location = cr::resolveLocation(dir.path(), QStringLiteral("cache.db"));
    QVERIFY(location.has_value());
    QVERIFY(location->source == cr::StoreLocation::Source::Configured);
    QCOMPARE(location->directory, QDir(dir.path()).absolutePath());
    QCOMPARE(location->dbPath, QDir(dir.path()).absoluteFilePath(QStringLiteral("cache.db")));
}

void TestStoreLocation::testConfiguredDirectoryCreated()
{
    QTemporaryDir dir;
    const QString nested = dir.path() + QStringLiteral("/a/b/c");
    QVERIFY(!QFileInfo::exists(nested));

    const auto location = cr::resolveLocation(nested, QStringLiteral("cache.db"));
    QVERIFY(location.has_value());
    QVERIFY(location->source == cr::StoreLocation::Source::Configured);
    QVERIFY(QFileInfo(nested).isDir());
}

void TestStoreLocation::testUnwritableConfiguredFallsBack()
{
    QTemporaryDir dir;
    // A regular file blocks directory creation beneath it
    const QString blocker = dir.path() + QStringLiteral("/blocker");
    QFile file(blocker);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.close();

    const auto location = cr::resolveLocation(blocker + QStringLiteral("/sub"),
                                              QStringLiteral("cache.db"));
    QVERIFY(location.has_value());
    QVERIFY(location->source != cr::StoreLocation::Source::Configured);
    QVERIFY(location->dbPath.endsWith(QStringLiteral("/cache.db")));
}

void TestStoreLocation::testEmptyConfiguredUsesUserDefault()
{
    const auto location = cr::resolveLocation(QString(), QStringLiteral("test.db"));
    QVERIFY(location.has_value());
    QVERIFY(location->source == cr::StoreLocation::Source::UserDefault);
    QCOMPARE(location->directory, QDir(cr::defaultStoreDirectory()).absolutePath());
}

void TestStoreLocation::testIsWritableDirectoryRejectsFile()
{
    QTemporaryDir dir;
    const QString path = dir.path() + QStringLiteral("/plain.txt");
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.close();

    QVERIFY(!cr::isWritableDirectory(path));
    QVERIFY(!cr::isWritableDirectory(QString()));
    QVERIFY(cr::isWritableDirectory(dir.path()));
}

void TestStoreLocation::testIsWritableDirectoryLeavesNoScratchFile()
{
    QTemporaryDir dir;
    QVERIFY(cr::isWritableDirectory(dir.path()));
    const QStringList left = QDir(dir.path()).entryList(QDir::Files | QDir::Hidden);
    QVERIFY(left.isEmpty());
}

void TestStoreLocation::testSourceNames()
{
    QCOMPARE(cr::storeLocationSourceToString(cr::StoreLocation::Source::Configured),
             QStringLiteral("configured"));
    QCOMPARE(cr::storeLocationSourceToString(cr::StoreLocation::Source::UserDefault),
             QStringLiteral("user-default"));
    QCOMPARE(cr::storeLocationSourceToString(cr::StoreLocation::Source::TempFallback),
             QStringLiteral("temp-fallback"));
}

QTEST_MAIN(TestStoreLocation)
#include "test_store_location.moc"
