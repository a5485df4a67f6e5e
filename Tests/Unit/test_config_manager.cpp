#include <QtTest/QtTest>
#include <QTemporaryDir>
#include "core/shared/config_manager.h"

#include <QJsonDocument>

namespace {

bool writeJson(const QString& path, const QJsonObject& object)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        return false;
    }
    return file.write(QJsonDocument(object).toJson()) > 0;
}

} // namespace

class TestConfigManager : public QObject {
    Q_OBJECT

private slots:
    void testDefaultsAreValid();
    void testMissingFileGivesDefaults();
    void testSaveLoadPreservesValues();
    void testPartialFileKeepsDefaults();
    void testMalformedJsonRejected();
    void testInvalidValuesRejected();
    void testThresholdOrderingValidated();
    void testDecayCurveParsing();
    void testUnknownDecayCurveRejected();
    void testWrongTypesRejected_data();
    void testWrongTypesRejected();
    void testWholeNumberAcceptedAsInteger();
    void testDatabaseFileMustBePlainName();
};

void TestConfigManager::testDefaultsAreValid()
{
    const cr::CacheConfig config;
    QVERIFY(config.isValid());
    QCOMPARE(config.positiveWeight, 0.2);
    QCOMPARE(config.negativeWeight, 0.6);
    QCOMPARE(config.maxErrorCount, 3);
    QVERIFY(config.autoCopyThreshold >= config.confidenceThreshold);
}

void TestConfigManager::testMissingFileGivesDefaults()
{
    QTemporaryDir dir;
    const auto config = cr::ConfigManager::load(dir.path() + QStringLiteral("/absent.json"));
    QVERIFY(config.has_value());
    QCOMPARE(config->cacheSizeLimit, cr::CacheConfig{}.cacheSizeLimit);
}

void TestConfigManager::testSaveLoadPreservesValues()
{
    QTemporaryDir dir;
    const QString path = dir.path() + QStringLiteral("/nested/config.json");

    cr::CacheConfig config;
    config.cacheDirectory = QStringLiteral("/var/tmp/cmdrecall");
    config.positiveWeight = 0.25;
    config.similarityThreshold = 0.65;
    config.decayCurve = cr::DecayCurve::Linear;
    config.cacheSizeLimit = 250;
    config.cacheEnabled = false;
    QVERIFY(cr::ConfigManager::save(config, path));

    const auto loaded = cr::ConfigManager::load(path);
    QVERIFY(loaded.has_value());
    QCOMPARE(loaded->cacheDirectory, config.cacheDirectory);
    QCOMPARE(loaded->positiveWeight, 0.25);
    QCOMPARE(loaded->similarityThreshold, 0.65);
    QVERIFY(loaded->decayCurve == cr::DecayCurve::Linear);
    QCOMPARE(loaded->cacheSizeLimit, 250);
    QCOMPARE(loaded->cacheEnabled, false);
}

void TestConfigManager::testPartialFileKeepsDefaults()
{
    const cr::CacheConfig config = cr::ConfigManager::fromJson(
        QJsonObject{{QStringLiteral("maxCacheAgeDays"), 7}});
    QCOMPARE(config.maxCacheAgeDays, 7);
    QCOMPARE(config.autoCopyThreshold, cr::CacheConfig{}.autoCopyThreshold);
}

void TestConfigManager::testMalformedJsonRejected()
{
    QTemporaryDir dir;
    const QString path = dir.path() + QStringLiteral("/config.json");
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("{ not json");
    file.close();

    QVERIFY(!cr::ConfigManager::load(path).has_value());
}

void TestConfigManager::testInvalidValuesRejected()
{
    QTemporaryDir dir;
    const QString path = dir.path() + QStringLiteral("/config.json");
    cr::CacheConfig config;
    config.similarityThreshold = 1.5;
    config.negativeWeight = -1.0;
    QCOMPARE(config.validate().size(), 2);
    QVERIFY(cr::ConfigManager::save(config, path));

    QVERIFY(!cr::ConfigManager::load(path).has_value());
}

void TestConfigManager::testThresholdOrderingValidated()
{
    cr::CacheConfig config;
    config.confidenceThreshold = 0.9;
    config.autoCopyThreshold = 0.8;
    const QStringList errors = config.validate();
    QCOMPARE(errors.size(), 1);
    QVERIFY(errors.first().contains(QStringLiteral("autoCopyThreshold")));
}

void TestConfigManager::testDecayCurveParsing()
{
    cr::DecayCurve curve = cr::DecayCurve::None;
    QVERIFY(cr::decayCurveFromString(QStringLiteral(" Exponential "), &curve));
    QVERIFY(curve == cr::DecayCurve::Exponential);
    QVERIFY(!cr::decayCurveFromString(QStringLiteral("cubic"), &curve));
    QVERIFY(curve == cr::DecayCurve::Exponential);

    QStringList errors;
    const cr::CacheConfig parsed = cr::ConfigManager::fromJson(
        QJsonObject{{QStringLiteral("decayCurve"), QStringLiteral("Linear")}}, &errors);
    QVERIFY(errors.isEmpty());
    QVERIFY(parsed.decayCurve == cr::DecayCurve::Linear);
}

void TestConfigManager::testUnknownDecayCurveRejected()
{
    QStringList errors;
    cr::ConfigManager::fromJson(
        QJsonObject{{QStringLiteral("decayCurve"), QStringLiteral("cubic")}}, &errors);
    QCOMPARE(errors.size(), 1);
    QVERIFY(errors.first().contains(QStringLiteral("decayCurve")));

    QTemporaryDir dir;
    const QString path = dir.path() + QStringLiteral("/config.json");
    QVERIFY(writeJson(path, QJsonObject{{QStringLiteral("decayCurve"), QStringLiteral("cubic")}}));
    QVERIFY(!cr::ConfigManager::load(path).has_value());
}

void TestConfigManager::testWrongTypesRejected_data()
{
    QTest::addColumn<QString>("key");
    QTest::addColumn<QJsonValue>("value");

    QTest::newRow("weight as string") << QStringLiteral("positiveWeight")
                                      << QJsonValue(QStringLiteral("abc"));
    QTest::newRow("fractional count") << QStringLiteral("maxErrorCount") << QJsonValue(3.5);
    QTest::newRow("enabled as number") << QStringLiteral("cacheEnabled") << QJsonValue(1);
    QTest::newRow("directory as number") << QStringLiteral("cacheDirectory") << QJsonValue(7);
    QTest::newRow("size limit as null") << QStringLiteral("cacheSizeLimit")
                                        << QJsonValue(QJsonValue::Null);
    QTest::newRow("curve as number") << QStringLiteral("decayCurve") << QJsonValue(2);
}

void TestConfigManager::testWrongTypesRejected()
{
    QFETCH(QString, key);
    QFETCH(QJsonValue, value);

    const QJsonObject json{{key, value}};
    QStringList errors;
    const cr::CacheConfig config = cr::ConfigManager::fromJson(json, &errors);
    QCOMPARE(errors.size(), 1);
    QVERIFY(errors.first().startsWith(key));
    QVERIFY(config.isValid());

    QTemporaryDir dir;
    const QString path = dir.path() + QStringLiteral("/config.json");
    QVERIFY(writeJson(path, json));
    QVERIFY(!cr::ConfigManager::load(path).has_value());
}

void TestConfigManager::testWholeNumberAcceptedAsInteger()
{
    QStringList errors;
    const cr::CacheConfig config = cr::ConfigManager::fromJson(
        QJsonObject{{QStringLiteral("maxErrorCount"), 5.0}}, &errors);
    QVERIFY(errors.isEmpty());
    QCOMPARE(config.maxErrorCount, 5);
}

void TestConfigManager::testDatabaseFileMustBePlainName()
{
    cr::CacheConfig config;
    config.databaseFile = QStringLiteral("../escape.db");
    QVERIFY(!config.isValid());
    config.databaseFile = QString();
    QVERIFY(!config.isValid());
    config.databaseFile = QStringLiteral("other.db");
    QVERIFY(config.isValid());
}

QTEST_MAIN(TestConfigManager)
#include "test_config_manager.moc"
