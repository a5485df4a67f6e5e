#include <QtTest/QtTest>
#include "core/cache/degradation_controller.h"

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

namespace {

cr::CacheError storeFailure()
{
    return cr::CacheError(cr::CacheErrorKind::CacheUnavailable, QStringLiteral("CacheManager::save"),
                          cr::CacheError(cr::CacheErrorKind::StoreUnavailable,
                                         QStringLiteral("disk I/O error")));
}

} // namespace

class TestDegradationController : public QObject {
    Q_OBJECT

private slots:
    void testStartsEnabled();
    void testSuccessPassesResultThrough();
    void testFailureReturnsFallback();
    void testTripsAtMaxErrors();
    void testDisabledSkipsCacheOp();
    void testSuccessDecrementsErrorCount();
    void testResetReenables();
    void testManualTrip();
    void testVoidOperations();
    void testUnexpectedExceptionCaught();
    void testNonStandardExceptionCaught();
    void testErrorsByKindUsesCause();
    void testMaxErrorCountClamped();
    void testConcurrentFailures();
};

void TestDegradationController::testStartsEnabled()
{
    cr::DegradationController controller;
    QVERIFY(controller.isEnabled());
    const cr::DegradationHealth health = controller.health();
    QVERIFY(health.enabled);
    QCOMPARE(health.errorCount, 0);
    QCOMPARE(health.maxErrorCount, 3);
    QVERIFY(health.lastError.isEmpty());
    QCOMPARE(health.lastErrorAt, 0.0);
}

void TestDegradationController::testSuccessPassesResultThrough()
{
    cr::DegradationController controller;
    const int value = controller.guard("op", [] { return 42; }, [] { return -1; });
    QCOMPARE(value, 42);
    QCOMPARE(controller.health().errorCount, 0);
}

void TestDegradationController::testFailureReturnsFallback()
{
    cr::DegradationController controller;
    const QString value = controller.guard(
        "save",
        []() -> QString { throw storeFailure(); },
        [] { return QStringLiteral("fallback"); });
    QCOMPARE(value, QStringLiteral("fallback"));

    const cr::DegradationHealth health = controller.health();
    QCOMPARE(health.errorCount, 1);
    QVERIFY(health.enabled);
    QVERIFY(health.lastError.startsWith(QStringLiteral("save: ")));
    QVERIFY(health.lastErrorAt > 0.0);
}

void TestDegradationController::testTripsAtMaxErrors()
{
    cr::DegradationController controller(3);
    for (int i = 0; i < 2; ++i) {
        controller.guard("op", []() -> int { throw storeFailure(); }, [] { return 0; });
        QVERIFY(controller.isEnabled());
    }
    controller.guard("op", []() -> int { throw storeFailure(); }, [] { return 0; });
    QVERIFY(!controller.isEnabled());
    QCOMPARE(controller.health().errorCount, 3);
}

void TestDegradationController::testDisabledSkipsCacheOp()
{
    cr::DegradationController controller(1);
    controller.guard("op", []() -> int { throw storeFailure(); }, [] { return 0; });
    QVERIFY(!controller.isEnabled());

    int cacheCalls = 0;
    const int value = controller.guard("op",
                                       [&] { ++cacheCalls; return 1; },
                                       [] { return 2; });
    QCOMPARE(value, 2);
    QCOMPARE(cacheCalls, 0);
    // Skipped calls are not errors
    QCOMPARE(controller.health().errorCount, 1);
}

void TestDegradationController::testSuccessDecrementsErrorCount()
{
    cr::DegradationController controller(3);
    controller.guard("op", []() -> int { throw storeFailure(); }, [] { return 0; });
    controller.guard("op", []() -> int { throw storeFailure(); }, [] { return 0; });
    QCOMPARE(controller.health().errorCount, 2);

    controller.guard("op", [] { return 1; }, [] { return 0; });
    QCOMPARE(controller.health().errorCount, 1);

    // Interleaved successes keep the breaker closed
    for (int i = 0; i < 5; ++i) {
        controller.guard("op", []() -> int { throw storeFailure(); }, [] { return 0; });
        controller.guard("op", [] { return 1; }, [] { return 0; });
    }
    QVERIFY(controller.isEnabled());
    QCOMPARE(controller.health().errorCount, 1);

    controller.recordSuccess();
    controller.recordSuccess();
    QCOMPARE(controller.health().errorCount, 0);
}

void TestDegradationController::testResetReenables()
{
    cr::DegradationController controller(2);
    controller.guard("op", []() -> int { throw storeFailure(); }, [] { return 0; });
    controller.guard("op", []() -> int { throw storeFailure(); }, [] { return 0; });
    QVERIFY(!controller.isEnabled());

    controller.reset();
    const cr::DegradationHealth health = controller.health();
    QVERIFY(health.enabled);
    QCOMPARE(health.errorCount, 0);
    QVERIFY(health.errorsByKind.isEmpty());
    QVERIFY(health.lastError.isEmpty());

    QCOMPARE(controller.guard("op", [] { return 7; }, [] { return 0; }), 7);
}

void TestDegradationController::testManualTrip()
{
    cr::DegradationController controller;
    controller.trip(QStringLiteral("no writable cache directory"));

    const cr::DegradationHealth health = controller.health();
    QVERIFY(!health.enabled);
    QCOMPARE(health.lastError, QStringLiteral("no writable cache directory"));
    QCOMPARE(health.errorsByKind.value(QStringLiteral("CacheDisabled")), 1);
    QCOMPARE(controller.guard("op", [] { return 1; }, [] { return 2; }), 2);
}

void TestDegradationController::testVoidOperations()
{
    cr::DegradationController controller;
    bool cacheRan = false;
    bool fallbackRan = false;
    controller.guard("touch", [&] { cacheRan = true; }, [&] { fallbackRan = true; });
    QVERIFY(cacheRan);
    QVERIFY(!fallbackRan);

    cacheRan = false;
    controller.guard("touch", [&] { cacheRan = true; throw storeFailure(); },
                     [&] { fallbackRan = true; });
    QVERIFY(cacheRan);
    QVERIFY(fallbackRan);
    QCOMPARE(controller.health().errorCount, 1);
}

void TestDegradationController::testUnexpectedExceptionCaught()
{
    cr::DegradationController controller;
    const int value = controller.guard(
        "op", []() -> int { throw std::runtime_error("boom"); }, [] { return -1; });
    QCOMPARE(value, -1);

    const cr::DegradationHealth health = controller.health();
    QCOMPARE(health.errorsByKind.value(QStringLiteral("Unexpected")), 1);
    QVERIFY(health.lastError.contains(QStringLiteral("boom")));
}

void TestDegradationController::testNonStandardExceptionCaught()
{
    cr::DegradationController controller;
    const int value = controller.guard("op", []() -> int { throw 42; }, [] { return -1; });
    QCOMPARE(value, -1);

    bool fallbackRan = false;
    controller.guard("void op", [] { throw 42; }, [&] { fallbackRan = true; });
    QVERIFY(fallbackRan);

    const cr::DegradationHealth health = controller.health();
    QCOMPARE(health.errorsByKind.value(QStringLiteral("Unexpected")), 2);
    QCOMPARE(health.errorCount, 2);
}

void TestDegradationController::testErrorsByKindUsesCause()
{
    cr::DegradationController controller(10);
    controller.guard("op", []() -> int { throw storeFailure(); }, [] { return 0; });
    controller.guard("op", []() -> int { throw storeFailure(); }, [] { return 0; });
    controller.guard("op", []() -> int {
        throw cr::CacheError(cr::CacheErrorKind::SchemaError, QStringLiteral("missing table"));
    }, [] { return 0; });

    const QMap<QString, int> byKind = controller.health().errorsByKind;
    QCOMPARE(byKind.value(QStringLiteral("StoreUnavailable")), 2);
    QCOMPARE(byKind.value(QStringLiteral("SchemaError")), 1);
    QVERIFY(!byKind.contains(QStringLiteral("CacheUnavailable")));
}

void TestDegradationController::testMaxErrorCountClamped()
{
    cr::DegradationController controller(0);
    QCOMPARE(controller.health().maxErrorCount, 1);
    controller.recordFailure("op", QStringLiteral("StoreUnavailable"), QStringLiteral("x"));
    QVERIFY(!controller.isEnabled());
}

void TestDegradationController::testConcurrentFailures()
{
    constexpr int kThreads = 8;
    constexpr int kPerThread = 50;
    cr::DegradationController controller(kThreads * kPerThread + 1);
    std::atomic<int> fallbacks{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < kPerThread; ++i) {
                controller.guard("op", []() -> int { throw storeFailure(); },
                                 [&] { return ++fallbacks; });
            }
        });
    }
    for (std::thread& thread : threads) {
        thread.join();
    }

    QCOMPARE(fallbacks.load(), kThreads * kPerThread);
    QCOMPARE(controller.health().errorCount, kThreads * kPerThread);
    QVERIFY(controller.isEnabled());
}

QTEST_MAIN(TestDegradationController)
#include "test_degradation_controller.moc"
