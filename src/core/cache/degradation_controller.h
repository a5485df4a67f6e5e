#pragma once

#include "core/shared/cache_error.h"
#include "core/shared/logging.h"

#include <QMap>
#include <QString>

#include <exception>
#include <mutex>
#include <type_traits>

namespace cr {

struct DegradationHealth {
    bool enabled = true;
    int errorCount = 0;
    int maxErrorCount = 0;
    QString lastError;
    double lastErrorAt = 0.0;              // Epoch seconds, 0 = never
    QMap<QString, int> errorsByKind;       // Cumulative since last reset
};

// DegradationController -- circuit breaker in front of every cache call.
//
// Enabled -> (errorCount reaches maxErrorCount) -> Disabled -> reset().
// There is no timed half-open state; only reset() re-enables the cache.
// A successful call lowers errorCount by one, so isolated transient errors
// do not accumulate into a trip.
class DegradationController {
public:
    explicit DegradationController(int maxErrorCount = 3);

    // Runs cacheOp while enabled; on CacheError or any std::exception the
    // error is recorded and fallbackOp's result is returned instead. While
    // disabled fallbackOp runs directly. Nothing thrown by cacheOp escapes.
    template <typename CacheOp, typename FallbackOp>
    auto guard(const char* operation, CacheOp&& cacheOp, FallbackOp&& fallbackOp)
        -> decltype(cacheOp());

    bool isEnabled() const;
    void recordSuccess();
    void recordFailure(const char* operation, const QString& kind, const QString& message);

    // Disable immediately, e.g. when no store location could be opened.
    void trip(const QString& reason);
    void reset();

    DegradationHealth health() const;

private:
    mutable std::mutex m_mutex;
    bool m_enabled = true;
    int m_errorCount = 0;
    int m_maxErrorCount = 3;
    QString m_lastError;
    double m_lastErrorAt = 0.0;
    QMap<QString, int> m_errorsByKind;
};

template <typename CacheOp, typename FallbackOp>
auto DegradationController::guard(const char* operation, CacheOp&& cacheOp, FallbackOp&& fallbackOp)
    -> decltype(cacheOp())
{
    if (!isEnabled()) {
        LOG_DEBUG(crCache, "%s skipped: cache disabled", operation);
        return fallbackOp();
    }

    try {
        if constexpr (std::is_void_v<decltype(cacheOp())>) {
            cacheOp();
            recordSuccess();
            return;
        } else {
            auto result = cacheOp();
            recordSuccess();
            return result;
        }
    } catch (const CacheError& e) {
        recordFailure(operation, cacheErrorKindToString(e.causeKind()), e.message());
    } catch (const std::exception& e) {
        recordFailure(operation, QStringLiteral("Unexpected"), QString::fromUtf8(e.what()));
    } catch (...) {
        recordFailure(operation, QStringLiteral("Unexpected"),
                      QStringLiteral("non-standard exception"));
    }
    return fallbackOp();
}

} // namespace cr
