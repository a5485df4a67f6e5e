#include "core/cache/degradation_controller.h"
#include "core/shared/types.h"

#include <algorithm>

namespace cr {

DegradationController::DegradationController(int maxErrorCount)
    : m_maxErrorCount(std::max(maxErrorCount, 1))
{
}

bool DegradationController::isEnabled() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_enabled;
}

void DegradationController::recordSuccess()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_enabled && m_errorCount > 0) {
        --m_errorCount;
    }
}

void DegradationController::recordFailure(const char* operation, const QString& kind,
                                          const QString& message)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    ++m_errorCount;
    m_errorsByKind[kind] += 1;
    m_lastError = QStringLiteral("%1: %2").arg(QLatin1String(operation), message);
    m_lastErrorAt = currentTimestamp();

    LOG_WARN(crCache, "Cache operation %s failed (%s, %d/%d): %s",
             operation, qUtf8Printable(kind), m_errorCount, m_maxErrorCount,
             qUtf8Printable(message));

    if (m_enabled && m_errorCount >= m_maxErrorCount) {
        m_enabled = false;
        LOG_ERROR(crCache, "Cache disabled after %d errors; reset required", m_errorCount);
    }
}

void DegradationController::trip(const QString& reason)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_enabled = false;
    m_lastError = reason;
    m_lastErrorAt = currentTimestamp();
    m_errorsByKind[cacheErrorKindToString(CacheErrorKind::CacheDisabled)] += 1;
    LOG_ERROR(crCache, "Cache disabled: %s", qUtf8Printable(reason));
}

void DegradationController::reset()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_enabled = true;
    m_errorCount = 0;
    m_lastError.clear();
    m_lastErrorAt = 0.0;
    m_errorsByKind.clear();
    LOG_INFO(crCache, "Cache re-enabled");
}

DegradationHealth DegradationController::health() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    DegradationHealth health;
    health.enabled = m_enabled;
    health.errorCount = m_errorCount;
    health.maxErrorCount = m_maxErrorCount;
    health.lastError = m_lastError;
    health.lastErrorAt = m_lastErrorAt;
    health.errorsByKind = m_errorsByKind;
    return health;
}

} // namespace cr
