#include "core/decision/cache_context.h"
#include "core/store/cache_store.h"
#include "core/shared/logging.h"

#include <stdexcept>

namespace cr {

namespace {

void requireValid(const CacheConfig& config)
{
    const QStringList errors = config.validate();
    if (!errors.isEmpty()) {
        throw std::invalid_argument(
            QStringLiteral("invalid cache configuration: %1")
                .arg(errors.join(QStringLiteral("; ")))
                .toStdString());
    }
}

CacheStore::Options storeOptions(const CacheConfig& config)
{
    CacheStore::Options options;
    options.busyTimeoutMs = config.storeTimeoutMs;
    options.busyRetryAttempts = config.busyRetryAttempts;
    options.busyRetryBaseMs = config.busyRetryBaseMs;
    return options;
}

} // namespace

CacheContext::CacheContext(const CacheConfig& config)
    : m_config(config)
    , m_controller(config.maxErrorCount)
{
    requireValid(m_config);

    if (!m_config.cacheEnabled) {
        wire();
        m_controller.trip(QStringLiteral("cache disabled by configuration"));
        return;
    }

    m_location = resolveLocation(m_config.cacheDirectory, m_config.databaseFile);
    if (m_location.has_value()) {
        LOG_INFO(crCore, "Cache location: %s (%s)", qUtf8Printable(m_location->dbPath),
                 qUtf8Printable(storeLocationSourceToString(m_location->source)));
        try {
            m_store = CacheStore::open(m_location->dbPath, storeOptions(m_config));
        } catch (const CacheError& e) {
            LOG_ERROR(crCore, "Cache store unavailable: %s", e.what());
            wire();
            m_controller.trip(e.message());
            return;
        }
    }

    wire();
    if (!m_store) {
        m_controller.trip(QStringLiteral("no writable cache location"));
    }
}

CacheContext::CacheContext(const CacheConfig& config, std::unique_ptr<CacheStore> store)
    : m_config(config)
    , m_store(std::move(store))
    , m_controller(config.maxErrorCount)
{
    requireValid(m_config);
    if (m_store) {
        StoreLocation location;
        location.dbPath = m_store->dbPath();
        m_location = location;
    }

    wire();
    if (!m_store) {
        m_controller.trip(QStringLiteral("no cache store"));
    }
}

CacheContext::~CacheContext() = default;

void CacheContext::wire()
{
    m_confidence = std::make_unique<ConfidenceModel>(m_store.get(), m_config);
    m_manager = std::make_unique<CacheManager>(m_store.get(), &m_matcher, m_config);
}

MaintenanceReport CacheContext::runMaintenance()
{
    MaintenanceReport report;
    if (!m_controller.isEnabled()) {
        LOG_INFO(crCore, "Maintenance skipped: cache disabled");
        return report;
    }
    report.ran = true;

    report.removed = m_controller.guard(
        "cleanup",
        [this]() { return m_manager->cleanup(m_config.maxCacheAgeDays, m_config.cacheSizeLimit); },
        []() { return 0; });

    const bool current = m_controller.guard(
        "isScoringCurrent",
        [this]() { return m_confidence->isScoringCurrent(); },
        []() { return true; });

    if (!current) {
        report.recalculated = true;
        report.recalculation = m_controller.guard(
            "recalculateAll",
            [this]() { return m_confidence->recalculateAll(); },
            []() { return RecalculationResult{}; });
    }
    return report;
}

} // namespace cr
