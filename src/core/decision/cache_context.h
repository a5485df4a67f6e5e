#pragma once

#include "core/cache/cache_manager.h"
#include "core/cache/degradation_controller.h"
#include "core/confidence/confidence_model.h"
#include "core/match/query_matcher.h"
#include "core/shared/cache_config.h"
#include "core/store/store_location.h"

#include <memory>
#include <optional>

namespace cr {

class CacheStore;

struct MaintenanceReport {
    bool ran = false;                    // false when the cache is disabled
    int removed = 0;
    bool recalculated = false;
    RecalculationResult recalculation;
};

// CacheContext -- everything one process needs to use the cache.
//
// Built once per process and passed explicitly. A store that cannot be
// opened leaves the context usable: the controller is tripped and every
// cache call takes its fallback path.
class CacheContext {
public:
    // Resolves the store location from the config and opens it.
    // Throws std::invalid_argument when config.validate() is not empty.
    explicit CacheContext(const CacheConfig& config);
    // Uses the given store (may be null, which trips the controller).
    CacheContext(const CacheConfig& config, std::unique_ptr<CacheStore> store);
    ~CacheContext();

    CacheContext(const CacheContext&) = delete;
    CacheContext& operator=(const CacheContext&) = delete;

    const CacheConfig& config() const { return m_config; }
    CacheStore* store() const { return m_store.get(); }
    const std::optional<StoreLocation>& location() const { return m_location; }

    const QueryMatcher& matcher() const { return m_matcher; }
    QueryMatcher& matcher() { return m_matcher; }
    ConfidenceModel& confidence() { return *m_confidence; }
    CacheManager& manager() { return *m_manager; }
    DegradationController& controller() { return m_controller; }

    // TTL/size cleanup, plus recalculateAll() when the stored scoring
    // signature differs from the current weights. Errors go through the
    // controller and are logged.
    MaintenanceReport runMaintenance();

private:
    void wire();

    CacheConfig m_config;
    std::optional<StoreLocation> m_location;
    std::unique_ptr<CacheStore> m_store;
    QueryMatcher m_matcher;
    std::unique_ptr<ConfidenceModel> m_confidence;
    std::unique_ptr<CacheManager> m_manager;
    DegradationController m_controller;
};

} // namespace cr
