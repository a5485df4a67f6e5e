#pragma once

#include "core/shared/cache_config.h"
#include "core/shared/cache_error.h"
#include "core/shared/types.h"

#include <QString>

#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace cr {

class CacheStore;
class QueryMatcher;

struct SimilarMatch {
    CacheEntry entry;
    double similarity = 0.0;
};

// CacheManager -- entry CRUD, exact and similar lookup, TTL/size maintenance.
//
// Every operation rethrows Store failures as CacheError(CacheUnavailable)
// with the Store's kind kept as the cause. Mutations run in one Store
// transaction each.
class CacheManager {
public:
    CacheManager(CacheStore* store, const QueryMatcher* matcher, const CacheConfig& config);

    // Insert or merge by query hash. Empty osType/shellType fall back to
    // the current platform.
    CacheEntry save(const QString& query, const QString& command,
                    const QString& osType = {}, const QString& shellType = {});

    std::optional<CacheEntry> findExact(const QString& query);
    std::optional<CacheEntry> findByHash(const QString& queryHash);

    // Best match over the `limit` most recently used entries (capped at
    // cacheSizeLimit; <= 0 means cacheSizeLimit). Ties prefer the higher
    // confidence score, then the more recent lastUsedAt.
    std::optional<SimilarMatch> findSimilar(const QString& query, int limit = 0);
    std::optional<SimilarMatch> findSimilar(const QString& query, int limit, double threshold);

    // Returns the number of entries removed.
    int cleanup(int maxAgeDays, int sizeLimit);
    int cleanup(int maxAgeDays, int sizeLimit, double now);

    bool touch(const QString& queryHash);
    bool remove(const QString& queryHash);
    void clear();
    int64_t count();
    std::vector<CacheEntry> recentEntries(int limit);
    std::vector<FeedbackEvent> feedbackHistory(const QString& queryHash, int limit = 50);
    CacheStats stats();

    QString queryHash(const QString& query) const;

    static QString currentOsType();
    static QString currentShellType();

private:
    template <typename Fn>
    auto run(const char* operation, Fn&& fn) -> decltype(fn(std::declval<CacheStore&>()));

    CacheStore* m_store = nullptr;
    const QueryMatcher* m_matcher = nullptr;
    CacheConfig m_config;
};

} // namespace cr
