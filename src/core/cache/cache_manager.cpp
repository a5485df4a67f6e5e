#include "core/cache/cache_manager.h"
#include "core/match/query_matcher.h"
#include "core/store/cache_store.h"
#include "core/shared/logging.h"

#include <QFileInfo>
#include <QSysInfo>

#include <algorithm>
#include <cmath>

namespace cr {

namespace {

constexpr double kSimilarityEpsilon = 1e-9;

// True when `candidate` should replace `best` at equal similarity.
bool winsTie(const SimilarMatch& candidate, const SimilarMatch& best)
{
    if (std::abs(candidate.entry.confidenceScore - best.entry.confidenceScore) > kSimilarityEpsilon) {
        return candidate.entry.confidenceScore > best.entry.confidenceScore;
    }
    return candidate.entry.lastUsedAt > best.entry.lastUsedAt;
}

} // namespace

CacheManager::CacheManager(CacheStore* store, const QueryMatcher* matcher, const CacheConfig& config)
    : m_store(store)
    , m_matcher(matcher)
    , m_config(config)
{
}

template <typename Fn>
auto CacheManager::run(const char* operation, Fn&& fn) -> decltype(fn(std::declval<CacheStore&>()))
{
    const QString context = QStringLiteral("CacheManager::%1").arg(QLatin1String(operation));
    if (!m_store) {
        throw CacheError(CacheErrorKind::CacheUnavailable, context,
                         CacheError(CacheErrorKind::StoreUnavailable,
                                    QStringLiteral("no store available")));
    }
    try {
        return fn(*m_store);
    } catch (const CacheError& e) {
        throw CacheError(CacheErrorKind::CacheUnavailable, context, e);
    }
}

QString CacheManager::queryHash(const QString& query) const
{
    return m_matcher->hash(query);
}

CacheEntry CacheManager::save(const QString& query, const QString& command,
                              const QString& osType, const QString& shellType)
{
    const QString hash = queryHash(query);
    const QString os = osType.isEmpty() ? currentOsType() : osType;
    const QString shell = shellType.isEmpty() ? currentShellType() : shellType;
    const double now = currentTimestamp();

    return run("save", [&](CacheStore& store) {
        CacheEntry entry = store.withTransaction([&]() {
            return store.upsertEntry(query, hash, command, os, shell, now);
        });
        LOG_DEBUG(crCache, "Saved entry %lld hash=%s", static_cast<long long>(entry.id),
                  qUtf8Printable(hash));
        return entry;
    });
}

std::optional<CacheEntry> CacheManager::findExact(const QString& query)
{
    return findByHash(queryHash(query));
}

std::optional<CacheEntry> CacheManager::findByHash(const QString& queryHash)
{
    return run("findByHash", [&](CacheStore& store) {
        return store.entryByHash(queryHash);
    });
}

std::optional<SimilarMatch> CacheManager::findSimilar(const QString& query, int limit)
{
    return findSimilar(query, limit, m_config.similarityThreshold);
}

std::optional<SimilarMatch> CacheManager::findSimilar(const QString& query, int limit,
                                                      double threshold)
{
    const int scanLimit = limit <= 0 ? m_config.cacheSizeLimit
                                     : std::min(limit, m_config.cacheSizeLimit);

    const std::vector<CacheEntry> candidates = run("findSimilar", [&](CacheStore& store) {
        return store.recentEntries(scanLimit);
    });

    const NormalizedQuery normalized = m_matcher->normalize(query);
    std::optional<SimilarMatch> best;
    for (const CacheEntry& entry : candidates) {
        SimilarMatch candidate;
        candidate.entry = entry;
        candidate.similarity = m_matcher->similarity(normalized,
                                                     m_matcher->normalize(entry.queryText),
                                                     m_config.jaccardWeight);
        if (candidate.similarity < threshold) {
            continue;
        }

        if (!best.has_value()
            || candidate.similarity > best->similarity + kSimilarityEpsilon
            || (std::abs(candidate.similarity - best->similarity) <= kSimilarityEpsilon
                && winsTie(candidate, *best))) {
            best = candidate;
        }
    }

    if (best.has_value()) {
        LOG_DEBUG(crCache, "Similar match for '%s': '%s' (%.3f)",
                  qUtf8Printable(query), qUtf8Printable(best->entry.queryText),
                  best->similarity);
    }
    return best;
}

int CacheManager::cleanup(int maxAgeDays, int sizeLimit)
{
    return cleanup(maxAgeDays, sizeLimit, currentTimestamp());
}

int CacheManager::cleanup(int maxAgeDays, int sizeLimit, double now)
{
    const double cutoff = now - static_cast<double>(std::max(maxAgeDays, 0)) * kSecondsPerDay;
    const int bound = std::max(sizeLimit, 0);

    const int removed = run("cleanup", [&](CacheStore& store) {
        return store.withTransaction([&]() {
            int total = store.deleteEntriesUsedBefore(cutoff);
            const int64_t remaining = store.entryCount();
            if (remaining > bound) {
                total += store.evictLeastRecentlyUsed(static_cast<int>(remaining - bound));
            }
            return total;
        });
    });

    LOG_INFO(crCache, "Cleanup removed %d entries (maxAgeDays=%d, sizeLimit=%d)",
             removed, maxAgeDays, sizeLimit);
    return removed;
}

bool CacheManager::touch(const QString& queryHash)
{
    const double now = currentTimestamp();
    return run("touch", [&](CacheStore& store) {
        return store.touchEntry(queryHash, now);
    });
}

bool CacheManager::remove(const QString& queryHash)
{
    return run("remove", [&](CacheStore& store) {
        return store.deleteEntry(queryHash);
    });
}

void CacheManager::clear()
{
    run("clear", [](CacheStore& store) {
        store.deleteAll();
    });
    LOG_INFO(crCache, "Cache cleared");
}

int64_t CacheManager::count()
{
    return run("count", [](CacheStore& store) {
        return store.entryCount();
    });
}

std::vector<CacheEntry> CacheManager::recentEntries(int limit)
{
    return run("recentEntries", [&](CacheStore& store) {
        return store.recentEntries(limit);
    });
}

std::vector<FeedbackEvent> CacheManager::feedbackHistory(const QString& queryHash, int limit)
{
    return run("feedbackHistory", [&](CacheStore& store) {
        return store.feedbackForHash(queryHash, limit);
    });
}

CacheStats CacheManager::stats()
{
    return run("stats", [](CacheStore& store) {
        return store.stats();
    });
}

QString CacheManager::currentOsType()
{
    return QSysInfo::productType();
}

QString CacheManager::currentShellType()
{
    const QString shell = qEnvironmentVariable("SHELL");
    if (shell.isEmpty()) {
        return QStringLiteral("unknown");
    }
    return QFileInfo(shell).fileName();
}

} // namespace cr
