#pragma once

#include "core/shared/cache_error.h"
#include "core/shared/types.h"

#include <QString>

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

#include <sqlite3.h>

namespace cr {

// CacheStore -- owner of the SQLite connection backing the cache.
//
// Several CLI processes may open the same file at once. Writers are
// serialized by SQLite's file lock; this class adds a bounded busy timeout
// and an exponential retry for SQLITE_BUSY/SQLITE_LOCKED that the busy
// handler does not cover (WAL deadlock detection returns BUSY at once).
//
// Every public operation throws CacheError(StoreUnavailable) on failure;
// schema problems throw CacheError(SchemaError).
class CacheStore {
public:
    struct Options {
        int busyTimeoutMs = 5000;
        int busyRetryAttempts = 5;
        int busyRetryBaseMs = 50;
    };

    ~CacheStore();

    CacheStore(const CacheStore&) = delete;
    CacheStore& operator=(const CacheStore&) = delete;
    CacheStore(CacheStore&&) = delete;
    CacheStore& operator=(CacheStore&&) = delete;

    // Open or create the database and run initialize().
    static std::unique_ptr<CacheStore> open(const QString& dbPath);
    static std::unique_ptr<CacheStore> open(const QString& dbPath, const Options& options);

    // Idempotent schema creation followed by verifySchema().
    void initialize();
    // Throws SchemaError naming the first missing table, column or index.
    void verifySchema();

    // Runs fn(sqlite3*) holding the in-process connection lock.
    template <typename Fn>
    auto withConnection(Fn&& fn) -> decltype(fn(std::declval<sqlite3*>()));

    // Runs fn() inside BEGIN IMMEDIATE ... COMMIT, rolling back if fn throws.
    // Nested calls join the outer transaction.
    template <typename Fn>
    auto withTransaction(Fn&& fn) -> decltype(fn());

    // ── Entries ─────────────────────────────────────────────

    // Insert, or merge into the row with the same hash. Counters and score
    // are kept when the command is unchanged and reset when it differs.
    CacheEntry upsertEntry(const QString& queryText,
                           const QString& queryHash,
                           const QString& command,
                           const QString& osType,
                           const QString& shellType,
                           double now);

    std::optional<CacheEntry> entryByHash(const QString& queryHash);
    std::optional<CacheEntry> entryById(int64_t id);

    // Most recently used first.
    std::vector<CacheEntry> recentEntries(int limit);
    std::vector<int64_t> allEntryIds();

    bool touchEntry(const QString& queryHash, double now);
    bool updateFeedbackCounters(int64_t id, int confirmations, int rejections,
                                double confidenceScore, double now);
    bool updateConfidence(int64_t id, double confidenceScore);
    bool deleteEntry(const QString& queryHash);

    int deleteEntriesUsedBefore(double cutoff);
    int evictLeastRecentlyUsed(int count);
    int64_t entryCount();

    // Removes every entry and feedback event. Settings are kept.
    void deleteAll();

    // ── Feedback ────────────────────────────────────────────

    int64_t appendFeedback(const FeedbackEvent& event);
    std::vector<FeedbackEvent> feedbackForHash(const QString& queryHash, int limit);
    int64_t feedbackCount();

    // ── Settings ────────────────────────────────────────────

    std::optional<QString> getSetting(const QString& key);
    void setSetting(const QString& key, const QString& value);

    // ── Maintenance ─────────────────────────────────────────

    CacheStats stats();

    // Online copy via the SQLite backup API. An empty destination writes
    // "<db>.backup.<yyyyMMdd_HHmmss>". Returns the path written.
    QString backup(const QString& destinationPath = {});

    bool integrityCheck();

    const QString& dbPath() const { return m_dbPath; }

    // Raw handle for tests
    sqlite3* rawDb() const { return m_db; }

private:
    CacheStore(const QString& dbPath, const Options& options);

    void openConnection();
    bool tableExists(const char* table);
    bool execSql(const char* sql);
    int execWithRetry(const char* sql);
    int stepWithRetry(sqlite3_stmt* stmt);
    sqlite3_stmt* prepare(const char* sql, const char* context);
    [[noreturn]] void fail(const char* context) const;
    [[noreturn]] void fail(const char* context, int rc) const;

    void beginTransaction();
    void commitTransaction();
    void rollbackTransaction();

    sqlite3* m_db = nullptr;
    QString m_dbPath;
    Options m_options;
    std::recursive_mutex m_mutex;
    int m_transactionDepth = 0;
};

template <typename Fn>
auto CacheStore::withConnection(Fn&& fn) -> decltype(fn(std::declval<sqlite3*>()))
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    if (!m_db) {
        throw CacheError(CacheErrorKind::StoreUnavailable,
                         QStringLiteral("store connection is closed"));
    }
    return fn(m_db);
}

template <typename Fn>
auto CacheStore::withTransaction(Fn&& fn) -> decltype(fn())
{
    using Result = decltype(fn());

    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    if (m_transactionDepth > 0) {
        return fn();
    }

    beginTransaction();
    ++m_transactionDepth;
    try {
        if constexpr (std::is_void_v<Result>) {
            fn();
            commitTransaction();
            --m_transactionDepth;
        } else {
            Result result = fn();
            commitTransaction();
            --m_transactionDepth;
            return result;
        }
    } catch (...) {
        --m_transactionDepth;
        rollbackTransaction();
        throw;
    }
}

} // namespace cr
