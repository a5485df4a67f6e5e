#include "core/store/cache_store.h"
#include "core/store/schema.h"
#include "core/shared/logging.h"

#include <QDateTime>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QThread>

#include <algorithm>
#include <iterator>
#include <string>

namespace cr {

namespace {

constexpr const char* kEntryColumns =
    "id, query_text, query_hash, command, confirmation_count, rejection_count, "
    "confidence_score, created_at, last_used_at, os_type, shell_type";

QString columnText(sqlite3_stmt* stmt, int col)
{
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? QString::fromUtf8(text) : QString();
}

CacheEntry readEntry(sqlite3_stmt* stmt)
{
    CacheEntry entry;
    entry.id = sqlite3_column_int64(stmt, 0);
    entry.queryText = columnText(stmt, 1);
    entry.queryHash = columnText(stmt, 2);
    entry.command = columnText(stmt, 3);
    entry.confirmationCount = sqlite3_column_int(stmt, 4);
    entry.rejectionCount = sqlite3_column_int(stmt, 5);
    entry.confidenceScore = sqlite3_column_double(stmt, 6);
    entry.createdAt = sqlite3_column_double(stmt, 7);
    entry.lastUsedAt = sqlite3_column_double(stmt, 8);
    entry.osType = columnText(stmt, 9);
    entry.shellType = columnText(stmt, 10);
    return entry;
}

bool isBusy(int rc)
{
    const int primary = rc & 0xff;
    return primary == SQLITE_BUSY || primary == SQLITE_LOCKED;
}

// Runs attempt() until it stops reporting BUSY/LOCKED, with busyTimeoutMs as
// the budget for the whole operation. The connection's busy handler is
// narrowed to the remaining budget for each attempt and restored afterwards.
template <typename Attempt>
int retryWithinBudget(sqlite3* db, const CacheStore::Options& options, Attempt&& attempt)
{
    QElapsedTimer timer;
    timer.start();
    const qint64 budgetMs = options.busyTimeoutMs;

    int rc = SQLITE_BUSY;
    for (int i = 0; i < options.busyRetryAttempts; ++i) {
        if (i > 0) {
            const qint64 backoffMs = static_cast<qint64>(options.busyRetryBaseMs) << (i - 1);
            QThread::msleep(static_cast<unsigned long>(
                std::min(backoffMs, std::max<qint64>(budgetMs - timer.elapsed(), 0))));
        }
        const qint64 remainingMs = budgetMs - timer.elapsed();
        if (remainingMs <= 0) {
            LOG_DEBUG(crStore, "Busy budget of %lld ms spent after %d attempts",
                      static_cast<long long>(budgetMs), i);
            break;
        }
        sqlite3_busy_timeout(db, static_cast<int>(remainingMs));
        rc = attempt(i);
        if (!isBusy(rc)) {
            break;
        }
        LOG_DEBUG(crStore, "Database busy (attempt %d/%d)", i + 1, options.busyRetryAttempts);
    }

    sqlite3_busy_timeout(db, options.busyTimeoutMs);
    return rc;
}

constexpr const char* kRequiredEntryColumns[] = {
    "id", "query_text", "query_hash", "command", "confirmation_count",
    "rejection_count", "confidence_score", "created_at", "last_used_at",
    "os_type", "shell_type",
};

constexpr const char* kRequiredFeedbackColumns[] = {
    "id", "query_hash", "command", "action", "timestamp",
};

constexpr const char* kRequiredIndexes[] = {
    "idx_cache_entries_query_hash",
    "idx_cache_entries_last_used_at",
    "idx_cache_entries_confidence",
    "idx_feedback_events_query_hash",
    "idx_feedback_events_timestamp",
};

} // namespace

CacheStore::CacheStore(const QString& dbPath, const Options& options)
    : m_dbPath(dbPath)
    , m_options(options)
{
}

CacheStore::~CacheStore()
{
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

std::unique_ptr<CacheStore> CacheStore::open(const QString& dbPath)
{
    return open(dbPath, Options{});
}

std::unique_ptr<CacheStore> CacheStore::open(const QString& dbPath, const Options& options)
{
    std::unique_ptr<CacheStore> store(new CacheStore(dbPath, options));
    store->openConnection();
    store->initialize();

    // Restrict database file permissions to owner-only (0600)
    QFile dbFile(dbPath);
    dbFile.setPermissions(QFile::ReadOwner | QFile::WriteOwner);
    QFile walFile(dbPath + QStringLiteral("-wal"));
    if (walFile.exists()) {
        walFile.setPermissions(QFile::ReadOwner | QFile::WriteOwner);
    }
    QFile shmFile(dbPath + QStringLiteral("-shm"));
    if (shmFile.exists()) {
        shmFile.setPermissions(QFile::ReadOwner | QFile::WriteOwner);
    }

    LOG_INFO(crStore, "Cache database opened: %s", qUtf8Printable(dbPath));
    return store;
}

void CacheStore::openConnection()
{
    const QByteArray pathUtf8 = m_dbPath.toUtf8();
    const int rc = sqlite3_open_v2(pathUtf8.constData(), &m_db,
                                   SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        const QString message = QStringLiteral("cannot open %1: %2")
                                    .arg(m_dbPath,
                                         QString::fromUtf8(m_db ? sqlite3_errmsg(m_db)
                                                                : sqlite3_errstr(rc)));
        if (m_db) {
            sqlite3_close(m_db);
            m_db = nullptr;
        }
        LOG_ERROR(crStore, "%s", qUtf8Printable(message));
        throw CacheError(CacheErrorKind::StoreUnavailable, message);
    }

    sqlite3_extended_result_codes(m_db, 1);

    // Busy handler first, so the pragmas below already wait on contention.
    sqlite3_busy_timeout(m_db, m_options.busyTimeoutMs);

    if (!execSql(kConnectionPragmas)) {
        fail("connection pragmas");
    }
}

void CacheStore::initialize()
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    // A newer schema written by a later release is never downgraded.
    if (tableExists("settings")) {
        const std::optional<QString> version = getSetting(QStringLiteral("schema_version"));
        if (version.has_value()) {
            bool ok = false;
            const int stored = version->toInt(&ok);
            if (!ok || stored > kCurrentSchemaVersion) {
                const QString message = QStringLiteral("schema version %1 is not supported (expected <= %2)")
                                            .arg(*version)
                                            .arg(kCurrentSchemaVersion);
                LOG_ERROR(crStore, "%s", qUtf8Printable(message));
                throw CacheError(CacheErrorKind::SchemaError, message);
            }
        }
    }

    const bool schemaExists = tableExists("cache_entries")
        && tableExists("feedback_events")
        && tableExists("settings");

    if (!schemaExists) {
        // WAL is a database-level setting; a failure here is not fatal.
        if (!execSql(kDatabasePragmas)) {
            LOG_WARN(crStore, "Could not enable WAL journal; continuing with default journal");
        }

        const int rc = execWithRetry(kSchemaV1);
        if (rc != SQLITE_OK) {
            fail("schema creation", rc);
        }
        LOG_INFO(crStore, "Created cache schema v%d", kCurrentSchemaVersion);
    }

    verifySchema();
}

void CacheStore::verifySchema()
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    auto columnsOf = [this](const char* table) {
        std::vector<std::string> columns;
        const std::string sql = std::string("PRAGMA table_info(") + table + ")";
        sqlite3_stmt* stmt = prepare(sql.c_str(), "verifySchema");
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            const char* name = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
            if (name) {
                columns.emplace_back(name);
            }
        }
        sqlite3_finalize(stmt);
        return columns;
    };

    auto requireColumns = [](const std::vector<std::string>& present,
                             const char* table,
                             const char* const* required,
                             size_t count) {
        for (size_t i = 0; i < count; ++i) {
            bool found = false;
            for (const std::string& column : present) {
                if (column == required[i]) {
                    found = true;
                    break;
                }
            }
            if (!found) {
                throw CacheError(CacheErrorKind::SchemaError,
                                 QStringLiteral("table %1 is missing column %2")
                                     .arg(QLatin1String(table), QLatin1String(required[i])));
            }
        }
    };

    for (const char* table : {"cache_entries", "feedback_events", "settings"}) {
        if (!tableExists(table)) {
            throw CacheError(CacheErrorKind::SchemaError,
                             QStringLiteral("missing table %1").arg(QLatin1String(table)));
        }
    }

    requireColumns(columnsOf("cache_entries"), "cache_entries", kRequiredEntryColumns,
                   std::size(kRequiredEntryColumns));
    requireColumns(columnsOf("feedback_events"), "feedback_events", kRequiredFeedbackColumns,
                   std::size(kRequiredFeedbackColumns));

    for (const char* index : kRequiredIndexes) {
        sqlite3_stmt* stmt = prepare(
            "SELECT count(*) FROM sqlite_master WHERE type = 'index' AND name = ?1",
            "verifySchema");
        sqlite3_bind_text(stmt, 1, index, -1, SQLITE_STATIC);
        bool found = false;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            found = sqlite3_column_int(stmt, 0) > 0;
        }
        sqlite3_finalize(stmt);
        if (!found) {
            throw CacheError(CacheErrorKind::SchemaError,
                             QStringLiteral("missing index %1").arg(QLatin1String(index)));
        }
    }
}

// ── Low-level helpers ───────────────────────────────────────

bool CacheStore::tableExists(const char* table)
{
    sqlite3_stmt* stmt = prepare(
        "SELECT count(*) FROM sqlite_master WHERE type = 'table' AND name = ?1",
        "tableExists");
    sqlite3_bind_text(stmt, 1, table, -1, SQLITE_STATIC);
    bool exists = false;
    const int rc = stepWithRetry(stmt);
    if (rc == SQLITE_ROW) {
        exists = sqlite3_column_int(stmt, 0) > 0;
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_ROW) {
        fail("tableExists", rc);
    }
    return exists;
}

bool CacheStore::execSql(const char* sql)
{
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LOG_ERROR(crStore, "SQL error: %s", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

int CacheStore::execWithRetry(const char* sql)
{
    return retryWithinBudget(m_db, m_options, [&](int attempt) {
        char* errMsg = nullptr;
        const int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &errMsg);
        if (rc != SQLITE_OK) {
            LOG_DEBUG(crStore, "exec attempt %d failed: %s", attempt + 1,
                      errMsg ? errMsg : "unknown");
        }
        sqlite3_free(errMsg);
        return rc;
    });
}

int CacheStore::stepWithRetry(sqlite3_stmt* stmt)
{
    // sqlite3_busy_timeout's handler is NOT invoked when SQLite detects a
    // potential WAL deadlock; step returns BUSY at once, so back off here.
    return retryWithinBudget(m_db, m_options, [stmt](int attempt) {
        if (attempt > 0) {
            sqlite3_reset(stmt);
        }
        return sqlite3_step(stmt);
    });
}

sqlite3_stmt* CacheStore::prepare(const char* sql, const char* context)
{
    if (!m_db) {
        throw CacheError(CacheErrorKind::StoreUnavailable,
                         QStringLiteral("%1: store connection is closed").arg(QLatin1String(context)));
    }
    sqlite3_stmt* stmt = nullptr;
    const int rc = sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_finalize(stmt);
        fail(context, rc);
    }
    return stmt;
}

void CacheStore::fail(const char* context) const
{
    fail(context, m_db ? sqlite3_extended_errcode(m_db) : SQLITE_CANTOPEN);
}

void CacheStore::fail(const char* context, int rc) const
{
    const QString detail = m_db ? QString::fromUtf8(sqlite3_errmsg(m_db))
                                : QString::fromUtf8(sqlite3_errstr(rc));
    const QString message = QStringLiteral("%1 failed (%2): %3")
                                .arg(QLatin1String(context))
                                .arg(rc)
                                .arg(detail);
    LOG_ERROR(crStore, "%s", qUtf8Printable(message));
    throw CacheError(CacheErrorKind::StoreUnavailable, message);
}

void CacheStore::beginTransaction()
{
    const int rc = execWithRetry("BEGIN IMMEDIATE TRANSACTION");
    if (rc != SQLITE_OK) {
        fail("BEGIN IMMEDIATE", rc);
    }
}

void CacheStore::commitTransaction()
{
    const int rc = execWithRetry("COMMIT");
    if (rc != SQLITE_OK) {
        fail("COMMIT", rc);
    }
}

void CacheStore::rollbackTransaction()
{
    if (sqlite3_get_autocommit(m_db)) {
        return;
    }
    if (!execSql("ROLLBACK")) {
        LOG_WARN(crStore, "ROLLBACK failed; connection may hold a stale transaction");
    }
}

// ── Entries ─────────────────────────────────────────────────

CacheEntry CacheStore::upsertEntry(const QString& queryText,
                                   const QString& queryHash,
                                   const QString& command,
                                   const QString& osType,
                                   const QString& shellType,
                                   double now)
{
    // SET expressions see the pre-update row, so the CASEs compare the old
    // command against the incoming one.
    const char* sql = R"(
        INSERT INTO cache_entries (query_text, query_hash, command, confirmation_count,
                                   rejection_count, confidence_score, created_at,
                                   last_used_at, os_type, shell_type)
        VALUES (?1, ?2, ?3, 0, 0, 0.0, ?4, ?4, ?5, ?6)
        ON CONFLICT(query_hash) DO UPDATE SET
            confirmation_count = CASE WHEN cache_entries.command = excluded.command
                                      THEN cache_entries.confirmation_count ELSE 0 END,
            rejection_count = CASE WHEN cache_entries.command = excluded.command
                                   THEN cache_entries.rejection_count ELSE 0 END,
            confidence_score = CASE WHEN cache_entries.command = excluded.command
                                    THEN cache_entries.confidence_score ELSE 0.0 END,
            command = excluded.command,
            last_used_at = excluded.last_used_at,
            os_type = excluded.os_type,
            shell_type = excluded.shell_type
    )";

    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    sqlite3_stmt* stmt = prepare(sql, "upsertEntry");

    const QByteArray queryUtf8 = queryText.toUtf8();
    const QByteArray hashUtf8 = queryHash.toUtf8();
    const QByteArray commandUtf8 = command.toUtf8();
    const QByteArray osUtf8 = osType.toUtf8();
    const QByteArray shellUtf8 = shellType.toUtf8();

    sqlite3_bind_text(stmt, 1, queryUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, hashUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 3, commandUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_double(stmt, 4, now);
    if (osType.isEmpty()) {
        sqlite3_bind_null(stmt, 5);
    } else {
        sqlite3_bind_text(stmt, 5, osUtf8.constData(), -1, SQLITE_STATIC);
    }
    if (shellType.isEmpty()) {
        sqlite3_bind_null(stmt, 6);
    } else {
        sqlite3_bind_text(stmt, 6, shellUtf8.constData(), -1, SQLITE_STATIC);
    }

    const int rc = stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        fail("upsertEntry", rc);
    }

    // Read back by hash; last_insert_rowid is stale when the UPDATE branch fires.
    auto entry = entryByHash(queryHash);
    if (!entry.has_value()) {
        throw CacheError(CacheErrorKind::StoreUnavailable,
                         QStringLiteral("upsertEntry: row %1 missing after write").arg(queryHash));
    }
    return *entry;
}

std::optional<CacheEntry> CacheStore::entryByHash(const QString& queryHash)
{
    const std::string sql = std::string("SELECT ") + kEntryColumns
        + " FROM cache_entries WHERE query_hash = ?1";

    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    sqlite3_stmt* stmt = prepare(sql.c_str(), "entryByHash");
    const QByteArray hashUtf8 = queryHash.toUtf8();
    sqlite3_bind_text(stmt, 1, hashUtf8.constData(), -1, SQLITE_STATIC);

    std::optional<CacheEntry> entry;
    const int rc = stepWithRetry(stmt);
    if (rc == SQLITE_ROW) {
        entry = readEntry(stmt);
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        fail("entryByHash", rc);
    }
    return entry;
}

std::optional<CacheEntry> CacheStore::entryById(int64_t id)
{
    const std::string sql = std::string("SELECT ") + kEntryColumns
        + " FROM cache_entries WHERE id = ?1";

    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    sqlite3_stmt* stmt = prepare(sql.c_str(), "entryById");
    sqlite3_bind_int64(stmt, 1, id);

    std::optional<CacheEntry> entry;
    const int rc = stepWithRetry(stmt);
    if (rc == SQLITE_ROW) {
        entry = readEntry(stmt);
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        fail("entryById", rc);
    }
    return entry;
}

std::vector<CacheEntry> CacheStore::recentEntries(int limit)
{
    const std::string sql = std::string("SELECT ") + kEntryColumns
        + " FROM cache_entries ORDER BY last_used_at DESC, id DESC LIMIT ?1";

    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    sqlite3_stmt* stmt = prepare(sql.c_str(), "recentEntries");
    sqlite3_bind_int(stmt, 1, limit);

    std::vector<CacheEntry> entries;
    int rc = stepWithRetry(stmt);
    while (rc == SQLITE_ROW) {
        entries.push_back(readEntry(stmt));
        rc = sqlite3_step(stmt);
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        fail("recentEntries", rc);
    }
    return entries;
}

std::vector<int64_t> CacheStore::allEntryIds()
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    sqlite3_stmt* stmt = prepare("SELECT id FROM cache_entries ORDER BY id", "allEntryIds");

    std::vector<int64_t> ids;
    int rc = stepWithRetry(stmt);
    while (rc == SQLITE_ROW) {
        ids.push_back(sqlite3_column_int64(stmt, 0));
        rc = sqlite3_step(stmt);
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        fail("allEntryIds", rc);
    }
    return ids;
}

bool CacheStore::touchEntry(const QString& queryHash, double now)
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    sqlite3_stmt* stmt = prepare(
        "UPDATE cache_entries SET last_used_at = ?1 WHERE query_hash = ?2", "touchEntry");
    const QByteArray hashUtf8 = queryHash.toUtf8();
    sqlite3_bind_double(stmt, 1, now);
    sqlite3_bind_text(stmt, 2, hashUtf8.constData(), -1, SQLITE_STATIC);

    const int rc = stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        fail("touchEntry", rc);
    }
    return sqlite3_changes(m_db) > 0;
}

bool CacheStore::updateFeedbackCounters(int64_t id, int confirmations, int rejections,
                                        double confidenceScore, double now)
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    sqlite3_stmt* stmt = prepare(R"(
        UPDATE cache_entries
        SET confirmation_count = ?1, rejection_count = ?2,
            confidence_score = ?3, last_used_at = ?4
        WHERE id = ?5
    )", "updateFeedbackCounters");
    sqlite3_bind_int(stmt, 1, confirmations);
    sqlite3_bind_int(stmt, 2, rejections);
    sqlite3_bind_double(stmt, 3, confidenceScore);
    sqlite3_bind_double(stmt, 4, now);
    sqlite3_bind_int64(stmt, 5, id);

    const int rc = stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        fail("updateFeedbackCounters", rc);
    }
    return sqlite3_changes(m_db) > 0;
}

bool CacheStore::updateConfidence(int64_t id, double confidenceScore)
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    sqlite3_stmt* stmt = prepare(
        "UPDATE cache_entries SET confidence_score = ?1 WHERE id = ?2", "updateConfidence");
    sqlite3_bind_double(stmt, 1, confidenceScore);
    sqlite3_bind_int64(stmt, 2, id);

    const int rc = stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        fail("updateConfidence", rc);
    }
    return sqlite3_changes(m_db) > 0;
}

bool CacheStore::deleteEntry(const QString& queryHash)
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    sqlite3_stmt* stmt = prepare("DELETE FROM cache_entries WHERE query_hash = ?1", "deleteEntry");
    const QByteArray hashUtf8 = queryHash.toUtf8();
    sqlite3_bind_text(stmt, 1, hashUtf8.constData(), -1, SQLITE_STATIC);

    const int rc = stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        fail("deleteEntry", rc);
    }
    return sqlite3_changes(m_db) > 0;
}

int CacheStore::deleteEntriesUsedBefore(double cutoff)
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    sqlite3_stmt* stmt = prepare("DELETE FROM cache_entries WHERE last_used_at < ?1",
                                 "deleteEntriesUsedBefore");
    sqlite3_bind_double(stmt, 1, cutoff);

    const int rc = stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        fail("deleteEntriesUsedBefore", rc);
    }
    return sqlite3_changes(m_db);
}

int CacheStore::evictLeastRecentlyUsed(int count)
{
    if (count <= 0) {
        return 0;
    }

    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    sqlite3_stmt* stmt = prepare(R"(
        DELETE FROM cache_entries WHERE id IN (
            SELECT id FROM cache_entries ORDER BY last_used_at ASC, id ASC LIMIT ?1
        )
    )", "evictLeastRecentlyUsed");
    sqlite3_bind_int(stmt, 1, count);

    const int rc = stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        fail("evictLeastRecentlyUsed", rc);
    }
    return sqlite3_changes(m_db);
}

int64_t CacheStore::entryCount()
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    sqlite3_stmt* stmt = prepare("SELECT count(*) FROM cache_entries", "entryCount");
    int64_t count = 0;
    const int rc = stepWithRetry(stmt);
    if (rc == SQLITE_ROW) {
        count = sqlite3_column_int64(stmt, 0);
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_ROW) {
        fail("entryCount", rc);
    }
    return count;
}

void CacheStore::deleteAll()
{
    withTransaction([this]() {
        const int entriesRc = execWithRetry("DELETE FROM cache_entries");
        if (entriesRc != SQLITE_OK) {
            fail("deleteAll entries", entriesRc);
        }
        const int feedbackRc = execWithRetry("DELETE FROM feedback_events");
        if (feedbackRc != SQLITE_OK) {
            fail("deleteAll feedback", feedbackRc);
        }
    });
}

// ── Feedback ────────────────────────────────────────────────

int64_t CacheStore::appendFeedback(const FeedbackEvent& event)
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    sqlite3_stmt* stmt = prepare(R"(
        INSERT INTO feedback_events (query_hash, command, action, timestamp)
        VALUES (?1, ?2, ?3, ?4)
    )", "appendFeedback");

    const QByteArray hashUtf8 = event.queryHash.toUtf8();
    const QByteArray commandUtf8 = event.command.toUtf8();
    const QByteArray actionUtf8 = feedbackActionToString(event.action).toUtf8();
    sqlite3_bind_text(stmt, 1, hashUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, commandUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 3, actionUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_double(stmt, 4, event.timestamp);

    const int rc = stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        fail("appendFeedback", rc);
    }
    return sqlite3_last_insert_rowid(m_db);
}

std::vector<FeedbackEvent> CacheStore::feedbackForHash(const QString& queryHash, int limit)
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    sqlite3_stmt* stmt = prepare(R"(
        SELECT id, query_hash, command, action, timestamp
        FROM feedback_events
        WHERE query_hash = ?1
        ORDER BY timestamp DESC, id DESC
        LIMIT ?2
    )", "feedbackForHash");
    const QByteArray hashUtf8 = queryHash.toUtf8();
    sqlite3_bind_text(stmt, 1, hashUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int(stmt, 2, limit);

    std::vector<FeedbackEvent> events;
    int rc = stepWithRetry(stmt);
    while (rc == SQLITE_ROW) {
        FeedbackEvent event;
        event.id = sqlite3_column_int64(stmt, 0);
        event.queryHash = columnText(stmt, 1);
        event.command = columnText(stmt, 2);
        const QString action = columnText(stmt, 3);
        event.action = feedbackActionFromString(action).value_or(FeedbackAction::Confirm);
        event.timestamp = sqlite3_column_double(stmt, 4);
        events.push_back(event);
        rc = sqlite3_step(stmt);
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        fail("feedbackForHash", rc);
    }
    return events;
}

int64_t CacheStore::feedbackCount()
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    sqlite3_stmt* stmt = prepare("SELECT count(*) FROM feedback_events", "feedbackCount");
    int64_t count = 0;
    const int rc = stepWithRetry(stmt);
    if (rc == SQLITE_ROW) {
        count = sqlite3_column_int64(stmt, 0);
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_ROW) {
        fail("feedbackCount", rc);
    }
    return count;
}

// ── Settings ────────────────────────────────────────────────

std::optional<QString> CacheStore::getSetting(const QString& key)
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    sqlite3_stmt* stmt = prepare("SELECT value FROM settings WHERE key = ?1", "getSetting");
    const QByteArray keyUtf8 = key.toUtf8();
    sqlite3_bind_text(stmt, 1, keyUtf8.constData(), -1, SQLITE_STATIC);

    std::optional<QString> value;
    const int rc = stepWithRetry(stmt);
    if (rc == SQLITE_ROW) {
        value = columnText(stmt, 0);
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        fail("getSetting", rc);
    }
    return value;
}

void CacheStore::setSetting(const QString& key, const QString& value)
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    sqlite3_stmt* stmt = prepare(
        "INSERT OR REPLACE INTO settings (key, value) VALUES (?1, ?2)", "setSetting");
    const QByteArray keyUtf8 = key.toUtf8();
    const QByteArray valueUtf8 = value.toUtf8();
    sqlite3_bind_text(stmt, 1, keyUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, valueUtf8.constData(), -1, SQLITE_STATIC);

    const int rc = stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        fail("setSetting", rc);
    }
}

// ── Maintenance ─────────────────────────────────────────────

CacheStats CacheStore::stats()
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    CacheStats stats;
    stats.dbPath = m_dbPath;
    stats.totalEntries = entryCount();
    stats.totalFeedback = feedbackCount();

    sqlite3_stmt* stmt = prepare(R"(
        SELECT COALESCE(SUM(confirmation_count), 0),
               COALESCE(SUM(rejection_count), 0),
               COALESCE(AVG(confidence_score), 0.0)
        FROM cache_entries
    )", "stats");
    const int rc = stepWithRetry(stmt);
    if (rc == SQLITE_ROW) {
        stats.totalConfirmations = sqlite3_column_int64(stmt, 0);
        stats.totalRejections = sqlite3_column_int64(stmt, 1);
        stats.averageConfidence = sqlite3_column_double(stmt, 2);
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_ROW) {
        fail("stats", rc);
    }

    const std::optional<QString> version = getSetting(QStringLiteral("schema_version"));
    stats.schemaVersion = version.has_value() ? version->toInt() : 0;

    const QFileInfo dbInfo(m_dbPath);
    const QFileInfo walInfo(m_dbPath + QStringLiteral("-wal"));
    stats.dbSizeBytes = (dbInfo.exists() ? dbInfo.size() : 0)
        + (walInfo.exists() ? walInfo.size() : 0);
    return stats;
}

QString CacheStore::backup(const QString& destinationPath)
{
    const QString target = destinationPath.isEmpty()
        ? QStringLiteral("%1.backup.%2")
              .arg(m_dbPath, QDateTime::currentDateTime().toString(QStringLiteral("yyyyMMdd_HHmmss")))
        : destinationPath;

    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    if (!m_db) {
        throw CacheError(CacheErrorKind::StoreUnavailable,
                         QStringLiteral("backup: store connection is closed"));
    }

    sqlite3* dest = nullptr;
    const QByteArray targetUtf8 = target.toUtf8();
    int rc = sqlite3_open(targetUtf8.constData(), &dest);
    if (rc != SQLITE_OK) {
        const QString detail = QString::fromUtf8(dest ? sqlite3_errmsg(dest) : sqlite3_errstr(rc));
        sqlite3_close(dest);
        throw CacheError(CacheErrorKind::StoreUnavailable,
                         QStringLiteral("backup: cannot open %1: %2").arg(target, detail));
    }

    sqlite3_backup* handle = sqlite3_backup_init(dest, "main", m_db, "main");
    if (!handle) {
        const QString detail = QString::fromUtf8(sqlite3_errmsg(dest));
        sqlite3_close(dest);
        throw CacheError(CacheErrorKind::StoreUnavailable,
                         QStringLiteral("backup: init failed: %1").arg(detail));
    }

    // Copy everything in one step; retry while another process holds a lock.
    for (int attempt = 0; attempt < m_options.busyRetryAttempts; ++attempt) {
        if (attempt > 0) {
            QThread::msleep(static_cast<unsigned long>(m_options.busyRetryBaseMs) << (attempt - 1));
        }
        rc = sqlite3_backup_step(handle, -1);
        if (!isBusy(rc)) {
            break;
        }
    }
    sqlite3_backup_finish(handle);
    const int destRc = sqlite3_errcode(dest);
    sqlite3_close(dest);

    if (rc != SQLITE_DONE || destRc != SQLITE_OK) {
        QFile::remove(target);
        throw CacheError(CacheErrorKind::StoreUnavailable,
                         QStringLiteral("backup to %1 failed (%2)").arg(target).arg(rc));
    }

    QFile(target).setPermissions(QFile::ReadOwner | QFile::WriteOwner);
    LOG_INFO(crStore, "Cache database backed up to %s", qUtf8Printable(target));
    return target;
}

bool CacheStore::integrityCheck()
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    sqlite3_stmt* stmt = prepare("PRAGMA integrity_check", "integrityCheck");
    bool ok = false;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        ok = columnText(stmt, 0) == QLatin1String("ok");
    }
    sqlite3_finalize(stmt);
    return ok;
}

} // namespace cr
