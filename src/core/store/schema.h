#pragma once

namespace cr {

constexpr int kCurrentSchemaVersion = 1;

// Per-connection pragmas, safe on every open. busy_timeout is applied
// separately through sqlite3_busy_timeout() with the configured bound.
constexpr const char* kConnectionPragmas = R"(
PRAGMA synchronous = NORMAL;
PRAGMA foreign_keys = OFF;
PRAGMA cache_size = -8192;
PRAGMA journal_size_limit = 8388608;
)";

// Database-level pragmas, run once when the file is first created.
constexpr const char* kDatabasePragmas = R"(
PRAGMA journal_mode = WAL;
PRAGMA application_id = 0x43524543;
)";

// Schema v1. Every statement is idempotent so initialize() can run on
// every process start.
constexpr const char* kSchemaV1 = R"(
CREATE TABLE IF NOT EXISTS cache_entries (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    query_text TEXT NOT NULL,
    query_hash TEXT NOT NULL UNIQUE,
    command TEXT NOT NULL,
    confirmation_count INTEGER NOT NULL DEFAULT 0 CHECK (confirmation_count >= 0),
    rejection_count INTEGER NOT NULL DEFAULT 0 CHECK (rejection_count >= 0),
    confidence_score REAL NOT NULL DEFAULT 0.0,
    created_at REAL NOT NULL,
    last_used_at REAL NOT NULL,
    os_type TEXT,
    shell_type TEXT
);

CREATE INDEX IF NOT EXISTS idx_cache_entries_query_hash ON cache_entries(query_hash);
CREATE INDEX IF NOT EXISTS idx_cache_entries_last_used_at ON cache_entries(last_used_at DESC);
CREATE INDEX IF NOT EXISTS idx_cache_entries_confidence ON cache_entries(confidence_score DESC);

-- Audit trail. query_hash is a plain reference: entries may be evicted
-- while their history is kept.
CREATE TABLE IF NOT EXISTS feedback_events (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    query_hash TEXT NOT NULL,
    command TEXT NOT NULL,
    action TEXT NOT NULL CHECK (action IN ('confirm', 'reject')),
    timestamp REAL NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_feedback_events_query_hash ON feedback_events(query_hash);
CREATE INDEX IF NOT EXISTS idx_feedback_events_timestamp ON feedback_events(timestamp DESC);

CREATE TABLE IF NOT EXISTS settings (
    key TEXT PRIMARY KEY,
    value TEXT NOT NULL
);

INSERT OR IGNORE INTO settings (key, value) VALUES ('schema_version', '1');
)";

} // namespace cr
