/**
 * @file DatabaseSchema.h
 * @brief SQLite schema definitions
 *
 * @copyright Copyright (c) 2024 Baresha Project
 * @license GPL-3.0-or-later
 */

#pragma once

namespace Baresha {
namespace DatabaseSchema {

constexpr int CURRENT_VERSION = 1;

// ═══════════════════════════════════════════════════════════════════════════════
// Jobs Table (checkpoints of non-terminal jobs)
// ═══════════════════════════════════════════════════════════════════════════════

constexpr const char* CREATE_JOBS_TABLE = R"(
    CREATE TABLE IF NOT EXISTS jobs (
        id                  TEXT PRIMARY KEY NOT NULL,
        source_url          TEXT NOT NULL,
        quality             TEXT NOT NULL,
        format              TEXT NOT NULL,
        title               TEXT,
        state               TEXT NOT NULL,
        bytes_received      INTEGER DEFAULT 0,
        bytes_total         INTEGER,
        token_offset        INTEGER,
        token_format        TEXT,
        token_partial_path  TEXT,
        token_engine_state  BLOB,
        error_kind          TEXT,
        error_cause         TEXT,
        error_message       TEXT,
        created_at          INTEGER NOT NULL,
        started_at          INTEGER,
        updated_at          INTEGER NOT NULL
    )
)";

constexpr const char* CREATE_JOBS_CREATED_INDEX = R"(
    CREATE INDEX IF NOT EXISTS idx_jobs_created ON jobs (created_at)
)";

// ═══════════════════════════════════════════════════════════════════════════════
// History Table
// ═══════════════════════════════════════════════════════════════════════════════

constexpr const char* CREATE_HISTORY_TABLE = R"(
    CREATE TABLE IF NOT EXISTS history (
        job_id          TEXT PRIMARY KEY NOT NULL,
        source_url      TEXT NOT NULL,
        title           TEXT,
        format          TEXT,
        quality         TEXT,
        state           TEXT NOT NULL,
        bytes_total     INTEGER,
        error_kind      TEXT,
        error_cause     TEXT,
        error_message   TEXT,
        started_at      INTEGER,
        finished_at     INTEGER NOT NULL
    )
)";

constexpr const char* CREATE_HISTORY_FINISHED_INDEX = R"(
    CREATE INDEX IF NOT EXISTS idx_history_finished ON history (finished_at DESC)
)";

// ═══════════════════════════════════════════════════════════════════════════════
// Settings Table
// ═══════════════════════════════════════════════════════════════════════════════

constexpr const char* CREATE_SETTINGS_TABLE = R"(
    CREATE TABLE IF NOT EXISTS settings (
        key   TEXT PRIMARY KEY NOT NULL,
        value TEXT
    )
)";

constexpr const char* CREATE_SCHEMA_VERSION_TABLE = R"(
    CREATE TABLE IF NOT EXISTS schema_version (
        version INTEGER NOT NULL
    )
)";

constexpr const char* PRAGMAS[] = {
    "PRAGMA journal_mode = WAL",
    "PRAGMA synchronous = NORMAL",
    "PRAGMA foreign_keys = ON",
    "PRAGMA cache_size = -8000",    // 8MB cache
    "PRAGMA temp_store = MEMORY",
};

} // namespace DatabaseSchema
} // namespace Baresha
