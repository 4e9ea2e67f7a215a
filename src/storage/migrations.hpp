#pragma once

#include "core/result.hpp"
#include "storage/database.hpp"
#include <string>
#include <vector>

namespace docsync::storage {

/**
 * Migration - one schema step. down_sql may be empty (irreversible).
 */
struct Migration {
    int version;
    std::string name;
    std::string up_sql;
    std::string down_sql;
};

/**
 * All migrations, ascending by version.
 */
inline const std::vector<Migration> ALL_MIGRATIONS = {
    {
        .version = 1,
        .name = "documents_and_tombstones",
        .up_sql = R"SQL(
            CREATE TABLE IF NOT EXISTS documents (
                local_id INTEGER PRIMARY KEY AUTOINCREMENT,
                sync_id TEXT,
                user_id TEXT NOT NULL,
                title TEXT NOT NULL,
                category TEXT NOT NULL DEFAULT '',
                notes TEXT,
                attachment_refs TEXT NOT NULL DEFAULT '[]',
                renewal_date INTEGER,
                version INTEGER NOT NULL DEFAULT 1,
                server_version INTEGER NOT NULL DEFAULT 0,
                created_at INTEGER NOT NULL,
                last_modified INTEGER NOT NULL,
                sync_state TEXT NOT NULL,
                conflict_id TEXT,
                deleted INTEGER NOT NULL DEFAULT 0,
                deleted_at INTEGER,
                CHECK ((deleted = 0) = (deleted_at IS NULL))
            );
            -- Not UNIQUE: duplicate identities are detected and reported, not rejected.
            CREATE INDEX IF NOT EXISTS idx_documents_sync_id ON documents(sync_id);
            CREATE INDEX IF NOT EXISTS idx_documents_state ON documents(sync_state);

            CREATE TABLE IF NOT EXISTS file_attachments (
                sync_id TEXT PRIMARY KEY,
                document_sync_id TEXT NOT NULL,
                file_name TEXT NOT NULL,
                blob_key TEXT,
                local_ref TEXT,
                file_size INTEGER NOT NULL DEFAULT 0,
                checksum TEXT,
                sync_state TEXT NOT NULL,
                CHECK (blob_key IS NOT NULL OR local_ref IS NOT NULL)
            );
            CREATE INDEX IF NOT EXISTS idx_attachments_document
                ON file_attachments(document_sync_id);

            CREATE TABLE IF NOT EXISTS tombstones (
                sync_id TEXT PRIMARY KEY,
                user_id TEXT NOT NULL,
                deleted_by TEXT NOT NULL,
                deleted_at INTEGER NOT NULL,
                reason TEXT NOT NULL DEFAULT 'user'
            );
            CREATE INDEX IF NOT EXISTS idx_tombstones_user ON tombstones(user_id);
            CREATE INDEX IF NOT EXISTS idx_tombstones_deleted_at ON tombstones(deleted_at);
        )SQL",
        .down_sql = R"SQL(
            DROP TABLE IF EXISTS tombstones;
            DROP TABLE IF EXISTS file_attachments;
            DROP TABLE IF EXISTS documents;
        )SQL"
    },
    {
        .version = 2,
        .name = "sync_queue_and_errors",
        .up_sql = R"SQL(
            CREATE TABLE IF NOT EXISTS sync_operations (
                id TEXT PRIMARY KEY,
                position INTEGER NOT NULL,
                document_sync_id TEXT NOT NULL,
                kind TEXT NOT NULL,
                queued_at INTEGER NOT NULL,
                retry_count INTEGER NOT NULL DEFAULT 0,
                payload TEXT NOT NULL,
                status TEXT NOT NULL DEFAULT 'queued'
            );
            CREATE INDEX IF NOT EXISTS idx_sync_operations_status
                ON sync_operations(status, position);

            CREATE TABLE IF NOT EXISTS sync_errors (
                sync_id TEXT PRIMARY KEY,
                document_title TEXT NOT NULL DEFAULT '',
                operation TEXT NOT NULL,
                failure_class TEXT NOT NULL,
                message TEXT NOT NULL,
                retry_count INTEGER NOT NULL,
                failed_at INTEGER NOT NULL,
                next_attempt_at INTEGER NOT NULL,
                permanent INTEGER NOT NULL DEFAULT 0,
                refresh_attempted INTEGER NOT NULL DEFAULT 0
            );
        )SQL",
        .down_sql = R"SQL(
            DROP TABLE IF EXISTS sync_errors;
            DROP TABLE IF EXISTS sync_operations;
        )SQL"
    },
    {
        .version = 3,
        .name = "conflicts",
        .up_sql = R"SQL(
            CREATE TABLE IF NOT EXISTS conflicts (
                id TEXT PRIMARY KEY,
                document_sync_id TEXT NOT NULL,
                type TEXT NOT NULL,
                local_snapshot TEXT NOT NULL,
                remote_snapshot TEXT NOT NULL,
                detected_at INTEGER NOT NULL,
                resolved INTEGER NOT NULL DEFAULT 0,
                resolution_strategy TEXT,
                resolved_at INTEGER
            );
            -- At most one unresolved conflict per document.
            CREATE UNIQUE INDEX IF NOT EXISTS idx_conflicts_open
                ON conflicts(document_sync_id) WHERE resolved = 0;
        )SQL",
        .down_sql = R"SQL(
            DROP TABLE IF EXISTS conflicts;
        )SQL"
    },
};

/**
 * MigrationRunner - applies ALL_MIGRATIONS and records them in
 * schema_migrations. Each run is a single transaction.
 */
class MigrationRunner {
public:
    explicit MigrationRunner(Database& db) : db_(db) {}

    [[nodiscard]] Result<void, Error> migrate();
    [[nodiscard]] Result<void, Error> migrate_to(int target_version);

    /**
     * Undo migrations above target_version (down_sql required).
     */
    [[nodiscard]] Result<void, Error> rollback_to(int target_version);

    [[nodiscard]] Result<int, Error> current_version();

    [[nodiscard]] static int latest_version() {
        return ALL_MIGRATIONS.empty() ? 0 : ALL_MIGRATIONS.back().version;
    }

private:
    Database& db_;

    [[nodiscard]] Result<void, Error> ensure_migrations_table();
};

[[nodiscard]] inline Result<void, Error> initialize_database(Database& db) {
    MigrationRunner runner(db);
    return runner.migrate();
}

} // namespace docsync::storage
