#include "storage/migrations.hpp"

namespace docsync::storage {

Result<void, Error> MigrationRunner::ensure_migrations_table() {
    return db_.execute(R"SQL(
        CREATE TABLE IF NOT EXISTS schema_migrations (
            version INTEGER PRIMARY KEY,
            name TEXT NOT NULL,
            applied_at INTEGER NOT NULL
        );
    )SQL");
}

Result<int, Error> MigrationRunner::current_version() {
    auto ensured = ensure_migrations_table();
    if (ensured.is_err()) return propagate<int>(ensured);

    auto rows = db_.query<int>("SELECT COALESCE(MAX(version), 0) FROM schema_migrations;",
                               [](Statement& stmt) { return stmt.column_int(0); });
    if (rows.is_err()) return propagate<int>(rows);
    return Result<int, Error>::ok(rows.unwrap().empty() ? 0 : rows.unwrap().front());
}

Result<void, Error> MigrationRunner::migrate() {
    return migrate_to(latest_version());
}

Result<void, Error> MigrationRunner::migrate_to(int target_version) {
    auto current_result = current_version();
    if (current_result.is_err()) return propagate<void>(current_result);
    const int current = current_result.unwrap();
    if (current >= target_version) {
        return Result<void, Error>::ok();
    }

    return db_.transaction([&]() -> Result<void, Error> {
        for (const auto& m : ALL_MIGRATIONS) {
            if (m.version <= current || m.version > target_version) continue;

            auto applied = db_.execute(m.up_sql);
            if (applied.is_err()) {
                return Result<void, Error>::err(Error::storage(
                    "Migration " + std::to_string(m.version) + " (" + m.name +
                    ") failed: " + applied.unwrap_err().message));
            }
            auto recorded = db_.run(
                "INSERT INTO schema_migrations (version, name, applied_at) VALUES (?, ?, ?);",
                m.version, m.name, Timestamp::now());
            if (recorded.is_err()) return propagate<void>(recorded);
        }
        return Result<void, Error>::ok();
    });
}

Result<void, Error> MigrationRunner::rollback_to(int target_version) {
    auto current_result = current_version();
    if (current_result.is_err()) return propagate<void>(current_result);
    const int current = current_result.unwrap();
    if (current <= target_version) {
        return Result<void, Error>::ok();
    }

    return db_.transaction([&]() -> Result<void, Error> {
        for (auto it = ALL_MIGRATIONS.rbegin(); it != ALL_MIGRATIONS.rend(); ++it) {
            if (it->version > current || it->version <= target_version) continue;
            if (it->down_sql.empty()) {
                return Result<void, Error>::err(Error::storage(
                    "Migration " + std::to_string(it->version) + " cannot be rolled back"));
            }
            auto undone = db_.execute(it->down_sql);
            if (undone.is_err()) return undone;
            auto removed = db_.run("DELETE FROM schema_migrations WHERE version = ?;", it->version);
            if (removed.is_err()) return propagate<void>(removed);
        }
        return Result<void, Error>::ok();
    });
}

} // namespace docsync::storage
