#include "storage/tombstone_repository.hpp"
#include "core/sync_id.hpp"

namespace docsync::storage {

namespace {

constexpr std::string_view kSelect =
    "SELECT sync_id, user_id, deleted_by, deleted_at, reason FROM tombstones";

Tombstone row_to_tombstone(Statement& stmt) {
    return Tombstone{
        .sync_id = stmt.column_text(0),
        .user_id = stmt.column_text(1),
        .deleted_by = stmt.column_text(2),
        .deleted_at = stmt.column_timestamp(3),
        .reason = stmt.column_text(4),
    };
}

} // namespace

Result<bool, Error> TombstoneRepository::insert_if_absent(const Tombstone& t) {
    if (t.sync_id.empty()) {
        return Result<bool, Error>::err(Error::validation("Tombstone requires a sync id"));
    }
    auto inserted = db_.run(R"SQL(
        INSERT OR IGNORE INTO tombstones (sync_id, user_id, deleted_by, deleted_at, reason)
        VALUES (?, ?, ?, ?, ?);
    )SQL", sync_id::normalize(t.sync_id), t.user_id, t.deleted_by, t.deleted_at, t.reason);
    if (inserted.is_err()) return propagate<bool>(inserted);
    return Result<bool, Error>::ok(inserted.unwrap() > 0);
}

Result<std::optional<Tombstone>, Error> TombstoneRepository::get(const std::string& id) {
    std::string sql(kSelect);
    sql += " WHERE sync_id = ?;";
    auto rows = db_.query<Tombstone>(sql, row_to_tombstone, sync_id::normalize(id));
    if (rows.is_err()) return propagate<std::optional<Tombstone>>(rows);
    if (rows.unwrap().empty()) return Result<std::optional<Tombstone>, Error>::ok(std::nullopt);
    return Result<std::optional<Tombstone>, Error>::ok(rows.unwrap().front());
}

Result<std::vector<Tombstone>, Error> TombstoneRepository::all() {
    std::string sql(kSelect);
    sql += " ORDER BY deleted_at, sync_id;";
    return db_.query<Tombstone>(sql, row_to_tombstone);
}

Result<std::vector<Tombstone>, Error> TombstoneRepository::for_user(const std::string& user_id) {
    std::string sql(kSelect);
    sql += " WHERE user_id = ? ORDER BY deleted_at, sync_id;";
    return db_.query<Tombstone>(sql, row_to_tombstone, user_id);
}

Result<int, Error> TombstoneRepository::purge_before(Timestamp cutoff) {
    return db_.run("DELETE FROM tombstones WHERE deleted_at < ?;", cutoff);
}

} // namespace docsync::storage
