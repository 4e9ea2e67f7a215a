#include "storage/conflict_repository.hpp"
#include "storage/document_codec.hpp"
#include <sqlite3.h>

namespace docsync::storage {

namespace {

constexpr std::string_view kSelect = R"SQL(
    SELECT id, document_sync_id, type, local_snapshot, remote_snapshot,
           detected_at, resolved, resolution_strategy, resolved_at
    FROM conflicts
)SQL";

struct ConflictRow {
    std::string id;
    std::string document_sync_id;
    std::string type;
    std::string local_snapshot;
    std::string remote_snapshot;
    Timestamp detected_at;
    bool resolved;
    std::optional<std::string> strategy;
    std::optional<Timestamp> resolved_at;
};

Result<Conflict, Error> to_conflict(ConflictRow row) {
    const auto type = parse_conflict_type(row.type);
    if (!type) {
        return Result<Conflict, Error>::err(
            Error::storage("Unknown conflict type '" + row.type + "' in conflicts"));
    }
    std::optional<ResolutionStrategy> strategy;
    if (row.strategy) {
        strategy = parse_resolution_strategy(*row.strategy);
        if (!strategy) {
            return Result<Conflict, Error>::err(
                Error::storage("Unknown resolution strategy '" + *row.strategy + "' in conflicts"));
        }
    }
    auto local = codec::decode_document(row.local_snapshot);
    if (local.is_err()) return propagate<Conflict>(local);
    auto remote = codec::decode_document(row.remote_snapshot);
    if (remote.is_err()) return propagate<Conflict>(remote);

    return Result<Conflict, Error>::ok(Conflict{
        .id = std::move(row.id),
        .document_sync_id = std::move(row.document_sync_id),
        .local_snapshot = std::move(local).unwrap(),
        .remote_snapshot = std::move(remote).unwrap(),
        .type = *type,
        .detected_at = row.detected_at,
        .resolved = row.resolved,
        .resolution_strategy = strategy,
        .resolved_at = row.resolved_at,
    });
}

} // namespace

Result<void, Error> ConflictRepository::save(const Conflict& c) {
    std::optional<std::string> strategy;
    if (c.resolution_strategy) strategy = std::string(to_string(*c.resolution_strategy));

    auto saved = db_.run(R"SQL(
        INSERT INTO conflicts (id, document_sync_id, type, local_snapshot, remote_snapshot,
                               detected_at, resolved, resolution_strategy, resolved_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(id) DO UPDATE SET
            type = excluded.type,
            local_snapshot = excluded.local_snapshot,
            remote_snapshot = excluded.remote_snapshot,
            resolved = excluded.resolved,
            resolution_strategy = excluded.resolution_strategy,
            resolved_at = excluded.resolved_at;
    )SQL",
        c.id, c.document_sync_id, std::string(to_string(c.type)),
        codec::encode_document(c.local_snapshot), codec::encode_document(c.remote_snapshot),
        c.detected_at, c.resolved, strategy, c.resolved_at);
    if (saved.is_err()) {
        if ((saved.unwrap_err().code & 0xff) == SQLITE_CONSTRAINT) {
            return Result<void, Error>::err(Error(
                ErrorKind::Concurrency,
                "Document " + c.document_sync_id + " already has an unresolved conflict",
                SQLITE_CONSTRAINT));
        }
        return propagate<void>(saved);
    }
    return Result<void, Error>::ok();
}

Result<std::vector<Conflict>, Error> ConflictRepository::select(std::string_view where_clause,
                                                                const std::string& arg) {
    std::string sql(kSelect);
    sql += where_clause;
    sql += " ORDER BY detected_at, id;";

    auto read_row = [](Statement& stmt) {
        return ConflictRow{
            .id = stmt.column_text(0),
            .document_sync_id = stmt.column_text(1),
            .type = stmt.column_text(2),
            .local_snapshot = stmt.column_text(3),
            .remote_snapshot = stmt.column_text(4),
            .detected_at = stmt.column_timestamp(5),
            .resolved = stmt.column_bool(6),
            .strategy = stmt.column_optional_text(7),
            .resolved_at = stmt.column_optional_timestamp(8),
        };
    };
    auto rows = arg.empty() ? db_.query<ConflictRow>(sql, read_row)
                            : db_.query<ConflictRow>(sql, read_row, arg);
    if (rows.is_err()) return propagate<std::vector<Conflict>>(rows);

    std::vector<Conflict> out;
    for (auto& row : rows.unwrap()) {
        auto conflict = to_conflict(std::move(row));
        if (conflict.is_err()) return propagate<std::vector<Conflict>>(conflict);
        out.push_back(std::move(conflict).unwrap());
    }
    return Result<std::vector<Conflict>, Error>::ok(std::move(out));
}

Result<std::optional<Conflict>, Error> ConflictRepository::get(const std::string& id) {
    auto rows = select(" WHERE id = ?", id);
    if (rows.is_err()) return propagate<std::optional<Conflict>>(rows);
    if (rows.unwrap().empty()) return Result<std::optional<Conflict>, Error>::ok(std::nullopt);
    return Result<std::optional<Conflict>, Error>::ok(rows.unwrap().front());
}

Result<std::optional<Conflict>, Error> ConflictRepository::open_for(const std::string& document_sync_id) {
    auto rows = select(" WHERE resolved = 0 AND document_sync_id = ?", document_sync_id);
    if (rows.is_err()) return propagate<std::optional<Conflict>>(rows);
    if (rows.unwrap().empty()) return Result<std::optional<Conflict>, Error>::ok(std::nullopt);
    return Result<std::optional<Conflict>, Error>::ok(rows.unwrap().front());
}

Result<std::vector<Conflict>, Error> ConflictRepository::open() {
    return select(" WHERE resolved = 0", "");
}

Result<int, Error> ConflictRepository::purge_resolved_before(Timestamp cutoff) {
    return db_.run("DELETE FROM conflicts WHERE resolved = 1 AND resolved_at < ?;", cutoff);
}

} // namespace docsync::storage
