#include "storage/sync_journal_repository.hpp"
#include "storage/document_codec.hpp"

namespace docsync::storage {

namespace {

const std::string kQueued = "queued";
const std::string kFailed = "failed";

struct OperationRow {
    std::string id;
    std::string document_sync_id;
    std::string kind;
    Timestamp queued_at;
    int retry_count;
    std::string payload;
};

struct RecordRow {
    RetryRecord record;
    std::string operation;
    std::string failure;
};

} // namespace

Result<void, Error> SyncJournalRepository::insert(const SyncOperation& op,
                                                  std::int64_t position,
                                                  const std::string& status) {
    auto inserted = db_.run(R"SQL(
        INSERT OR REPLACE INTO sync_operations
            (id, position, document_sync_id, kind, queued_at, retry_count, payload, status)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?);
    )SQL",
        op.id, position, op.document_sync_id, std::string(to_string(op.kind)),
        op.queued_at, op.retry_count, codec::encode_document(op.payload), status);
    if (inserted.is_err()) return propagate<void>(inserted);
    return Result<void, Error>::ok();
}

Result<void, Error> SyncJournalRepository::replace_queue(const std::vector<SyncOperation>& queued) {
    auto cleared = db_.run("DELETE FROM sync_operations WHERE status = ?;", kQueued);
    if (cleared.is_err()) return propagate<void>(cleared);

    std::int64_t position = 0;
    for (const auto& op : queued) {
        auto inserted = insert(op, position++, kQueued);
        if (inserted.is_err()) return inserted;
    }
    return Result<void, Error>::ok();
}

Result<std::vector<SyncOperation>, Error> SyncJournalRepository::select_status(const std::string& status) {
    auto rows = db_.query<OperationRow>(R"SQL(
        SELECT id, document_sync_id, kind, queued_at, retry_count, payload
        FROM sync_operations WHERE status = ? ORDER BY position, queued_at;
    )SQL", [](Statement& stmt) {
        return OperationRow{
            .id = stmt.column_text(0),
            .document_sync_id = stmt.column_text(1),
            .kind = stmt.column_text(2),
            .queued_at = stmt.column_timestamp(3),
            .retry_count = stmt.column_int(4),
            .payload = stmt.column_text(5),
        };
    }, status);
    if (rows.is_err()) return propagate<std::vector<SyncOperation>>(rows);

    std::vector<SyncOperation> ops;
    for (auto& row : rows.unwrap()) {
        const auto kind = parse_operation_kind(row.kind);
        if (!kind) {
            return Result<std::vector<SyncOperation>, Error>::err(
                Error::storage("Unknown operation kind '" + row.kind + "' in sync_operations"));
        }
        auto payload = codec::decode_document(row.payload);
        if (payload.is_err()) return propagate<std::vector<SyncOperation>>(payload);
        ops.push_back(SyncOperation{
            .id = std::move(row.id),
            .document_sync_id = std::move(row.document_sync_id),
            .kind = *kind,
            .queued_at = row.queued_at,
            .retry_count = row.retry_count,
            .payload = std::move(payload).unwrap(),
            .in_flight = false,
        });
    }
    return Result<std::vector<SyncOperation>, Error>::ok(std::move(ops));
}

Result<std::vector<SyncOperation>, Error> SyncJournalRepository::queued() {
    return select_status(kQueued);
}

Result<void, Error> SyncJournalRepository::save_failed(const SyncOperation& op) {
    return insert(op, 0, kFailed);
}

Result<std::vector<SyncOperation>, Error> SyncJournalRepository::failed() {
    return select_status(kFailed);
}

Result<int, Error> SyncJournalRepository::remove_failed_for(const std::string& document_sync_id) {
    return db_.run("DELETE FROM sync_operations WHERE status = ? AND document_sync_id = ?;",
                   kFailed, document_sync_id);
}

Result<void, Error> SyncJournalRepository::save_record(const RetryRecord& r) {
    auto saved = db_.run(R"SQL(
        INSERT OR REPLACE INTO sync_errors
            (sync_id, document_title, operation, failure_class, message, retry_count,
             failed_at, next_attempt_at, permanent, refresh_attempted)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
    )SQL",
        r.sync_id, r.document_title, std::string(to_string(r.operation)),
        std::string(to_string(r.failure)), r.message, r.retry_count,
        r.failed_at, r.next_attempt_at, r.permanent, r.refresh_attempted);
    if (saved.is_err()) return propagate<void>(saved);
    return Result<void, Error>::ok();
}

Result<void, Error> SyncJournalRepository::remove_record(const std::string& sync_id) {
    auto removed = db_.run("DELETE FROM sync_errors WHERE sync_id = ?;", sync_id);
    if (removed.is_err()) return propagate<void>(removed);
    return Result<void, Error>::ok();
}

Result<std::vector<RetryRecord>, Error> SyncJournalRepository::records() {
    auto rows = db_.query<RecordRow>(R"SQL(
        SELECT sync_id, document_title, operation, failure_class, message, retry_count,
               failed_at, next_attempt_at, permanent, refresh_attempted
        FROM sync_errors ORDER BY failed_at, sync_id;
    )SQL", [](Statement& stmt) {
        RecordRow row;
        row.record.sync_id = stmt.column_text(0);
        row.record.document_title = stmt.column_text(1);
        row.operation = stmt.column_text(2);
        row.failure = stmt.column_text(3);
        row.record.message = stmt.column_text(4);
        row.record.retry_count = stmt.column_int(5);
        row.record.failed_at = stmt.column_timestamp(6);
        row.record.next_attempt_at = stmt.column_timestamp(7);
        row.record.permanent = stmt.column_bool(8);
        row.record.refresh_attempted = stmt.column_bool(9);
        return row;
    });
    if (rows.is_err()) return propagate<std::vector<RetryRecord>>(rows);

    std::vector<RetryRecord> out;
    for (auto& row : rows.unwrap()) {
        const auto operation = parse_operation_kind(row.operation);
        const auto failure = parse_failure_class(row.failure);
        if (!operation || !failure) {
            return Result<std::vector<RetryRecord>, Error>::err(Error::storage(
                "Malformed sync_errors row for " + row.record.sync_id));
        }
        row.record.operation = *operation;
        row.record.failure = *failure;
        out.push_back(std::move(row.record));
    }
    return Result<std::vector<RetryRecord>, Error>::ok(std::move(out));
}

} // namespace docsync::storage
