#pragma once

#include "storage/conflict_repository.hpp"
#include "storage/database.hpp"
#include "storage/document_repository.hpp"
#include "storage/local_store.hpp"
#include "storage/sync_journal_repository.hpp"
#include "storage/tombstone_repository.hpp"
#include <memory>
#include <string>

namespace docsync::storage {

/**
 * SqliteLocalStore - LocalStore over a single SQLite database.
 *
 * Owns the connection; open() runs migrations before returning. Queue
 * replacement runs in its own transaction, everything else is a single
 * statement.
 */
class SqliteLocalStore final : public LocalStore {
public:
    [[nodiscard]] static Result<std::unique_ptr<SqliteLocalStore>, Error> open(const std::string& path);
    [[nodiscard]] static Result<std::unique_ptr<SqliteLocalStore>, Error> open_memory();

    SqliteLocalStore(const SqliteLocalStore&) = delete;
    SqliteLocalStore& operator=(const SqliteLocalStore&) = delete;

    [[nodiscard]] Database& database() { return db_; }

    Result<Document, Error> save_document(const Document& doc) override;
    Result<std::optional<Document>, Error> document_by_sync_id(std::string_view sync_id) override;
    Result<std::optional<Document>, Error> document_by_local_id(std::int64_t local_id) override;
    Result<std::vector<Document>, Error> documents() override;
    Result<std::vector<Document>, Error> documents_in_state(SyncState state) override;
    Result<std::vector<Document>, Error> documents_for_user(const std::string& user_id) override;
    Result<bool, Error> remove_document(std::int64_t local_id) override;

    Result<void, Error> save_attachment(const FileAttachment& attachment) override;
    Result<std::vector<FileAttachment>, Error> attachments_for(const std::string& document_sync_id) override;
    Result<int, Error> remove_attachments_for(const std::string& document_sync_id) override;

    Result<bool, Error> insert_tombstone_if_absent(const Tombstone& tombstone) override;
    Result<std::optional<Tombstone>, Error> tombstone(const std::string& sync_id) override;
    Result<std::vector<Tombstone>, Error> tombstones() override;
    Result<std::vector<Tombstone>, Error> tombstones_for_user(const std::string& user_id) override;
    Result<int, Error> purge_tombstones_before(Timestamp cutoff) override;

    Result<void, Error> save_queue(const std::vector<SyncOperation>& queued) override;
    Result<std::vector<SyncOperation>, Error> queued_operations() override;
    Result<void, Error> save_failed_operation(const SyncOperation& op) override;
    Result<std::vector<SyncOperation>, Error> failed_operations() override;
    Result<int, Error> remove_failed_operations_for(const std::string& document_sync_id) override;

    Result<void, Error> save_retry_record(const RetryRecord& record) override;
    Result<void, Error> remove_retry_record(const std::string& sync_id) override;
    Result<std::vector<RetryRecord>, Error> retry_records() override;

    Result<void, Error> save_conflict(const Conflict& conflict) override;
    Result<std::optional<Conflict>, Error> conflict(const std::string& id) override;
    Result<std::optional<Conflict>, Error> open_conflict_for(const std::string& document_sync_id) override;
    Result<std::vector<Conflict>, Error> open_conflicts() override;
    Result<int, Error> purge_resolved_conflicts_before(Timestamp cutoff) override;

private:
    explicit SqliteLocalStore(Database db);

    [[nodiscard]] static Result<std::unique_ptr<SqliteLocalStore>, Error> wrap(Result<Database, Error> opened);

    Database db_;
    DocumentRepository documents_;
    TombstoneRepository tombstones_;
    SyncJournalRepository journal_;
    ConflictRepository conflicts_;
};

} // namespace docsync::storage
