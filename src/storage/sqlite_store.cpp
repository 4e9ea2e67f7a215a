#include "storage/sqlite_store.hpp"
#include "storage/migrations.hpp"

namespace docsync::storage {

SqliteLocalStore::SqliteLocalStore(Database db)
    : db_(std::move(db))
    , documents_(db_)
    , tombstones_(db_)
    , journal_(db_)
    , conflicts_(db_) {}

Result<std::unique_ptr<SqliteLocalStore>, Error> SqliteLocalStore::wrap(Result<Database, Error> opened) {
    if (opened.is_err()) return propagate<std::unique_ptr<SqliteLocalStore>>(opened);
    std::unique_ptr<SqliteLocalStore> store(new SqliteLocalStore(std::move(opened).unwrap()));
    auto migrated = initialize_database(store->db_);
    if (migrated.is_err()) return propagate<std::unique_ptr<SqliteLocalStore>>(migrated);
    return Result<std::unique_ptr<SqliteLocalStore>, Error>::ok(std::move(store));
}

Result<std::unique_ptr<SqliteLocalStore>, Error> SqliteLocalStore::open(const std::string& path) {
    return wrap(Database::open(path));
}

Result<std::unique_ptr<SqliteLocalStore>, Error> SqliteLocalStore::open_memory() {
    return wrap(Database::open_memory());
}

Result<Document, Error> SqliteLocalStore::save_document(const Document& doc) {
    return documents_.save(doc);
}

Result<std::optional<Document>, Error> SqliteLocalStore::document_by_sync_id(std::string_view sync_id) {
    return documents_.get_by_sync_id(sync_id);
}

Result<std::optional<Document>, Error> SqliteLocalStore::document_by_local_id(std::int64_t local_id) {
    return documents_.get(local_id);
}

Result<std::vector<Document>, Error> SqliteLocalStore::documents() {
    return documents_.all();
}

Result<std::vector<Document>, Error> SqliteLocalStore::documents_in_state(SyncState state) {
    return documents_.in_state(state);
}

Result<std::vector<Document>, Error> SqliteLocalStore::documents_for_user(const std::string& user_id) {
    return documents_.for_user(user_id);
}

Result<bool, Error> SqliteLocalStore::remove_document(std::int64_t local_id) {
    return documents_.remove(local_id);
}

Result<void, Error> SqliteLocalStore::save_attachment(const FileAttachment& attachment) {
    return documents_.save_attachment(attachment);
}

Result<std::vector<FileAttachment>, Error> SqliteLocalStore::attachments_for(const std::string& document_sync_id) {
    return documents_.attachments_for(document_sync_id);
}

Result<int, Error> SqliteLocalStore::remove_attachments_for(const std::string& document_sync_id) {
    return documents_.remove_attachments_for(document_sync_id);
}

Result<bool, Error> SqliteLocalStore::insert_tombstone_if_absent(const Tombstone& tombstone) {
    return tombstones_.insert_if_absent(tombstone);
}

Result<std::optional<Tombstone>, Error> SqliteLocalStore::tombstone(const std::string& sync_id) {
    return tombstones_.get(sync_id);
}

Result<std::vector<Tombstone>, Error> SqliteLocalStore::tombstones() {
    return tombstones_.all();
}

Result<std::vector<Tombstone>, Error> SqliteLocalStore::tombstones_for_user(const std::string& user_id) {
    return tombstones_.for_user(user_id);
}

Result<int, Error> SqliteLocalStore::purge_tombstones_before(Timestamp cutoff) {
    return tombstones_.purge_before(cutoff);
}

Result<void, Error> SqliteLocalStore::save_queue(const std::vector<SyncOperation>& queued) {
    return db_.transaction([&] { return journal_.replace_queue(queued); });
}

Result<std::vector<SyncOperation>, Error> SqliteLocalStore::queued_operations() {
    return journal_.queued();
}

Result<void, Error> SqliteLocalStore::save_failed_operation(const SyncOperation& op) {
    return journal_.save_failed(op);
}

Result<std::vector<SyncOperation>, Error> SqliteLocalStore::failed_operations() {
    return journal_.failed();
}

Result<int, Error> SqliteLocalStore::remove_failed_operations_for(const std::string& document_sync_id) {
    return journal_.remove_failed_for(document_sync_id);
}

Result<void, Error> SqliteLocalStore::save_retry_record(const RetryRecord& record) {
    return journal_.save_record(record);
}

Result<void, Error> SqliteLocalStore::remove_retry_record(const std::string& sync_id) {
    return journal_.remove_record(sync_id);
}

Result<std::vector<RetryRecord>, Error> SqliteLocalStore::retry_records() {
    return journal_.records();
}

Result<void, Error> SqliteLocalStore::save_conflict(const Conflict& conflict) {
    return conflicts_.save(conflict);
}

Result<std::optional<Conflict>, Error> SqliteLocalStore::conflict(const std::string& id) {
    return conflicts_.get(id);
}

Result<std::optional<Conflict>, Error> SqliteLocalStore::open_conflict_for(const std::string& document_sync_id) {
    return conflicts_.open_for(document_sync_id);
}

Result<std::vector<Conflict>, Error> SqliteLocalStore::open_conflicts() {
    return conflicts_.open();
}

Result<int, Error> SqliteLocalStore::purge_resolved_conflicts_before(Timestamp cutoff) {
    return conflicts_.purge_resolved_before(cutoff);
}

} // namespace docsync::storage
