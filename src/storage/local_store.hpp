#pragma once

#include "core/conflict.hpp"
#include "core/document.hpp"
#include "core/result.hpp"
#include "core/retry_policy.hpp"
#include "core/sync_operation.hpp"
#include "core/types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docsync::storage {

/**
 * Tombstone - permanent record that a sync id was deleted. Written once,
 * never updated, purged only by age.
 */
struct Tombstone {
    std::string sync_id;
    std::string user_id;
    std::string deleted_by;
    Timestamp deleted_at;
    std::string reason;

    bool operator==(const Tombstone&) const = default;
};

/**
 * LocalStore - everything the sync engine persists on the device.
 *
 * The engine talks to this interface only; SqliteLocalStore is the
 * production implementation.
 */
class LocalStore {
public:
    virtual ~LocalStore() = default;

    // Documents ---------------------------------------------------------------

    /**
     * Insert (local_id == 0) or update by local_id. Returns the stored row.
     */
    [[nodiscard]] virtual Result<Document, Error> save_document(const Document& doc) = 0;
    [[nodiscard]] virtual Result<std::optional<Document>, Error> document_by_sync_id(std::string_view sync_id) = 0;
    [[nodiscard]] virtual Result<std::optional<Document>, Error> document_by_local_id(std::int64_t local_id) = 0;
    [[nodiscard]] virtual Result<std::vector<Document>, Error> documents() = 0;
    [[nodiscard]] virtual Result<std::vector<Document>, Error> documents_in_state(SyncState state) = 0;
    [[nodiscard]] virtual Result<std::vector<Document>, Error> documents_for_user(const std::string& user_id) = 0;
    [[nodiscard]] virtual Result<bool, Error> remove_document(std::int64_t local_id) = 0;

    // Attachments -------------------------------------------------------------

    [[nodiscard]] virtual Result<void, Error> save_attachment(const FileAttachment& attachment) = 0;
    [[nodiscard]] virtual Result<std::vector<FileAttachment>, Error> attachments_for(const std::string& document_sync_id) = 0;
    [[nodiscard]] virtual Result<int, Error> remove_attachments_for(const std::string& document_sync_id) = 0;

    // Tombstones --------------------------------------------------------------

    /**
     * Returns true when a new tombstone was written, false when one existed.
     */
    [[nodiscard]] virtual Result<bool, Error> insert_tombstone_if_absent(const Tombstone& tombstone) = 0;
    [[nodiscard]] virtual Result<std::optional<Tombstone>, Error> tombstone(const std::string& sync_id) = 0;
    [[nodiscard]] virtual Result<std::vector<Tombstone>, Error> tombstones() = 0;
    [[nodiscard]] virtual Result<std::vector<Tombstone>, Error> tombstones_for_user(const std::string& user_id) = 0;
    [[nodiscard]] virtual Result<int, Error> purge_tombstones_before(Timestamp cutoff) = 0;

    // Operation queue ---------------------------------------------------------

    /**
     * Replace the persisted queue with `queued`, preserving its order.
     */
    [[nodiscard]] virtual Result<void, Error> save_queue(const std::vector<SyncOperation>& queued) = 0;
    [[nodiscard]] virtual Result<std::vector<SyncOperation>, Error> queued_operations() = 0;
    [[nodiscard]] virtual Result<void, Error> save_failed_operation(const SyncOperation& op) = 0;
    [[nodiscard]] virtual Result<std::vector<SyncOperation>, Error> failed_operations() = 0;
    [[nodiscard]] virtual Result<int, Error> remove_failed_operations_for(const std::string& document_sync_id) = 0;

    // Retry records -----------------------------------------------------------

    [[nodiscard]] virtual Result<void, Error> save_retry_record(const RetryRecord& record) = 0;
    [[nodiscard]] virtual Result<void, Error> remove_retry_record(const std::string& sync_id) = 0;
    [[nodiscard]] virtual Result<std::vector<RetryRecord>, Error> retry_records() = 0;

    // Conflicts ---------------------------------------------------------------

    /**
     * Insert or update by id. Fails when a second unresolved conflict for
     * the same document would result.
     */
    [[nodiscard]] virtual Result<void, Error> save_conflict(const Conflict& conflict) = 0;
    [[nodiscard]] virtual Result<std::optional<Conflict>, Error> conflict(const std::string& id) = 0;
    [[nodiscard]] virtual Result<std::optional<Conflict>, Error> open_conflict_for(const std::string& document_sync_id) = 0;
    [[nodiscard]] virtual Result<std::vector<Conflict>, Error> open_conflicts() = 0;
    [[nodiscard]] virtual Result<int, Error> purge_resolved_conflicts_before(Timestamp cutoff) = 0;
};

} // namespace docsync::storage
