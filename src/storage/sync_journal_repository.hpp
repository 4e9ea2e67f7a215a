#pragma once

#include "core/result.hpp"
#include "core/retry_policy.hpp"
#include "core/sync_operation.hpp"
#include "storage/database.hpp"
#include <string>
#include <vector>

namespace docsync::storage {

/**
 * SyncJournalRepository - the persisted half of the sync engine: the
 * pending operation queue, operations that failed permanently, and the
 * per-document retry records (sync_errors).
 *
 * Callers that need atomicity wrap these calls in Database::transaction;
 * nothing here opens a transaction of its own.
 */
class SyncJournalRepository {
public:
    explicit SyncJournalRepository(Database& db) : db_(db) {}

    [[nodiscard]] Result<void, Error> replace_queue(const std::vector<SyncOperation>& queued);
    [[nodiscard]] Result<std::vector<SyncOperation>, Error> queued();

    [[nodiscard]] Result<void, Error> save_failed(const SyncOperation& op);
    [[nodiscard]] Result<std::vector<SyncOperation>, Error> failed();
    [[nodiscard]] Result<int, Error> remove_failed_for(const std::string& document_sync_id);

    [[nodiscard]] Result<void, Error> save_record(const RetryRecord& record);
    [[nodiscard]] Result<void, Error> remove_record(const std::string& sync_id);
    [[nodiscard]] Result<std::vector<RetryRecord>, Error> records();

private:
    Database& db_;

    [[nodiscard]] Result<std::vector<SyncOperation>, Error> select_status(const std::string& status);
    [[nodiscard]] Result<void, Error> insert(const SyncOperation& op, std::int64_t position,
                                             const std::string& status);
};

} // namespace docsync::storage
