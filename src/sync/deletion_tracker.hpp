#pragma once

#include "core/document.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "storage/local_store.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace docsync::sync {

inline constexpr std::chrono::hours kDefaultTombstoneRetention{24 * 90};

/**
 * DeletionTracker - tombstone lifecycle.
 *
 * A document with a sync id gets its tombstone before it moves to
 * PendingDeletion, so a crash in between leaves the deletion protected.
 * Identity-less documents cannot be protected and are removed locally.
 * Incoming remote documents whose sync id is tombstoned are discarded.
 * Deleting a conflicted document closes its open conflict (keep_local).
 */
class DeletionTracker {
public:
    enum class MarkOutcome {
        Tombstoned,       // tombstone present, document now PendingDeletion
        RemovedLocally    // identity-less: row removed, nothing to push
    };

    struct Marked {
        MarkOutcome outcome{MarkOutcome::Tombstoned};
        Document document;
        bool tombstone_created{false};
        std::optional<std::string> closed_conflict_id;
    };

    DeletionTracker(storage::LocalStore& store,
                    Clock clock = system_clock(),
                    std::chrono::milliseconds retention = kDefaultTombstoneRetention)
        : store_(store), clock_(std::move(clock)), retention_(retention) {}

    [[nodiscard]] Result<Marked, Error> mark_for_deletion(const Document& doc,
                                                          const std::string& deleted_by,
                                                          const std::string& reason = "user");

    [[nodiscard]] Result<bool, Error> is_tombstoned(const std::string& sync_id);

    /**
     * Documents whose sync id is not tombstoned. Identity-less documents
     * pass through.
     */
    [[nodiscard]] Result<std::vector<Document>, Error> filter_tombstoned(const std::vector<Document>& docs);

    /**
     * False when an incoming remote copy must be discarded.
     */
    [[nodiscard]] Result<bool, Error> accept_incoming(const Document& remote);

    /**
     * The remote acknowledged the deletion: drop the local row and its
     * attachment rows. The tombstone stays.
     */
    [[nodiscard]] Result<void, Error> complete_deletion(const Document& doc);

    /**
     * Tombstone for a deletion that originated on another device.
     */
    [[nodiscard]] Result<bool, Error> record_remote_deletion(const Document& doc);

    [[nodiscard]] Result<int, Error> purge_expired();
    [[nodiscard]] Result<std::vector<storage::Tombstone>, Error> tombstones_for_user(const std::string& user_id);

    [[nodiscard]] std::chrono::milliseconds retention() const { return retention_; }

private:
    storage::LocalStore& store_;
    Clock clock_;
    std::chrono::milliseconds retention_;

    [[nodiscard]] Result<std::optional<std::string>, Error> close_open_conflict(const std::string& sync_id,
                                                                                Timestamp now);
};

} // namespace docsync::sync
