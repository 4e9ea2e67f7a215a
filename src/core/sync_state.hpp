#pragma once

#include "core/result.hpp"
#include <optional>
#include <string_view>

namespace docsync {

/**
 * SyncState - per-document (and per-attachment) synchronization state.
 *
 * Synced is the only stable state. Error stays retriable until the retry
 * scheduler marks the record permanent.
 */
enum class SyncState {
    PendingUpload,
    Uploading,
    PendingDownload,
    Downloading,
    Synced,
    Conflict,
    PendingDeletion,
    Error
};

/**
 * SyncTrigger - everything that can move a document between states.
 */
enum class SyncTrigger {
    LocalEdit,          // enqueue create/update
    BeginUpload,
    BeginDownload,
    TransferSucceeded,
    TransferFailed,
    VersionRejected,    // optimistic-concurrency mismatch
    Delete,
    ResolvedRemote,     // conflict resolved, remote content adopted
    ResolvedPush,       // conflict resolved, result must be pushed
    RemoteChanged,
    Retry,              // explicit caller retry of an errored document
    Recover             // engine restart found a transfer state on disk
};

[[nodiscard]] std::string_view to_string(SyncState state) noexcept;
[[nodiscard]] std::optional<SyncState> parse_sync_state(std::string_view text) noexcept;
[[nodiscard]] std::string_view to_string(SyncTrigger trigger) noexcept;

/**
 * Apply a trigger. Returns the next state or a Validation error naming the
 * illegal (state, trigger) pair. A trigger that leaves the state unchanged
 * is accepted as a no-op.
 */
[[nodiscard]] Result<SyncState, Error> transition(SyncState from, SyncTrigger trigger);

[[nodiscard]] constexpr bool is_transferring(SyncState s) noexcept {
    return s == SyncState::Uploading || s == SyncState::Downloading;
}

/**
 * True while the local copy holds changes the remote has not acknowledged.
 */
[[nodiscard]] constexpr bool has_unpushed_changes(SyncState s) noexcept {
    return s == SyncState::PendingUpload || s == SyncState::Uploading ||
           s == SyncState::PendingDeletion;
}

} // namespace docsync
