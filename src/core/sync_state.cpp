#include "core/sync_state.hpp"

#include <array>
#include <string>

namespace docsync {

namespace {

constexpr std::array<std::pair<SyncState, std::string_view>, 8> kStateNames{{
    {SyncState::PendingUpload, "pending_upload"},
    {SyncState::Uploading, "uploading"},
    {SyncState::PendingDownload, "pending_download"},
    {SyncState::Downloading, "downloading"},
    {SyncState::Synced, "synced"},
    {SyncState::Conflict, "conflict"},
    {SyncState::PendingDeletion, "pending_deletion"},
    {SyncState::Error, "error"},
}};

std::optional<SyncState> next_state(SyncState from, SyncTrigger trigger) {
    using S = SyncState;
    switch (trigger) {
        case SyncTrigger::LocalEdit:
            if (from == S::Conflict || from == S::PendingDeletion || from == S::Downloading) {
                return std::nullopt;
            }
            return S::PendingUpload;

        case SyncTrigger::BeginUpload:
            if (from == S::PendingUpload || from == S::Error || from == S::Uploading) {
                return S::Uploading;
            }
            return std::nullopt;

        case SyncTrigger::BeginDownload:
            if (from == S::PendingDownload || from == S::Synced || from == S::Error ||
                from == S::Downloading) {
                return S::Downloading;
            }
            return std::nullopt;

        case SyncTrigger::TransferSucceeded:
            if (from == S::Uploading || from == S::Downloading || from == S::Synced) {
                return S::Synced;
            }
            return std::nullopt;

        case SyncTrigger::TransferFailed:
            // A failed delete push keeps its intent; the tombstone already exists.
            if (from == S::PendingDeletion) return S::PendingDeletion;
            if (from == S::Conflict || from == S::Synced) return std::nullopt;
            return S::Error;

        case SyncTrigger::VersionRejected:
            if (from == S::Downloading) return std::nullopt;
            return S::Conflict;

        case SyncTrigger::Delete:
            return S::PendingDeletion;

        case SyncTrigger::ResolvedRemote:
            if (from == S::Conflict || from == S::Synced) return S::Synced;
            return std::nullopt;

        case SyncTrigger::ResolvedPush:
            if (from == S::Conflict || from == S::PendingUpload) return S::PendingUpload;
            return std::nullopt;

        case SyncTrigger::RemoteChanged:
            if (from == S::Synced || from == S::Error || from == S::PendingDownload) {
                return S::PendingDownload;
            }
            return std::nullopt;

        case SyncTrigger::Retry:
            if (from == S::Error || from == S::PendingUpload) return S::PendingUpload;
            return std::nullopt;

        case SyncTrigger::Recover:
            if (from == S::Uploading) return S::PendingUpload;
            if (from == S::Downloading) return S::PendingDownload;
            return from;
    }
    return std::nullopt;
}

} // namespace

std::string_view to_string(SyncState state) noexcept {
    for (const auto& [s, name] : kStateNames) {
        if (s == state) return name;
    }
    return "error";
}

std::optional<SyncState> parse_sync_state(std::string_view text) noexcept {
    for (const auto& [s, name] : kStateNames) {
        if (name == text) return s;
    }
    return std::nullopt;
}

std::string_view to_string(SyncTrigger trigger) noexcept {
    switch (trigger) {
        case SyncTrigger::LocalEdit: return "local_edit";
        case SyncTrigger::BeginUpload: return "begin_upload";
        case SyncTrigger::BeginDownload: return "begin_download";
        case SyncTrigger::TransferSucceeded: return "transfer_succeeded";
        case SyncTrigger::TransferFailed: return "transfer_failed";
        case SyncTrigger::VersionRejected: return "version_rejected";
        case SyncTrigger::Delete: return "delete";
        case SyncTrigger::ResolvedRemote: return "resolved_remote";
        case SyncTrigger::ResolvedPush: return "resolved_push";
        case SyncTrigger::RemoteChanged: return "remote_changed";
        case SyncTrigger::Retry: return "retry";
        case SyncTrigger::Recover: return "recover";
    }
    return "unknown";
}

Result<SyncState, Error> transition(SyncState from, SyncTrigger trigger) {
    auto next = next_state(from, trigger);
    if (!next) {
        return Result<SyncState, Error>::err(Error::validation(
            "Illegal sync transition: " + std::string(to_string(trigger)) +
            " from " + std::string(to_string(from))));
    }
    return Result<SyncState, Error>::ok(*next);
}

} // namespace docsync
