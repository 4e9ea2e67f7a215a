#include <catch2/catch_test_macros.hpp>
#include "core/sync_state.hpp"

using namespace docsync;

namespace {

SyncState next(SyncState from, SyncTrigger trigger) {
    return transition(from, trigger).unwrap();
}

} // namespace

TEST_CASE("Upload path: pending, uploading, synced", "[sync_state]") {
    auto state = next(SyncState::PendingUpload, SyncTrigger::BeginUpload);
    REQUIRE(state == SyncState::Uploading);
    REQUIRE(next(state, SyncTrigger::TransferSucceeded) == SyncState::Synced);
    REQUIRE(next(state, SyncTrigger::TransferFailed) == SyncState::Error);
}

TEST_CASE("Download path: remote change, downloading, synced", "[sync_state]") {
    auto state = next(SyncState::Synced, SyncTrigger::RemoteChanged);
    REQUIRE(state == SyncState::PendingDownload);
    state = next(state, SyncTrigger::BeginDownload);
    REQUIRE(state == SyncState::Downloading);
    REQUIRE(next(state, SyncTrigger::TransferSucceeded) == SyncState::Synced);
}

TEST_CASE("Local edits are refused in conflict, deletion and download", "[sync_state]") {
    for (auto from : {SyncState::Conflict, SyncState::PendingDeletion, SyncState::Downloading}) {
        auto result = transition(from, SyncTrigger::LocalEdit);
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().kind == ErrorKind::Validation);
    }
    REQUIRE(next(SyncState::Synced, SyncTrigger::LocalEdit) == SyncState::PendingUpload);
    REQUIRE(next(SyncState::Error, SyncTrigger::LocalEdit) == SyncState::PendingUpload);
}

TEST_CASE("Delete is accepted from every state", "[sync_state]") {
    for (auto from : {SyncState::PendingUpload, SyncState::Uploading, SyncState::PendingDownload,
                      SyncState::Downloading, SyncState::Synced, SyncState::Conflict,
                      SyncState::PendingDeletion, SyncState::Error}) {
        REQUIRE(next(from, SyncTrigger::Delete) == SyncState::PendingDeletion);
    }
}

TEST_CASE("A failed delete push keeps the deletion pending", "[sync_state]") {
    REQUIRE(next(SyncState::PendingDeletion, SyncTrigger::TransferFailed) == SyncState::PendingDeletion);
    REQUIRE(transition(SyncState::Synced, SyncTrigger::TransferFailed).is_err());
    REQUIRE(transition(SyncState::Conflict, SyncTrigger::TransferFailed).is_err());
}

TEST_CASE("Version rejection enters conflict except mid-download", "[sync_state]") {
    REQUIRE(next(SyncState::Uploading, SyncTrigger::VersionRejected) == SyncState::Conflict);
    REQUIRE(transition(SyncState::Downloading, SyncTrigger::VersionRejected).is_err());
}

TEST_CASE("Recover returns transfer states to their pending state", "[sync_state]") {
    REQUIRE(next(SyncState::Uploading, SyncTrigger::Recover) == SyncState::PendingUpload);
    REQUIRE(next(SyncState::Downloading, SyncTrigger::Recover) == SyncState::PendingDownload);
    REQUIRE(next(SyncState::Synced, SyncTrigger::Recover) == SyncState::Synced);
}

TEST_CASE("Retry only applies to errored or pending uploads", "[sync_state]") {
    REQUIRE(next(SyncState::Error, SyncTrigger::Retry) == SyncState::PendingUpload);
    REQUIRE(transition(SyncState::Conflict, SyncTrigger::Retry).is_err());
}

TEST_CASE("Sync state names round-trip", "[sync_state]") {
    for (auto state : {SyncState::PendingUpload, SyncState::Uploading, SyncState::PendingDownload,
                       SyncState::Downloading, SyncState::Synced, SyncState::Conflict,
                       SyncState::PendingDeletion, SyncState::Error}) {
        REQUIRE(parse_sync_state(to_string(state)) == state);
    }
    REQUIRE(to_string(SyncState::PendingUpload) == "pending_upload");
    REQUIRE_FALSE(parse_sync_state("uploaded").has_value());
}

TEST_CASE("Unpushed changes", "[sync_state]") {
    REQUIRE(has_unpushed_changes(SyncState::PendingUpload));
    REQUIRE(has_unpushed_changes(SyncState::Uploading));
    REQUIRE(has_unpushed_changes(SyncState::PendingDeletion));
    REQUIRE_FALSE(has_unpushed_changes(SyncState::Synced));
    REQUIRE_FALSE(has_unpushed_changes(SyncState::PendingDownload));
    REQUIRE(is_transferring(SyncState::Downloading));
}
