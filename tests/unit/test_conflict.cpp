#include <catch2/catch_test_macros.hpp>
#include "core/conflict.hpp"
#include "core/sync_id.hpp"

using namespace docsync;
using namespace std::chrono_literals;

namespace {

const Timestamp T1{1'700'000'000'000};
const Timestamp T2{1'700'000'300'000};
const Timestamp NOW{1'700'001'000'000};

struct Pair {
    Document local;
    Document remote;
};

// Local "Car Insurance" at T1 against remote "Auto Insurance" at T2 > T1,
// both at version 1.
Pair insurance_pair() {
    auto local = create_document("user-1", "Car Insurance", "insurance", T1);
    local.local_id = 3;
    auto remote = local;
    remote.local_id = 0;
    remote.title = "Auto Insurance";
    remote.last_modified = T2;
    remote.server_version = 1;
    remote.sync_state = SyncState::Synced;
    return {local, remote};
}

} // namespace

TEST_CASE("Same version, different content is a version mismatch", "[conflict]") {
    const auto [local, remote] = insurance_pair();
    REQUIRE(detect_conflict(local, remote) == ConflictType::VersionMismatch);
}

TEST_CASE("Copies differing only in notes are a version mismatch", "[conflict]") {
    auto [local, remote] = insurance_pair();
    remote.title = local.title;
    remote.last_modified = local.last_modified;
    local.notes = "Policy 4411, renews in March";
    remote.notes = "Policy 4411, renews in April";

    REQUIRE(detect_conflict(local, remote) == ConflictType::VersionMismatch);
    REQUIRE(detect_conflict(remote, local) == ConflictType::VersionMismatch);
    REQUIRE(differing_fields(local, remote) == std::vector<std::string>{"notes"});
}

TEST_CASE("Merge picks the later title and bumps the version", "[conflict]") {
    const auto [local, remote] = insurance_pair();
    const auto merged = merge_documents(local, remote, NOW);

    REQUIRE(merged.title == "Auto Insurance");
    REQUIRE(merged.version == 2);
    REQUIRE(merged.sync_state == SyncState::PendingUpload);
    REQUIRE(merged.last_modified == NOW);
}

TEST_CASE("Identical copies do not conflict", "[conflict]") {
    auto [local, remote] = insurance_pair();
    remote.title = local.title;
    remote.last_modified = local.last_modified;
    REQUIRE_FALSE(detect_conflict(local, remote).has_value());
}

TEST_CASE("Different documents never conflict", "[conflict]") {
    auto [local, remote] = insurance_pair();
    remote.sync_id = sync_id::generate();
    REQUIRE_FALSE(detect_conflict(local, remote).has_value());

    local.sync_id.reset();
    REQUIRE_FALSE(detect_conflict(local, remote).has_value());
}

TEST_CASE("A newer remote edit on an older version is concurrent", "[conflict]") {
    auto [local, remote] = insurance_pair();
    local.version = 3;
    remote.version = 2;
    REQUIRE(detect_conflict(local, remote) == ConflictType::ConcurrentModification);

    // A remote strictly ahead in version is a plain download.
    remote.version = 4;
    REQUIRE_FALSE(detect_conflict(local, remote).has_value());
}

TEST_CASE("Merge joins notes and unions attachments", "[conflict]") {
    auto [local, remote] = insurance_pair();
    local.notes = "policy 1";
    remote.notes = "policy 2";
    local.attachment_refs = {"k1", "k2"};
    remote.attachment_refs = {"k2", "k3"};
    remote.created_at = Timestamp(T1.millis() - 5000);

    const auto merged = merge_documents(local, remote, NOW);
    REQUIRE(*merged.notes == "policy 1" + std::string(kMergeSeparator) + "policy 2");
    REQUIRE(merged.attachment_refs == std::vector<std::string>{"k1", "k2", "k3"});
    REQUIRE(merged.created_at == remote.created_at);

    remote.notes = "policy 1";
    REQUIRE(*merge_documents(local, remote, NOW).notes == "policy 1");
}

TEST_CASE("differing_fields lists what changed", "[conflict]") {
    const auto [local, remote] = insurance_pair();
    const auto fields = differing_fields(local, remote);
    REQUIRE(fields == std::vector<std::string>{"title", "last_modified"});
}

TEST_CASE("Resolution strategies", "[conflict]") {
    const auto [local, remote] = insurance_pair();
    const auto conflict = make_conflict(local, remote, ConflictType::VersionMismatch, T2);

    SECTION("keep local pushes the local copy above both versions") {
        const auto r = resolve_conflict(conflict, ResolutionStrategy::KeepLocal, std::nullopt, NOW).unwrap();
        REQUIRE(r.followup == ResolutionFollowup::PushUpdate);
        REQUIRE(r.document.title == "Car Insurance");
        REQUIRE(r.document.version == 2);
        REQUIRE(r.document.server_version == 1);
        REQUIRE(r.document.local_id == 3);
        REQUIRE_FALSE(r.document.conflict_id.has_value());
    }
    SECTION("keep remote adopts remote content without a push") {
        const auto r = resolve_conflict(conflict, ResolutionStrategy::KeepRemote, std::nullopt, NOW).unwrap();
        REQUIRE(r.followup == ResolutionFollowup::None);
        REQUIRE(r.document.title == "Auto Insurance");
        REQUIRE(r.document.sync_state == SyncState::Synced);
        REQUIRE(r.document.local_id == 3);
    }
    SECTION("manual requires a document with the same sync id") {
        REQUIRE(resolve_conflict(conflict, ResolutionStrategy::Manual, std::nullopt, NOW).is_err());

        auto stranger = local;
        stranger.sync_id = sync_id::generate();
        REQUIRE(resolve_conflict(conflict, ResolutionStrategy::Manual, stranger, NOW).is_err());

        auto chosen = local;
        chosen.title = "Vehicle Insurance";
        const auto r = resolve_conflict(conflict, ResolutionStrategy::Manual, chosen, NOW).unwrap();
        REQUIRE(r.document.title == "Vehicle Insurance");
        REQUIRE(r.followup == ResolutionFollowup::PushUpdate);
    }
    SECTION("a resolved conflict cannot be resolved again") {
        auto closed = conflict;
        closed.resolved = true;
        REQUIRE(resolve_conflict(closed, ResolutionStrategy::Merge, std::nullopt, NOW).unwrap_err().kind ==
                ErrorKind::Validation);
    }
}

TEST_CASE("Deletion conflicts", "[conflict]") {
    auto [local, remote] = insurance_pair();
    remote = with_deleted(remote, T2);
    remote.version = 2;
    const auto conflict = make_conflict(local, remote, ConflictType::DeletionConflict, T2);

    const auto accept = resolve_conflict(conflict, ResolutionStrategy::KeepRemote, std::nullopt, NOW).unwrap();
    REQUIRE(accept.followup == ResolutionFollowup::AcceptRemoteDeletion);
    REQUIRE(accept.document.deleted);
    REQUIRE(accept.document.sync_state == SyncState::PendingDeletion);

    const auto revive = resolve_conflict(conflict, ResolutionStrategy::Merge, std::nullopt, NOW).unwrap();
    REQUIRE(revive.followup == ResolutionFollowup::PushUpdate);
    REQUIRE_FALSE(revive.document.deleted);
    REQUIRE(revive.document.title == "Car Insurance");
    REQUIRE(revive.document.version == 3);
    REQUIRE(revive.document.server_version == 2);
}

TEST_CASE("Auto-resolution thresholds", "[conflict]") {
    auto [local, remote] = insurance_pair();
    AutoResolvePolicy policy;

    remote.last_modified = T1 + std::chrono::milliseconds(2h);
    REQUIRE(choose_auto_strategy(make_conflict(local, remote, ConflictType::VersionMismatch, NOW), policy) ==
            ResolutionStrategy::KeepRemote);

    remote.last_modified = T1 - std::chrono::milliseconds(2h);
    REQUIRE(choose_auto_strategy(make_conflict(local, remote, ConflictType::VersionMismatch, NOW), policy) ==
            ResolutionStrategy::KeepLocal);

    remote.last_modified = T2;
    REQUIRE(choose_auto_strategy(make_conflict(local, remote, ConflictType::VersionMismatch, NOW), policy) ==
            ResolutionStrategy::Merge);
}

TEST_CASE("Conflict names", "[conflict]") {
    REQUIRE(to_string(ConflictType::DeletionConflict) == "deletion_conflict");
    REQUIRE(parse_resolution_strategy("keepRemote") == ResolutionStrategy::KeepRemote);
    REQUIRE(parse_resolution_strategy("keep_local") == ResolutionStrategy::KeepLocal);
    REQUIRE_FALSE(parse_resolution_strategy("newest").has_value());
}
