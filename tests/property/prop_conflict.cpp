#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "core/conflict.hpp"
#include "core/document_matcher.hpp"
#include "generators.hpp"

#include <algorithm>
#include <set>

using namespace docsync;
using docsync::testing::document_for;

namespace {

const std::string kSyncId = "1f0e2d3c-4b5a-4968-8776-a5b4c3d2e1f0";
const Timestamp kNow{docsync::testing::kEpochMs + 20'000'000};

} // namespace

TEST_CASE("Property: merge lands above both versions", "[property][conflict]") {
    rc::check("merged version exceeds both sides and stays pushable",
        [] {
            const auto local = *document_for(kSyncId);
            const auto remote = *document_for(kSyncId);
            const auto merged = merge_documents(local, remote, kNow);

            RC_ASSERT(merged.version > local.version);
            RC_ASSERT(merged.version > remote.version);
            RC_ASSERT(merged.server_version <= merged.version);
            RC_ASSERT(merged.sync_id == local.sync_id);
            RC_ASSERT(merged.sync_state == SyncState::PendingUpload);
            RC_ASSERT(validate(merged).is_ok());
        });
}

TEST_CASE("Property: merge keeps every attachment exactly once", "[property][conflict]") {
    rc::check("attachment refs are the union of both sides",
        [] {
            const auto local = *document_for(kSyncId);
            const auto remote = *document_for(kSyncId);
            const auto merged = merge_documents(local, remote, kNow);

            std::set<std::string> expected(local.attachment_refs.begin(), local.attachment_refs.end());
            expected.insert(remote.attachment_refs.begin(), remote.attachment_refs.end());
            const std::set<std::string> actual(merged.attachment_refs.begin(), merged.attachment_refs.end());

            RC_ASSERT(actual == expected);
            RC_ASSERT(merged.attachment_refs.size() == expected.size());
        });
}

TEST_CASE("Property: merged content does not depend on argument order", "[property][conflict]") {
    rc::check("same attachments and title either way round when timestamps differ",
        [] {
            const auto a = *document_for(kSyncId);
            const auto b = *document_for(kSyncId);
            RC_PRE(a.last_modified != b.last_modified);

            const auto ab = merge_documents(a, b, kNow);
            const auto ba = merge_documents(b, a, kNow);
            RC_ASSERT(ab.title == ba.title);
            RC_ASSERT(ab.version == ba.version);

            auto refs_ab = ab.attachment_refs;
            auto refs_ba = ba.attachment_refs;
            std::sort(refs_ab.begin(), refs_ab.end());
            std::sort(refs_ba.begin(), refs_ba.end());
            RC_ASSERT(refs_ab == refs_ba);
        });
}

TEST_CASE("Property: equal versions conflict symmetrically", "[property][conflict]") {
    rc::check("detect(a, b) is a conflict iff detect(b, a) is",
        [] {
            const auto a = *document_for(kSyncId);
            auto b = *document_for(kSyncId);
            b.version = a.version;

            RC_ASSERT(detect_conflict(a, b).has_value() == detect_conflict(b, a).has_value());
        });
}

TEST_CASE("Property: equal versions that differ in notes conflict", "[property][conflict]") {
    rc::check("notes alone decide a version mismatch",
        [] {
            const auto a = *document_for(kSyncId);
            const auto notes = *rc::gen::arbitrary<std::string>();
            const auto other = *rc::gen::arbitrary<std::string>();
            RC_PRE(notes != other);

            auto local = a;
            local.notes = notes;
            auto remote = a;
            remote.notes = other;

            RC_ASSERT(detect_conflict(local, remote) == ConflictType::VersionMismatch);
            RC_ASSERT(detect_conflict(remote, local) == ConflictType::VersionMismatch);
        });
}

TEST_CASE("Property: a document never conflicts with itself", "[property][conflict]") {
    rc::check("detect(a, a) is none",
        [] {
            const auto a = *document_for(kSyncId);
            RC_ASSERT(!detect_conflict(a, a).has_value());
        });
}

TEST_CASE("Property: every resolution ends above both sides", "[property][conflict]") {
    rc::check("non-manual strategies end above both versions or accept the deletion",
        [] {
            const auto local = *document_for(kSyncId);
            auto remote = *document_for(kSyncId);
            if (*rc::gen::arbitrary<bool>()) {
                remote = with_deleted(remote, remote.last_modified);
            }
            const auto strategy = *rc::gen::element(ResolutionStrategy::KeepLocal,
                                                    ResolutionStrategy::KeepRemote,
                                                    ResolutionStrategy::Merge);
            const auto conflict = make_conflict(local, remote, ConflictType::VersionMismatch, kNow);

            const auto resolved = resolve_conflict(conflict, strategy, std::nullopt, kNow);
            RC_ASSERT(resolved.is_ok());
            const auto& doc = resolved.unwrap().document;
            if (resolved.unwrap().followup == ResolutionFollowup::AcceptRemoteDeletion) {
                RC_ASSERT(doc.deleted);
                RC_ASSERT(doc.sync_state == SyncState::PendingDeletion);
                return;
            }
            RC_ASSERT(doc.version > std::max(local.version, remote.version));
            RC_ASSERT(doc.sync_id == local.sync_id);
            RC_ASSERT(!doc.conflict_id.has_value());
        });
}

TEST_CASE("Property: content hash ignores attachment order and bookkeeping", "[property][matcher]") {
    rc::check("shuffled refs and different versions hash the same",
        [] {
            const auto doc = *document_for(kSyncId);
            auto other = doc;
            std::reverse(other.attachment_refs.begin(), other.attachment_refs.end());
            other.version = doc.version + 3;
            other.server_version = 0;
            other.sync_id = "a3bb189e-8bf9-4888-9912-ace4e6543002";
            other.sync_state = SyncState::PendingUpload;
            other.last_modified = kNow;

            RC_ASSERT(matcher::content_hash(doc) == matcher::content_hash(other));
            RC_ASSERT(matcher::have_same_content(doc, other));
        });
}
