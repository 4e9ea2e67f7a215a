#include <catch2/catch_test_macros.hpp>
#include "core/document.hpp"
#include "core/sync_id.hpp"

using namespace docsync;

namespace {

const Timestamp T0{1'700'000'000'000};
const Timestamp T1{1'700'000'060'000};

Document synced_document() {
    auto doc = create_document("user-1", "Car Insurance", "insurance", T0);
    doc.local_id = 7;
    doc.server_version = 1;
    doc.sync_state = SyncState::Synced;
    return doc;
}

} // namespace

TEST_CASE("New documents start at version 1 with a fresh sync id", "[document]") {
    const auto doc = create_document("user-1", "Passport", "identity", T0);

    REQUIRE(doc.has_sync_id());
    REQUIRE(sync_id::is_valid(*doc.sync_id));
    REQUIRE(doc.version == 1);
    REQUIRE(doc.server_version == 0);
    REQUIRE(doc.sync_state == SyncState::PendingUpload);
    REQUIRE(doc.created_at == T0);
    REQUIRE(validate(doc).is_ok());
}

TEST_CASE("Document validation", "[document]") {
    auto doc = synced_document();

    SECTION("server_version above version") {
        doc.server_version = 3;
        REQUIRE(validate(doc).unwrap_err().kind == ErrorKind::Validation);
    }
    SECTION("deleted without deleted_at") {
        doc.deleted = true;
        REQUIRE(validate(doc).is_err());
    }
    SECTION("malformed sync id") {
        doc.sync_id = "not-a-uuid";
        REQUIRE(validate(doc).is_err());
    }
    SECTION("blank title") {
        doc.title = "   ";
        REQUIRE(validate(doc).is_err());
    }
    SECTION("conflict without a conflict id") {
        doc.sync_state = SyncState::Conflict;
        REQUIRE(validate(doc).is_err());
        doc.conflict_id = "c-1";
        REQUIRE(validate(doc).is_ok());
    }
    SECTION("legacy documents may lack a sync id") {
        doc.sync_id.reset();
        REQUIRE(validate(doc).is_ok());
    }
}

TEST_CASE("Sanitize trims and deduplicates", "[document]") {
    DocumentPatch patch;
    patch.title = "  Home Insurance \t";
    patch.notes.emplace("   ");
    patch.attachment_refs = std::vector<std::string>{"a", "", "b", "a"};

    const auto clean = sanitize(patch).unwrap();
    REQUIRE(*clean.title == "Home Insurance");
    REQUIRE_FALSE(clean.notes->has_value());
    REQUIRE(*clean.attachment_refs == std::vector<std::string>{"a", "b"});
}

TEST_CASE("Sanitize rejects empty and oversized titles", "[document]") {
    DocumentPatch empty;
    empty.title = "   ";
    REQUIRE(sanitize(empty).unwrap_err().kind == ErrorKind::Validation);

    DocumentPatch oversized;
    oversized.title = std::string(kMaxTitleLength + 1, 'x');
    REQUIRE(sanitize(oversized).is_err());
}

TEST_CASE("Editing a synced document bumps its version once", "[document]") {
    DocumentPatch patch;
    patch.title = "Auto Insurance";

    const auto edited = apply_patch(synced_document(), patch, T1).unwrap();
    REQUIRE(edited.version == 2);
    REQUIRE(edited.server_version == 1);
    REQUIRE(edited.sync_state == SyncState::PendingUpload);
    REQUIRE(edited.last_modified == T1);

    // Still pending: the next edit rides on the same version.
    patch.title = "Auto Insurance 2024";
    const auto again = apply_patch(edited, patch, T1).unwrap();
    REQUIRE(again.version == 2);
}

TEST_CASE("Patches are refused while in conflict or pending deletion", "[document]") {
    DocumentPatch patch;
    patch.title = "x";

    auto doc = synced_document();
    doc.sync_state = SyncState::PendingDeletion;
    REQUIRE(apply_patch(doc, patch, T1).is_err());
}

TEST_CASE("diff reports only changed content fields", "[document]") {
    const auto before = synced_document();
    auto after = before;
    after.notes = "policy 1234";
    after.version = 5;

    const auto patch = diff(before, after);
    REQUIRE_FALSE(patch.title.has_value());
    REQUIRE(patch.notes.has_value());
    REQUIRE(**patch.notes == "policy 1234");
    REQUIRE(patch == diff(before, apply_patch(before, patch, T1).unwrap()));
}

TEST_CASE("with_deleted stamps deletion time", "[document]") {
    const auto deleted = with_deleted(synced_document(), T1);
    REQUIRE(deleted.deleted);
    REQUIRE(deleted.deleted_at == T1);
    REQUIRE(deleted.last_modified == T1);
    REQUIRE(validate(deleted).is_ok());
}

TEST_CASE("Attachment transfer direction", "[document][attachment]") {
    FileAttachment a{.sync_id = "att-1", .document_sync_id = "doc-1", .file_name = "scan.pdf"};

    REQUIRE(transfer_need(a).is_err());

    a.local_ref = "/tmp/scan.pdf";
    REQUIRE(transfer_need(a).unwrap() == AttachmentTransfer::NeedsUpload);

    a.blob_key = attachment_blob_key(a);
    REQUIRE(*a.blob_key == "documents/doc-1/att-1-scan.pdf");
    REQUIRE(transfer_need(a).unwrap() == AttachmentTransfer::Synced);

    a.local_ref.reset();
    REQUIRE(transfer_need(a).unwrap() == AttachmentTransfer::NeedsDownload);
}
