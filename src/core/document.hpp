#pragma once

#include "core/result.hpp"
#include "core/sync_state.hpp"
#include "core/types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace docsync {

/**
 * Document - a user record kept in sync between the local store and the
 * remote document service.
 *
 * Versioning: `version` is the version this copy proposes. A local edit
 * of a synced copy bumps it once; further edits before the push do not.
 * `server_version` is the remote version the copy is based on (0 until the
 * remote first acknowledges it); the remote accepts an update only when
 * its stored version equals `server_version`.
 */
struct Document {
    std::int64_t local_id{0};                 // store row id, 0 = not persisted
    std::optional<std::string> sync_id;       // absent only for legacy rows
    std::string user_id;
    std::string title;
    std::string category;
    std::optional<std::string> notes;
    std::vector<std::string> attachment_refs; // opaque blob keys
    std::optional<Timestamp> renewal_date;
    std::int64_t version{0};
    std::int64_t server_version{0};
    Timestamp created_at;
    Timestamp last_modified;
    SyncState sync_state{SyncState::PendingUpload};
    std::optional<std::string> conflict_id;
    bool deleted{false};
    std::optional<Timestamp> deleted_at;

    [[nodiscard]] bool has_sync_id() const { return sync_id.has_value() && !sync_id->empty(); }

    bool operator==(const Document&) const = default;
};

/**
 * DocumentPatch - typed partial update, one optional per mutable field.
 * A nested optional distinguishes "leave alone" from "clear".
 */
struct DocumentPatch {
    std::optional<std::string> title;
    std::optional<std::string> category;
    std::optional<std::optional<std::string>> notes;
    std::optional<std::vector<std::string>> attachment_refs;
    std::optional<std::optional<Timestamp>> renewal_date;

    [[nodiscard]] bool empty() const {
        return !title && !category && !notes && !attachment_refs && !renewal_date;
    }

    bool operator==(const DocumentPatch&) const = default;
};

/**
 * FileAttachment - one file belonging to a document.
 * Valid only when at least one of blob_key / local_ref is set.
 */
struct FileAttachment {
    std::string sync_id;
    std::string document_sync_id;
    std::string file_name;
    std::optional<std::string> blob_key;
    std::optional<std::string> local_ref;
    std::int64_t file_size{0};
    std::optional<std::string> checksum;
    SyncState sync_state{SyncState::PendingUpload};

    bool operator==(const FileAttachment&) const = default;
};

enum class AttachmentTransfer {
    NeedsUpload,
    NeedsDownload,
    Synced
};

inline constexpr size_t kMaxTitleLength = 512;
inline constexpr size_t kMaxCategoryLength = 128;

// ============================================================================
// Pure transformation functions
// ============================================================================

/**
 * Create a new local document: fresh sync id, version 1, pending upload.
 */
[[nodiscard]] Document create_document(std::string user_id,
                                       std::string title,
                                       std::string category,
                                       Timestamp now);

/**
 * Check the structural invariants of a document.
 */
[[nodiscard]] Result<void, Error> validate(const Document& doc);

/**
 * Trim text fields, reject empty or oversized titles, drop empty and
 * duplicate attachment refs.
 */
[[nodiscard]] Result<DocumentPatch, Error> sanitize(DocumentPatch patch);

/**
 * Apply a sanitized patch as a local edit. Bumps the version when the
 * document was synced, moves it to PendingUpload and stamps last_modified.
 * Fails for documents in conflict or pending deletion.
 */
[[nodiscard]] Result<Document, Error> apply_patch(Document doc,
                                                  const DocumentPatch& patch,
                                                  Timestamp now);

/**
 * The patch that turns `before` into `after` (content fields only).
 */
[[nodiscard]] DocumentPatch diff(const Document& before, const Document& after);

/**
 * Mark deleted (sets deleted_at). Leaves sync_state to the caller.
 */
[[nodiscard]] Document with_deleted(Document doc, Timestamp now);

[[nodiscard]] Result<AttachmentTransfer, Error> transfer_need(const FileAttachment& attachment);

/**
 * Destination key for an attachment upload.
 */
[[nodiscard]] std::string attachment_blob_key(const FileAttachment& attachment);

} // namespace docsync
