#include "core/document.hpp"
#include "core/sync_id.hpp"

#include <algorithm>
#include <cctype>
#include <set>

namespace docsync {

namespace {

std::string trimmed(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(),
                                  [](unsigned char c) { return std::isspace(c) != 0; });
    auto end = std::find_if_not(s.rbegin(), s.rend(),
                                [](unsigned char c) { return std::isspace(c) != 0; }).base();
    return begin < end ? std::string(begin, end) : std::string{};
}

std::vector<std::string> unique_refs(const std::vector<std::string>& refs) {
    std::vector<std::string> out;
    std::set<std::string> seen;
    for (const auto& raw : refs) {
        auto ref = trimmed(raw);
        if (ref.empty() || !seen.insert(ref).second) continue;
        out.push_back(std::move(ref));
    }
    return out;
}

} // namespace

Document create_document(std::string user_id,
                         std::string title,
                         std::string category,
                         Timestamp now) {
    return Document{
        .sync_id = sync_id::generate(),
        .user_id = std::move(user_id),
        .title = std::move(title),
        .category = std::move(category),
        .version = 1,
        .server_version = 0,
        .created_at = now,
        .last_modified = now,
        .sync_state = SyncState::PendingUpload,
    };
}

Result<void, Error> validate(const Document& doc) {
    if (doc.deleted != doc.deleted_at.has_value()) {
        return Result<void, Error>::err(
            Error::validation("deleted flag and deleted_at must be set together"));
    }
    if (doc.version < 0 || doc.server_version < 0) {
        return Result<void, Error>::err(Error::validation("version must be non-negative"));
    }
    if (doc.server_version > doc.version) {
        return Result<void, Error>::err(
            Error::validation("server_version cannot exceed version"));
    }
    if (doc.sync_id && !sync_id::is_valid(*doc.sync_id)) {
        return Result<void, Error>::err(
            Error::validation("Malformed sync id: '" + *doc.sync_id + "'"));
    }
    if (trimmed(doc.title).empty()) {
        return Result<void, Error>::err(Error::validation("title must not be empty"));
    }
    if (doc.sync_state == SyncState::Conflict && !doc.conflict_id) {
        return Result<void, Error>::err(
            Error::validation("document in conflict must reference its conflict"));
    }
    return Result<void, Error>::ok();
}

Result<DocumentPatch, Error> sanitize(DocumentPatch patch) {
    if (patch.title) {
        *patch.title = trimmed(*patch.title);
        if (patch.title->empty()) {
            return Result<DocumentPatch, Error>::err(Error::validation("title must not be empty"));
        }
        if (patch.title->size() > kMaxTitleLength) {
            return Result<DocumentPatch, Error>::err(Error::validation("title too long"));
        }
    }
    if (patch.category) {
        *patch.category = trimmed(*patch.category);
        if (patch.category->size() > kMaxCategoryLength) {
            return Result<DocumentPatch, Error>::err(Error::validation("category too long"));
        }
    }
    if (patch.notes && *patch.notes && trimmed(**patch.notes).empty()) {
        *patch.notes = std::nullopt;
    }
    if (patch.attachment_refs) {
        *patch.attachment_refs = unique_refs(*patch.attachment_refs);
    }
    return Result<DocumentPatch, Error>::ok(std::move(patch));
}

Result<Document, Error> apply_patch(Document doc, const DocumentPatch& patch, Timestamp now) {
    auto next = transition(doc.sync_state, SyncTrigger::LocalEdit);
    if (next.is_err()) {
        return propagate<Document>(next);
    }
    if (patch.empty()) {
        return Result<Document, Error>::ok(std::move(doc));
    }

    if (doc.sync_state == SyncState::Synced) {
        doc.version += 1;
    }
    if (patch.title) doc.title = *patch.title;
    if (patch.category) doc.category = *patch.category;
    if (patch.notes) doc.notes = *patch.notes;
    if (patch.attachment_refs) doc.attachment_refs = *patch.attachment_refs;
    if (patch.renewal_date) doc.renewal_date = *patch.renewal_date;
    doc.last_modified = now;
    doc.sync_state = next.unwrap();
    return Result<Document, Error>::ok(std::move(doc));
}

DocumentPatch diff(const Document& before, const Document& after) {
    DocumentPatch patch;
    if (before.title != after.title) patch.title = after.title;
    if (before.category != after.category) patch.category = after.category;
    if (before.notes != after.notes) patch.notes = after.notes;
    if (before.attachment_refs != after.attachment_refs) patch.attachment_refs = after.attachment_refs;
    if (before.renewal_date != after.renewal_date) patch.renewal_date = after.renewal_date;
    return patch;
}

Document with_deleted(Document doc, Timestamp now) {
    doc.deleted = true;
    doc.deleted_at = now;
    doc.last_modified = now;
    return doc;
}

Result<AttachmentTransfer, Error> transfer_need(const FileAttachment& attachment) {
    const bool uploaded = attachment.blob_key && !attachment.blob_key->empty();
    const bool local = attachment.local_ref && !attachment.local_ref->empty();
    if (!uploaded && !local) {
        return Result<AttachmentTransfer, Error>::err(Error::validation(
            "Attachment " + attachment.sync_id + " has neither a blob key nor a local file"));
    }
    if (uploaded && local) return Result<AttachmentTransfer, Error>::ok(AttachmentTransfer::Synced);
    return Result<AttachmentTransfer, Error>::ok(
        uploaded ? AttachmentTransfer::NeedsDownload : AttachmentTransfer::NeedsUpload);
}

std::string attachment_blob_key(const FileAttachment& attachment) {
    return "documents/" + attachment.document_sync_id + "/" + attachment.sync_id + "-" +
           attachment.file_name;
}

} // namespace docsync
