#include "core/conflict.hpp"
#include "core/document_matcher.hpp"
#include "core/sync_id.hpp"

#include <algorithm>
#include <array>
#include <set>

namespace docsync {

namespace {

constexpr std::array<std::pair<ConflictType, std::string_view>, 3> kConflictTypeNames{{
    {ConflictType::VersionMismatch, "version_mismatch"},
    {ConflictType::ConcurrentModification, "concurrent_modification"},
    {ConflictType::DeletionConflict, "deletion_conflict"},
}};

constexpr std::array<std::pair<ResolutionStrategy, std::string_view>, 4> kStrategyNames{{
    {ResolutionStrategy::KeepLocal, "keep_local"},
    {ResolutionStrategy::KeepRemote, "keep_remote"},
    {ResolutionStrategy::Merge, "merge"},
    {ResolutionStrategy::Manual, "manual"},
}};

std::optional<std::string> merge_notes(const std::optional<std::string>& local,
                                       const std::optional<std::string>& remote) {
    if (local && remote) {
        if (*local == *remote) return local;
        return *local + std::string(kMergeSeparator) + *remote;
    }
    return local ? local : remote;
}

std::vector<std::string> union_refs(const std::vector<std::string>& local,
                                    const std::vector<std::string>& remote) {
    std::vector<std::string> out;
    std::set<std::string> seen;
    for (const auto* side : {&local, &remote}) {
        for (const auto& ref : *side) {
            if (seen.insert(ref).second) out.push_back(ref);
        }
    }
    return out;
}

// Common tail of every strategy: ids from the local copy, version above both
// sides, push base at the remote's version.
Document finish(Document doc, const Conflict& conflict, SyncState state, Timestamp now) {
    const auto& local = conflict.local_snapshot;
    const auto& remote = conflict.remote_snapshot;
    doc.local_id = local.local_id;
    doc.sync_id = local.sync_id;
    doc.user_id = local.user_id;
    doc.version = std::max(local.version, remote.version) + 1;
    doc.server_version = remote.version;
    doc.last_modified = now;
    doc.sync_state = state;
    doc.conflict_id.reset();
    doc.deleted = false;
    doc.deleted_at.reset();
    return doc;
}

} // namespace

std::string_view to_string(ConflictType type) noexcept {
    for (const auto& [t, name] : kConflictTypeNames) {
        if (t == type) return name;
    }
    return "version_mismatch";
}

std::optional<ConflictType> parse_conflict_type(std::string_view text) noexcept {
    for (const auto& [t, name] : kConflictTypeNames) {
        if (name == text) return t;
    }
    return std::nullopt;
}

std::string_view to_string(ResolutionStrategy strategy) noexcept {
    for (const auto& [s, name] : kStrategyNames) {
        if (s == strategy) return name;
    }
    return "manual";
}

std::optional<ResolutionStrategy> parse_resolution_strategy(std::string_view text) noexcept {
    for (const auto& [s, name] : kStrategyNames) {
        if (name == text) return s;
    }
    // Accept the camelCase spelling used by older settings files.
    if (text == "keepLocal") return ResolutionStrategy::KeepLocal;
    if (text == "keepRemote") return ResolutionStrategy::KeepRemote;
    return std::nullopt;
}

std::optional<ConflictType> detect_conflict(const Document& local, const Document& remote) {
    if (!local.has_sync_id() || !remote.has_sync_id() ||
        sync_id::normalize(*local.sync_id) != sync_id::normalize(*remote.sync_id)) {
        return std::nullopt;
    }

    if (local.version == remote.version) {
        if (local.title == remote.title && local.last_modified == remote.last_modified &&
            matcher::have_same_content(local, remote)) {
            return std::nullopt;
        }
        return ConflictType::VersionMismatch;
    }

    if (remote.last_modified > local.last_modified && remote.version <= local.version) {
        return ConflictType::ConcurrentModification;
    }
    return std::nullopt;
}

Document merge_documents(const Document& local, const Document& remote, Timestamp now) {
    Document merged = local;
    // Ties go to the remote title.
    merged.title = local.last_modified > remote.last_modified ? local.title : remote.title;
    merged.notes = merge_notes(local.notes, remote.notes);
    merged.attachment_refs = union_refs(local.attachment_refs, remote.attachment_refs);
    merged.created_at = std::min(local.created_at, remote.created_at);
    merged.renewal_date = local.renewal_date ? local.renewal_date : remote.renewal_date;
    merged.version = std::max(local.version, remote.version) + 1;
    merged.server_version = std::max(local.server_version, remote.version);
    merged.last_modified = now;
    merged.sync_state = SyncState::PendingUpload;
    merged.conflict_id.reset();
    merged.deleted = false;
    merged.deleted_at.reset();
    return merged;
}

std::vector<std::string> differing_fields(const Document& local, const Document& remote) {
    std::vector<std::string> fields;
    if (local.title != remote.title) fields.emplace_back("title");
    if (local.category != remote.category) fields.emplace_back("category");
    if (local.notes != remote.notes) fields.emplace_back("notes");
    if (local.attachment_refs != remote.attachment_refs) fields.emplace_back("attachment_refs");
    if (local.renewal_date != remote.renewal_date) fields.emplace_back("renewal_date");
    if (local.version != remote.version) fields.emplace_back("version");
    if (local.last_modified != remote.last_modified) fields.emplace_back("last_modified");
    if (local.deleted != remote.deleted) fields.emplace_back("deleted");
    return fields;
}

Conflict make_conflict(const Document& local,
                       const Document& remote,
                       ConflictType type,
                       Timestamp now) {
    return Conflict{
        .id = Uuid::generate().to_string(),
        .document_sync_id = local.sync_id ? sync_id::normalize(*local.sync_id) : std::string{},
        .local_snapshot = local,
        .remote_snapshot = remote,
        .type = type,
        .detected_at = now,
    };
}

ResolutionStrategy choose_auto_strategy(const Conflict& conflict, const AutoResolvePolicy& policy) {
    const auto delta = conflict.remote_snapshot.last_modified - conflict.local_snapshot.last_modified;
    if (delta > policy.remote_newer_threshold) return ResolutionStrategy::KeepRemote;
    if (-delta > policy.local_newer_threshold) return ResolutionStrategy::KeepLocal;
    return ResolutionStrategy::Merge;
}

Result<Resolution, Error> resolve_conflict(const Conflict& conflict,
                                           ResolutionStrategy strategy,
                                           const std::optional<Document>& manual_document,
                                           Timestamp now) {
    if (conflict.resolved) {
        return Result<Resolution, Error>::err(
            Error::validation("Conflict " + conflict.id + " is already resolved"));
    }

    const auto& local = conflict.local_snapshot;
    const auto& remote = conflict.remote_snapshot;
    const bool remote_deleted = remote.deleted;

    switch (strategy) {
        case ResolutionStrategy::KeepLocal:
            return Result<Resolution, Error>::ok(Resolution{
                .document = finish(local, conflict, SyncState::PendingUpload, now),
                .followup = ResolutionFollowup::PushUpdate,
            });

        case ResolutionStrategy::KeepRemote:
            if (remote_deleted) {
                auto doc = local;
                doc.conflict_id.reset();
                doc.sync_state = SyncState::PendingDeletion;
                return Result<Resolution, Error>::ok(Resolution{
                    .document = with_deleted(std::move(doc), now),
                    .followup = ResolutionFollowup::AcceptRemoteDeletion,
                });
            }
            return Result<Resolution, Error>::ok(Resolution{
                .document = finish(remote, conflict, SyncState::Synced, now),
                .followup = ResolutionFollowup::None,
            });

        case ResolutionStrategy::Merge: {
            // Nothing to merge from a deleted remote copy.
            auto merged = remote_deleted ? local : merge_documents(local, remote, now);
            return Result<Resolution, Error>::ok(Resolution{
                .document = finish(std::move(merged), conflict, SyncState::PendingUpload, now),
                .followup = ResolutionFollowup::PushUpdate,
            });
        }

        case ResolutionStrategy::Manual: {
            if (!manual_document) {
                return Result<Resolution, Error>::err(
                    Error::validation("Manual resolution requires a document"));
            }
            if (!manual_document->has_sync_id() ||
                sync_id::normalize(*manual_document->sync_id) != conflict.document_sync_id) {
                return Result<Resolution, Error>::err(Error::validation(
                    "Manual resolution document must keep sync id " + conflict.document_sync_id));
            }
            auto doc = finish(*manual_document, conflict, SyncState::PendingUpload, now);
            auto valid = validate(doc);
            if (valid.is_err()) {
                return propagate<Resolution>(valid);
            }
            return Result<Resolution, Error>::ok(Resolution{
                .document = std::move(doc),
                .followup = ResolutionFollowup::PushUpdate,
            });
        }
    }
    return Result<Resolution, Error>::err(Error{"Unknown resolution strategy"});
}

} // namespace docsync
