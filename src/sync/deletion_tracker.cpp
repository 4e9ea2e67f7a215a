#include "sync/deletion_tracker.hpp"
#include "core/sync_id.hpp"
#include "sync/sync_log.hpp"

namespace docsync::sync {

Result<DeletionTracker::Marked, Error> DeletionTracker::mark_for_deletion(const Document& doc,
                                                                          const std::string& deleted_by,
                                                                          const std::string& reason) {
    if (doc.user_id.empty()) {
        return Result<Marked, Error>::err(Error::validation("Cannot delete a document without a user id"));
    }
    if (deleted_by.empty()) {
        return Result<Marked, Error>::err(Error::validation("Deletion requires the deleting user"));
    }

    const auto now = clock_();

    if (!doc.has_sync_id()) {
        qCInfo(docsyncDeletionLog) << "Removing identity-less document" << doc.local_id
                                   << "without a tombstone";
        if (doc.local_id != 0) {
            auto removed = store_.remove_document(doc.local_id);
            if (removed.is_err()) return propagate<Marked>(removed);
        }
        return Result<Marked, Error>::ok(Marked{
            .outcome = MarkOutcome::RemovedLocally,
            .document = with_deleted(doc, now),
            .tombstone_created = false,
        });
    }

    const auto id = sync_id::normalize(*doc.sync_id);
    auto created = store_.insert_tombstone_if_absent(storage::Tombstone{
        .sync_id = id,
        .user_id = doc.user_id,
        .deleted_by = deleted_by,
        .deleted_at = now,
        .reason = reason,
    });
    if (created.is_err()) return propagate<Marked>(created);

    // Mark the stored row; a copy without local_id must not insert a second one.
    auto found = doc.local_id != 0 ? store_.document_by_local_id(doc.local_id)
                                   : store_.document_by_sync_id(id);
    if (found.is_err()) return propagate<Marked>(found);
    const Document& base = found.unwrap() ? *found.unwrap() : doc;

    auto state = transition(base.sync_state, SyncTrigger::Delete);
    if (state.is_err()) return propagate<Marked>(state);

    auto closed = close_open_conflict(id, now);
    if (closed.is_err()) return propagate<Marked>(closed);

    auto pending = base.deleted ? base : with_deleted(base, now);
    pending.sync_id = id;
    pending.sync_state = state.unwrap();
    pending.conflict_id.reset();

    auto saved = store_.save_document(pending);
    if (saved.is_err()) return propagate<Marked>(saved);

    qCDebug(docsyncDeletionLog) << "Marked" << QString::fromStdString(id) << "for deletion"
                                << (created.unwrap() ? "(new tombstone)" : "(tombstone existed)");
    return Result<Marked, Error>::ok(Marked{
        .outcome = MarkOutcome::Tombstoned,
        .document = std::move(saved).unwrap(),
        .tombstone_created = created.unwrap(),
        .closed_conflict_id = std::move(closed).unwrap(),
    });
}

// The deletion settles an open conflict in favour of the local side.
Result<std::optional<std::string>, Error> DeletionTracker::close_open_conflict(const std::string& sync_id,
                                                                               Timestamp now) {
    auto open = store_.open_conflict_for(sync_id);
    if (open.is_err()) return propagate<std::optional<std::string>>(open);
    if (!open.unwrap()) return Result<std::optional<std::string>, Error>::ok(std::nullopt);

    auto conflict = *open.unwrap();
    conflict.resolved = true;
    conflict.resolution_strategy = ResolutionStrategy::KeepLocal;
    conflict.resolved_at = now;
    auto saved = store_.save_conflict(conflict);
    if (saved.is_err()) return propagate<std::optional<std::string>>(saved);

    qCInfo(docsyncDeletionLog) << "Conflict" << QString::fromStdString(conflict.id)
                               << "closed by deleting" << QString::fromStdString(sync_id);
    return Result<std::optional<std::string>, Error>::ok(conflict.id);
}

Result<bool, Error> DeletionTracker::is_tombstoned(const std::string& sync_id) {
    if (sync_id.empty()) return Result<bool, Error>::ok(false);
    auto found = store_.tombstone(sync_id);
    if (found.is_err()) return propagate<bool>(found);
    return Result<bool, Error>::ok(found.unwrap().has_value());
}

Result<std::vector<Document>, Error> DeletionTracker::filter_tombstoned(const std::vector<Document>& docs) {
    std::vector<Document> kept;
    kept.reserve(docs.size());
    for (const auto& doc : docs) {
        if (doc.has_sync_id()) {
            auto tombstoned = is_tombstoned(*doc.sync_id);
            if (tombstoned.is_err()) return propagate<std::vector<Document>>(tombstoned);
            if (tombstoned.unwrap()) continue;
        }
        kept.push_back(doc);
    }
    return Result<std::vector<Document>, Error>::ok(std::move(kept));
}

Result<bool, Error> DeletionTracker::accept_incoming(const Document& remote) {
    if (!remote.has_sync_id()) {
        return Result<bool, Error>::err(Error::validation("Remote document without a sync id"));
    }
    auto tombstoned = is_tombstoned(*remote.sync_id);
    if (tombstoned.is_err()) return propagate<bool>(tombstoned);
    if (tombstoned.unwrap()) {
        qCDebug(docsyncDeletionLog) << "Discarding incoming copy of tombstoned"
                                    << QString::fromStdString(*remote.sync_id);
        return Result<bool, Error>::ok(false);
    }
    return Result<bool, Error>::ok(true);
}

Result<void, Error> DeletionTracker::complete_deletion(const Document& doc) {
    if (doc.has_sync_id()) {
        auto attachments = store_.remove_attachments_for(sync_id::normalize(*doc.sync_id));
        if (attachments.is_err()) return propagate<void>(attachments);
    }
    if (doc.local_id != 0) {
        auto removed = store_.remove_document(doc.local_id);
        if (removed.is_err()) return propagate<void>(removed);
    }
    return Result<void, Error>::ok();
}

Result<bool, Error> DeletionTracker::record_remote_deletion(const Document& doc) {
    if (!doc.has_sync_id()) {
        return Result<bool, Error>::err(Error::validation("Remote deletion without a sync id"));
    }
    return store_.insert_tombstone_if_absent(storage::Tombstone{
        .sync_id = sync_id::normalize(*doc.sync_id),
        .user_id = doc.user_id,
        .deleted_by = doc.user_id,
        .deleted_at = doc.deleted_at.value_or(clock_()),
        .reason = "remote",
    });
}

Result<int, Error> DeletionTracker::purge_expired() {
    const auto cutoff = clock_() - retention_;
    auto purged = store_.purge_tombstones_before(cutoff);
    if (purged.is_ok() && purged.unwrap() > 0) {
        qCInfo(docsyncDeletionLog) << "Purged" << purged.unwrap() << "expired tombstones";
    }
    return purged;
}

Result<std::vector<storage::Tombstone>, Error> DeletionTracker::tombstones_for_user(const std::string& user_id) {
    return store_.tombstones_for_user(user_id);
}

} // namespace docsync::sync
