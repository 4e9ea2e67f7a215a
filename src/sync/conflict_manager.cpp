#include "sync/conflict_manager.hpp"
#include "core/sync_id.hpp"
#include "sync/sync_log.hpp"

namespace docsync::sync {

Result<Conflict, Error> ConflictManager::register_conflict(const Document& local,
                                                           const Document& remote,
                                                           ConflictType type) {
    if (!local.has_sync_id()) {
        return Result<Conflict, Error>::err(
            Error::validation("Conflicts require a document with a sync id"));
    }
    const auto id = sync_id::normalize(*local.sync_id);

    auto existing = store_.open_conflict_for(id);
    if (existing.is_err()) return propagate<Conflict>(existing);

    Conflict conflict;
    if (existing.unwrap()) {
        conflict = *existing.unwrap();
        conflict.local_snapshot = local;
        conflict.remote_snapshot = remote;
        conflict.type = type;
    } else {
        conflict = make_conflict(local, remote, type, clock_());
    }

    auto saved = store_.save_conflict(conflict);
    if (saved.is_err()) return propagate<Conflict>(saved);

    qCInfo(docsyncConflictLog) << "Conflict" << QString::fromStdString(conflict.id)
                               << to_string(type).data() << "on" << QString::fromStdString(id);
    return Result<Conflict, Error>::ok(std::move(conflict));
}

Result<std::optional<Conflict>, Error> ConflictManager::find(const std::string& conflict_id) {
    return store_.conflict(conflict_id);
}

Result<std::optional<Conflict>, Error> ConflictManager::open_for(const std::string& document_sync_id) {
    return store_.open_conflict_for(sync_id::normalize(document_sync_id));
}

Result<std::vector<Conflict>, Error> ConflictManager::unresolved() {
    return store_.open_conflicts();
}

Result<Conflict, Error> ConflictManager::require_open(const std::string& conflict_id) {
    auto found = store_.conflict(conflict_id);
    if (found.is_err()) return propagate<Conflict>(found);
    if (!found.unwrap()) {
        return Result<Conflict, Error>::err(Error::not_found("No conflict with id " + conflict_id));
    }
    return Result<Conflict, Error>::ok(*found.unwrap());
}

Result<ConflictManager::Prepared, Error> ConflictManager::prepare_resolution(
    const std::string& conflict_id,
    ResolutionStrategy strategy,
    const std::optional<Document>& manual_document) {
    auto conflict = require_open(conflict_id);
    if (conflict.is_err()) return propagate<Prepared>(conflict);

    auto resolution = resolve_conflict(conflict.unwrap(), strategy, manual_document, clock_());
    if (resolution.is_err()) return propagate<Prepared>(resolution);

    return Result<Prepared, Error>::ok(Prepared{
        .conflict = std::move(conflict).unwrap(),
        .strategy = strategy,
        .resolution = std::move(resolution).unwrap(),
    });
}

Result<ConflictManager::Prepared, Error> ConflictManager::prepare_auto_resolution(const std::string& conflict_id) {
    auto conflict = require_open(conflict_id);
    if (conflict.is_err()) return propagate<Prepared>(conflict);
    const auto strategy = choose_auto_strategy(conflict.unwrap(), policy_);
    qCDebug(docsyncConflictLog) << "Auto-resolving" << QString::fromStdString(conflict_id)
                                << "with" << to_string(strategy).data();
    return prepare_resolution(conflict_id, strategy);
}

Result<void, Error> ConflictManager::mark_resolved(const Prepared& prepared) {
    auto closed = prepared.conflict;
    closed.resolved = true;
    closed.resolution_strategy = prepared.strategy;
    closed.resolved_at = clock_();
    return store_.save_conflict(closed);
}

Result<int, Error> ConflictManager::purge_resolved() {
    return store_.purge_resolved_conflicts_before(clock_() - resolved_retention_);
}

} // namespace docsync::sync
