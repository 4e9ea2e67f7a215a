#include "sync/sync_coordinator.hpp"
#include "core/document_matcher.hpp"
#include "core/sync_id.hpp"
#include "sync/sync_log.hpp"

#include <QTimer>
#include <algorithm>

namespace docsync::sync {

namespace {

constexpr int kMaxDeleteRebases = 3;
constexpr std::chrono::hours kSweepInterval{24};

QString q(const std::string& s) {
    return QString::fromStdString(s);
}

QString q(std::string_view s) {
    return QString::fromUtf8(s.data(), static_cast<qsizetype>(s.size()));
}

OperationKind push_kind(const Document& doc) {
    return doc.server_version == 0 ? OperationKind::Upload : OperationKind::Update;
}

std::string file_name_from_key(const std::string& key) {
    const auto slash = key.find_last_of('/');
    return slash == std::string::npos ? key : key.substr(slash + 1);
}

// A synced copy may sit above its server version after adopting the remote
// side of a conflict; only a failed push still holds an edit.
bool has_local_changes(const Document& doc) {
    if (has_unpushed_changes(doc.sync_state)) return true;
    return doc.sync_state == SyncState::Error && doc.version > doc.server_version;
}

} // namespace

bool SyncCoordinator::GateSnapshot::allowsSync() const {
    if (paused || !is_online(connectivity)) return false;
    return !wifi_only || connectivity != Connectivity::Cellular;
}

SyncCoordinator::SyncCoordinator(storage::LocalStore& store,
                                 RemoteDocumentService& remote,
                                 BlobStore& blobs,
                                 AuthProvider& auth,
                                 ConnectivityMonitor* connectivity,
                                 SyncSettings settings,
                                 Clock clock,
                                 QObject* parent)
    : QObject(parent)
    , store_(store)
    , remote_(remote)
    , blobs_(blobs)
    , auth_(auth)
    , connectivity_(connectivity)
    , settings_(std::move(settings))
    , clock_(std::move(clock))
    , retry_(settings_.retry)
    , deletions_(store_, clock_, settings_.tombstone_retention)
    , conflicts_(store_, clock_, settings_.auto_resolve_policy, settings_.resolved_conflict_retention)
    , debounce_timer_(std::make_unique<QTimer>(this))
    , periodic_timer_(std::make_unique<QTimer>(this))
    , backoff_timer_(std::make_unique<QTimer>(this)) {
    qRegisterMetaType<SyncEvent>();
    qRegisterMetaType<Connectivity>();

    debounce_timer_->setSingleShot(true);
    debounce_timer_->setInterval(settings_.debounce);
    connect(debounce_timer_.get(), &QTimer::timeout, this, &SyncCoordinator::runCycle);

    periodic_timer_->setInterval(settings_.periodic_interval);
    connect(periodic_timer_.get(), &QTimer::timeout, this, &SyncCoordinator::requestSync);

    backoff_timer_->setSingleShot(true);
    connect(backoff_timer_.get(), &QTimer::timeout, this, &SyncCoordinator::requestSync);

    if (connectivity_) {
        connect(connectivity_, &ConnectivityMonitor::changed,
                this, &SyncCoordinator::onConnectivityChanged);
    }
}

SyncCoordinator::~SyncCoordinator() = default;

// ============================================================================
// Lifecycle
// ============================================================================

Result<void, Error> SyncCoordinator::restore() {
    auto queued = store_.queued_operations();
    if (queued.is_err()) return propagate<void>(queued);
    queue_.clear();
    for (auto& op : queued.unwrap()) {
        queue_.enqueue(std::move(op));
    }

    auto records = store_.retry_records();
    if (records.is_err()) return propagate<void>(records);
    retry_.restore(records.unwrap());

    auto recovered = recoverTransientStates();
    if (recovered.is_err()) return recovered;

    restored_ = true;
    qCInfo(docsyncSyncLog) << "Restored" << queue_.size() << "queued operations and"
                           << records.unwrap().size() << "retry records";
    return Result<void, Error>::ok();
}

Result<void, Error> SyncCoordinator::ensureRestored() {
    if (restored_) return Result<void, Error>::ok();
    return restore();
}

Result<void, Error> SyncCoordinator::recoverTransientStates() {
    for (const auto state : {SyncState::Uploading, SyncState::Downloading}) {
        auto stuck = store_.documents_in_state(state);
        if (stuck.is_err()) return propagate<void>(stuck);
        for (const auto& doc : stuck.unwrap()) {
            auto recovered = saveState(doc, SyncTrigger::Recover);
            if (recovered.is_err()) return propagate<void>(recovered);
            qCInfo(docsyncSyncLog) << "Recovered" << q(doc.sync_id.value_or(""))
                                   << "from" << q(to_string(state));
        }
    }

    // Unpushed work whose queue entry was lost between the document write
    // and the queue write.
    bool added = false;
    for (const auto state : {SyncState::PendingUpload, SyncState::PendingDeletion}) {
        auto pending = store_.documents_in_state(state);
        if (pending.is_err()) return propagate<void>(pending);
        for (const auto& doc : pending.unwrap()) {
            if (!doc.has_sync_id() || queue_.contains_document(*doc.sync_id)) continue;
            const auto kind = state == SyncState::PendingDeletion ? OperationKind::Delete : push_kind(doc);
            queue_.enqueue(make_operation(doc, kind, clock_()));
            added = true;
        }
    }
    if (added) {
        return store_.save_queue(queue_.snapshot());
    }
    return Result<void, Error>::ok();
}

Result<void, Error> SyncCoordinator::start() {
    if (running_) return Result<void, Error>::ok();
    auto restored = ensureRestored();
    if (restored.is_err()) return restored;

    running_ = true;
    gate_.invalidate();
    periodic_timer_->start();
    qCInfo(docsyncSyncLog) << "Sync started; debounce" << settings_.debounce.count()
                           << "ms, interval" << settings_.periodic_interval.count() << "ms";
    requestSync();
    return Result<void, Error>::ok();
}

void SyncCoordinator::stop() {
    if (!running_) return;
    running_ = false;
    debounce_timer_->stop();
    periodic_timer_->stop();
    backoff_timer_->stop();
    qCInfo(docsyncSyncLog) << "Sync stopped";
}

void SyncCoordinator::setPaused(bool paused) {
    settings_.paused = paused;
    gate_.invalidate();
    if (!paused) requestSync();
}

void SyncCoordinator::requestSync() {
    if (!running_) return;
    // Restarting the single-shot timer folds bursts of triggers into one cycle.
    debounce_timer_->start();
}

void SyncCoordinator::syncNow() {
    debounce_timer_->stop();
    runCycle();
}

void SyncCoordinator::onConnectivityChanged(Connectivity connectivity) {
    gate_.invalidate();
    qCDebug(docsyncSyncLog) << "Connectivity now" << q(to_string(connectivity));
    if (is_online(connectivity)) {
        requestSync();
    }
}

bool SyncCoordinator::gateAllowsSync() {
    const auto now = clock_();
    if (gate_.is_stale(now, settings_.gate_cache_ttl)) {
        gate_.refresh(GateSnapshot{
            .paused = settings_.paused,
            .wifi_only = settings_.wifi_only,
            .connectivity = connectivity_ ? connectivity_->current() : Connectivity::Ethernet,
        }, now);
    }
    return gate_.value->allowsSync();
}

SyncStatus SyncCoordinator::syncStatus() const {
    return SyncStatus{
        .is_syncing = cycle_running_,
        .pending_count = static_cast<int>(queue_.size()),
        .last_sync_time = last_sync_time_,
    };
}

// ============================================================================
// Cycle
// ============================================================================

void SyncCoordinator::runCycle() {
    if (cycle_running_) {
        cycle_deferred_ = true;
        qCDebug(docsyncSyncLog) << "Cycle already running; deferring trigger";
        return;
    }
    auto restored = ensureRestored();
    if (restored.is_err()) {
        qCCritical(docsyncStorageLog) << "Cannot restore sync state:" << q(restored.unwrap_err().message);
        emitEvent(SyncEventType::Failed, {}, q(restored.unwrap_err().message));
        return;
    }
    if (!gateAllowsSync()) {
        qCDebug(docsyncSyncLog) << "Sync gated (paused, offline or Wi-Fi only)";
        return;
    }

    cycle_running_ = true;
    ++cycle_count_;
    pushed_this_cycle_.clear();
    emitEvent(SyncEventType::Started);

    drainQueue();
    const bool pulled = pullRemoteChanges();
    sweep(clock_());
    persistQueue();

    last_sync_time_ = clock_();
    cycle_running_ = false;
    if (pulled) {
        emitEvent(SyncEventType::Completed, {},
                  QStringLiteral("%1 pushed, %2 pending")
                      .arg(pushed_this_cycle_.size())
                      .arg(queue_.size()));
    }
    scheduleBackoffWakeup();

    if (cycle_deferred_) {
        cycle_deferred_ = false;
        debounce_timer_->start();
    }
}

void SyncCoordinator::drainQueue() {
    const auto now = clock_();
    for (const auto& snapshot : queue_.snapshot()) {
        // Earlier operations may have completed, coalesced or removed this one.
        auto op = queue_.find(snapshot.id);
        if (!op || op->in_flight) continue;
        if (!retry_.is_eligible(op->document_sync_id, now)) {
            qCDebug(docsyncSyncLog) << "Skipping" << q(op->document_sync_id) << "until backoff elapses";
            continue;
        }
        processOperation(*op);
    }
}

void SyncCoordinator::processOperation(const SyncOperation& op) {
    const auto& id = op.document_sync_id;
    auto found = store_.document_by_sync_id(id);
    if (found.is_err()) {
        qCWarning(docsyncStorageLog) << "Cannot load" << q(id) << ":" << q(found.unwrap_err().message);
        return;
    }

    if (op.kind == OperationKind::Delete) {
        queue_.begin(op.id);
        pushDeletion(op, found.unwrap() ? *found.unwrap() : op.payload);
        return;
    }

    // The current row is pushed, not the payload captured at enqueue time.
    const auto& current = found.unwrap();
    if (!current || current->deleted || current->sync_state == SyncState::PendingDeletion ||
        current->sync_state == SyncState::Conflict) {
        qCDebug(docsyncSyncLog) << "Dropping" << q(to_string(op.kind)) << "for" << q(id)
                                << "(document gone, deleted or in conflict)";
        finishOperation(op);
        return;
    }
    if (current->sync_state == SyncState::Synced && !has_local_changes(*current)) {
        finishOperation(op);
        return;
    }
    if (transition(current->sync_state, SyncTrigger::BeginUpload).is_err()) {
        qCDebug(docsyncSyncLog) << "Leaving" << q(id) << "queued while"
                                << q(to_string(current->sync_state));
        return;
    }

    queue_.begin(op.id);
    pushDocument(op, *current);
}

void SyncCoordinator::pushDocument(const SyncOperation& op, Document doc) {
    const auto& id = op.document_sync_id;

    auto uploading = saveState(doc, SyncTrigger::BeginUpload);
    if (uploading.is_err()) {
        onPushFailed(op, doc, uploading.unwrap_err());
        return;
    }
    doc = std::move(uploading).unwrap();
    emitEvent(SyncEventType::StateChanged, id, q(to_string(doc.sync_state)));

    auto with_blobs = uploadAttachments(doc);
    if (with_blobs.is_err()) {
        onPushFailed(op, doc, with_blobs.unwrap_err());
        return;
    }
    doc = std::move(with_blobs).unwrap();

    if (doc.server_version == 0) {
        auto created = remote_.create(doc);
        if (created.is_ok()) {
            onPushAccepted(op, std::move(doc), created.unwrap());
            return;
        }
        if (created.unwrap_err().kind != ErrorKind::Concurrency) {
            onPushFailed(op, doc, created.unwrap_err());
            return;
        }
        // Already on the remote (a lost acknowledgement or another device).
        auto existing = remote_.get(id);
        if (existing.is_err()) {
            onPushFailed(op, doc, existing.unwrap_err());
            return;
        }
        onVersionConflict(op, doc, existing.unwrap());
        return;
    }

    auto outcome = remote_.update(doc);
    if (auto* updated = std::get_if<Updated>(&outcome)) {
        onPushAccepted(op, std::move(doc), updated->document);
    } else if (auto* rejected = std::get_if<VersionConflict>(&outcome)) {
        onVersionConflict(op, doc, rejected->remote);
    } else {
        onPushFailed(op, doc, std::get<Error>(outcome));
    }
}

void SyncCoordinator::pushDeletion(const SyncOperation& op, Document doc) {
    if (!doc.deleted) doc = with_deleted(std::move(doc), clock_());

    if (doc.server_version == 0) {
        // The remote never saw it.
        completeDeletion(op, doc);
        return;
    }

    for (int attempt = 0; attempt < kMaxDeleteRebases; ++attempt) {
        auto outcome = remote_.update(doc);
        if (std::holds_alternative<Updated>(outcome)) {
            completeDeletion(op, doc);
            return;
        }
        if (auto* rejected = std::get_if<VersionConflict>(&outcome)) {
            if (rejected->remote.deleted) {
                completeDeletion(op, doc);
                return;
            }
            // Local deletes win: rebase onto the remote's version and push again.
            doc.server_version = rejected->remote.version;
            doc.version = std::max(doc.version, rejected->remote.version) + 1;
            qCDebug(docsyncDeletionLog) << "Rebased deletion of" << q(op.document_sync_id)
                                        << "onto remote version" << rejected->remote.version;
            continue;
        }
        const auto& error = std::get<Error>(outcome);
        if (error.kind == ErrorKind::NotFound) {
            completeDeletion(op, doc);
            return;
        }
        onPushFailed(op, doc, error);
        return;
    }
    onPushFailed(op, doc, Error(ErrorKind::Internal, "Remote kept changing during deletion"));
}

void SyncCoordinator::completeDeletion(const SyncOperation& op, const Document& doc) {
    const auto& id = op.document_sync_id;

    auto attachments = store_.attachments_for(id);
    if (attachments.is_ok()) {
        for (const auto& attachment : attachments.unwrap()) {
            if (!attachment.blob_key) continue;
            auto removed = blobs_.remove(*attachment.blob_key);
            if (removed.is_err()) {
                qCWarning(docsyncDeletionLog) << "Orphaned blob" << q(*attachment.blob_key) << ":"
                                              << q(removed.unwrap_err().message);
            }
        }
    } else {
        qCWarning(docsyncStorageLog) << "Cannot list attachments of" << q(id) << ":"
                                     << q(attachments.unwrap_err().message);
    }

    auto completed = deletions_.complete_deletion(doc);
    if (completed.is_err()) {
        onPushFailed(op, doc, completed.unwrap_err());
        return;
    }

    retry_.record_success(id);
    persistRecord(id);
    removeFailedOperations(id);
    finishOperation(op);
    pushed_this_cycle_.insert(id);
    emitEvent(SyncEventType::DocumentUploaded, id, QStringLiteral("deleted"));
}

Result<Document, Error> SyncCoordinator::uploadAttachments(Document doc) {
    const auto id = sync_id::normalize(*doc.sync_id);
    auto attachments = store_.attachments_for(id);
    if (attachments.is_err()) return propagate<Document>(attachments);

    bool refs_changed = false;
    for (auto attachment : attachments.unwrap()) {
        auto need = transfer_need(attachment);
        if (need.is_err()) return propagate<Document>(need);
        if (need.unwrap() != AttachmentTransfer::NeedsUpload) continue;

        auto key = blobs_.upload(*attachment.local_ref, attachment_blob_key(attachment));
        if (key.is_err()) return propagate<Document>(key);

        attachment.blob_key = key.unwrap();
        attachment.sync_state = SyncState::Synced;
        auto saved = store_.save_attachment(attachment);
        if (saved.is_err()) return propagate<Document>(saved);

        auto& refs = doc.attachment_refs;
        if (std::find(refs.begin(), refs.end(), key.unwrap()) == refs.end()) {
            refs.push_back(key.unwrap());
            refs_changed = true;
        }
        qCDebug(docsyncSyncLog) << "Uploaded attachment" << q(attachment.file_name) << "of" << q(id);
    }

    if (!refs_changed) return Result<Document, Error>::ok(std::move(doc));
    return store_.save_document(doc);
}

void SyncCoordinator::downloadAttachments(const Document& doc) {
    const auto id = sync_id::normalize(*doc.sync_id);
    auto attachments = store_.attachments_for(id);
    if (attachments.is_err()) {
        qCWarning(docsyncStorageLog) << "Cannot list attachments of" << q(id) << ":"
                                     << q(attachments.unwrap_err().message);
        return;
    }

    for (const auto& ref : doc.attachment_refs) {
        const auto& known = attachments.unwrap();
        auto it = std::find_if(known.begin(), known.end(),
                               [&](const FileAttachment& a) { return a.blob_key == ref; });
        FileAttachment attachment = it != known.end()
            ? *it
            : FileAttachment{
                  .sync_id = sync_id::generate(),
                  .document_sync_id = id,
                  .file_name = file_name_from_key(ref),
                  .blob_key = ref,
                  .sync_state = SyncState::PendingDownload,
              };
        if (attachment.local_ref) continue;

        auto local = blobs_.download(ref);
        if (local.is_ok()) {
            attachment.local_ref = local.unwrap();
            attachment.sync_state = SyncState::Synced;
        } else {
            // Left without a local file; retried on the next pull.
            attachment.sync_state = SyncState::Error;
            qCWarning(docsyncSyncLog) << "Attachment download failed for" << q(ref) << ":"
                                      << q(local.unwrap_err().message);
        }
        auto saved = store_.save_attachment(attachment);
        if (saved.is_err()) {
            qCWarning(docsyncStorageLog) << "Cannot save attachment" << q(attachment.sync_id) << ":"
                                         << q(saved.unwrap_err().message);
        }
    }
}

// ============================================================================
// Push outcomes
// ============================================================================

void SyncCoordinator::onPushAccepted(const SyncOperation& op, Document pushed, const Document& stored) {
    const auto& id = op.document_sync_id;
    pushed.version = stored.version;
    pushed.server_version = stored.version;

    auto synced = saveState(std::move(pushed), SyncTrigger::TransferSucceeded);
    if (synced.is_err()) {
        qCCritical(docsyncStorageLog) << "Pushed" << q(id) << "but could not record it:"
                                      << q(synced.unwrap_err().message);
    }

    retry_.record_success(id);
    persistRecord(id);
    removeFailedOperations(id);
    finishOperation(op);
    pushed_this_cycle_.insert(id);
    emitEvent(SyncEventType::DocumentUploaded, id,
              QStringLiteral("version %1").arg(stored.version));
}

void SyncCoordinator::onVersionConflict(const SyncOperation& op, const Document& local, const Document& remote) {
    const auto& id = op.document_sync_id;
    finishOperation(op);
    retry_.record_success(id);
    persistRecord(id);

    if (!remote.deleted && matcher::have_same_content(local, remote)) {
        // Both copies already agree; adopt the remote version line.
        auto adopted = local;
        adopted.version = std::max(local.version, remote.version);
        adopted.server_version = remote.version;
        adopted.sync_state = SyncState::Synced;
        auto saved = store_.save_document(adopted);
        if (saved.is_err()) {
            qCWarning(docsyncStorageLog) << "Cannot save" << q(id) << ":" << q(saved.unwrap_err().message);
            return;
        }
        qCDebug(docsyncConflictLog) << "Version rejected for" << q(id) << "but content matches; adopted remote";
        emitEvent(SyncEventType::StateChanged, id, q(to_string(SyncState::Synced)));
        return;
    }

    const auto type = remote.deleted
        ? ConflictType::DeletionConflict
        : detect_conflict(local, remote).value_or(ConflictType::ConcurrentModification);
    openConflict(local, remote, type);
}

void SyncCoordinator::onPushFailed(const SyncOperation& op, const Document& doc, const Error& error) {
    const auto& id = op.document_sync_id;
    const auto description = describe_failure(op.kind, doc.title, id, error);
    auto decision = retry_.record_failure(id, op.kind, error, clock_(), doc.title);

    if (decision.action == RetryAction::RouteToConflict) {
        auto remote = remote_.get(id);
        if (remote.is_ok()) {
            onVersionConflict(op, doc, remote.unwrap());
            return;
        }
        // The competing copy is unavailable; fall back to the retry path.
        const auto& fetch_error = remote.unwrap_err();
        decision = retry_.record_failure(
            id, op.kind,
            fetch_error.kind == ErrorKind::Concurrency ? Error(ErrorKind::Internal, fetch_error.message)
                                                       : fetch_error,
            clock_(), doc.title);
    }

    if (decision.action == RetryAction::RefreshThenRetry) {
        auto refreshed = auth_.refresh();
        if (refreshed.is_ok()) {
            decision.action = RetryAction::RetryLater;
        } else {
            retry_.mark_permanent(id, "Token refresh failed: " + refreshed.unwrap_err().message);
            decision.action = RetryAction::GiveUp;
        }
    }

    auto failed = saveState(doc, SyncTrigger::TransferFailed);
    if (failed.is_err()) {
        qCWarning(docsyncStorageLog) << "Cannot record failure state for" << q(id) << ":"
                                     << q(failed.unwrap_err().message);
    }
    persistRecord(id);

    const auto record = retry_.find(id);
    if (decision.action == RetryAction::GiveUp) {
        qCWarning(docsyncSyncLog).noquote() << q(description) << "- giving up after"
                                            << (record ? record->retry_count : 0) << "attempts";
        auto failed_op = queue_.complete(op.id).value_or(op);
        failed_op.payload = failed.is_ok() ? failed.unwrap() : doc;
        auto kept = store_.save_failed_operation(failed_op);
        if (kept.is_err()) {
            qCCritical(docsyncStorageLog) << "Cannot keep failed operation for" << q(id) << ":"
                                          << q(kept.unwrap_err().message);
        }
    } else {
        qCWarning(docsyncSyncLog).noquote() << q(description) << "- retry"
                                            << (record ? record->retry_count : 0) << "in"
                                            << decision.delay.count() << "s";
        queue_.requeue(op.id);
    }
    persistQueue();
    emitEvent(SyncEventType::Failed, id, q(description), q(user_message(op.kind, classify(error))));
}

void SyncCoordinator::openConflict(const Document& local, const Document& remote, ConflictType type) {
    const auto id = sync_id::normalize(*local.sync_id);
    auto conflict = conflicts_.register_conflict(local, remote, type);
    if (conflict.is_err()) {
        qCCritical(docsyncConflictLog) << "Cannot record conflict for" << q(id) << ":"
                                       << q(conflict.unwrap_err().message);
        emitEvent(SyncEventType::Failed, id, q(conflict.unwrap_err().message));
        return;
    }

    auto in_conflict = local;
    in_conflict.conflict_id = conflict.unwrap().id;
    auto saved = saveState(std::move(in_conflict), SyncTrigger::VersionRejected);
    if (saved.is_err()) {
        qCCritical(docsyncStorageLog) << "Cannot mark" << q(id) << "as conflicted:"
                                      << q(saved.unwrap_err().message);
        return;
    }
    emitEvent(SyncEventType::ConflictDetected, id, q(to_string(type)));

    if (!settings_.auto_resolve) return;
    auto prepared = conflicts_.prepare_auto_resolution(conflict.unwrap().id);
    if (prepared.is_err()) {
        qCWarning(docsyncConflictLog) << "Auto-resolution failed for" << q(id) << ":"
                                      << q(prepared.unwrap_err().message);
        return;
    }
    auto applied = applyResolution(prepared.unwrap());
    if (applied.is_err()) {
        qCWarning(docsyncConflictLog) << "Auto-resolution failed for" << q(id) << ":"
                                      << q(applied.unwrap_err().message);
    }
}

// ============================================================================
// Pull
// ============================================================================

bool SyncCoordinator::pullRemoteChanges() {
    if (settings_.pull_policy == PullPolicy::SkipAfterUpload && !pushed_this_cycle_.empty()) {
        qCDebug(docsyncSyncLog) << "Pushed" << pushed_this_cycle_.size()
                                << "documents; pull deferred to the next cycle";
        return true;
    }
    const auto user = auth_.current_user_id();
    if (user.empty()) {
        qCDebug(docsyncSyncLog) << "Signed out; skipping pull";
        return true;
    }

    auto listed = remote_.list(user, false);
    if (listed.is_err()) {
        const auto& error = listed.unwrap_err();
        qCWarning(docsyncSyncLog) << "Pull failed:" << q(error.message);
        if (error.kind == ErrorKind::Auth) {
            auto refreshed = auth_.refresh();
            if (refreshed.is_err()) {
                qCWarning(docsyncSyncLog) << "Token refresh failed:" << q(refreshed.unwrap_err().message);
            }
        }
        emitEvent(SyncEventType::Failed, {}, q("Pull failed: " + error.message));
        return false;
    }

    for (const auto& remote : listed.unwrap()) {
        if (!remote.has_sync_id()) continue;
        if (pushed_this_cycle_.count(sync_id::normalize(*remote.sync_id)) > 0) continue;
        applyRemote(remote);
    }
    return true;
}

void SyncCoordinator::applyRemote(const Document& remote) {
    const auto id = sync_id::normalize(*remote.sync_id);

    auto accepted = deletions_.accept_incoming(remote);
    if (accepted.is_err()) {
        qCWarning(docsyncDeletionLog) << "Cannot check tombstone for" << q(id) << ":"
                                      << q(accepted.unwrap_err().message);
        return;
    }
    if (!accepted.unwrap()) return;

    auto found = store_.document_by_sync_id(id);
    if (found.is_err()) {
        qCWarning(docsyncStorageLog) << "Cannot load" << q(id) << ":" << q(found.unwrap_err().message);
        return;
    }
    const auto& local = found.unwrap();

    if (local && local->sync_state == SyncState::Conflict) return;

    if (remote.deleted) {
        if (!local) return;
        if (has_local_changes(*local)) {
            openConflict(*local, remote, ConflictType::DeletionConflict);
            return;
        }
        auto tombstoned = deletions_.record_remote_deletion(remote);
        if (tombstoned.is_err()) {
            qCWarning(docsyncDeletionLog) << "Cannot tombstone" << q(id) << ":"
                                          << q(tombstoned.unwrap_err().message);
            return;
        }
        auto removed = deletions_.complete_deletion(*local);
        if (removed.is_err()) {
            qCWarning(docsyncStorageLog) << "Cannot remove" << q(id) << ":" << q(removed.unwrap_err().message);
            return;
        }
        queue_.remove_for_document(id);
        retry_.record_success(id);
        persistRecord(id);
        emitEvent(SyncEventType::DocumentDownloaded, id, QStringLiteral("deleted remotely"));
        return;
    }

    Document incoming = remote;
    incoming.sync_id = id;
    incoming.conflict_id.reset();
    incoming.server_version = remote.version;
    SyncState from = SyncState::PendingDownload;

    if (local) {
        if (has_local_changes(*local)) {
            // The push resolves it unless the copies already diverge.
            if (local->sync_state == SyncState::PendingDeletion) return;
            if (auto type = detect_conflict(*local, remote)) {
                openConflict(*local, remote, *type);
            }
            return;
        }
        if (remote.version <= local->server_version) {
            downloadAttachments(*local);
            return;
        }
        auto noticed = transition(local->sync_state, SyncTrigger::RemoteChanged);
        if (noticed.is_err()) return;
        from = noticed.unwrap();
        incoming.local_id = local->local_id;
        incoming.version = std::max(remote.version, local->version);
    } else {
        // A legacy identity-less row with the same content becomes this document.
        auto mine = store_.documents_for_user(remote.user_id);
        if (mine.is_ok()) {
            auto matches = matcher::match_by_content_hash(matcher::find_without_identity(mine.unwrap()),
                                                          matcher::content_hash(remote));
            if (!matches.empty()) {
                incoming.local_id = matches.front().local_id;
                qCInfo(docsyncSyncLog) << "Identity-less document" << incoming.local_id
                                       << "matched remote" << q(id);
            }
        }
    }

    incoming.sync_state = from;
    auto downloading = saveState(std::move(incoming), SyncTrigger::BeginDownload);
    if (downloading.is_err()) {
        qCWarning(docsyncStorageLog) << "Cannot store incoming" << q(id) << ":"
                                     << q(downloading.unwrap_err().message);
        return;
    }
    downloadAttachments(downloading.unwrap());

    auto synced = saveState(downloading.unwrap(), SyncTrigger::TransferSucceeded);
    if (synced.is_err()) {
        qCWarning(docsyncStorageLog) << "Cannot finish download of" << q(id) << ":"
                                     << q(synced.unwrap_err().message);
        return;
    }
    emitEvent(SyncEventType::DocumentDownloaded, id,
              QStringLiteral("version %1").arg(remote.version));
}

void SyncCoordinator::sweep(Timestamp now) {
    if (last_sweep_ && now - *last_sweep_ < kSweepInterval) return;
    last_sweep_ = now;

    auto tombstones = deletions_.purge_expired();
    if (tombstones.is_err()) {
        qCWarning(docsyncDeletionLog) << "Tombstone sweep failed:" << q(tombstones.unwrap_err().message);
    }
    auto conflicts = conflicts_.purge_resolved();
    if (conflicts.is_err()) {
        qCWarning(docsyncConflictLog) << "Conflict sweep failed:" << q(conflicts.unwrap_err().message);
    }
}

// ============================================================================
// Caller operations
// ============================================================================

Result<void, Error> SyncCoordinator::enqueue(const Document& doc, OperationKind kind) {
    auto restored = ensureRestored();
    if (restored.is_err()) return restored;

    if (kind == OperationKind::Delete) {
        auto deleted_by = auth_.current_user_id();
        if (deleted_by.empty()) deleted_by = doc.user_id;
        auto marked = deletions_.mark_for_deletion(doc, deleted_by);
        if (marked.is_err()) return propagate<void>(marked);
        if (marked.unwrap().outcome == DeletionTracker::MarkOutcome::RemovedLocally) {
            emitEvent(SyncEventType::StateChanged, {}, QStringLiteral("identity-less document removed"));
            return Result<void, Error>::ok();
        }
        const auto& pending = marked.unwrap().document;
        if (marked.unwrap().closed_conflict_id) {
            emitEvent(SyncEventType::StateChanged, *pending.sync_id,
                      QStringLiteral("conflict closed by deletion"));
        }
        auto queued = queueOperation(pending, OperationKind::Delete);
        if (queued.is_err()) return queued;
        emitEvent(SyncEventType::StateChanged, *pending.sync_id, q(to_string(pending.sync_state)));
        requestSync();
        return Result<void, Error>::ok();
    }

    if (!doc.has_sync_id()) {
        return Result<void, Error>::err(
            Error::validation("Document has no sync id; backfill identities before syncing it"));
    }
    auto id = sync_id::parse(*doc.sync_id);
    if (id.is_err()) return propagate<void>(id);

    auto tombstoned = deletions_.is_tombstoned(id.unwrap());
    if (tombstoned.is_err()) return propagate<void>(tombstoned);
    if (tombstoned.unwrap()) {
        return Result<void, Error>::err(
            Error::validation("Document " + id.unwrap() + " was deleted and cannot be re-synced"));
    }

    auto found = doc.local_id != 0 ? store_.document_by_local_id(doc.local_id)
                                   : store_.document_by_sync_id(id.unwrap());
    if (found.is_err()) return propagate<void>(found);
    const auto& stored = found.unwrap();

    auto next = transition(stored ? stored->sync_state : doc.sync_state, SyncTrigger::LocalEdit);
    if (next.is_err()) return propagate<void>(next);

    Document pending = doc;
    pending.sync_id = id.unwrap();
    pending.sync_state = next.unwrap();
    if (stored) {
        pending.local_id = stored->local_id;
        pending.server_version = stored->server_version;
        // One bump per edit of a synced copy; never below the stored version.
        if (stored->sync_state == SyncState::Synced && pending.version <= stored->version) {
            pending.version = stored->version + 1;
        }
        pending.version = std::max(pending.version, stored->version);
    }

    auto saved = store_.save_document(pending);
    if (saved.is_err()) return propagate<void>(saved);

    const auto effective = kind == OperationKind::Upload ? OperationKind::Upload : push_kind(saved.unwrap());
    auto queued = queueOperation(saved.unwrap(), effective);
    if (queued.is_err()) return queued;

    emitEvent(SyncEventType::StateChanged, id.unwrap(), q(to_string(pending.sync_state)));
    requestSync();
    return Result<void, Error>::ok();
}

Result<Document, Error> SyncCoordinator::resolveConflict(const std::string& conflict_id,
                                                         ResolutionStrategy strategy,
                                                         const std::optional<Document>& manual_document) {
    auto restored = ensureRestored();
    if (restored.is_err()) return propagate<Document>(restored);

    auto prepared = conflicts_.prepare_resolution(conflict_id, strategy, manual_document);
    if (prepared.is_err()) return propagate<Document>(prepared);
    return applyResolution(prepared.unwrap());
}

Result<Document, Error> SyncCoordinator::applyResolution(const ConflictManager::Prepared& prepared) {
    const auto& id = prepared.conflict.document_sync_id;
    auto doc = prepared.resolution.document;

    // A deleted document stays deleted whichever side the resolution keeps.
    auto tombstoned = deletions_.is_tombstoned(id);
    if (tombstoned.is_err()) return propagate<Document>(tombstoned);
    if (tombstoned.unwrap()) {
        return Result<Document, Error>::err(
            Error::validation("Document " + id + " was deleted; its conflict cannot be resolved"));
    }

    auto current = store_.document_by_sync_id(id);
    if (current.is_err()) return propagate<Document>(current);
    if (current.unwrap()) {
        doc.local_id = current.unwrap()->local_id;
        doc.version = std::max(doc.version, current.unwrap()->version + 1);
    }

    Document result = doc;
    switch (prepared.resolution.followup) {
        case ResolutionFollowup::None: {
            auto saved = store_.save_document(doc);
            if (saved.is_err()) return propagate<Document>(saved);
            result = std::move(saved).unwrap();
            break;
        }
        case ResolutionFollowup::PushUpdate: {
            auto saved = store_.save_document(doc);
            if (saved.is_err()) return propagate<Document>(saved);
            result = std::move(saved).unwrap();
            auto queued = queueOperation(result, push_kind(result));
            if (queued.is_err()) return propagate<Document>(queued);
            break;
        }
        case ResolutionFollowup::AcceptRemoteDeletion: {
            auto tombstoned = deletions_.record_remote_deletion(prepared.conflict.remote_snapshot);
            if (tombstoned.is_err()) return propagate<Document>(tombstoned);
            auto removed = deletions_.complete_deletion(doc);
            if (removed.is_err()) return propagate<Document>(removed);
            queue_.remove_for_document(id);
            auto persisted = store_.save_queue(queue_.snapshot());
            if (persisted.is_err()) return propagate<Document>(persisted);
            break;
        }
    }

    auto closed = conflicts_.mark_resolved(prepared);
    if (closed.is_err()) return propagate<Document>(closed);

    retry_.record_success(id);
    persistRecord(id);
    qCInfo(docsyncConflictLog) << "Resolved" << q(prepared.conflict.id) << "with"
                               << q(to_string(prepared.strategy));
    emitEvent(SyncEventType::StateChanged, id,
              QStringLiteral("conflict resolved: %1").arg(q(to_string(prepared.strategy))));
    requestSync();
    return Result<Document, Error>::ok(std::move(result));
}

Result<RecoveryPlan, Error> SyncCoordinator::recoveryPlan() {
    auto restored = ensureRestored();
    if (restored.is_err()) return propagate<RecoveryPlan>(restored);
    auto open = conflicts_.unresolved();
    if (open.is_err()) return propagate<RecoveryPlan>(open);
    return Result<RecoveryPlan, Error>::ok(build_recovery_plan(retry_.records(), open.unwrap(), clock_()));
}

Result<void, Error> SyncCoordinator::retryDocument(const std::string& raw_sync_id) {
    auto restored = ensureRestored();
    if (restored.is_err()) return restored;

    auto id = sync_id::parse(raw_sync_id);
    if (id.is_err()) return propagate<void>(id);
    auto found = store_.document_by_sync_id(id.unwrap());
    if (found.is_err()) return propagate<void>(found);
    if (!found.unwrap()) {
        return Result<void, Error>::err(Error::not_found("No document with sync id " + id.unwrap()));
    }
    auto doc = *found.unwrap();
    if (doc.sync_state == SyncState::Conflict) {
        return Result<void, Error>::err(
            Error::validation("Document " + id.unwrap() + " is in conflict; resolve it instead"));
    }

    retry_.clear(id.unwrap());
    persistRecord(id.unwrap());
    auto cleared = store_.remove_failed_operations_for(id.unwrap());
    if (cleared.is_err()) return propagate<void>(cleared);

    if (doc.deleted || doc.sync_state == SyncState::PendingDeletion) {
        auto queued = queueOperation(doc, OperationKind::Delete);
        if (queued.is_err()) return queued;
    } else {
        if (doc.sync_state == SyncState::Error) {
            auto retried = saveState(doc, SyncTrigger::Retry);
            if (retried.is_err()) return propagate<void>(retried);
            doc = std::move(retried).unwrap();
        }
        if (!has_local_changes(doc)) return Result<void, Error>::ok();
        auto queued = queueOperation(doc, push_kind(doc));
        if (queued.is_err()) return queued;
    }

    emitEvent(SyncEventType::StateChanged, id.unwrap(), QStringLiteral("retry requested"));
    requestSync();
    return Result<void, Error>::ok();
}

Result<bool, Error> SyncCoordinator::clearError(const std::string& raw_sync_id) {
    auto restored = ensureRestored();
    if (restored.is_err()) return propagate<bool>(restored);

    auto id = sync_id::parse(raw_sync_id);
    if (id.is_err()) return propagate<bool>(id);

    const bool had_record = retry_.clear(id.unwrap());
    auto removed_record = store_.remove_retry_record(id.unwrap());
    if (removed_record.is_err()) return propagate<bool>(removed_record);
    auto removed_ops = store_.remove_failed_operations_for(id.unwrap());
    if (removed_ops.is_err()) return propagate<bool>(removed_ops);
    return Result<bool, Error>::ok(had_record || removed_ops.unwrap() > 0);
}

Result<int, Error> SyncCoordinator::backfillIdentities() {
    auto restored = ensureRestored();
    if (restored.is_err()) return propagate<int>(restored);

    auto docs = store_.documents();
    if (docs.is_err()) return propagate<int>(docs);

    int count = 0;
    for (auto doc : matcher::find_without_identity(docs.unwrap())) {
        if (doc.deleted) continue;
        auto next = transition(doc.sync_state, SyncTrigger::LocalEdit);
        if (next.is_err()) {
            qCWarning(docsyncSyncLog) << "Not backfilling document" << doc.local_id << ":"
                                      << q(next.unwrap_err().message);
            continue;
        }
        doc.sync_id = sync_id::generate();
        doc.server_version = 0;
        doc.sync_state = next.unwrap();
        auto saved = store_.save_document(doc);
        if (saved.is_err()) return propagate<int>(saved);
        queue_.enqueue(make_operation(saved.unwrap(), OperationKind::Upload, clock_()));
        ++count;
    }

    if (count > 0) {
        auto persisted = store_.save_queue(queue_.snapshot());
        if (persisted.is_err()) return propagate<int>(persisted);
        qCInfo(docsyncSyncLog) << "Assigned sync ids to" << count << "documents";
        requestSync();
    }
    return Result<int, Error>::ok(count);
}

Result<void, Error> SyncCoordinator::handleSignOut() {
    stop();
    const auto records = retry_.records();
    queue_.clear();
    retry_.restore({});

    auto cleared = store_.save_queue({});
    if (cleared.is_err()) return cleared;
    for (const auto& record : records) {
        auto removed = store_.remove_retry_record(record.sync_id);
        if (removed.is_err()) return removed;
    }
    gate_.invalidate();
    emitEvent(SyncEventType::StateChanged, {}, QStringLiteral("signed out"));
    return Result<void, Error>::ok();
}

// ============================================================================
// Helpers
// ============================================================================

Result<void, Error> SyncCoordinator::queueOperation(const Document& doc, OperationKind kind) {
    const auto outcome = queue_.enqueue(make_operation(doc, kind, clock_()));
    qCDebug(docsyncSyncLog) << (outcome == OperationQueue::EnqueueOutcome::Added ? "Queued" : "Coalesced")
                            << q(to_string(kind)) << "for" << q(doc.sync_id.value_or(""));
    return store_.save_queue(queue_.snapshot());
}

Result<Document, Error> SyncCoordinator::saveState(Document doc, SyncTrigger trigger) {
    auto next = transition(doc.sync_state, trigger);
    if (next.is_err()) return propagate<Document>(next);
    doc.sync_state = next.unwrap();
    return store_.save_document(doc);
}

void SyncCoordinator::finishOperation(const SyncOperation& op) {
    queue_.complete(op.id);
    persistQueue();
}

void SyncCoordinator::removeFailedOperations(const std::string& sync_id) {
    auto removed = store_.remove_failed_operations_for(sync_id);
    if (removed.is_err()) {
        qCWarning(docsyncStorageLog) << "Cannot clear failed operations of" << q(sync_id) << ":"
                                     << q(removed.unwrap_err().message);
    }
}

void SyncCoordinator::persistQueue() {
    auto saved = store_.save_queue(queue_.snapshot());
    if (saved.is_err()) {
        qCCritical(docsyncStorageLog) << "Cannot persist sync queue:" << q(saved.unwrap_err().message);
    }
}

void SyncCoordinator::persistRecord(const std::string& sync_id) {
    auto record = retry_.find(sync_id);
    auto saved = record ? store_.save_retry_record(*record) : store_.remove_retry_record(sync_id);
    if (saved.is_err()) {
        qCCritical(docsyncStorageLog) << "Cannot persist retry record for" << q(sync_id) << ":"
                                      << q(saved.unwrap_err().message);
    }
}

void SyncCoordinator::scheduleBackoffWakeup() {
    if (!running_) return;
    const auto now = clock_();
    const auto next = retry_.next_wakeup(now);
    if (!next) {
        backoff_timer_->stop();
        return;
    }
    const auto delay = std::max(*next - now, Timestamp::Duration(0));
    backoff_timer_->start(delay);
}

void SyncCoordinator::emitEvent(SyncEventType type, const std::string& sync_id, const QString& message,
                                const QString& user_text) {
    SyncEvent event{
        .type = type,
        .document_sync_id = q(sync_id),
        .message = message,
        .user_message = user_text,
        .timestamp = clock_(),
    };
    qCDebug(docsyncSyncLog).noquote() << q(to_string(type)) << event.document_sync_id << message;
    emit syncEvent(event);
}

} // namespace docsync::sync
