#pragma once

#include "core/cached_value.hpp"
#include "core/conflict.hpp"
#include "core/result.hpp"
#include "core/retry_policy.hpp"
#include "core/sync_operation.hpp"
#include "core/types.hpp"
#include "storage/local_store.hpp"
#include "sync/auth_provider.hpp"
#include "sync/blob_store.hpp"
#include "sync/conflict_manager.hpp"
#include "sync/connectivity.hpp"
#include "sync/deletion_tracker.hpp"
#include "sync/remote_service.hpp"
#include "sync/sync_event.hpp"
#include "sync/sync_settings.hpp"
#include <QObject>
#include <memory>
#include <optional>
#include <set>
#include <string>

class QTimer;

namespace docsync::sync {

/**
 * SyncCoordinator - drives documents between the local store and the
 * remote service.
 *
 * Responsibilities:
 * - Owning the persisted operation queue and the retry scheduler
 * - Running sync cycles: drain the queue, then pull remote changes
 * - Routing compare-and-swap failures to conflict handling and every
 *   other failure to the retry scheduler
 * - Debouncing triggers (request, enqueue, connectivity, timers) into one
 *   cycle; a trigger that arrives mid-cycle runs a cycle afterwards
 *
 * All state is touched on the thread that owns the coordinator.
 */
class SyncCoordinator : public QObject {
    Q_OBJECT

public:
    SyncCoordinator(storage::LocalStore& store,
                    RemoteDocumentService& remote,
                    BlobStore& blobs,
                    AuthProvider& auth,
                    ConnectivityMonitor* connectivity,
                    SyncSettings settings = {},
                    Clock clock = system_clock(),
                    QObject* parent = nullptr);
    ~SyncCoordinator() override;

    /**
     * Load the persisted queue and retry records and recover documents
     * left in a transfer state. Runs on first use when not called.
     */
    [[nodiscard]] Result<void, Error> restore();

    /**
     * restore() if needed, then start the periodic timer and schedule a cycle.
     */
    [[nodiscard]] Result<void, Error> start();

    /**
     * Cancel the periodic, debounce and backoff timers. A running cycle
     * completes.
     */
    void stop();

    [[nodiscard]] bool isRunning() const { return running_; }

    /**
     * Persist a local change and queue its push. Upload and Update need a
     * sync id; Delete goes through the DeletionTracker (identity-less
     * documents are removed locally and nothing is queued).
     */
    [[nodiscard]] Result<void, Error> enqueue(const Document& doc, OperationKind kind);

    /**
     * Resolve an open conflict. Returns the persisted document (the
     * pre-deletion copy when the resolution accepts a remote deletion).
     */
    [[nodiscard]] Result<Document, Error> resolveConflict(const std::string& conflict_id,
                                                          ResolutionStrategy strategy,
                                                          const std::optional<Document>& manual_document = std::nullopt);

    [[nodiscard]] SyncStatus syncStatus() const;
    [[nodiscard]] Result<RecoveryPlan, Error> recoveryPlan();

    /**
     * Explicit retry: clears the failure history (permanent or not) and
     * queues the document again.
     */
    [[nodiscard]] Result<void, Error> retryDocument(const std::string& sync_id);

    /**
     * Drop the failure history without retrying. False when none existed.
     */
    [[nodiscard]] Result<bool, Error> clearError(const std::string& sync_id);

    /**
     * Give identity-less documents a sync id and queue their first upload.
     * Returns the number of documents updated.
     */
    [[nodiscard]] Result<int, Error> backfillIdentities();

    /**
     * Stop and forget queued work and failure history.
     */
    [[nodiscard]] Result<void, Error> handleSignOut();

    /**
     * Debounced: repeated requests within the debounce window run one cycle.
     */
    void requestSync();

    /**
     * Run a cycle immediately (deferred if one is already running).
     */
    void syncNow();

    [[nodiscard]] const SyncSettings& settings() const { return settings_; }
    void setPaused(bool paused);

    [[nodiscard]] const OperationQueue& queue() const { return queue_; }
    [[nodiscard]] const RetryScheduler& retryScheduler() const { return retry_; }
    [[nodiscard]] int cycleCount() const { return cycle_count_; }

signals:
    void syncEvent(const docsync::sync::SyncEvent& event);

private slots:
    void onConnectivityChanged(docsync::sync::Connectivity connectivity);

private:
    struct GateSnapshot {
        bool paused = false;
        bool wifi_only = false;
        Connectivity connectivity = Connectivity::Offline;

        [[nodiscard]] bool allowsSync() const;
    };

    storage::LocalStore& store_;
    RemoteDocumentService& remote_;
    BlobStore& blobs_;
    AuthProvider& auth_;
    ConnectivityMonitor* connectivity_;
    SyncSettings settings_;
    Clock clock_;

    OperationQueue queue_;
    RetryScheduler retry_;
    DeletionTracker deletions_;
    ConflictManager conflicts_;
    CachedValue<GateSnapshot> gate_;

    std::unique_ptr<QTimer> debounce_timer_;
    std::unique_ptr<QTimer> periodic_timer_;
    std::unique_ptr<QTimer> backoff_timer_;

    bool restored_ = false;
    bool running_ = false;
    bool cycle_running_ = false;
    bool cycle_deferred_ = false;
    int cycle_count_ = 0;
    std::optional<Timestamp> last_sync_time_;
    std::optional<Timestamp> last_sweep_;
    std::set<std::string> pushed_this_cycle_;

    void runCycle();
    [[nodiscard]] bool gateAllowsSync();
    void drainQueue();
    void processOperation(const SyncOperation& op);
    void pushDocument(const SyncOperation& op, Document doc);
    void pushDeletion(const SyncOperation& op, Document doc);
    [[nodiscard]] Result<Document, Error> uploadAttachments(Document doc);
    void downloadAttachments(const Document& doc);
    bool pullRemoteChanges();
    void applyRemote(const Document& remote);
    void sweep(Timestamp now);

    void completeDeletion(const SyncOperation& op, const Document& doc);
    void onPushAccepted(const SyncOperation& op, Document pushed, const Document& stored);
    void onVersionConflict(const SyncOperation& op, const Document& local, const Document& remote);
    void onPushFailed(const SyncOperation& op, const Document& doc, const Error& error);
    void openConflict(const Document& local, const Document& remote, ConflictType type);
    [[nodiscard]] Result<Document, Error> applyResolution(const ConflictManager::Prepared& prepared);

    [[nodiscard]] Result<void, Error> ensureRestored();
    void finishOperation(const SyncOperation& op);
    void removeFailedOperations(const std::string& sync_id);
    void persistQueue();
    void persistRecord(const std::string& sync_id);
    void scheduleBackoffWakeup();
    [[nodiscard]] Result<void, Error> queueOperation(const Document& doc, OperationKind kind);
    [[nodiscard]] Result<void, Error> recoverTransientStates();
    [[nodiscard]] Result<Document, Error> saveState(Document doc, SyncTrigger trigger);

    void emitEvent(SyncEventType type, const std::string& sync_id = {}, const QString& message = {},
                   const QString& user_text = {});
};

} // namespace docsync::sync
