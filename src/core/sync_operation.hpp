#pragma once

#include "core/document.hpp"
#include "core/types.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docsync {

enum class OperationKind {
    Upload,   // first push of a document the remote has never seen
    Update,
    Delete
};

[[nodiscard]] std::string_view to_string(OperationKind kind) noexcept;
[[nodiscard]] std::optional<OperationKind> parse_operation_kind(std::string_view text) noexcept;

/**
 * SyncOperation - one queued push of a local change.
 */
struct SyncOperation {
    std::string id;
    std::string document_sync_id;
    OperationKind kind{OperationKind::Update};
    Timestamp queued_at;
    int retry_count{0};
    Document payload;
    bool in_flight{false};

    bool operator==(const SyncOperation&) const = default;
};

[[nodiscard]] SyncOperation make_operation(const Document& doc, OperationKind kind, Timestamp now);

/**
 * OperationQueue - FIFO of pending pushes with per-document coalescing.
 *
 * For any document there is at most one queued operation, plus at most
 * one in flight. Coalescing rules for a new operation against a queued one:
 *   delete           replaces whatever is queued
 *   upload + update  stays an upload with the newer payload
 *   update + update  keeps the newer payload
 * A coalesced operation restarts its retry count.
 */
class OperationQueue {
public:
    enum class EnqueueOutcome {
        Added,
        Coalesced
    };

    EnqueueOutcome enqueue(SyncOperation op);

    /**
     * Mark an operation in flight; returns false when it is unknown.
     */
    bool begin(const std::string& operation_id);

    /**
     * Remove a finished (or permanently failed) operation.
     */
    std::optional<SyncOperation> complete(const std::string& operation_id);

    /**
     * Return an in-flight operation to the queue after a retryable failure.
     * If a newer operation for the same document arrived meanwhile, the
     * failed one is dropped in its favour.
     */
    std::optional<SyncOperation> requeue(const std::string& operation_id);

    /**
     * Drop every operation for a document (sign-out, accepted remote deletion).
     */
    size_t remove_for_document(const std::string& sync_id);

    void clear() { ops_.clear(); }

    [[nodiscard]] std::optional<SyncOperation> find(const std::string& operation_id) const;
    [[nodiscard]] std::optional<SyncOperation> queued_for(const std::string& sync_id) const;
    [[nodiscard]] bool contains_document(const std::string& sync_id) const;
    [[nodiscard]] std::vector<SyncOperation> snapshot() const { return ops_; }
    [[nodiscard]] size_t size() const { return ops_.size(); }
    [[nodiscard]] bool empty() const { return ops_.empty(); }

private:
    std::vector<SyncOperation> ops_;

    [[nodiscard]] std::vector<SyncOperation>::iterator find_queued(const std::string& sync_id);
};

} // namespace docsync
