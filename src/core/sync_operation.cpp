#include "core/sync_operation.hpp"
#include "core/sync_id.hpp"

#include <algorithm>

namespace docsync {

std::string_view to_string(OperationKind kind) noexcept {
    switch (kind) {
        case OperationKind::Upload: return "upload";
        case OperationKind::Update: return "update";
        case OperationKind::Delete: return "delete";
    }
    return "update";
}

std::optional<OperationKind> parse_operation_kind(std::string_view text) noexcept {
    if (text == "upload") return OperationKind::Upload;
    if (text == "update") return OperationKind::Update;
    if (text == "delete") return OperationKind::Delete;
    return std::nullopt;
}

SyncOperation make_operation(const Document& doc, OperationKind kind, Timestamp now) {
    return SyncOperation{
        .id = Uuid::generate().to_string(),
        .document_sync_id = doc.sync_id ? sync_id::normalize(*doc.sync_id) : std::string{},
        .kind = kind,
        .queued_at = now,
        .retry_count = 0,
        .payload = doc,
    };
}

std::vector<SyncOperation>::iterator OperationQueue::find_queued(const std::string& sync_id) {
    return std::find_if(ops_.begin(), ops_.end(), [&](const SyncOperation& op) {
        return !op.in_flight && op.document_sync_id == sync_id;
    });
}

OperationQueue::EnqueueOutcome OperationQueue::enqueue(SyncOperation op) {
    auto queued = find_queued(op.document_sync_id);
    if (queued == ops_.end()) {
        op.in_flight = false;
        ops_.push_back(std::move(op));
        return EnqueueOutcome::Added;
    }

    if (queued->kind == OperationKind::Delete) {
        // The tombstone already exists; nothing can supersede a delete.
        return EnqueueOutcome::Coalesced;
    }

    if (op.kind == OperationKind::Delete) {
        queued->kind = OperationKind::Delete;
    } else if (queued->kind != OperationKind::Upload) {
        queued->kind = op.kind;
    }
    queued->payload = std::move(op.payload);
    queued->retry_count = 0;
    return EnqueueOutcome::Coalesced;
}

bool OperationQueue::begin(const std::string& operation_id) {
    auto it = std::find_if(ops_.begin(), ops_.end(),
                           [&](const SyncOperation& op) { return op.id == operation_id; });
    if (it == ops_.end()) return false;
    it->in_flight = true;
    return true;
}

std::optional<SyncOperation> OperationQueue::complete(const std::string& operation_id) {
    auto it = std::find_if(ops_.begin(), ops_.end(),
                           [&](const SyncOperation& op) { return op.id == operation_id; });
    if (it == ops_.end()) return std::nullopt;
    auto op = std::move(*it);
    ops_.erase(it);
    op.in_flight = false;
    return op;
}

std::optional<SyncOperation> OperationQueue::requeue(const std::string& operation_id) {
    auto it = std::find_if(ops_.begin(), ops_.end(),
                           [&](const SyncOperation& op) { return op.id == operation_id; });
    if (it == ops_.end()) return std::nullopt;

    if (find_queued(it->document_sync_id) != ops_.end()) {
        ops_.erase(it);
        return std::nullopt;
    }
    it->in_flight = false;
    it->retry_count += 1;
    return *it;
}

size_t OperationQueue::remove_for_document(const std::string& sync_id) {
    const auto before = ops_.size();
    std::erase_if(ops_, [&](const SyncOperation& op) { return op.document_sync_id == sync_id; });
    return before - ops_.size();
}

std::optional<SyncOperation> OperationQueue::find(const std::string& operation_id) const {
    auto it = std::find_if(ops_.begin(), ops_.end(),
                           [&](const SyncOperation& op) { return op.id == operation_id; });
    if (it == ops_.end()) return std::nullopt;
    return *it;
}

std::optional<SyncOperation> OperationQueue::queued_for(const std::string& sync_id) const {
    auto it = std::find_if(ops_.begin(), ops_.end(), [&](const SyncOperation& op) {
        return !op.in_flight && op.document_sync_id == sync_id;
    });
    if (it == ops_.end()) return std::nullopt;
    return *it;
}

bool OperationQueue::contains_document(const std::string& sync_id) const {
    return std::any_of(ops_.begin(), ops_.end(),
                       [&](const SyncOperation& op) { return op.document_sync_id == sync_id; });
}

} // namespace docsync
