#include "core/retry_policy.hpp"

#include <algorithm>
#include <array>
#include <cstdint>

namespace docsync {

namespace {

constexpr std::array<std::pair<FailureClass, std::string_view>, 9> kFailureNames{{
    {FailureClass::Network, "network"},
    {FailureClass::Timeout, "timeout"},
    {FailureClass::Auth, "auth"},
    {FailureClass::Concurrency, "concurrency"},
    {FailureClass::NotFound, "not_found"},
    {FailureClass::Storage, "storage"},
    {FailureClass::Quota, "quota"},
    {FailureClass::Validation, "validation"},
    {FailureClass::Unknown, "unknown"},
}};

std::string_view verb(OperationKind operation) {
    switch (operation) {
        case OperationKind::Upload: return "upload";
        case OperationKind::Update: return "update";
        case OperationKind::Delete: return "delete";
    }
    return "sync";
}

} // namespace

std::string_view to_string(FailureClass cls) noexcept {
    for (const auto& [c, name] : kFailureNames) {
        if (c == cls) return name;
    }
    return "unknown";
}

std::optional<FailureClass> parse_failure_class(std::string_view text) noexcept {
    for (const auto& [c, name] : kFailureNames) {
        if (name == text) return c;
    }
    return std::nullopt;
}

FailureClass classify(const Error& error) noexcept {
    switch (error.kind) {
        case ErrorKind::Network: return FailureClass::Network;
        case ErrorKind::Timeout: return FailureClass::Timeout;
        case ErrorKind::Auth: return FailureClass::Auth;
        case ErrorKind::Concurrency: return FailureClass::Concurrency;
        case ErrorKind::NotFound: return FailureClass::NotFound;
        case ErrorKind::Storage: return FailureClass::Storage;
        case ErrorKind::Quota: return FailureClass::Quota;
        case ErrorKind::Validation: return FailureClass::Validation;
        case ErrorKind::Internal: return FailureClass::Unknown;
    }
    return FailureClass::Unknown;
}

FailurePolicy policy_for(FailureClass cls) noexcept {
    switch (cls) {
        case FailureClass::Network:
        case FailureClass::Timeout:
        case FailureClass::Storage:
        case FailureClass::Quota:
        case FailureClass::Unknown:
            return FailurePolicy{.retryable = true};
        case FailureClass::Auth:
            return FailurePolicy{.retryable = true, .refresh_first = true};
        case FailureClass::Concurrency:
            return FailurePolicy{.route_to_conflict = true};
        case FailureClass::NotFound:
        case FailureClass::Validation:
            return FailurePolicy{};
    }
    return FailurePolicy{};
}

std::chrono::seconds backoff_delay(int retry_count, std::chrono::seconds cap) {
    if (retry_count < 0) retry_count = 0;
    // 2^9 already exceeds the default cap; avoid shifting past 62 bits.
    const int exponent = std::min(retry_count, 62);
    const auto raw = std::int64_t{1} << exponent;
    return std::chrono::seconds(std::min<std::int64_t>(raw, cap.count()));
}

RetryDecision RetryScheduler::record_failure(const std::string& sync_id,
                                             OperationKind operation,
                                             const Error& error,
                                             Timestamp now,
                                             std::string document_title) {
    const auto cls = classify(error);
    const auto policy = policy_for(cls);

    if (policy.route_to_conflict) {
        records_.erase(sync_id);
        return RetryDecision{.action = RetryAction::RouteToConflict};
    }

    auto& rec = records_[sync_id];
    rec.sync_id = sync_id;
    if (!document_title.empty()) rec.document_title = std::move(document_title);
    rec.operation = operation;
    rec.failure = cls;
    rec.message = error.message;
    rec.failed_at = now;

    if (!policy.retryable) {
        rec.permanent = true;
        rec.next_attempt_at = now;
        return RetryDecision{.action = RetryAction::GiveUp, .record = rec};
    }

    const auto delay = backoff_delay(rec.retry_count, policy_.backoff_cap);
    rec.retry_count += 1;
    rec.next_attempt_at = now + std::chrono::duration_cast<Timestamp::Duration>(delay);

    auto action = RetryAction::RetryLater;
    if (policy.refresh_first) {
        if (rec.refresh_attempted) {
            // Already refreshed once and still rejected.
            rec.permanent = true;
            action = RetryAction::GiveUp;
        } else {
            rec.refresh_attempted = true;
            action = RetryAction::RefreshThenRetry;
        }
    }
    if (rec.retry_count >= policy_.max_retries) {
        rec.permanent = true;
        action = RetryAction::GiveUp;
    }
    return RetryDecision{.action = action, .delay = delay, .record = rec};
}

void RetryScheduler::record_success(const std::string& sync_id) {
    records_.erase(sync_id);
}

std::optional<RetryRecord> RetryScheduler::mark_permanent(const std::string& sync_id,
                                                         std::string reason) {
    auto it = records_.find(sync_id);
    if (it == records_.end()) return std::nullopt;
    it->second.permanent = true;
    if (!reason.empty()) it->second.message = std::move(reason);
    return it->second;
}

bool RetryScheduler::clear(const std::string& sync_id) {
    return records_.erase(sync_id) > 0;
}

bool RetryScheduler::is_eligible(const std::string& sync_id, Timestamp now) const {
    auto it = records_.find(sync_id);
    if (it == records_.end()) return true;
    return !it->second.permanent && it->second.next_attempt_at <= now;
}

bool RetryScheduler::is_permanent(const std::string& sync_id) const {
    auto it = records_.find(sync_id);
    return it != records_.end() && it->second.permanent;
}

std::optional<RetryRecord> RetryScheduler::find(const std::string& sync_id) const {
    auto it = records_.find(sync_id);
    if (it == records_.end()) return std::nullopt;
    return it->second;
}

std::vector<RetryRecord> RetryScheduler::records() const {
    std::vector<RetryRecord> out;
    out.reserve(records_.size());
    for (const auto& [id, rec] : records_) {
        out.push_back(rec);
    }
    return out;
}

std::optional<Timestamp> RetryScheduler::next_wakeup(Timestamp now) const {
    std::optional<Timestamp> earliest;
    for (const auto& [id, rec] : records_) {
        if (rec.permanent || rec.next_attempt_at <= now) continue;
        if (!earliest || rec.next_attempt_at < *earliest) {
            earliest = rec.next_attempt_at;
        }
    }
    return earliest;
}

void RetryScheduler::restore(const std::vector<RetryRecord>& records) {
    records_.clear();
    for (const auto& rec : records) {
        records_[rec.sync_id] = rec;
    }
}

RecoveryPlan build_recovery_plan(const std::vector<RetryRecord>& records,
                                 const std::vector<Conflict>& unresolved,
                                 Timestamp now) {
    RecoveryPlan plan;
    for (const auto& rec : records) {
        RecoveryItem item{
            .sync_id = rec.sync_id,
            .title = rec.document_title,
            .reason = std::string(to_string(rec.failure)) + ": " + rec.message,
            .retry_count = rec.retry_count,
            .next_attempt_at = rec.next_attempt_at,
        };
        if (rec.permanent || !policy_for(rec.failure).retryable) {
            item.next_attempt_at.reset();
            plan.unrecoverable.push_back(std::move(item));
        } else if (rec.next_attempt_at <= now) {
            plan.immediate.push_back(std::move(item));
        } else {
            plan.delayed.push_back(std::move(item));
        }
    }
    for (const auto& conflict : unresolved) {
        if (conflict.resolved) continue;
        plan.manual.push_back(RecoveryItem{
            .sync_id = conflict.document_sync_id,
            .title = conflict.local_snapshot.title,
            .reason = std::string(to_string(conflict.type)),
        });
    }
    return plan;
}

std::string describe_failure(OperationKind operation,
                             std::string_view title,
                             std::string_view sync_id,
                             const Error& error) {
    std::string out = "Failed to ";
    out += verb(operation);
    out += " document \"";
    out += title;
    out += "\" (syncId: ";
    out += sync_id.empty() ? std::string_view("none") : sync_id;
    out += "): ";
    out += error.message;
    return out;
}

std::string user_message(OperationKind operation, FailureClass cls) {
    const std::string action(verb(operation));
    switch (cls) {
        case FailureClass::Network:
        case FailureClass::Timeout:
            return "Could not " + action + " the document. Check your connection; it will retry automatically.";
        case FailureClass::Auth:
            return "Your session has expired. Sign in again to " + action + " the document.";
        case FailureClass::Concurrency:
            return "This document was changed on another device. Review the conflict to continue.";
        case FailureClass::NotFound:
            return "The document no longer exists on the server.";
        case FailureClass::Storage:
        case FailureClass::Quota:
            return "Storage is unavailable or full; could not " + action + " the document.";
        case FailureClass::Validation:
            return "The document is invalid and cannot be synced.";
        case FailureClass::Unknown:
            break;
    }
    return "Could not " + action + " the document. It will retry automatically.";
}

} // namespace docsync
