#pragma once

#include "core/conflict.hpp"
#include "core/result.hpp"
#include "core/sync_operation.hpp"
#include "core/types.hpp"
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docsync {

enum class FailureClass {
    Network,
    Timeout,
    Auth,
    Concurrency,
    NotFound,
    Storage,
    Quota,
    Validation,
    Unknown
};

[[nodiscard]] std::string_view to_string(FailureClass cls) noexcept;
[[nodiscard]] std::optional<FailureClass> parse_failure_class(std::string_view text) noexcept;

/**
 * Map an error to its failure class (one classification per failure).
 */
[[nodiscard]] FailureClass classify(const Error& error) noexcept;

struct FailurePolicy {
    bool retryable{false};
    bool refresh_first{false};     // invoke the auth refresh hook before retrying
    bool route_to_conflict{false};
};

[[nodiscard]] FailurePolicy policy_for(FailureClass cls) noexcept;

struct RetryPolicy {
    int max_retries{5};
    std::chrono::seconds backoff_cap{300};
};

/**
 * min(2^retry_count, cap) seconds, where retry_count is the number of
 * failures recorded before this one.
 */
[[nodiscard]] std::chrono::seconds backoff_delay(int retry_count,
                                                 std::chrono::seconds cap = std::chrono::seconds(300));

/**
 * RetryRecord - the failure history of one document.
 */
struct RetryRecord {
    std::string sync_id;
    std::string document_title;
    OperationKind operation{OperationKind::Update};
    FailureClass failure{FailureClass::Unknown};
    std::string message;
    int retry_count{0};
    Timestamp failed_at;
    Timestamp next_attempt_at;
    bool permanent{false};
    bool refresh_attempted{false};

    bool operator==(const RetryRecord&) const = default;
};

enum class RetryAction {
    RetryLater,
    RefreshThenRetry,
    RouteToConflict,
    GiveUp
};

struct RetryDecision {
    RetryAction action{RetryAction::GiveUp};
    std::chrono::seconds delay{0};
    std::optional<RetryRecord> record;   // absent for conflict routing
};

/**
 * RetryScheduler - per-document failure bookkeeping and backoff.
 *
 * Retries never block: a failing document records when it may next be
 * attempted and the coordinator skips it until then. Permanent records
 * leave automatic retry until clear() or an explicit retry.
 */
class RetryScheduler {
public:
    explicit RetryScheduler(RetryPolicy policy = {}) : policy_(policy) {}

    RetryDecision record_failure(const std::string& sync_id,
                                 OperationKind operation,
                                 const Error& error,
                                 Timestamp now,
                                 std::string document_title = {});

    void record_success(const std::string& sync_id);

    /**
     * Escalate an existing record to permanent (e.g. the auth refresh hook
     * itself failed). Returns the updated record.
     */
    std::optional<RetryRecord> mark_permanent(const std::string& sync_id, std::string reason);

    /**
     * Drop a record (explicit caller action). Returns false when none existed.
     */
    bool clear(const std::string& sync_id);

    /**
     * No record, or a non-permanent record whose backoff has elapsed.
     */
    [[nodiscard]] bool is_eligible(const std::string& sync_id, Timestamp now) const;

    [[nodiscard]] bool is_permanent(const std::string& sync_id) const;
    [[nodiscard]] std::optional<RetryRecord> find(const std::string& sync_id) const;
    [[nodiscard]] std::vector<RetryRecord> records() const;

    /**
     * Earliest future eligibility among waiting records.
     */
    [[nodiscard]] std::optional<Timestamp> next_wakeup(Timestamp now) const;

    void restore(const std::vector<RetryRecord>& records);

    [[nodiscard]] const RetryPolicy& policy() const { return policy_; }
    void set_policy(RetryPolicy policy) { policy_ = policy; }

private:
    RetryPolicy policy_;
    std::map<std::string, RetryRecord> records_;
};

struct RecoveryItem {
    std::string sync_id;
    std::string title;
    std::string reason;
    int retry_count{0};
    std::optional<Timestamp> next_attempt_at;
};

/**
 * RecoveryPlan - every document the engine could not sync, bucketed by
 * what it takes to recover.
 */
struct RecoveryPlan {
    std::vector<RecoveryItem> immediate;      // retryable, backoff elapsed
    std::vector<RecoveryItem> delayed;        // retryable, still waiting
    std::vector<RecoveryItem> manual;         // unresolved conflicts
    std::vector<RecoveryItem> unrecoverable;  // non-retryable or out of retries

    [[nodiscard]] size_t total() const {
        return immediate.size() + delayed.size() + manual.size() + unrecoverable.size();
    }
    [[nodiscard]] bool empty() const { return total() == 0; }
};

[[nodiscard]] RecoveryPlan build_recovery_plan(const std::vector<RetryRecord>& records,
                                               const std::vector<Conflict>& unresolved,
                                               Timestamp now);

/**
 * Failed to upload document "Car Insurance" (syncId: ...): connection reset
 */
[[nodiscard]] std::string describe_failure(OperationKind operation,
                                           std::string_view title,
                                           std::string_view sync_id,
                                           const Error& error);

/**
 * Short message suitable for showing to a user.
 */
[[nodiscard]] std::string user_message(OperationKind operation, FailureClass cls);

} // namespace docsync
