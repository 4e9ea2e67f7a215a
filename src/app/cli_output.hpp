#pragma once

#include "core/conflict.hpp"
#include "core/document.hpp"
#include "core/result.hpp"
#include "core/retry_policy.hpp"
#include "storage/local_store.hpp"

#include <QString>
#include <map>
#include <vector>

namespace docsync::app {

struct StoreSummary {
    std::map<SyncState, int> by_state;
    int documents = 0;
    int without_identity = 0;
    int queued_operations = 0;
    int failed_operations = 0;
    int retry_records = 0;
    int open_conflicts = 0;
    int tombstones = 0;
};

[[nodiscard]] Result<StoreSummary, Error> summarize(storage::LocalStore& store);

// Plain text output is line-oriented and stable so it can be diffed; JSON
// output uses the camelCase keys of the sync event payloads.
[[nodiscard]] QString format_summary(const StoreSummary& summary);
[[nodiscard]] QString format_summary_json(const StoreSummary& summary);

// "<syncId>  <state>  v<version>/<serverVersion>  <title>"
[[nodiscard]] QString format_documents(const std::vector<Document>& documents);
[[nodiscard]] QString format_documents_json(const std::vector<Document>& documents);

[[nodiscard]] QString format_recovery_plan(const RecoveryPlan& plan);
[[nodiscard]] QString format_recovery_plan_json(const RecoveryPlan& plan);

[[nodiscard]] QString format_conflicts(const std::vector<Conflict>& conflicts);
[[nodiscard]] QString format_tombstones(const std::vector<storage::Tombstone>& tombstones);

} // namespace docsync::app
