#include "app/commands.hpp"

#include "app/cli_output.hpp"
#include "core/document_matcher.hpp"
#include "sync/deletion_tracker.hpp"

namespace docsync::app {

namespace {

using CommandResult = Result<QString, Error>;

[[nodiscard]] CommandResult ok(QString text) {
    return CommandResult::ok(std::move(text));
}

[[nodiscard]] std::string argument(const CommandOptions& options, qsizetype index) {
    return index < options.arguments.size() ? options.arguments.at(index).toStdString() : std::string{};
}

CommandResult status(storage::LocalStore& store, const CommandOptions& options) {
    auto summary = summarize(store);
    if (summary.is_err()) return propagate<QString>(summary);
    return ok(options.json ? format_summary_json(summary.unwrap()) : format_summary(summary.unwrap()));
}

CommandResult list(storage::LocalStore& store, const CommandOptions& options) {
    auto docs = options.state ? store.documents_in_state(*options.state) : store.documents();
    if (docs.is_err()) return propagate<QString>(docs);
    return ok(options.json ? format_documents_json(docs.unwrap()) : format_documents(docs.unwrap()));
}

CommandResult recovery(sync::SyncCoordinator& coordinator, const CommandOptions& options) {
    auto plan = coordinator.recoveryPlan();
    if (plan.is_err()) return propagate<QString>(plan);
    return ok(options.json ? format_recovery_plan_json(plan.unwrap()) : format_recovery_plan(plan.unwrap()));
}

CommandResult conflicts(storage::LocalStore& store) {
    auto open = store.open_conflicts();
    if (open.is_err()) return propagate<QString>(open);
    if (open.unwrap().empty()) return ok(QStringLiteral("No open conflicts.\n"));
    return ok(format_conflicts(open.unwrap()));
}

CommandResult resolve(sync::SyncCoordinator& coordinator, const CommandOptions& options) {
    const auto conflict_id = argument(options, 0);
    const auto strategy_text = argument(options, 1);
    if (conflict_id.empty() || strategy_text.empty()) {
        return CommandResult::err(
            Error::validation("usage: resolve <conflictId> <keepLocal|keepRemote|merge>"));
    }
    const auto strategy = parse_resolution_strategy(strategy_text);
    if (!strategy || *strategy == ResolutionStrategy::Manual) {
        return CommandResult::err(Error::validation("Unknown strategy '" + strategy_text +
                                                    "' (expected keepLocal, keepRemote or merge)"));
    }

    auto resolved = coordinator.resolveConflict(conflict_id, *strategy);
    if (resolved.is_err()) return propagate<QString>(resolved);
    const auto& doc = resolved.unwrap();
    return ok(QStringLiteral("Resolved %1 with %2; document is now %3 (v%4)\n")
                  .arg(QString::fromStdString(conflict_id),
                       QString::fromUtf8(to_string(*strategy).data()),
                       QString::fromUtf8(to_string(doc.sync_state).data()))
                  .arg(doc.version));
}

CommandResult check_ids(storage::LocalStore& store) {
    auto docs = store.documents();
    if (docs.is_err()) return propagate<QString>(docs);
    const auto report = matcher::validate_unique_identities(docs.unwrap());
    if (!report.valid()) {
        return CommandResult::err(Error::validation(report.summary()));
    }
    return ok(QStringLiteral("%1 documents: %2 with sync id, %3 without; no duplicates\n")
                  .arg(report.total_documents)
                  .arg(report.with_identity)
                  .arg(report.without_identity));
}

CommandResult backfill_ids(sync::SyncCoordinator& coordinator) {
    auto count = coordinator.backfillIdentities();
    if (count.is_err()) return propagate<QString>(count);
    return ok(QStringLiteral("Assigned sync ids to %1 documents\n").arg(count.unwrap()));
}

CommandResult purge_tombstones(storage::LocalStore& store, sync::SyncCoordinator& coordinator) {
    sync::DeletionTracker tracker(store, system_clock(), coordinator.settings().tombstone_retention);
    auto purged = tracker.purge_expired();
    if (purged.is_err()) return propagate<QString>(purged);
    return ok(QStringLiteral("Purged %1 expired tombstones\n").arg(purged.unwrap()));
}

CommandResult tombstones(storage::LocalStore& store) {
    auto all = store.tombstones();
    if (all.is_err()) return propagate<QString>(all);
    if (all.unwrap().empty()) return ok(QStringLiteral("No tombstones.\n"));
    return ok(format_tombstones(all.unwrap()));
}

} // namespace

QStringList command_names() {
    return {
        QStringLiteral("status"),
        QStringLiteral("list"),
        QStringLiteral("recovery"),
        QStringLiteral("conflicts"),
        QStringLiteral("resolve"),
        QStringLiteral("check-ids"),
        QStringLiteral("backfill-ids"),
        QStringLiteral("purge-tombstones"),
        QStringLiteral("tombstones"),
    };
}

Result<QString, Error> run_command(const QString& command,
                                   storage::LocalStore& store,
                                   sync::SyncCoordinator& coordinator,
                                   const CommandOptions& options) {
    if (command == QStringLiteral("status")) return status(store, options);
    if (command == QStringLiteral("list")) return list(store, options);
    if (command == QStringLiteral("recovery")) return recovery(coordinator, options);
    if (command == QStringLiteral("conflicts")) return conflicts(store);
    if (command == QStringLiteral("resolve")) return resolve(coordinator, options);
    if (command == QStringLiteral("check-ids")) return check_ids(store);
    if (command == QStringLiteral("backfill-ids")) return backfill_ids(coordinator);
    if (command == QStringLiteral("purge-tombstones")) return purge_tombstones(store, coordinator);
    if (command == QStringLiteral("tombstones")) return tombstones(store);

    return CommandResult::err(Error::validation(
        "Unknown command '" + command.toStdString() + "' (expected one of: " +
        command_names().join(QStringLiteral(", ")).toStdString() + ")"));
}

int exit_code_for(const Error& error) {
    switch (error.kind) {
        case ErrorKind::Validation: return 2;
        case ErrorKind::NotFound: return 3;
        case ErrorKind::Storage: return 4;
        default: return 1;
    }
}

} // namespace docsync::app
