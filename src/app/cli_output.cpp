#include "app/cli_output.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QStringList>

namespace docsync::app {

namespace {

constexpr SyncState kAllStates[] = {
    SyncState::PendingUpload, SyncState::Uploading, SyncState::PendingDownload,
    SyncState::Downloading,   SyncState::Synced,    SyncState::Conflict,
    SyncState::Error,         SyncState::PendingDeletion,
};

[[nodiscard]] QString q(std::string_view s) {
    return QString::fromUtf8(s.data(), static_cast<qsizetype>(s.size()));
}

[[nodiscard]] QString iso(Timestamp ts) {
    return QString::fromStdString(ts.to_iso_string());
}

[[nodiscard]] QString to_json_text(const QJsonObject& obj) {
    return QString::fromUtf8(QJsonDocument(obj).toJson(QJsonDocument::Indented));
}

[[nodiscard]] QJsonObject document_to_json(const Document& doc) {
    QJsonObject obj;
    obj.insert(QStringLiteral("localId"), static_cast<qint64>(doc.local_id));
    obj.insert(QStringLiteral("syncId"), doc.sync_id ? q(*doc.sync_id) : QJsonValue());
    obj.insert(QStringLiteral("title"), q(doc.title));
    obj.insert(QStringLiteral("category"), q(doc.category));
    obj.insert(QStringLiteral("syncState"), q(to_string(doc.sync_state)));
    obj.insert(QStringLiteral("version"), static_cast<qint64>(doc.version));
    obj.insert(QStringLiteral("serverVersion"), static_cast<qint64>(doc.server_version));
    obj.insert(QStringLiteral("lastModified"), iso(doc.last_modified));
    obj.insert(QStringLiteral("attachments"), static_cast<int>(doc.attachment_refs.size()));
    if (doc.conflict_id) obj.insert(QStringLiteral("conflictId"), q(*doc.conflict_id));
    if (doc.deleted) obj.insert(QStringLiteral("deleted"), true);
    return obj;
}

[[nodiscard]] QJsonArray items_to_json(const std::vector<RecoveryItem>& items) {
    QJsonArray out;
    for (const auto& item : items) {
        QJsonObject obj;
        obj.insert(QStringLiteral("syncId"), q(item.sync_id));
        obj.insert(QStringLiteral("title"), q(item.title));
        obj.insert(QStringLiteral("reason"), q(item.reason));
        obj.insert(QStringLiteral("retryCount"), item.retry_count);
        if (item.next_attempt_at) {
            obj.insert(QStringLiteral("nextAttemptAt"), iso(*item.next_attempt_at));
        }
        out.append(obj);
    }
    return out;
}

void append_items(QStringList& out, const QString& heading, const std::vector<RecoveryItem>& items) {
    if (items.empty()) return;
    out.append(QStringLiteral("%1 (%2)").arg(heading).arg(items.size()));
    for (const auto& item : items) {
        auto line = QStringLiteral("  - %1 \"%2\": %3").arg(q(item.sync_id), q(item.title), q(item.reason));
        if (item.retry_count > 0) line += QStringLiteral(" [retries: %1]").arg(item.retry_count);
        if (item.next_attempt_at) line += QStringLiteral(" [next: %1]").arg(iso(*item.next_attempt_at));
        out.append(line);
    }
}

[[nodiscard]] QString join_lines(const QStringList& lines) {
    return lines.isEmpty() ? QString{} : lines.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

} // namespace

Result<StoreSummary, Error> summarize(storage::LocalStore& store) {
    StoreSummary summary;

    auto docs = store.documents();
    if (docs.is_err()) return propagate<StoreSummary>(docs);
    for (const auto& doc : docs.unwrap()) {
        ++summary.by_state[doc.sync_state];
        ++summary.documents;
        if (!doc.has_sync_id()) ++summary.without_identity;
    }

    auto queued = store.queued_operations();
    if (queued.is_err()) return propagate<StoreSummary>(queued);
    summary.queued_operations = static_cast<int>(queued.unwrap().size());

    auto failed = store.failed_operations();
    if (failed.is_err()) return propagate<StoreSummary>(failed);
    summary.failed_operations = static_cast<int>(failed.unwrap().size());

    auto records = store.retry_records();
    if (records.is_err()) return propagate<StoreSummary>(records);
    summary.retry_records = static_cast<int>(records.unwrap().size());

    auto conflicts = store.open_conflicts();
    if (conflicts.is_err()) return propagate<StoreSummary>(conflicts);
    summary.open_conflicts = static_cast<int>(conflicts.unwrap().size());

    auto tombstones = store.tombstones();
    if (tombstones.is_err()) return propagate<StoreSummary>(tombstones);
    summary.tombstones = static_cast<int>(tombstones.unwrap().size());

    return Result<StoreSummary, Error>::ok(std::move(summary));
}

QString format_summary(const StoreSummary& summary) {
    QStringList lines;
    lines.append(QStringLiteral("documents: %1").arg(summary.documents));
    for (const auto state : kAllStates) {
        const auto it = summary.by_state.find(state);
        if (it == summary.by_state.end()) continue;
        lines.append(QStringLiteral("  %1: %2").arg(q(to_string(state))).arg(it->second));
    }
    if (summary.without_identity > 0) {
        lines.append(QStringLiteral("without sync id: %1").arg(summary.without_identity));
    }
    lines.append(QStringLiteral("queued operations: %1").arg(summary.queued_operations));
    lines.append(QStringLiteral("failed operations: %1").arg(summary.failed_operations));
    lines.append(QStringLiteral("retry records: %1").arg(summary.retry_records));
    lines.append(QStringLiteral("open conflicts: %1").arg(summary.open_conflicts));
    lines.append(QStringLiteral("tombstones: %1").arg(summary.tombstones));
    return join_lines(lines);
}

QString format_summary_json(const StoreSummary& summary) {
    QJsonObject states;
    for (const auto& [state, count] : summary.by_state) {
        states.insert(q(to_string(state)), count);
    }
    QJsonObject obj;
    obj.insert(QStringLiteral("documents"), summary.documents);
    obj.insert(QStringLiteral("byState"), states);
    obj.insert(QStringLiteral("withoutIdentity"), summary.without_identity);
    obj.insert(QStringLiteral("pendingCount"), summary.queued_operations);
    obj.insert(QStringLiteral("failedOperations"), summary.failed_operations);
    obj.insert(QStringLiteral("retryRecords"), summary.retry_records);
    obj.insert(QStringLiteral("openConflicts"), summary.open_conflicts);
    obj.insert(QStringLiteral("tombstones"), summary.tombstones);
    return to_json_text(obj);
}

QString format_documents(const std::vector<Document>& documents) {
    QStringList lines;
    for (const auto& doc : documents) {
        const auto id = doc.sync_id ? q(*doc.sync_id) : QStringLiteral("(no sync id, local %1)").arg(doc.local_id);
        lines.append(QStringLiteral("%1  %2  v%3/%4  %5")
                         .arg(id, q(to_string(doc.sync_state)))
                         .arg(doc.version)
                         .arg(doc.server_version)
                         .arg(q(doc.title)));
    }
    return join_lines(lines);
}

QString format_documents_json(const std::vector<Document>& documents) {
    QJsonArray arr;
    for (const auto& doc : documents) {
        arr.append(document_to_json(doc));
    }
    QJsonObject obj;
    obj.insert(QStringLiteral("documents"), arr);
    return to_json_text(obj);
}

QString format_recovery_plan(const RecoveryPlan& plan) {
    if (plan.empty()) return QStringLiteral("Nothing to recover.\n");
    QStringList lines;
    append_items(lines, QStringLiteral("Ready to retry"), plan.immediate);
    append_items(lines, QStringLiteral("Waiting for backoff"), plan.delayed);
    append_items(lines, QStringLiteral("Needs conflict resolution"), plan.manual);
    append_items(lines, QStringLiteral("Unrecoverable"), plan.unrecoverable);
    return join_lines(lines);
}

QString format_recovery_plan_json(const RecoveryPlan& plan) {
    QJsonObject obj;
    obj.insert(QStringLiteral("immediate"), items_to_json(plan.immediate));
    obj.insert(QStringLiteral("delayed"), items_to_json(plan.delayed));
    obj.insert(QStringLiteral("manual"), items_to_json(plan.manual));
    obj.insert(QStringLiteral("unrecoverable"), items_to_json(plan.unrecoverable));
    obj.insert(QStringLiteral("total"), static_cast<int>(plan.total()));
    return to_json_text(obj);
}

QString format_conflicts(const std::vector<Conflict>& conflicts) {
    QStringList lines;
    for (const auto& c : conflicts) {
        QStringList fields;
        for (const auto& field : differing_fields(c.local_snapshot, c.remote_snapshot)) {
            fields.append(q(field));
        }
        lines.append(QStringLiteral("%1  %2  %3  local v%4 \"%5\" / remote v%6 \"%7\"%8  [%9]")
                         .arg(q(c.id), q(c.document_sync_id), q(to_string(c.type)))
                         .arg(c.local_snapshot.version)
                         .arg(q(c.local_snapshot.title))
                         .arg(c.remote_snapshot.version)
                         .arg(q(c.remote_snapshot.title),
                              c.remote_snapshot.deleted ? QStringLiteral(" (deleted)") : QString{},
                              fields.join(QStringLiteral(", "))));
    }
    return join_lines(lines);
}

QString format_tombstones(const std::vector<storage::Tombstone>& tombstones) {
    QStringList lines;
    for (const auto& t : tombstones) {
        lines.append(QStringLiteral("%1  %2  by %3  (%4)")
                         .arg(q(t.sync_id), iso(t.deleted_at), q(t.deleted_by), q(t.reason)));
    }
    return join_lines(lines);
}

} // namespace docsync::app
