#include <catch2/catch_test_macros.hpp>

#include "sync_fixture.hpp"

using namespace docsync;
using namespace docsync::sync;
using namespace docsync::testing;
using namespace std::chrono_literals;

namespace {

Error network_error() {
    return Error(ErrorKind::Network, "connection reset");
}

} // namespace

TEST_CASE("Coordinator: a new document is uploaded and reaches another device", "[integration][sync]") {
    SyncFixture f;
    auto a = f.device();
    auto b = f.device();
    QSignalSpy eventsA(a->coordinator.get(), &SyncCoordinator::syncEvent);

    const auto doc = a->create("Car Insurance", f.now);
    REQUIRE(a->coordinator->syncStatus().pending_count == 1);

    a->coordinator->syncNow();

    const auto pushed = *a->find(*doc.sync_id);
    REQUIRE(pushed.sync_state == SyncState::Synced);
    REQUIRE(pushed.version == 1);
    REQUIRE(pushed.server_version == 1);
    REQUIRE(a->coordinator->syncStatus().pending_count == 0);
    REQUIRE(a->coordinator->syncStatus().last_sync_time == f.now);
    REQUIRE(f.remote.stored(*doc.sync_id)->title == "Car Insurance");
    REQUIRE(a->store->queued_operations().unwrap().empty());

    REQUIRE(events_of(eventsA, SyncEventType::Started).size() == 1);
    REQUIRE(events_of(eventsA, SyncEventType::DocumentUploaded).size() == 1);
    REQUIRE(events_of(eventsA, SyncEventType::Completed).size() == 1);
    // The cycle's own upload is not downloaded back.
    REQUIRE(events_of(eventsA, SyncEventType::DocumentDownloaded).empty());

    b->coordinator->syncNow();
    const auto received = b->find(*doc.sync_id);
    REQUIRE(received.has_value());
    REQUIRE(received->title == "Car Insurance");
    REQUIRE(received->sync_state == SyncState::Synced);
    REQUIRE(received->server_version == 1);
}

TEST_CASE("Coordinator: edits push with compare-and-swap and propagate", "[integration][sync]") {
    SyncFixture f;
    auto a = f.device();
    auto b = f.device();
    const auto id = *a->create("Car Insurance", f.now).sync_id;
    a->coordinator->syncNow();
    b->coordinator->syncNow();

    f.advance(1min);
    a->edit(id, "Auto Insurance", f.now);
    REQUIRE(a->find(id)->version == 2);
    REQUIRE(a->find(id)->sync_state == SyncState::PendingUpload);

    // A second edit before the push stays on the same version.
    a->edit(id, "Auto Insurance Policy", f.now);
    REQUIRE(a->find(id)->version == 2);
    REQUIRE(a->coordinator->queue().size() == 1);

    a->coordinator->syncNow();
    REQUIRE(f.remote.stored(id)->version == 2);
    REQUIRE(f.remote.update_calls() == 1);

    b->coordinator->syncNow();
    REQUIRE(b->find(id)->title == "Auto Insurance Policy");
    REQUIRE(b->find(id)->version == 2);
}

TEST_CASE("Coordinator: concurrent edits open a conflict that resolves by merge", "[integration][sync][conflict]") {
    SyncFixture f;
    auto a = f.device();
    auto b = f.device();
    const auto id = *a->create("Car Insurance", f.now).sync_id;
    a->coordinator->syncNow();
    b->coordinator->syncNow();

    f.advance(1min);
    a->edit(id, "Auto Insurance", f.now);
    a->coordinator->syncNow();

    f.advance(1min);
    b->edit(id, "Motor Insurance", f.now);
    QSignalSpy eventsB(b->coordinator.get(), &SyncCoordinator::syncEvent);
    b->coordinator->syncNow();

    const auto conflicted = *b->find(id);
    REQUIRE(conflicted.sync_state == SyncState::Conflict);
    REQUIRE(conflicted.conflict_id.has_value());
    const auto detected = events_of(eventsB, SyncEventType::ConflictDetected);
    REQUIRE(detected.size() == 1);
    REQUIRE(detected[0].message == QStringLiteral("version_mismatch"));

    // Pulls leave the conflicted copy alone.
    b->coordinator->syncNow();
    REQUIRE(b->find(id)->title == "Motor Insurance");

    const auto plan = b->coordinator->recoveryPlan().unwrap();
    REQUIRE(plan.manual.size() == 1);

    const auto merged = b->coordinator->resolveConflict(*conflicted.conflict_id, ResolutionStrategy::Merge).unwrap();
    REQUIRE(merged.title == "Motor Insurance");
    REQUIRE(merged.version == 3);
    REQUIRE(merged.server_version == 2);
    REQUIRE(merged.sync_state == SyncState::PendingUpload);
    REQUIRE(b->store->open_conflicts().unwrap().empty());

    b->coordinator->syncNow();
    REQUIRE(f.remote.stored(id)->version == 3);
    REQUIRE(b->find(id)->sync_state == SyncState::Synced);

    a->coordinator->syncNow();
    REQUIRE(a->find(id)->title == "Motor Insurance");
    REQUIRE(a->find(id)->version == 3);
}

TEST_CASE("Coordinator: keeping the remote copy needs no push", "[integration][sync][conflict]") {
    SyncFixture f;
    auto a = f.device();
    auto b = f.device();
    const auto id = *a->create("Car Insurance", f.now).sync_id;
    a->coordinator->syncNow();
    b->coordinator->syncNow();

    f.advance(1min);
    a->edit(id, "Auto Insurance", f.now);
    a->coordinator->syncNow();
    b->edit(id, "Motor Insurance", f.now);
    b->coordinator->syncNow();

    const auto conflict_id = *b->find(id)->conflict_id;
    const auto kept = b->coordinator->resolveConflict(conflict_id, ResolutionStrategy::KeepRemote).unwrap();
    REQUIRE(kept.title == "Auto Insurance");
    REQUIRE(kept.sync_state == SyncState::Synced);
    REQUIRE(b->coordinator->queue().empty());

    const auto updates = f.remote.update_calls();
    b->coordinator->syncNow();
    REQUIRE(f.remote.update_calls() == updates);
    REQUIRE(b->find(id)->title == "Auto Insurance");

    REQUIRE(b->coordinator->resolveConflict(conflict_id, ResolutionStrategy::KeepLocal).is_err());
}

TEST_CASE("Coordinator: identical concurrent edits adopt the remote without a conflict", "[integration][sync][conflict]") {
    SyncFixture f;
    auto a = f.device();
    auto b = f.device();
    const auto id = *a->create("Car Insurance", f.now).sync_id;
    a->coordinator->syncNow();
    b->coordinator->syncNow();

    a->edit(id, "Auto Insurance", f.now);
    a->coordinator->syncNow();
    b->edit(id, "Auto Insurance", f.now);
    b->coordinator->syncNow();

    const auto doc = *b->find(id);
    REQUIRE(doc.sync_state == SyncState::Synced);
    REQUIRE(doc.server_version == 2);
    REQUIRE(b->store->open_conflicts().unwrap().empty());
}

TEST_CASE("Coordinator: local deletes win over concurrent remote edits", "[integration][sync][deletion]") {
    SyncFixture f;
    auto a = f.device();
    auto b = f.device();
    const auto created = a->create("Car Insurance", f.now);
    const auto id = *created.sync_id;
    REQUIRE(a->store->save_attachment(FileAttachment{
        .sync_id = "att-1",
        .document_sync_id = id,
        .file_name = "scan.pdf",
        .local_ref = "/tmp/scan.pdf",
        .file_size = 1024,
    }).is_ok());
    a->coordinator->syncNow();
    REQUIRE(f.blobs.size() == 1);
    b->coordinator->syncNow();

    f.advance(1min);
    b->edit(id, "Auto Insurance", f.now);
    b->coordinator->syncNow();
    REQUIRE(f.remote.stored(id)->version == 2);

    // A deletes its stale copy without pulling first.
    REQUIRE(a->coordinator->enqueue(*a->find(id), OperationKind::Delete).is_ok());
    REQUIRE(a->find(id)->sync_state == SyncState::PendingDeletion);
    REQUIRE(a->store->tombstone(id).unwrap().has_value());

    a->coordinator->syncNow();
    const auto remote = *f.remote.stored(id);
    REQUIRE(remote.deleted);
    REQUIRE(remote.version == 3);
    REQUIRE_FALSE(a->find(id).has_value());
    REQUIRE(a->store->attachments_for(id).unwrap().empty());
    REQUIRE(f.blobs.size() == 0);

    SECTION("the other device accepts the deletion") {
        b->coordinator->syncNow();
        REQUIRE_FALSE(b->find(id).has_value());
        REQUIRE(b->store->tombstone(id).unwrap()->reason == "remote");
    }

    SECTION("a tombstoned document is never resurrected") {
        auto revived = remote;
        revived.deleted = false;
        revived.deleted_at.reset();
        revived.version = 9;
        f.remote.put(revived);

        a->coordinator->syncNow();
        REQUIRE_FALSE(a->find(id).has_value());

        auto stale = created;
        stale.title = "Edited after delete";
        const auto rejected = a->coordinator->enqueue(stale, OperationKind::Update);
        REQUIRE(rejected.is_err());
        REQUIRE(rejected.unwrap_err().kind == ErrorKind::Validation);
    }
}

TEST_CASE("Coordinator: a remote deletion of a locally edited document is a conflict", "[integration][sync][deletion]") {
    SyncFixture f;
    auto a = f.device();
    auto b = f.device();
    const auto id = *a->create("Car Insurance", f.now).sync_id;
    a->coordinator->syncNow();
    b->coordinator->syncNow();

    REQUIRE(a->coordinator->enqueue(*a->find(id), OperationKind::Delete).is_ok());
    a->coordinator->syncNow();
    REQUIRE(f.remote.stored(id)->deleted);

    f.advance(1min);
    b->edit(id, "Auto Insurance", f.now);
    b->coordinator->syncNow();

    const auto conflicted = *b->find(id);
    REQUIRE(conflicted.sync_state == SyncState::Conflict);
    const auto conflict = *b->store->conflict(*conflicted.conflict_id).unwrap();
    REQUIRE(conflict.type == ConflictType::DeletionConflict);

    SECTION("keeping the local copy revives it on the remote") {
        const auto revived = b->coordinator->resolveConflict(conflict.id, ResolutionStrategy::KeepLocal).unwrap();
        REQUIRE_FALSE(revived.deleted);
        b->coordinator->syncNow();
        REQUIRE_FALSE(f.remote.stored(id)->deleted);
        REQUIRE(f.remote.stored(id)->title == "Auto Insurance");
    }

    SECTION("keeping the remote copy accepts the deletion") {
        REQUIRE(b->coordinator->resolveConflict(conflict.id, ResolutionStrategy::KeepRemote).is_ok());
        REQUIRE_FALSE(b->find(id).has_value());
        REQUIRE(b->store->tombstone(id).unwrap().has_value());
        REQUIRE(b->coordinator->queue().empty());
    }
}

TEST_CASE("Coordinator: deleting a conflicted document closes its conflict", "[integration][sync][deletion][conflict]") {
    SyncFixture f;
    auto a = f.device();
    auto b = f.device();
    const auto id = *a->create("Car Insurance", f.now).sync_id;
    a->coordinator->syncNow();
    b->coordinator->syncNow();

    f.advance(1min);
    a->edit(id, "Auto Insurance", f.now);
    a->coordinator->syncNow();
    b->edit(id, "Motor Insurance", f.now);
    b->coordinator->syncNow();
    const auto conflict_id = *b->find(id)->conflict_id;
    REQUIRE(b->coordinator->recoveryPlan().unwrap().manual.size() == 1);

    QSignalSpy events(b->coordinator.get(), &SyncCoordinator::syncEvent);
    REQUIRE(b->coordinator->enqueue(*b->find(id), OperationKind::Delete).is_ok());

    const auto pending = *b->find(id);
    REQUIRE(pending.sync_state == SyncState::PendingDeletion);
    REQUIRE_FALSE(pending.conflict_id.has_value());
    REQUIRE(b->store->open_conflicts().unwrap().empty());
    const auto closed = *b->store->conflict(conflict_id).unwrap();
    REQUIRE(closed.resolved);
    REQUIRE(closed.resolution_strategy == ResolutionStrategy::KeepLocal);
    REQUIRE(closed.resolved_at == f.now);
    REQUIRE(events_of(events, SyncEventType::StateChanged)[0].message == QStringLiteral("conflict closed by deletion"));

    SECTION("the deletion reaches the remote and nothing is left to recover") {
        b->coordinator->syncNow();
        REQUIRE(f.remote.stored(id)->deleted);
        REQUIRE_FALSE(b->find(id).has_value());
        REQUIRE(b->coordinator->recoveryPlan().unwrap().empty());

        const auto again = b->coordinator->resolveConflict(conflict_id, ResolutionStrategy::KeepLocal);
        REQUIRE(again.is_err());
        b->coordinator->syncNow();
        REQUIRE(f.remote.stored(id)->deleted);
    }

    SECTION("a pending deletion cannot be undone through the conflict") {
        f.remote.set_offline(true);
        b->coordinator->syncNow();
        REQUIRE(b->find(id)->sync_state == SyncState::PendingDeletion);

        REQUIRE(b->coordinator->resolveConflict(conflict_id, ResolutionStrategy::Merge).is_err());
        REQUIRE(b->find(id)->deleted);

        f.remote.set_offline(false);
        f.advance(1min);
        b->coordinator->syncNow();
        REQUIRE(f.remote.stored(id)->deleted);
    }
}

TEST_CASE("Coordinator: a conflict on a tombstoned document is refused", "[integration][sync][deletion][conflict]") {
    SyncFixture f;
    auto a = f.device();
    auto b = f.device();
    const auto id = *a->create("Car Insurance", f.now).sync_id;
    a->coordinator->syncNow();
    b->coordinator->syncNow();

    a->edit(id, "Auto Insurance", f.now);
    a->coordinator->syncNow();
    b->edit(id, "Motor Insurance", f.now);
    b->coordinator->syncNow();
    const auto conflict_id = *b->find(id)->conflict_id;

    // A tombstone written behind the coordinator's back, as by an older build.
    REQUIRE(b->store->insert_tombstone_if_absent(storage::Tombstone{
        .sync_id = id,
        .user_id = "user-1",
        .deleted_by = "user-1",
        .deleted_at = f.now,
        .reason = "user",
    }).unwrap());

    for (auto strategy : {ResolutionStrategy::KeepLocal, ResolutionStrategy::Merge}) {
        const auto refused = b->coordinator->resolveConflict(conflict_id, strategy);
        REQUIRE(refused.is_err());
        REQUIRE(refused.unwrap_err().kind == ErrorKind::Validation);
    }
    REQUIRE(b->store->open_conflicts().unwrap().size() == 1);
    b->coordinator->syncNow();
    REQUIRE(f.remote.stored(id)->title == "Auto Insurance");
}

TEST_CASE("Coordinator: deleting through a copy without a local id marks the stored row", "[integration][sync][deletion]") {
    SyncFixture f;
    auto a = f.device();
    const auto original = create_document("user-1", "Car Insurance", "insurance", f.now);
    REQUIRE(original.local_id == 0);
    REQUIRE(a->coordinator->enqueue(original, OperationKind::Upload).is_ok());
    a->coordinator->syncNow();
    REQUIRE(a->find(*original.sync_id)->sync_state == SyncState::Synced);

    REQUIRE(a->coordinator->enqueue(original, OperationKind::Delete).is_ok());
    const auto rows = a->store->documents().unwrap();
    REQUIRE(rows.size() == 1);
    REQUIRE(rows[0].sync_state == SyncState::PendingDeletion);
    REQUIRE(rows[0].server_version == 1);

    a->coordinator->syncNow();
    REQUIRE(f.remote.stored(*original.sync_id)->deleted);
    REQUIRE(a->store->documents().unwrap().empty());
}

TEST_CASE("Coordinator: deleting an identity-less document only removes it locally", "[integration][sync][deletion]") {
    SyncFixture f;
    auto a = f.device();
    auto legacy = create_document("user-1", "Legacy", "misc", f.now);
    legacy.sync_id.reset();
    legacy = a->store->save_document(legacy).unwrap();

    REQUIRE(a->coordinator->enqueue(legacy, OperationKind::Delete).is_ok());
    REQUIRE(a->store->documents().unwrap().empty());
    REQUIRE(a->store->tombstones().unwrap().empty());
    REQUIRE(a->coordinator->queue().empty());

    auto other = legacy;
    other.local_id = 0;
    REQUIRE(a->coordinator->enqueue(other, OperationKind::Update).unwrap_err().kind == ErrorKind::Validation);
}

TEST_CASE("Coordinator: transient failures back off on the injected clock", "[integration][sync][retry]") {
    SyncFixture f;
    auto a = f.device();
    const auto id = *a->create("Car Insurance", f.now).sync_id;

    f.remote.failures().fail_next(network_error());
    QSignalSpy events(a->coordinator.get(), &SyncCoordinator::syncEvent);
    a->coordinator->syncNow();

    REQUIRE(a->find(id)->sync_state == SyncState::Error);
    REQUIRE(events_of(events, SyncEventType::Failed).size() == 1);
    REQUIRE(events_of(events, SyncEventType::Failed)[0].message.contains(QStringLiteral("Failed to upload document \"Car Insurance\"")));
    REQUIRE(events_of(events, SyncEventType::Failed)[0].user_message ==
            QStringLiteral("Could not upload the document. Check your connection; it will retry automatically."));
    const auto record = *a->coordinator->retryScheduler().find(id);
    REQUIRE(record.retry_count == 1);
    REQUIRE(record.next_attempt_at == f.now + 1s);
    REQUIRE(a->store->retry_records().unwrap().size() == 1);
    REQUIRE(a->coordinator->queue().size() == 1);

    // Still inside the backoff window: nothing is attempted.
    const auto creates = f.remote.create_calls();
    a->coordinator->syncNow();
    REQUIRE(f.remote.create_calls() == creates);

    f.advance(1s);
    a->coordinator->syncNow();
    REQUIRE(a->find(id)->sync_state == SyncState::Synced);
    REQUIRE_FALSE(a->coordinator->retryScheduler().find(id).has_value());
    REQUIRE(a->store->retry_records().unwrap().empty());
}

TEST_CASE("Coordinator: repeated failures become permanent until retried", "[integration][sync][retry]") {
    SyncFixture f;
    auto a = f.device();
    const auto id = *a->create("Car Insurance", f.now).sync_id;

    f.remote.set_offline(true);
    for (int i = 0; i < 5; ++i) {
        a->coordinator->syncNow();
        f.advance(301s);
    }
    f.remote.set_offline(false);

    REQUIRE(a->coordinator->retryScheduler().is_permanent(id));
    REQUIRE(a->coordinator->queue().empty());
    REQUIRE(a->store->failed_operations().unwrap().size() == 1);

    const auto plan = a->coordinator->recoveryPlan().unwrap();
    REQUIRE(plan.unrecoverable.size() == 1);
    REQUIRE(plan.unrecoverable[0].retry_count == 5);

    // Permanent records are not retried automatically.
    const auto creates = f.remote.create_calls();
    a->coordinator->syncNow();
    REQUIRE(f.remote.create_calls() == creates);

    SECTION("an explicit retry pushes again") {
        REQUIRE(a->coordinator->retryDocument(id).is_ok());
        REQUIRE(a->store->failed_operations().unwrap().empty());
        a->coordinator->syncNow();
        REQUIRE(a->find(id)->sync_state == SyncState::Synced);
        REQUIRE(a->coordinator->recoveryPlan().unwrap().empty());
    }

    SECTION("clearing the error only forgets the history") {
        REQUIRE(a->coordinator->clearError(id).unwrap());
        REQUIRE_FALSE(a->coordinator->clearError(id).unwrap());
        REQUIRE(a->coordinator->recoveryPlan().unwrap().empty());
        REQUIRE(a->find(id)->sync_state == SyncState::Error);
    }
}

TEST_CASE("Coordinator: non-retryable failures give up at once", "[integration][sync][retry]") {
    SyncFixture f;
    auto a = f.device();
    const auto id = *a->create("Car Insurance", f.now).sync_id;

    f.remote.failures().fail_next(Error::validation("rejected by server"));
    a->coordinator->syncNow();

    REQUIRE(a->coordinator->retryScheduler().is_permanent(id));
    REQUIRE(a->coordinator->queue().empty());
    REQUIRE(a->coordinator->recoveryPlan().unwrap().unrecoverable.size() == 1);
}

TEST_CASE("Coordinator: auth failures refresh the token once", "[integration][sync][auth]") {
    SyncFixture f;
    auto a = f.device();
    const auto id = *a->create("Car Insurance", f.now).sync_id;
    const Error expired(ErrorKind::Auth, "token expired", 401);

    SECTION("refresh succeeds, then a second rejection is permanent") {
        f.remote.failures().fail_next(expired);
        a->coordinator->syncNow();
        REQUIRE(f.auth.refresh_calls() == 1);
        REQUIRE(a->coordinator->queue().size() == 1);
        REQUIRE_FALSE(a->coordinator->retryScheduler().is_permanent(id));

        f.advance(2s);
        f.remote.failures().fail_next(expired);
        a->coordinator->syncNow();
        REQUIRE(f.auth.refresh_calls() == 1);
        REQUIRE(a->coordinator->retryScheduler().is_permanent(id));
        REQUIRE(a->coordinator->queue().empty());
    }

    SECTION("refresh fails") {
        f.auth.set_refresh_fails(true);
        f.remote.failures().fail_next(expired);
        a->coordinator->syncNow();
        REQUIRE(f.auth.refresh_calls() == 1);
        const auto record = *a->coordinator->retryScheduler().find(id);
        REQUIRE(record.permanent);
        REQUIRE(record.message.rfind("Token refresh failed", 0) == 0);
    }
}

TEST_CASE("Coordinator: attachments travel as blobs", "[integration][sync][attachments]") {
    SyncFixture f;
    auto a = f.device();
    auto b = f.device();
    const auto id = *a->create("Car Insurance", f.now).sync_id;
    REQUIRE(a->store->save_attachment(FileAttachment{
        .sync_id = "att-1",
        .document_sync_id = id,
        .file_name = "scan.pdf",
        .local_ref = "/tmp/scan.pdf",
        .file_size = 1024,
    }).is_ok());

    a->coordinator->syncNow();
    const auto key = "documents/" + id + "/att-1-scan.pdf";
    REQUIRE(f.blobs.contains(key));
    REQUIRE(f.remote.stored(id)->attachment_refs == std::vector<std::string>{key});
    REQUIRE(a->store->attachments_for(id).unwrap()[0].sync_state == SyncState::Synced);

    SECTION("downloaded on the other device") {
        b->coordinator->syncNow();
        const auto attachments = b->store->attachments_for(id).unwrap();
        REQUIRE(attachments.size() == 1);
        REQUIRE(attachments[0].file_name == "att-1-scan.pdf");
        REQUIRE(attachments[0].local_ref == "cache/" + key);
        REQUIRE(attachments[0].sync_state == SyncState::Synced);
    }

    SECTION("a failed download is retried on the next pull") {
        f.blobs.failures().fail_next(network_error());
        b->coordinator->syncNow();
        REQUIRE(b->find(id)->sync_state == SyncState::Synced);
        REQUIRE(b->store->attachments_for(id).unwrap()[0].sync_state == SyncState::Error);

        b->coordinator->syncNow();
        REQUIRE(b->store->attachments_for(id).unwrap()[0].sync_state == SyncState::Synced);
    }

    SECTION("a failed upload keeps the document queued") {
        auto c = f.device();
        const auto other = *c->create("Passport", f.now).sync_id;
        REQUIRE(c->store->save_attachment(FileAttachment{
            .sync_id = "att-2",
            .document_sync_id = other,
            .file_name = "passport.jpg",
            .local_ref = "/tmp/passport.jpg",
        }).is_ok());
        f.blobs.failures().fail_next(network_error());
        c->coordinator->syncNow();
        REQUIRE(c->find(other)->sync_state == SyncState::Error);
        REQUIRE_FALSE(f.remote.stored(other).has_value());
        REQUIRE(c->coordinator->queue().size() == 1);
    }
}

TEST_CASE("Coordinator: pull policy", "[integration][sync]") {
    SyncFixture f;

    SECTION("echo suppression still pulls other documents") {
        auto a = f.device();
        a->create("Car Insurance", f.now);
        const auto lists = f.remote.list_calls();
        a->coordinator->syncNow();
        REQUIRE(f.remote.list_calls() == lists + 1);
    }

    SECTION("skip after upload defers the pull") {
        f.settings.pull_policy = PullPolicy::SkipAfterUpload;
        auto a = f.device();
        a->create("Car Insurance", f.now);
        const auto lists = f.remote.list_calls();
        a->coordinator->syncNow();
        REQUIRE(f.remote.list_calls() == lists);

        a->coordinator->syncNow();
        REQUIRE(f.remote.list_calls() == lists + 1);
    }
}

TEST_CASE("Coordinator: failed pulls do not complete the cycle", "[integration][sync]") {
    SyncFixture f;
    auto a = f.device();
    QSignalSpy events(a->coordinator.get(), &SyncCoordinator::syncEvent);
    f.remote.failures().fail_next(network_error());
    a->coordinator->syncNow();
    REQUIRE(events_of(events, SyncEventType::Completed).empty());
    REQUIRE(events_of(events, SyncEventType::Failed).size() == 1);

    f.remote.failures().fail_next(Error(ErrorKind::Auth, "expired"));
    a->coordinator->syncNow();
    REQUIRE(f.auth.refresh_calls() == 1);
}

TEST_CASE("Coordinator: identity backfill and adoption", "[integration][sync][identity]") {
    SyncFixture f;
    auto a = f.device();
    auto legacy = create_document("user-1", "Car Insurance", "insurance", f.now);
    legacy.sync_id.reset();
    REQUIRE(a->store->save_document(legacy).is_ok());

    SECTION("backfill assigns an id and uploads") {
        REQUIRE(a->coordinator->backfillIdentities().unwrap() == 1);
        const auto docs = a->store->documents().unwrap();
        REQUIRE(docs.size() == 1);
        REQUIRE(docs[0].has_sync_id());
        REQUIRE(a->coordinator->queue().size() == 1);
        REQUIRE(a->coordinator->backfillIdentities().unwrap() == 0);

        a->coordinator->syncNow();
        REQUIRE(f.remote.stored(*docs[0].sync_id).has_value());
    }

    SECTION("a matching remote document adopts the legacy row") {
        auto b = f.device();
        const auto id = *b->create("Car Insurance", f.now).sync_id;
        b->coordinator->syncNow();

        a->coordinator->syncNow();
        const auto docs = a->store->documents().unwrap();
        REQUIRE(docs.size() == 1);
        REQUIRE(docs[0].sync_id == id);
        REQUIRE(docs[0].sync_state == SyncState::Synced);
    }
}

TEST_CASE("Coordinator: queue and failures survive a restart", "[integration][sync][restore]") {
    SyncFixture f;
    auto a = f.device();
    const auto id = *a->create("Car Insurance", f.now).sync_id;
    f.remote.set_offline(true);
    a->coordinator->syncNow();
    REQUIRE(a->coordinator->retryScheduler().find(id).has_value());

    a->restart(f.remote, f.blobs, f.auth, f.settings, f.now);
    REQUIRE(a->coordinator->queue().empty());
    REQUIRE(a->coordinator->restore().is_ok());
    REQUIRE(a->coordinator->queue().size() == 1);
    REQUIRE(a->coordinator->retryScheduler().find(id)->retry_count == 1);

    f.remote.set_offline(false);
    f.advance(1s);
    a->coordinator->syncNow();
    REQUIRE(a->find(id)->sync_state == SyncState::Synced);
}

TEST_CASE("Coordinator: restore recovers interrupted transfers", "[integration][sync][restore]") {
    SyncFixture f;
    auto a = f.device();
    auto stuck = create_document("user-1", "Car Insurance", "insurance", f.now);
    stuck.sync_state = SyncState::Uploading;
    REQUIRE(a->store->save_document(stuck).is_ok());

    REQUIRE(a->coordinator->restore().is_ok());
    REQUIRE(a->find(*stuck.sync_id)->sync_state == SyncState::PendingUpload);
    REQUIRE(a->coordinator->queue().contains_document(*stuck.sync_id));
    REQUIRE(a->store->queued_operations().unwrap().size() == 1);

    a->coordinator->syncNow();
    REQUIRE(f.remote.stored(*stuck.sync_id).has_value());
}

TEST_CASE("Coordinator: sign-out forgets queued work", "[integration][sync]") {
    SyncFixture f;
    auto a = f.device();
    const auto id = *a->create("Car Insurance", f.now).sync_id;
    f.remote.set_offline(true);
    a->coordinator->syncNow();

    REQUIRE(a->coordinator->handleSignOut().is_ok());
    REQUIRE(a->coordinator->queue().empty());
    REQUIRE_FALSE(a->coordinator->isRunning());
    REQUIRE(a->store->queued_operations().unwrap().empty());
    REQUIRE(a->store->retry_records().unwrap().empty());
    // Local data is kept.
    REQUIRE(a->find(id).has_value());
}

TEST_CASE("Coordinator: triggers are debounced into one cycle", "[integration][sync][timers]") {
    SyncFixture f;
    ManualConnectivity online{Connectivity::Wifi};
    auto a = f.device(&online);
    REQUIRE(a->coordinator->start().is_ok());
    REQUIRE(a->coordinator->isRunning());

    a->create("Car Insurance", f.now);
    a->create("Passport", f.now);
    a->create("Health Card", f.now);

    REQUIRE(wait_until([&] { return f.remote.size() == 3; }));
    REQUIRE(a->coordinator->cycleCount() == 1);
    a->coordinator->stop();
}

TEST_CASE("Coordinator: gating by pause, connectivity and Wi-Fi only", "[integration][sync][timers]") {
    SyncFixture f;
    ManualConnectivity network{Connectivity::Offline};

    SECTION("offline until connectivity returns") {
        auto a = f.device(&network);
        REQUIRE(a->coordinator->start().is_ok());
        a->create("Car Insurance", f.now);
        a->coordinator->syncNow();
        REQUIRE(a->coordinator->cycleCount() == 0);

        network.set(Connectivity::Ethernet);
        REQUIRE(wait_until([&] { return f.remote.size() == 1; }));
        a->coordinator->stop();
    }

    SECTION("Wi-Fi only holds back on cellular") {
        f.settings.wifi_only = true;
        network.set(Connectivity::Cellular);
        auto a = f.device(&network);
        a->create("Car Insurance", f.now);
        a->coordinator->syncNow();
        REQUIRE(f.remote.size() == 0);

        network.set(Connectivity::Wifi);
        a->coordinator->syncNow();
        REQUIRE(f.remote.size() == 1);
    }

    SECTION("paused") {
        network.set(Connectivity::Wifi);
        auto a = f.device(&network);
        a->coordinator->setPaused(true);
        a->create("Car Insurance", f.now);
        a->coordinator->syncNow();
        REQUIRE(a->coordinator->cycleCount() == 0);

        a->coordinator->setPaused(false);
        a->coordinator->syncNow();
        REQUIRE(f.remote.size() == 1);
    }
}
