#include <QCoreApplication>
#include <QEventLoop>
#include <QTimer>
#include <functional>

#include "core/document.hpp"
#include "storage/sqlite_store.hpp"
#include "sync/connectivity.hpp"
#include "sync/memory_remote.hpp"
#include "sync/sync_coordinator.hpp"

namespace {

// Runs the event loop until `done` holds or the timeout expires.
bool wait_until(const std::function<bool()>& done, int timeoutMs = 3000) {
    QEventLoop loop;
    QTimer timeout;
    timeout.setSingleShot(true);
    timeout.setInterval(timeoutMs);
    QObject::connect(&timeout, &QTimer::timeout, &loop, &QEventLoop::quit);

    QTimer poll;
    poll.setInterval(20);
    QObject::connect(&poll, &QTimer::timeout, &loop, [&]() {
        if (done()) {
            loop.quit();
        }
    });

    timeout.start();
    poll.start();
    loop.exec();
    return done();
}

bool has_document(docsync::storage::LocalStore& store, const std::string& syncId) {
    auto found = store.document_by_sync_id(syncId);
    return found.is_ok() && found.unwrap().has_value();
}

} // namespace

int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);

    qputenv("DOCSYNC_DEBUG_SYNC", "1");

    auto storeA = docsync::storage::SqliteLocalStore::open_memory();
    auto storeB = docsync::storage::SqliteLocalStore::open_memory();
    if (storeA.is_err() || storeB.is_err()) {
        qCritical() << "cannot open in-memory stores";
        return 1;
    }
    auto a = std::move(storeA).unwrap();
    auto b = std::move(storeB).unwrap();

    docsync::sync::MemoryRemoteService remote;
    docsync::sync::MemoryBlobStore blobs;
    docsync::sync::StaticAuthProvider auth{"user-1"};
    docsync::sync::ManualConnectivity online{docsync::sync::Connectivity::Wifi};

    docsync::sync::SyncSettings settings;
    settings.debounce = std::chrono::milliseconds(10);
    settings.periodic_interval = std::chrono::milliseconds(100);

    docsync::sync::SyncCoordinator deviceA(*a, remote, blobs, auth, &online, settings);
    docsync::sync::SyncCoordinator deviceB(*b, remote, blobs, auth, &online, settings);

    QObject::connect(&deviceA, &docsync::sync::SyncCoordinator::syncEvent, &app,
                     [](const docsync::sync::SyncEvent &event) {
        if (event.type == docsync::sync::SyncEventType::Failed) {
            qCritical().noquote() << "A failed:" << event.message;
        }
    });
    QObject::connect(&deviceB, &docsync::sync::SyncCoordinator::syncEvent, &app,
                     [](const docsync::sync::SyncEvent &event) {
        if (event.type == docsync::sync::SyncEventType::Failed) {
            qCritical().noquote() << "B failed:" << event.message;
        }
    });

    if (deviceA.start().is_err() || deviceB.start().is_err()) {
        return 1;
    }

    // A creates a document; B picks it up on its periodic pull.
    const auto doc = docsync::create_document("user-1", "Car Insurance", "insurance", docsync::Timestamp::now());
    const auto syncId = *doc.sync_id;
    if (deviceA.enqueue(doc, docsync::OperationKind::Upload).is_err()) {
        return 1;
    }
    if (!wait_until([&] { return has_document(*b, syncId); })) {
        qCritical() << "B never received the document";
        return 2;
    }

    // B deletes it; A drops its copy and keeps a tombstone.
    auto onB = b->document_by_sync_id(syncId);
    if (onB.is_err() || !onB.unwrap()) {
        return 1;
    }
    if (deviceB.enqueue(*onB.unwrap(), docsync::OperationKind::Delete).is_err()) {
        return 1;
    }
    const bool removed = wait_until([&] {
        auto tomb = a->tombstone(syncId);
        return !has_document(*a, syncId) && tomb.is_ok() && tomb.unwrap().has_value();
    });
    if (!removed) {
        qCritical() << "A never applied the remote deletion";
        return 3;
    }

    deviceA.stop();
    deviceB.stop();
    return 0;
}
