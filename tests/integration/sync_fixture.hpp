#pragma once

#include <catch2/catch_test_macros.hpp>

#include <QCoreApplication>
#include <QEventLoop>
#include <QSignalSpy>
#include <QTimer>
#include <functional>
#include <memory>

#include "storage/sqlite_store.hpp"
#include "sync/connectivity.hpp"
#include "sync/memory_remote.hpp"
#include "sync/sync_coordinator.hpp"

namespace docsync::testing {

// Runs the event loop until `done` holds or the timeout expires.
inline bool wait_until(const std::function<bool()>& done, int timeoutMs = 2000) {
    if (done()) return true;
    QEventLoop loop;
    QTimer timeout;
    timeout.setSingleShot(true);
    timeout.setInterval(timeoutMs);
    QObject::connect(&timeout, &QTimer::timeout, &loop, &QEventLoop::quit);

    QTimer poll;
    poll.setInterval(5);
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

/**
 * One device: its own store and coordinator over a shared remote. Time is
 * a mutable Timestamp shared by every device of a test.
 */
struct Device {
    std::unique_ptr<storage::SqliteLocalStore> store;
    std::unique_ptr<sync::SyncCoordinator> coordinator;

    Device(sync::MemoryRemoteService& remote,
           sync::MemoryBlobStore& blobs,
           sync::AuthProvider& auth,
           sync::ConnectivityMonitor* connectivity,
           const sync::SyncSettings& settings,
           Timestamp& clock)
        : store(storage::SqliteLocalStore::open_memory().unwrap()) {
        coordinator = std::make_unique<sync::SyncCoordinator>(
            *store, remote, blobs, auth, connectivity, settings, [&clock] { return clock; });
    }

    // Rebuild the coordinator over the same store, as after an app restart.
    void restart(sync::MemoryRemoteService& remote,
                 sync::MemoryBlobStore& blobs,
                 sync::AuthProvider& auth,
                 const sync::SyncSettings& settings,
                 Timestamp& clock) {
        coordinator = std::make_unique<sync::SyncCoordinator>(
            *store, remote, blobs, auth, nullptr, settings, [&clock] { return clock; });
    }

    [[nodiscard]] std::optional<Document> find(const std::string& sync_id) {
        return store->document_by_sync_id(sync_id).unwrap();
    }

    // Create a document locally and queue its first upload.
    Document create(const std::string& title, Timestamp now) {
        auto doc = create_document("user-1", title, "insurance", now);
        REQUIRE(coordinator->enqueue(doc, OperationKind::Upload).is_ok());
        return *find(*doc.sync_id);
    }

    // Edit the stored copy and queue the push.
    void edit(const std::string& sync_id, const std::string& title, Timestamp now) {
        auto doc = *find(sync_id);
        doc.title = title;
        doc.last_modified = now;
        REQUIRE(coordinator->enqueue(doc, OperationKind::Update).is_ok());
    }
};

struct SyncFixture {
    Timestamp now{1'700'000'000'000};
    sync::MemoryRemoteService remote;
    sync::MemoryBlobStore blobs;
    sync::StaticAuthProvider auth{"user-1"};
    sync::SyncSettings settings = [] {
        sync::SyncSettings s;
        s.debounce = std::chrono::milliseconds(10);
        s.periodic_interval = std::chrono::hours(1);
        s.gate_cache_ttl = std::chrono::milliseconds(0);
        return s;
    }();

    std::unique_ptr<Device> device(sync::ConnectivityMonitor* connectivity = nullptr) {
        return std::make_unique<Device>(remote, blobs, auth, connectivity, settings, now);
    }

    void advance(std::chrono::milliseconds by) { now = now + by; }
};

inline std::vector<sync::SyncEvent> events_of(const QSignalSpy& spy, sync::SyncEventType type) {
    std::vector<sync::SyncEvent> out;
    for (const auto& args : spy) {
        const auto event = args.at(0).value<sync::SyncEvent>();
        if (event.type == type) out.push_back(event);
    }
    return out;
}

} // namespace docsync::testing
