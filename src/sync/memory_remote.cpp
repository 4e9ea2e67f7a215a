#include "sync/memory_remote.hpp"
#include "core/sync_id.hpp"

#include <algorithm>

namespace docsync::sync {

namespace {

// The remote's view of a record: no local bookkeeping.
Document as_stored(Document doc) {
    doc.local_id = 0;
    doc.server_version = doc.version;
    doc.sync_state = SyncState::Synced;
    doc.conflict_id.reset();
    if (doc.sync_id) doc.sync_id = sync_id::normalize(*doc.sync_id);
    return doc;
}

Error offline_error() {
    return Error(ErrorKind::Network, "Remote unreachable");
}

} // namespace

std::optional<Error> MemoryRemoteService::injected() {
    if (offline_) return offline_error();
    return failures_.take();
}

Result<Document, Error> MemoryRemoteService::create(const Document& doc) {
    ++create_calls_;
    if (auto error = injected()) return Result<Document, Error>::err(*error);
    if (!doc.has_sync_id()) {
        return Result<Document, Error>::err(Error::validation("Remote create requires a sync id"));
    }

    const auto key = sync_id::normalize(*doc.sync_id);
    auto it = documents_.find(key);
    if (it != documents_.end() && !it->second.deleted) {
        return Result<Document, Error>::err(
            Error(ErrorKind::Concurrency, "Document " + key + " already exists", 409));
    }

    auto stored_doc = as_stored(doc);
    // Re-creating a soft-deleted record continues its version line.
    if (it != documents_.end()) {
        stored_doc.version = std::max(stored_doc.version, it->second.version + 1);
    }
    stored_doc.version = std::max<std::int64_t>(stored_doc.version, 1);
    stored_doc.server_version = stored_doc.version;
    documents_[key] = stored_doc;
    return Result<Document, Error>::ok(stored_doc);
}

UpdateOutcome MemoryRemoteService::update(const Document& doc) {
    ++update_calls_;
    if (auto error = injected()) return *error;
    if (!doc.has_sync_id()) {
        return Error::validation("Remote update requires a sync id");
    }

    const auto key = sync_id::normalize(*doc.sync_id);
    auto it = documents_.find(key);
    if (it == documents_.end()) {
        return Error::not_found("Document " + key + " does not exist on the remote");
    }
    if (it->second.version != doc.server_version) {
        return VersionConflict{doc, it->second};
    }

    auto stored_doc = as_stored(doc);
    if (stored_doc.version <= it->second.version) {
        stored_doc.version = it->second.version + 1;
        stored_doc.server_version = stored_doc.version;
    }
    it->second = stored_doc;
    return Updated{stored_doc};
}

Result<Document, Error> MemoryRemoteService::get(const std::string& raw) {
    if (auto error = injected()) return Result<Document, Error>::err(*error);
    auto it = documents_.find(sync_id::normalize(raw));
    if (it == documents_.end()) {
        return Result<Document, Error>::err(Error::not_found("Document " + raw + " not found"));
    }
    return Result<Document, Error>::ok(it->second);
}

Result<std::vector<Document>, Error> MemoryRemoteService::list(const std::string& user_id,
                                                               bool exclude_deleted) {
    ++list_calls_;
    if (auto error = injected()) return Result<std::vector<Document>, Error>::err(*error);
    std::vector<Document> out;
    for (const auto& [key, doc] : documents_) {
        if (doc.user_id != user_id) continue;
        if (exclude_deleted && doc.deleted) continue;
        out.push_back(doc);
    }
    return Result<std::vector<Document>, Error>::ok(std::move(out));
}

void MemoryRemoteService::put(Document doc) {
    auto stored_doc = as_stored(std::move(doc));
    documents_[*stored_doc.sync_id] = stored_doc;
}

std::optional<Document> MemoryRemoteService::stored(const std::string& sync_id) const {
    auto it = documents_.find(sync_id::normalize(sync_id));
    if (it == documents_.end()) return std::nullopt;
    return it->second;
}

Result<std::string, Error> MemoryBlobStore::upload(const std::string& local_ref,
                                                   const std::string& dest_key) {
    if (auto error = failures_.take()) return Result<std::string, Error>::err(*error);
    if (dest_key.empty()) {
        return Result<std::string, Error>::err(Error::validation("Blob key must not be empty"));
    }
    blobs_[dest_key] = local_ref;
    return Result<std::string, Error>::ok(dest_key);
}

Result<std::string, Error> MemoryBlobStore::download(const std::string& blob_key) {
    if (auto error = failures_.take()) return Result<std::string, Error>::err(*error);
    if (blobs_.count(blob_key) == 0) {
        return Result<std::string, Error>::err(Error::not_found("Blob " + blob_key + " not found"));
    }
    return Result<std::string, Error>::ok("cache/" + blob_key);
}

Result<void, Error> MemoryBlobStore::remove(const std::string& blob_key) {
    if (auto error = failures_.take()) return Result<void, Error>::err(*error);
    blobs_.erase(blob_key);
    return Result<void, Error>::ok();
}

Result<void, Error> StaticAuthProvider::refresh() {
    ++refresh_calls_;
    if (refresh_fails_) {
        return Result<void, Error>::err(Error(ErrorKind::Auth, "Token refresh rejected", 401));
    }
    return Result<void, Error>::ok();
}

} // namespace docsync::sync
