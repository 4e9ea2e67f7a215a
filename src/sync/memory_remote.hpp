#pragma once

#include "sync/auth_provider.hpp"
#include "sync/blob_store.hpp"
#include "sync/remote_service.hpp"
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace docsync::sync {

/**
 * FailureInjector - queued errors returned by the next calls of an
 * in-memory collaborator, one per call.
 */
class FailureInjector {
public:
    void fail_next(Error error, int times = 1) {
        for (int i = 0; i < times; ++i) pending_.push_back(error);
    }
    void clear() { pending_.clear(); }
    [[nodiscard]] bool empty() const { return pending_.empty(); }

    [[nodiscard]] std::optional<Error> take() {
        if (pending_.empty()) return std::nullopt;
        auto error = pending_.front();
        pending_.pop_front();
        return error;
    }

private:
    std::deque<Error> pending_;
};

/**
 * MemoryRemoteService - loopback remote with compare-and-swap updates and
 * soft deletion. Several devices (coordinators) may share one instance.
 */
class MemoryRemoteService final : public RemoteDocumentService {
public:
    Result<Document, Error> create(const Document& doc) override;
    UpdateOutcome update(const Document& doc) override;
    Result<Document, Error> get(const std::string& sync_id) override;
    Result<std::vector<Document>, Error> list(const std::string& user_id,
                                              bool exclude_deleted) override;

    /**
     * Store a record directly, as if another client had written it.
     */
    void put(Document doc);

    [[nodiscard]] std::optional<Document> stored(const std::string& sync_id) const;
    [[nodiscard]] size_t size() const { return documents_.size(); }

    FailureInjector& failures() { return failures_; }
    void set_offline(bool offline) { offline_ = offline; }

    [[nodiscard]] int create_calls() const { return create_calls_; }
    [[nodiscard]] int update_calls() const { return update_calls_; }
    [[nodiscard]] int list_calls() const { return list_calls_; }

private:
    std::map<std::string, Document> documents_;
    FailureInjector failures_;
    bool offline_ = false;
    int create_calls_ = 0;
    int update_calls_ = 0;
    int list_calls_ = 0;

    [[nodiscard]] std::optional<Error> injected();
};

/**
 * MemoryBlobStore - blobs kept as their source reference.
 */
class MemoryBlobStore final : public BlobStore {
public:
    Result<std::string, Error> upload(const std::string& local_ref,
                                      const std::string& dest_key) override;
    Result<std::string, Error> download(const std::string& blob_key) override;
    Result<void, Error> remove(const std::string& blob_key) override;

    [[nodiscard]] bool contains(const std::string& blob_key) const {
        return blobs_.count(blob_key) > 0;
    }
    [[nodiscard]] size_t size() const { return blobs_.size(); }

    FailureInjector& failures() { return failures_; }

private:
    std::map<std::string, std::string> blobs_;
    FailureInjector failures_;
};

/**
 * StaticAuthProvider - fixed user; refresh succeeds unless told otherwise.
 */
class StaticAuthProvider final : public AuthProvider {
public:
    explicit StaticAuthProvider(std::string user_id) : user_id_(std::move(user_id)) {}

    [[nodiscard]] std::string current_user_id() const override { return user_id_; }
    Result<void, Error> refresh() override;

    void sign_out() { user_id_.clear(); }
    void set_refresh_fails(bool fails) { refresh_fails_ = fails; }
    [[nodiscard]] int refresh_calls() const { return refresh_calls_; }

private:
    std::string user_id_;
    bool refresh_fails_ = false;
    int refresh_calls_ = 0;
};

} // namespace docsync::sync
