#pragma once

#include "core/document.hpp"
#include "core/result.hpp"
#include <string>
#include <variant>
#include <vector>

namespace docsync::sync {

/**
 * The remote accepted the write; `document` is the stored copy.
 */
struct Updated {
    Document document;
};

/**
 * Compare-and-swap rejected the write: the remote's stored version is not
 * the one the local copy was based on.
 */
struct VersionConflict {
    Document local;
    Document remote;
};

using UpdateOutcome = std::variant<Updated, VersionConflict, Error>;

/**
 * RemoteDocumentService - the remote document store.
 *
 * Documents returned by the remote carry the stored version in both
 * `version` and `server_version`, with sync_state Synced. Deletion is an
 * update carrying deleted = true; deleted records stay listable.
 */
class RemoteDocumentService {
public:
    virtual ~RemoteDocumentService() = default;

    /**
     * First push of a document. Fails with ErrorKind::Concurrency when a
     * live record with the same sync id already exists.
     */
    [[nodiscard]] virtual Result<Document, Error> create(const Document& doc) = 0;

    /**
     * Compare-and-swap on version: succeeds only when the stored version
     * equals doc.server_version, and stores doc.version.
     */
    [[nodiscard]] virtual UpdateOutcome update(const Document& doc) = 0;

    [[nodiscard]] virtual Result<Document, Error> get(const std::string& sync_id) = 0;
    [[nodiscard]] virtual Result<std::vector<Document>, Error> list(const std::string& user_id,
                                                                    bool exclude_deleted) = 0;
};

} // namespace docsync::sync
