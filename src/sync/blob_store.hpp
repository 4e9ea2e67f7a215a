#pragma once

#include "core/result.hpp"
#include <string>

namespace docsync::sync {

/**
 * BlobStore - opaque file transfer for attachments. Blobs are never
 * diffed; a key names one immutable upload.
 */
class BlobStore {
public:
    virtual ~BlobStore() = default;

    /**
     * Upload the file at `local_ref` under `dest_key`; returns the blob key.
     */
    [[nodiscard]] virtual Result<std::string, Error> upload(const std::string& local_ref,
                                                            const std::string& dest_key) = 0;

    /**
     * Fetch a blob to local storage; returns the local reference.
     */
    [[nodiscard]] virtual Result<std::string, Error> download(const std::string& blob_key) = 0;

    [[nodiscard]] virtual Result<void, Error> remove(const std::string& blob_key) = 0;
};

} // namespace docsync::sync
