#pragma once

#include "core/document.hpp"
#include "core/result.hpp"
#include "storage/database.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docsync::storage {

/**
 * DocumentRepository - documents and their file attachments.
 */
class DocumentRepository {
public:
    explicit DocumentRepository(Database& db) : db_(db) {}

    [[nodiscard]] Result<Document, Error> save(const Document& doc);
    [[nodiscard]] Result<std::optional<Document>, Error> get(std::int64_t local_id);

    /**
     * Lowest local_id among rows with this (normalized) sync id.
     */
    [[nodiscard]] Result<std::optional<Document>, Error> get_by_sync_id(std::string_view sync_id);
    [[nodiscard]] Result<std::vector<Document>, Error> all();
    [[nodiscard]] Result<std::vector<Document>, Error> in_state(SyncState state);
    [[nodiscard]] Result<std::vector<Document>, Error> for_user(const std::string& user_id);
    [[nodiscard]] Result<bool, Error> remove(std::int64_t local_id);

    [[nodiscard]] Result<void, Error> save_attachment(const FileAttachment& attachment);
    [[nodiscard]] Result<std::vector<FileAttachment>, Error> attachments_for(const std::string& document_sync_id);
    [[nodiscard]] Result<int, Error> remove_attachments_for(const std::string& document_sync_id);

private:
    Database& db_;

    [[nodiscard]] Result<std::vector<Document>, Error> select(std::string_view where_clause,
                                                              const std::string& arg);
};

} // namespace docsync::storage
