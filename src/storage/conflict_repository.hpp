#pragma once

#include "core/conflict.hpp"
#include "core/result.hpp"
#include "storage/database.hpp"
#include <optional>
#include <string>
#include <vector>

namespace docsync::storage {

/**
 * ConflictRepository - conflict records with both snapshots stored as
 * JSON. The partial unique index keeps one open conflict per document.
 */
class ConflictRepository {
public:
    explicit ConflictRepository(Database& db) : db_(db) {}

    [[nodiscard]] Result<void, Error> save(const Conflict& conflict);
    [[nodiscard]] Result<std::optional<Conflict>, Error> get(const std::string& id);
    [[nodiscard]] Result<std::optional<Conflict>, Error> open_for(const std::string& document_sync_id);
    [[nodiscard]] Result<std::vector<Conflict>, Error> open();
    [[nodiscard]] Result<int, Error> purge_resolved_before(Timestamp cutoff);

private:
    Database& db_;

    [[nodiscard]] Result<std::vector<Conflict>, Error> select(std::string_view where_clause,
                                                              const std::string& arg);
};

} // namespace docsync::storage
