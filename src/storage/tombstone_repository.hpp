#pragma once

#include "core/result.hpp"
#include "storage/database.hpp"
#include "storage/local_store.hpp"
#include <optional>
#include <string>
#include <vector>

namespace docsync::storage {

class TombstoneRepository {
public:
    explicit TombstoneRepository(Database& db) : db_(db) {}

    /**
     * INSERT OR IGNORE; true when the row is new.
     */
    [[nodiscard]] Result<bool, Error> insert_if_absent(const Tombstone& tombstone);
    [[nodiscard]] Result<std::optional<Tombstone>, Error> get(const std::string& sync_id);
    [[nodiscard]] Result<std::vector<Tombstone>, Error> all();
    [[nodiscard]] Result<std::vector<Tombstone>, Error> for_user(const std::string& user_id);
    [[nodiscard]] Result<int, Error> purge_before(Timestamp cutoff);

private:
    Database& db_;
};

} // namespace docsync::storage
