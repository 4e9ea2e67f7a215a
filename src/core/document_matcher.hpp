#pragma once

#include "core/document.hpp"
#include "core/result.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

/**
 * Identity and content equivalence between documents that may come from
 * different storage systems.
 */
namespace docsync::matcher {

/**
 * Find the document whose sync id equals `sync_id` after normalization.
 * Malformed input is a Validation error, not a miss.
 */
[[nodiscard]] Result<std::optional<Document>, Error> match_by_sync_id(
    const std::vector<Document>& documents,
    std::string_view sync_id);

/**
 * SHA-256 hex over title, category, notes ("" when absent) and the sorted
 * attachment refs. Independent of version, timestamps, state and ids.
 */
[[nodiscard]] std::string content_hash(const Document& doc);

[[nodiscard]] std::vector<Document> match_by_content_hash(
    const std::vector<Document>& documents,
    std::string_view hash);

[[nodiscard]] bool have_same_content(const Document& a, const Document& b);

/**
 * Documents with an absent or empty sync id.
 */
[[nodiscard]] std::vector<Document> find_without_identity(const std::vector<Document>& documents);

struct DuplicateIdentity {
    std::string sync_id;
    std::vector<Document> documents;
};

struct IdentityReport {
    std::vector<DuplicateIdentity> duplicates;
    size_t total_documents{0};
    size_t with_identity{0};
    size_t without_identity{0};

    [[nodiscard]] bool valid() const { return duplicates.empty(); }

    /**
     * One line per violation, e.g.
     *   duplicate sync id 1f0e...: 2 documents ("Car Insurance", "Auto Insurance")
     */
    [[nodiscard]] std::string summary() const;
};

/**
 * Group by normalized sync id and report every group with more than one
 * member. Duplicates are reported, never resolved here.
 */
[[nodiscard]] IdentityReport validate_unique_identities(const std::vector<Document>& documents);

} // namespace docsync::matcher
