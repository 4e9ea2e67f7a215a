#pragma once

#include "core/result.hpp"
#include <string>
#include <string_view>

/**
 * Sync identifiers: the cross-system identity of a document.
 *
 * A sync id is a version-4 UUID in canonical lowercase form. Input from
 * storage or the remote may carry surrounding whitespace or upper case;
 * normalize() folds both before comparison.
 */
namespace docsync::sync_id {

/**
 * Generate a fresh identifier (already normalized).
 */
[[nodiscard]] std::string generate();

/**
 * Trim ASCII whitespace and lowercase.
 */
[[nodiscard]] std::string normalize(std::string_view raw);

/**
 * True iff normalize(raw) is a well-formed version-4 UUID.
 */
[[nodiscard]] bool is_valid(std::string_view raw);

/**
 * Normalize and validate in one step; Validation error when malformed.
 */
[[nodiscard]] Result<std::string, Error> parse(std::string_view raw);

} // namespace docsync::sync_id
