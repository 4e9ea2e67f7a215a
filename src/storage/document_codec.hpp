#pragma once

#include "core/document.hpp"
#include "core/result.hpp"
#include <string>
#include <string_view>
#include <vector>

/**
 * Compact JSON encodings for the columns that hold structured values:
 * attachment ref lists, conflict snapshots and queued operation payloads.
 */
namespace docsync::storage::codec {

[[nodiscard]] std::string encode_refs(const std::vector<std::string>& refs);
[[nodiscard]] Result<std::vector<std::string>, Error> decode_refs(std::string_view json);

[[nodiscard]] std::string encode_document(const Document& doc);
[[nodiscard]] Result<Document, Error> decode_document(std::string_view json);

} // namespace docsync::storage::codec
