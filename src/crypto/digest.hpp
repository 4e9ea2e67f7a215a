#pragma once

#include "core/result.hpp"
#include <string>
#include <string_view>

namespace docsync::crypto {

/**
 * Initialize libsodium. Safe to call more than once.
 */
[[nodiscard]] Result<void, Error> init();

/**
 * SHA-256 of `data`, lowercase hex (64 chars).
 */
[[nodiscard]] std::string sha256_hex(std::string_view data);

} // namespace docsync::crypto
