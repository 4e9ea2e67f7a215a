#pragma once

#include "core/result.hpp"
#include <string>

namespace docsync::sync {

class AuthProvider {
public:
    virtual ~AuthProvider() = default;

    /**
     * Empty while signed out.
     */
    [[nodiscard]] virtual std::string current_user_id() const = 0;

    /**
     * Token refresh hook, invoked once before retrying an auth failure.
     */
    [[nodiscard]] virtual Result<void, Error> refresh() = 0;
};

} // namespace docsync::sync
