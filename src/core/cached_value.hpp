#pragma once

#include "core/types.hpp"
#include <chrono>
#include <optional>

namespace docsync {

/**
 * CachedValue - a value plus the time it was last refreshed.
 *
 * Staleness is a pure function of (now, ttl); the owner decides when to
 * refresh. A default-constructed cache holds nothing and is always stale.
 */
template<typename T>
struct CachedValue {
    std::optional<T> value;
    Timestamp last_refreshed;

    [[nodiscard]] bool is_stale(Timestamp now, std::chrono::milliseconds ttl) const {
        if (!value) return true;
        return now - last_refreshed >= ttl || now < last_refreshed;
    }

    void refresh(T fresh, Timestamp now) {
        value = std::move(fresh);
        last_refreshed = now;
    }

    void invalidate() { value.reset(); }
};

} // namespace docsync
