#pragma once

#include "core/conflict.hpp"
#include "core/retry_policy.hpp"
#include <chrono>
#include <optional>
#include <string_view>

namespace docsync::sync {

/**
 * What a cycle does about pulling after it pushed something.
 */
enum class PullPolicy {
    SuppressEchoes,   // pull, skipping only the documents pushed this cycle
    SkipAfterUpload   // no pull at all in a cycle that pushed anything
};

[[nodiscard]] std::string_view to_string(PullPolicy policy) noexcept;
[[nodiscard]] std::optional<PullPolicy> parse_pull_policy(std::string_view text) noexcept;

struct SyncSettings {
    std::chrono::milliseconds debounce{500};
    std::chrono::milliseconds periodic_interval{std::chrono::minutes(5)};
    RetryPolicy retry{};
    std::chrono::milliseconds tombstone_retention{std::chrono::hours(24 * 90)};
    std::chrono::milliseconds resolved_conflict_retention{std::chrono::hours(24 * 7)};
    AutoResolvePolicy auto_resolve_policy{};
    bool auto_resolve{false};
    PullPolicy pull_policy{PullPolicy::SuppressEchoes};
    bool paused{false};
    bool wifi_only{false};
    std::chrono::milliseconds gate_cache_ttl{5000};

    /**
     * QSettings group "sync", then DOCSYNC_SYNC_* environment overrides.
     */
    [[nodiscard]] static SyncSettings load();

    /**
     * Write back the user-facing toggles (paused, Wi-Fi only, auto resolve,
     * pull policy).
     */
    void save() const;
};

} // namespace docsync::sync
