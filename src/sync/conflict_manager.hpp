#pragma once

#include "core/conflict.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "storage/local_store.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace docsync::sync {

inline constexpr std::chrono::hours kDefaultResolvedConflictRetention{24 * 7};

/**
 * ConflictManager - registry of conflicts, at most one unresolved per
 * document.
 *
 * Resolution is two-step so the caller can persist the resolved document
 * before the conflict is closed: prepare_resolution() computes the outcome,
 * mark_resolved() records it.
 */
class ConflictManager {
public:
    struct Prepared {
        Conflict conflict;
        ResolutionStrategy strategy{ResolutionStrategy::Merge};
        Resolution resolution;
    };

    ConflictManager(storage::LocalStore& store,
                    Clock clock = system_clock(),
                    AutoResolvePolicy policy = {},
                    std::chrono::milliseconds resolved_retention = kDefaultResolvedConflictRetention)
        : store_(store), clock_(std::move(clock)), policy_(policy), resolved_retention_(resolved_retention) {}

    /**
     * Record a conflict. When the document already has an open one, its
     * snapshots and type are refreshed in place and the existing id kept.
     */
    [[nodiscard]] Result<Conflict, Error> register_conflict(const Document& local,
                                                            const Document& remote,
                                                            ConflictType type);

    [[nodiscard]] Result<std::optional<Conflict>, Error> find(const std::string& conflict_id);
    [[nodiscard]] Result<std::optional<Conflict>, Error> open_for(const std::string& document_sync_id);
    [[nodiscard]] Result<std::vector<Conflict>, Error> unresolved();

    [[nodiscard]] Result<Prepared, Error> prepare_resolution(const std::string& conflict_id,
                                                             ResolutionStrategy strategy,
                                                             const std::optional<Document>& manual_document = std::nullopt);

    [[nodiscard]] Result<Prepared, Error> prepare_auto_resolution(const std::string& conflict_id);

    [[nodiscard]] Result<void, Error> mark_resolved(const Prepared& prepared);

    [[nodiscard]] Result<int, Error> purge_resolved();

    [[nodiscard]] const AutoResolvePolicy& policy() const { return policy_; }

private:
    storage::LocalStore& store_;
    Clock clock_;
    AutoResolvePolicy policy_;
    std::chrono::milliseconds resolved_retention_;

    [[nodiscard]] Result<Conflict, Error> require_open(const std::string& conflict_id);
};

} // namespace docsync::sync
