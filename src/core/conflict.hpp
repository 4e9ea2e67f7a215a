#pragma once

#include "core/document.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docsync {

enum class ConflictType {
    VersionMismatch,
    ConcurrentModification,
    DeletionConflict
};

enum class ResolutionStrategy {
    KeepLocal,
    KeepRemote,
    Merge,
    Manual
};

[[nodiscard]] std::string_view to_string(ConflictType type) noexcept;
[[nodiscard]] std::optional<ConflictType> parse_conflict_type(std::string_view text) noexcept;
[[nodiscard]] std::string_view to_string(ResolutionStrategy strategy) noexcept;
[[nodiscard]] std::optional<ResolutionStrategy> parse_resolution_strategy(std::string_view text) noexcept;

/**
 * Conflict - two divergent copies of one document awaiting resolution.
 */
struct Conflict {
    std::string id;
    std::string document_sync_id;
    Document local_snapshot;
    Document remote_snapshot;
    ConflictType type{ConflictType::VersionMismatch};
    Timestamp detected_at;
    bool resolved{false};
    std::optional<ResolutionStrategy> resolution_strategy;
    std::optional<Timestamp> resolved_at;

    bool operator==(const Conflict&) const = default;
};

inline constexpr std::string_view kMergeSeparator = "\n\n--- Merged from other device ---\n\n";

/**
 * Decide whether two copies of a document conflict.
 *
 *  1. different sync ids: not a conflict
 *  2. same version, title and last_modified with equal content: none
 *  3. same version, different content or last_modified: VersionMismatch
 *  4. remote modified later while its version is not newer: ConcurrentModification
 *  5. otherwise none (one side is strictly newer and authoritative)
 *
 * Symmetric in the sense that detect(a, b) is a conflict iff detect(b, a)
 * is, whenever the versions are equal.
 */
[[nodiscard]] std::optional<ConflictType> detect_conflict(const Document& local,
                                                          const Document& remote);

/**
 * Field-wise merge. Version becomes max(local, remote) + 1 and the result
 * is left PendingUpload with last_modified = now.
 */
[[nodiscard]] Document merge_documents(const Document& local,
                                       const Document& remote,
                                       Timestamp now);

/**
 * Names of the content fields that differ between the two copies.
 */
[[nodiscard]] std::vector<std::string> differing_fields(const Document& local,
                                                        const Document& remote);

[[nodiscard]] Conflict make_conflict(const Document& local,
                                     const Document& remote,
                                     ConflictType type,
                                     Timestamp now);

/**
 * Thresholds for automatic resolution.
 */
struct AutoResolvePolicy {
    std::chrono::milliseconds remote_newer_threshold{std::chrono::hours(1)};
    std::chrono::milliseconds local_newer_threshold{std::chrono::hours(1)};
};

/**
 * Remote clearly newer: KeepRemote. Local clearly newer: KeepLocal.
 * Otherwise Merge.
 */
[[nodiscard]] ResolutionStrategy choose_auto_strategy(const Conflict& conflict,
                                                      const AutoResolvePolicy& policy);

/**
 * What the coordinator must do after a resolution is persisted.
 */
enum class ResolutionFollowup {
    None,                  // local copy now matches the remote
    PushUpdate,            // queue an update carrying the resolved document
    AcceptRemoteDeletion   // tombstone and drop the local copy
};

struct Resolution {
    Document document;
    ResolutionFollowup followup{ResolutionFollowup::None};
};

/**
 * Apply a strategy. Every strategy keeps the local sync id and ends with a
 * version above both sides; the push base (server_version) becomes the
 * remote snapshot's version. Manual requires `manual_document`.
 */
[[nodiscard]] Result<Resolution, Error> resolve_conflict(
    const Conflict& conflict,
    ResolutionStrategy strategy,
    const std::optional<Document>& manual_document,
    Timestamp now);

} // namespace docsync
