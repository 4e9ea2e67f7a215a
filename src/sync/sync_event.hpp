#pragma once

#include "core/types.hpp"
#include <QMetaType>
#include <QString>
#include <optional>
#include <string_view>

namespace docsync::sync {

enum class SyncEventType {
    Started,
    Completed,
    Failed,
    DocumentUploaded,
    DocumentDownloaded,
    ConflictDetected,
    StateChanged
};

[[nodiscard]] constexpr std::string_view to_string(SyncEventType type) noexcept {
    switch (type) {
        case SyncEventType::Started: return "started";
        case SyncEventType::Completed: return "completed";
        case SyncEventType::Failed: return "failed";
        case SyncEventType::DocumentUploaded: return "documentUploaded";
        case SyncEventType::DocumentDownloaded: return "documentDownloaded";
        case SyncEventType::ConflictDetected: return "conflictDetected";
        case SyncEventType::StateChanged: return "stateChanged";
    }
    return "failed";
}

struct SyncEvent {
    SyncEventType type{SyncEventType::StateChanged};
    QString document_sync_id;   // empty for cycle-level events
    QString message;
    QString user_message;       // Failed events only
    Timestamp timestamp;
};

struct SyncStatus {
    bool is_syncing{false};
    int pending_count{0};
    std::optional<Timestamp> last_sync_time;
};

} // namespace docsync::sync

Q_DECLARE_METATYPE(docsync::sync::SyncEvent)
