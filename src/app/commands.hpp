#pragma once

#include "core/result.hpp"
#include "core/sync_state.hpp"
#include "storage/local_store.hpp"
#include "sync/sync_coordinator.hpp"

#include <QString>
#include <QStringList>
#include <optional>

namespace docsync::app {

struct CommandOptions {
    bool json = false;
    std::optional<SyncState> state;   // filter for 'list'
    QStringList arguments;            // positional arguments after the command name
};

// Commands an offline administrator can run against a local store. The
// coordinator is never started here; commands that change sync state only
// touch the local store and the persisted queue.
[[nodiscard]] QStringList command_names();

// Returns the text to print on stdout.
[[nodiscard]] Result<QString, Error> run_command(const QString& command,
                                                 storage::LocalStore& store,
                                                 sync::SyncCoordinator& coordinator,
                                                 const CommandOptions& options);

// Process exit code for a failed command.
[[nodiscard]] int exit_code_for(const Error& error);

} // namespace docsync::app
