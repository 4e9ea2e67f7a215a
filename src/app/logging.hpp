#pragma once

#include <QString>

namespace docsync::app {

// Routes Qt messages into logs/docsync.log under the app's local data
// directory (or DOCSYNC_LOG_PATH). Warnings and worse also go to stderr.
void install_file_logging();

// Empty when no writable location exists.
QString default_log_file_path();

// Turns on the debug level of the docsync.* categories. Also honoured when
// DOCSYNC_DEBUG_SYNC=1 is set in the environment.
void enable_sync_debug_logging();

// True when DOCSYNC_DEBUG_SYNC is set to a non-zero value.
[[nodiscard]] bool sync_debug_requested();

} // namespace docsync::app
