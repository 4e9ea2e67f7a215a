#include "sync/sync_log.hpp"

Q_LOGGING_CATEGORY(docsyncSyncLog, "docsync.sync")
Q_LOGGING_CATEGORY(docsyncStorageLog, "docsync.storage")
Q_LOGGING_CATEGORY(docsyncDeletionLog, "docsync.deletion")
Q_LOGGING_CATEGORY(docsyncConflictLog, "docsync.conflict")
Q_LOGGING_CATEGORY(docsyncConnectivityLog, "docsync.connectivity")
