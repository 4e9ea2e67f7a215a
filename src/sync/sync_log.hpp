#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(docsyncSyncLog)
Q_DECLARE_LOGGING_CATEGORY(docsyncStorageLog)
Q_DECLARE_LOGGING_CATEGORY(docsyncDeletionLog)
Q_DECLARE_LOGGING_CATEGORY(docsyncConflictLog)
Q_DECLARE_LOGGING_CATEGORY(docsyncConnectivityLog)
