#pragma once

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(quireTxnLog)
Q_DECLARE_LOGGING_CATEGORY(quireConflictLog)
Q_DECLARE_LOGGING_CATEGORY(quireHistoryLog)
Q_DECLARE_LOGGING_CATEGORY(quireIntegrityLog)
Q_DECLARE_LOGGING_CATEGORY(quireBackupLog)
Q_DECLARE_LOGGING_CATEGORY(quireConsistencyLog)
Q_DECLARE_LOGGING_CATEGORY(quireStorageLog)

namespace quire {

// Installs a Qt message handler that appends every message to `path`
// (or default_log_file_path() when empty) in addition to stderr.
void install_file_logging(const QString& path = QString{});

// Returns the default log file path (may be empty if unavailable).
QString default_log_file_path();

} // namespace quire
