#pragma once

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(lcDiscovery)
Q_DECLARE_LOGGING_CATEGORY(lcConnection)
Q_DECLARE_LOGGING_CATEGORY(lcPasscodes)
Q_DECLARE_LOGGING_CATEGORY(lcRemote)
Q_DECLARE_LOGGING_CATEGORY(lcServer)

namespace lanlog {

// Installs a Qt message handler that appends to `path` (or the default log file
// when empty). With `echo_stderr` every line is also written to stderr, which is
// what the command-line tool wants.
void install_file_logging(const QString& path = QString{}, bool echo_stderr = false);

// Returns the default log file path (may be empty if unavailable).
QString default_log_file_path();

// Turns on lanlog.*.debug output.
void enable_debug_logging();

} // namespace lanlog
