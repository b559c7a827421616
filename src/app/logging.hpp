#pragma once

#include <QString>

namespace quire::app {

struct LoggingOptions {
    // Empty means default_log_file_path().
    QString file_path;
    bool echo_stderr = false;
    // Enables the quire.*.debug categories.
    bool debug = false;
};

// Installs a Qt message handler that appends every log line to a file.
// Call once, after the QCoreApplication exists.
void install_logging(const LoggingOptions& options);

// `<AppLocalDataLocation>/logs/quire-merge.log`, or empty if unavailable.
QString default_log_file_path();

// The file the installed handler writes to (empty before install_logging).
QString active_log_file_path();

} // namespace quire::app
