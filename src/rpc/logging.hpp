#pragma once

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(folioRpcLog)
Q_DECLARE_LOGGING_CATEGORY(folioStorageLog)

namespace folio::rpc {

// Installs a Qt message handler that appends "time level category message"
// lines to path (or to default_log_file_path() when path is empty). stderr
// still receives warnings and above, since stdout carries responses.
void install_file_logging(const QString& path = {});

// Returns the default log file path (may be empty if unavailable).
QString default_log_file_path();

// Returns the file the installed handler writes to (empty before install or
// if it could not be opened).
QString active_log_file_path();

// Turns folio.rpc debug output on or off.
void set_rpc_debug(bool enabled);

} // namespace folio::rpc
