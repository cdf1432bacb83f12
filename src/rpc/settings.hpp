#pragma once

#include <QString>
#include <optional>

namespace folio::rpc {

/**
 * Settings - Runtime configuration of the folio executable.
 */
struct Settings {
    QString config_file;     // INI file the values were read from
    QString database_path;   // empty: keep the site in memory only
    QString log_file;        // empty: default_log_file_path()
    bool debug_rpc = false;
};

/**
 * Values given on the command line; unset members defer to lower layers.
 */
struct SettingsOverrides {
    std::optional<QString> config_file;
    std::optional<QString> database_path;
    std::optional<QString> log_file;
    bool debug_rpc = false;
};

// INI keys
inline constexpr const char* kSettingsStoragePath = "storage/path";
inline constexpr const char* kSettingsLogFile = "logging/file";
inline constexpr const char* kSettingsDebugRpc = "logging/debug_rpc";

// Environment variables
inline constexpr const char* kEnvDatabasePath = "FOLIO_DB_PATH";
inline constexpr const char* kEnvLogFile = "FOLIO_LOG_FILE";
inline constexpr const char* kEnvDebugRpc = "FOLIO_DEBUG_RPC";

// Returns <AppConfigLocation>/folio.ini (may be relative if unavailable).
QString default_config_file_path();

// Returns <AppDataLocation>/folio.db.
QString default_database_path();

/**
 * Resolve settings: command line > environment > INI file > defaults.
 *
 * A missing INI file is not an error; it just contributes nothing.
 */
[[nodiscard]] Settings resolve_settings(const SettingsOverrides& overrides = {});

} // namespace folio::rpc
