#include "rpc/settings.hpp"

#include <QDir>
#include <QFileInfo>
#include <QSettings>
#include <QStandardPaths>
#include <QtGlobal>

namespace folio::rpc {

namespace {

bool is_truthy(const QString& value) {
    const auto v = value.trimmed().toLower();
    return v == QStringLiteral("1") || v == QStringLiteral("true") ||
           v == QStringLiteral("yes") || v == QStringLiteral("on");
}

QString absolute(const QString& path) {
    if (path.isEmpty() || path == QStringLiteral(":memory:")) {
        return path;
    }
    return QFileInfo(path).absoluteFilePath();
}

} // namespace

QString default_config_file_path() {
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
    if (base.isEmpty()) {
        return QStringLiteral("folio.ini");
    }
    return QDir(base).filePath(QStringLiteral("folio.ini"));
}

QString default_database_path() {
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (base.isEmpty()) {
        return QStringLiteral("folio.db");
    }
    return QDir(base).filePath(QStringLiteral("folio.db"));
}

Settings resolve_settings(const SettingsOverrides& overrides) {
    Settings out;
    out.config_file = overrides.config_file.value_or(default_config_file_path());
    out.database_path = default_database_path();

    // INI file
    if (QFileInfo::exists(out.config_file)) {
        QSettings ini(out.config_file, QSettings::IniFormat);
        out.database_path = ini.value(QString::fromLatin1(kSettingsStoragePath),
                                      out.database_path).toString();
        out.log_file = ini.value(QString::fromLatin1(kSettingsLogFile), out.log_file).toString();
        out.debug_rpc = is_truthy(ini.value(QString::fromLatin1(kSettingsDebugRpc),
                                            QStringLiteral("false")).toString());
    }

    // Environment
    if (qEnvironmentVariableIsSet(kEnvDatabasePath)) {
        out.database_path = qEnvironmentVariable(kEnvDatabasePath);
    }
    if (qEnvironmentVariableIsSet(kEnvLogFile)) {
        out.log_file = qEnvironmentVariable(kEnvLogFile);
    }
    if (qEnvironmentVariableIsSet(kEnvDebugRpc)) {
        out.debug_rpc = is_truthy(qEnvironmentVariable(kEnvDebugRpc));
    }

    // Command line
    if (overrides.database_path) {
        out.database_path = *overrides.database_path;
    }
    if (overrides.log_file) {
        out.log_file = *overrides.log_file;
    }
    if (overrides.debug_rpc) {
        out.debug_rpc = true;
    }

    out.database_path = absolute(out.database_path);
    out.log_file = absolute(out.log_file);
    return out;
}

} // namespace folio::rpc
