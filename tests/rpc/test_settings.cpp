#include <catch2/catch_test_macros.hpp>

#include <QDir>
#include <QFileInfo>
#include <QSettings>
#include <QTemporaryDir>

#include "rpc/settings.hpp"

using namespace folio::rpc;

namespace {

struct CleanEnvironment {
    CleanEnvironment() { clear(); }
    ~CleanEnvironment() { clear(); }

    static void clear() {
        qunsetenv(kEnvDatabasePath);
        qunsetenv(kEnvLogFile);
        qunsetenv(kEnvDebugRpc);
    }
};

QString write_ini(const QTemporaryDir& dir, const QString& db_path, const QString& debug) {
    const auto path = dir.filePath(QStringLiteral("folio.ini"));
    QSettings ini(path, QSettings::IniFormat);
    ini.setValue(QString::fromLatin1(kSettingsStoragePath), db_path);
    ini.setValue(QString::fromLatin1(kSettingsLogFile), dir.filePath(QStringLiteral("ini.log")));
    ini.setValue(QString::fromLatin1(kSettingsDebugRpc), debug);
    ini.sync();
    return path;
}

} // namespace

TEST_CASE("Settings: defaults without file or environment", "[rpc][settings]") {
    CleanEnvironment env;
    QTemporaryDir dir;
    REQUIRE(dir.isValid());

    const auto settings = resolve_settings(SettingsOverrides{
        .config_file = dir.filePath(QStringLiteral("missing.ini"))});
    REQUIRE(settings.database_path == QFileInfo(default_database_path()).absoluteFilePath());
    REQUIRE(settings.database_path.endsWith(QStringLiteral("folio.db")));
    REQUIRE(settings.log_file.isEmpty());
    REQUIRE_FALSE(settings.debug_rpc);
}

TEST_CASE("Settings: INI file values", "[rpc][settings]") {
    CleanEnvironment env;
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto ini = write_ini(dir, dir.filePath(QStringLiteral("from_ini.db")), QStringLiteral("yes"));

    const auto settings = resolve_settings(SettingsOverrides{.config_file = ini});
    REQUIRE(settings.config_file == ini);
    REQUIRE(settings.database_path == dir.filePath(QStringLiteral("from_ini.db")));
    REQUIRE(settings.log_file == dir.filePath(QStringLiteral("ini.log")));
    REQUIRE(settings.debug_rpc);
}

TEST_CASE("Settings: environment beats the INI file", "[rpc][settings]") {
    CleanEnvironment env;
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto ini = write_ini(dir, dir.filePath(QStringLiteral("from_ini.db")), QStringLiteral("on"));

    qputenv(kEnvDatabasePath, dir.filePath(QStringLiteral("from_env.db")).toUtf8());
    qputenv(kEnvDebugRpc, "0");

    const auto settings = resolve_settings(SettingsOverrides{.config_file = ini});
    REQUIRE(settings.database_path == dir.filePath(QStringLiteral("from_env.db")));
    REQUIRE(settings.log_file == dir.filePath(QStringLiteral("ini.log")));
    REQUIRE_FALSE(settings.debug_rpc);
}

TEST_CASE("Settings: command line beats everything", "[rpc][settings]") {
    CleanEnvironment env;
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto ini = write_ini(dir, dir.filePath(QStringLiteral("from_ini.db")), QStringLiteral("false"));
    qputenv(kEnvDatabasePath, dir.filePath(QStringLiteral("from_env.db")).toUtf8());
    qputenv(kEnvLogFile, dir.filePath(QStringLiteral("env.log")).toUtf8());

    const auto settings = resolve_settings(SettingsOverrides{
        .config_file = ini,
        .database_path = dir.filePath(QStringLiteral("from_cli.db")),
        .log_file = dir.filePath(QStringLiteral("cli.log")),
        .debug_rpc = true});
    REQUIRE(settings.database_path == dir.filePath(QStringLiteral("from_cli.db")));
    REQUIRE(settings.log_file == dir.filePath(QStringLiteral("cli.log")));
    REQUIRE(settings.debug_rpc);
}

TEST_CASE("Settings: in-memory and relative paths", "[rpc][settings]") {
    CleanEnvironment env;
    QTemporaryDir dir;
    REQUIRE(dir.isValid());

    SECTION(":memory: is kept as is") {
        const auto settings = resolve_settings(SettingsOverrides{
            .config_file = dir.filePath(QStringLiteral("missing.ini")),
            .database_path = QStringLiteral(":memory:")});
        REQUIRE(settings.database_path == QStringLiteral(":memory:"));
    }

    SECTION("An empty path stays empty") {
        qputenv(kEnvDatabasePath, "");
        const auto settings = resolve_settings(SettingsOverrides{
            .config_file = dir.filePath(QStringLiteral("missing.ini"))});
        REQUIRE(settings.database_path.isEmpty());
    }

    SECTION("Relative paths become absolute") {
        const auto settings = resolve_settings(SettingsOverrides{
            .config_file = dir.filePath(QStringLiteral("missing.ini")),
            .database_path = QStringLiteral("site.db")});
        REQUIRE(QDir::isAbsolutePath(settings.database_path));
        REQUIRE(settings.database_path.endsWith(QStringLiteral("/site.db")));
    }
}
