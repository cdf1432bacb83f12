#include <QCoreApplication>
#include <QCommandLineParser>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QTextStream>

#include "rpc/logging.hpp"
#include "rpc/session.hpp"
#include "rpc/settings.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    // Set application metadata
    app.setApplicationName("Folio");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("Folio");
    app.setOrganizationDomain("folio.local");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Folio page hierarchy and content engine"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption configOption(
        QStringList{QStringLiteral("config")},
        QStringLiteral("INI file to read settings from."),
        QStringLiteral("file"));
    parser.addOption(configOption);

    const QCommandLineOption dbPathOption(
        QStringList{QStringLiteral("db")},
        QStringLiteral("Database path (overrides FOLIO_DB_PATH); ':memory:' keeps nothing."),
        QStringLiteral("path"));
    parser.addOption(dbPathOption);

    const QCommandLineOption logFileOption(
        QStringList{QStringLiteral("log-file")},
        QStringLiteral("Log file path (overrides FOLIO_LOG_FILE)."),
        QStringLiteral("path"));
    parser.addOption(logFileOption);

    const QCommandLineOption debugRpcOption(
        QStringList{QStringLiteral("debug-rpc")},
        QStringLiteral("Enable request debug logging (also sets FOLIO_DEBUG_RPC=1)."));
    parser.addOption(debugRpcOption);

    const QCommandLineOption paramsOption(
        QStringList{QStringLiteral("params")},
        QStringLiteral("JSON object of arguments for 'call'."),
        QStringLiteral("json"));
    parser.addOption(paramsOption);

    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("'serve', or 'call <method>'."));
    parser.process(app);

    folio::rpc::SettingsOverrides overrides;
    if (parser.isSet(configOption)) {
        overrides.config_file = parser.value(configOption);
    }
    if (parser.isSet(dbPathOption)) {
        overrides.database_path = parser.value(dbPathOption);
    }
    if (parser.isSet(logFileOption)) {
        overrides.log_file = parser.value(logFileOption);
    }
    overrides.debug_rpc = parser.isSet(debugRpcOption);
    if (overrides.debug_rpc) {
        qputenv("FOLIO_DEBUG_RPC", "1");
    }

    const auto settings = folio::rpc::resolve_settings(overrides);

    folio::rpc::install_file_logging(settings.log_file);
    folio::rpc::set_rpc_debug(settings.debug_rpc);
    qInfo() << "Folio: logging to" << folio::rpc::active_log_file_path();
    if (settings.debug_rpc) {
        qInfo() << "Folio: rpc debug enabled";
    }

    const auto positional = parser.positionalArguments();
    const auto command = positional.isEmpty() ? QString{} : positional.first();
    if (command != QStringLiteral("serve") && command != QStringLiteral("call")) {
        QTextStream(stderr) << "Expected a command: serve | call <method>\n";
        parser.showHelp(2);
    }

    auto opened = folio::rpc::Session::open(settings.database_path);
    if (opened.is_err()) {
        QTextStream(stderr) << "Cannot open site database " << settings.database_path << ": "
                            << QString::fromStdString(opened.unwrap_err().message) << '\n';
        return 1;
    }
    auto session = std::move(opened).unwrap();

    if (command == QStringLiteral("serve")) {
        QFile in;
        QFile out;
        if (!in.open(stdin, QIODevice::ReadOnly) || !out.open(stdout, QIODevice::WriteOnly)) {
            QTextStream(stderr) << "Cannot attach to stdin/stdout\n";
            return 1;
        }
        session->serve(in, out);
        return 0;
    }

    // call <method>
    if (positional.size() < 2) {
        QTextStream(stderr) << "'call' needs a method name\n";
        return 2;
    }

    QJsonObject params;
    if (parser.isSet(paramsOption)) {
        QJsonParseError parse_error{};
        const auto doc = QJsonDocument::fromJson(parser.value(paramsOption).toUtf8(), &parse_error);
        if (parse_error.error != QJsonParseError::NoError || !doc.isObject()) {
            QTextStream(stderr) << "--params must be a JSON object\n";
            return 2;
        }
        params = doc.object();
    }

    const auto response = session->call(positional.at(1), params);
    QTextStream(stdout) << QJsonDocument(response).toJson(QJsonDocument::Indented);
    return response.value(QStringLiteral("ok")).toBool() ? 0 : 1;
}
