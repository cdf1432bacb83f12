#include "rpc/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QStandardPaths>
#include <QTextStream>
#include <QtGlobal>

Q_LOGGING_CATEGORY(folioRpcLog, "folio.rpc", QtInfoMsg)
Q_LOGGING_CATEGORY(folioStorageLog, "folio.storage", QtInfoMsg)

namespace folio::rpc {
namespace {

QString compute_log_file_path() {
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (base.isEmpty()) {
        return QString{};
    }
    return QDir(base).filePath(QStringLiteral("logs/folio.log"));
}

const char* level_tag(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return "D";
        case QtInfoMsg: return "I";
        case QtWarningMsg: return "W";
        case QtCriticalMsg: return "C";
        case QtFatalMsg: return "F";
    }
    return "?";
}

struct LoggerState {
    QMutex mu;
    QFile file;
    QString requested_path;
    bool initialized = false;
};

LoggerState& state() {
    static LoggerState s{};
    return s;
}

void ensure_open(LoggerState& s) {
    if (s.initialized) return;
    s.initialized = true;

    const auto path = s.requested_path.isEmpty() ? compute_log_file_path() : s.requested_path;
    if (path.isEmpty()) {
        return;
    }

    QDir dir(QFileInfo(path).absolutePath());
    dir.mkpath(QStringLiteral("."));

    s.file.setFileName(path);
    if (!s.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        QTextStream(stderr) << "folio: cannot open log file " << path << ": "
                            << s.file.errorString() << '\n';
    }
}

void message_handler(QtMsgType type,
                     const QMessageLogContext& ctx,
                     const QString& msg) {
    auto& s = state();
    QMutexLocker lock(&s.mu);
    ensure_open(s);

    const auto ts = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
    const auto cat = ctx.category ? QString::fromLatin1(ctx.category) : QStringLiteral("");

    const auto line = QStringLiteral("%1 %2 %3 %4\n")
                          .arg(ts, QString::fromLatin1(level_tag(type)), cat, msg);

    if (s.file.isOpen()) {
        s.file.write(line.toUtf8());
        s.file.flush();
    }
    if (type >= QtWarningMsg) {
        QTextStream(stderr) << line;
    }
}

} // namespace

void install_file_logging(const QString& path) {
    {
        auto& s = state();
        QMutexLocker lock(&s.mu);
        if (s.file.isOpen()) {
            s.file.close();
        }
        s.requested_path = path;
        s.initialized = false;
        ensure_open(s);
    }
    // Keep the pattern stable; our message handler already stamps time/level/category.
    qSetMessagePattern(QStringLiteral("%{category} %{message}"));
    qInstallMessageHandler(message_handler);
}

QString default_log_file_path() {
    return compute_log_file_path();
}

QString active_log_file_path() {
    auto& s = state();
    QMutexLocker lock(&s.mu);
    return s.file.isOpen() ? s.file.fileName() : QString{};
}

void set_rpc_debug(bool enabled) {
    QLoggingCategory::setFilterRules(enabled ? QStringLiteral("folio.rpc.debug=true\n")
                                             : QStringLiteral("folio.rpc.debug=false\n"));
}

} // namespace folio::rpc
