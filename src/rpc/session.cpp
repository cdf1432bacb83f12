#include "rpc/session.hpp"

#include "rpc/json_codec.hpp"
#include "rpc/logging.hpp"
#include "storage/migrations.hpp"
#include "storage/site_repository.hpp"

#include <QDir>
#include <QFileDevice>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>

namespace folio::rpc {

namespace {

[[nodiscard]] QJsonObject error_response(const Error& error) {
    QJsonObject response;
    response.insert(QStringLiteral("ok"), false);
    response.insert(QStringLiteral("error"), error_to_json(error));
    return response;
}

[[nodiscard]] QJsonObject request_failure(const QJsonValue& id, const std::string& message) {
    auto response = error_response(Error::validation(message));
    response.insert(QStringLiteral("id"), id);
    return response;
}

} // namespace

Result<std::unique_ptr<Session>> Session::open(const QString& database_path) {
    using R = Result<std::unique_ptr<Session>>;

    std::unique_ptr<Session> session(new Session());
    if (database_path.isEmpty() || database_path == QStringLiteral(":memory:")) {
        qCInfo(folioStorageLog) << "site kept in memory only";
        return R::ok(std::move(session));
    }

    QDir().mkpath(QFileInfo(database_path).absolutePath());
    auto db = storage::Database::open(database_path.toStdString());
    if (db.is_err()) {
        qCWarning(folioStorageLog) << "cannot open" << database_path << ":"
                                   << QString::fromStdString(db.unwrap_err().message);
        return R::err(db.unwrap_err());
    }
    session->database_.emplace(std::move(db).unwrap());

    auto migrated = storage::initialize_database(*session->database_);
    if (migrated.is_err()) {
        qCWarning(folioStorageLog) << "migration failed:"
                                   << QString::fromStdString(migrated.unwrap_err().message);
        return R::err(migrated.unwrap_err());
    }

    storage::SiteRepository repository(*session->database_);
    auto stored = repository.load();
    if (stored.is_err()) {
        return R::err(stored.unwrap_err());
    }
    if (auto& snapshot = stored.unwrap()) {
        const auto page_count = snapshot->pages.size();
        auto restored = session->engine_.restore(std::move(*snapshot));
        if (restored.is_err()) {
            qCWarning(folioStorageLog) << "stored site is inconsistent:"
                                       << QString::fromStdString(restored.unwrap_err().message);
            return R::err(restored.unwrap_err());
        }
        qCInfo(folioStorageLog) << "loaded" << page_count << "pages from" << database_path;
    } else {
        qCInfo(folioStorageLog) << "new site in" << database_path;
    }

    return R::ok(std::move(session));
}

Result<void> Session::save() {
    if (!database_) {
        return Result<void>::ok();
    }
    storage::SiteRepository repository(*database_);
    auto saved = repository.save(engine_.snapshot());
    if (saved.is_err()) {
        qCWarning(folioStorageLog) << "save failed:"
                                   << QString::fromStdString(saved.unwrap_err().message);
    } else {
        qCDebug(folioStorageLog) << "saved site";
    }
    return saved;
}

QJsonObject Session::call(const QString& method, const QJsonObject& params) {
    if (!database_ || !Dispatcher::is_mutation(method)) {
        return dispatcher_.call(method, params);
    }

    // An error response must leave the site as it was, so a change that
    // cannot be saved is undone.
    auto before = engine_.snapshot();
    auto response = dispatcher_.call(method, params);
    if (!response.value(QStringLiteral("ok")).toBool()) {
        return response;
    }

    auto saved = save();
    if (saved.is_err()) {
        auto error = saved.unwrap_err();
        auto restored = engine_.restore(std::move(before));
        if (restored.is_err()) {
            qCCritical(folioStorageLog) << "cannot undo unsaved" << method << ":"
                                        << QString::fromStdString(restored.unwrap_err().message);
            error.message = "Change could not be saved or undone: " + error.message;
        } else {
            qCWarning(folioStorageLog) << "undid" << method << "after failed save";
            error.message = "Change not saved and undone: " + error.message;
        }
        return error_response(error);
    }
    return response;
}

QJsonObject Session::handle_request(const QJsonObject& request) {
    const auto id = request.value(QStringLiteral("id"));
    const auto method = request.value(QStringLiteral("method"));
    if (!method.isString()) {
        return request_failure(id, "Request needs a string 'method'");
    }

    const auto params = request.value(QStringLiteral("params"));
    if (!params.isUndefined() && !params.isNull() && !params.isObject()) {
        return request_failure(id, "'params' must be an object");
    }

    auto response = call(method.toString(), params.toObject());
    response.insert(QStringLiteral("id"), id);
    return response;
}

QByteArray Session::handle_line(const QByteArray& line) {
    QJsonParseError parse_error{};
    const auto doc = QJsonDocument::fromJson(line, &parse_error);
    QJsonObject response;
    if (parse_error.error != QJsonParseError::NoError) {
        response = request_failure(QJsonValue(QJsonValue::Null),
                                   "Invalid JSON: " + parse_error.errorString().toStdString());
    } else if (!doc.isObject()) {
        response = request_failure(QJsonValue(QJsonValue::Null), "Request must be a JSON object");
    } else {
        response = handle_request(doc.object());
    }
    return QJsonDocument(response).toJson(QJsonDocument::Compact);
}

int Session::serve(QIODevice& in, QIODevice& out) {
    int handled = 0;
    while (true) {
        // readLine blocks on stdin; an empty result (not even "\n") means end of input.
        auto line = in.readLine();
        if (line.isEmpty()) {
            break;
        }
        line = line.trimmed();
        if (line.isEmpty()) {
            continue;
        }
        out.write(handle_line(line));
        out.write("\n");
        if (auto* file = qobject_cast<QFileDevice*>(&out)) {
            file->flush();
        }
        ++handled;
    }
    qCDebug(folioRpcLog) << "input closed after" << handled << "requests";
    return handled;
}

} // namespace folio::rpc
