#pragma once

#include "core/content_engine.hpp"
#include "core/result.hpp"
#include "rpc/dispatcher.hpp"
#include "storage/database.hpp"

#include <QByteArray>
#include <QIODevice>
#include <QJsonObject>
#include <QString>

#include <memory>
#include <optional>

namespace folio::rpc {

/**
 * Session - One site opened for requests.
 *
 * Owns the engine and, when a database path is given, the SQLite database
 * the site is loaded from and saved back to after every successful mutating
 * call. Without a database the site lives in memory only.
 */
class Session {
public:
    /**
     * Open a session. An empty path (or ":memory:") gives a fresh in-memory
     * site; otherwise the database is created or migrated and its stored
     * site, if any, is loaded.
     */
    [[nodiscard]] static Result<std::unique_ptr<Session>> open(const QString& database_path);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    [[nodiscard]] ContentEngine& engine() { return engine_; }
    [[nodiscard]] bool is_persistent() const { return database_.has_value(); }

    /**
     * Run one operation, saving afterwards if it changed the site.
     *
     * A save failure turns the response into a StorageError and the change
     * is undone in memory, so an error response always means nothing
     * changed.
     */
    [[nodiscard]] QJsonObject call(const QString& method, const QJsonObject& params);

    /**
     * Handle one request object {"id", "method", "params"}; the response
     * echoes "id".
     */
    [[nodiscard]] QJsonObject handle_request(const QJsonObject& request);

    /**
     * Handle one line of JSON text and return one compact line of JSON
     * (without the newline). Unparseable input yields a ValidationError
     * response with a null id.
     */
    [[nodiscard]] QByteArray handle_line(const QByteArray& line);

    /**
     * Read requests line by line from in until end of input, writing one
     * response line per non-blank request line to out.
     * Returns the number of requests handled.
     */
    int serve(QIODevice& in, QIODevice& out);

    /**
     * Save the current state to the database (no-op without one).
     */
    [[nodiscard]] Result<void> save();

private:
    Session() : dispatcher_(engine_) {}

    ContentEngine engine_;
    Dispatcher dispatcher_;
    std::optional<storage::Database> database_;
};

} // namespace folio::rpc
