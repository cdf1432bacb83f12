#include <catch2/catch_test_macros.hpp>

#include <QBuffer>
#include <QJsonDocument>
#include <QJsonObject>
#include <QList>
#include <QTemporaryDir>

#include "rpc/session.hpp"
#include "storage/database.hpp"

using folio::rpc::Session;

namespace {

std::unique_ptr<Session> open_session(const QString& path = {}) {
    auto opened = Session::open(path);
    REQUIRE(opened.is_ok());
    return std::move(opened).unwrap();
}

QJsonObject parse(const QByteArray& line) {
    const auto doc = QJsonDocument::fromJson(line);
    REQUIRE(doc.isObject());
    return doc.object();
}

QString error_kind(const QJsonObject& response) {
    return response.value(QStringLiteral("error")).toObject().value(QStringLiteral("kind")).toString();
}

} // namespace

TEST_CASE("Session: handle_line", "[rpc][session]") {
    auto session = open_session();
    REQUIRE_FALSE(session->is_persistent());

    SECTION("Echoes the request id") {
        const auto response = parse(session->handle_line(
            R"({"id": 7, "method": "create_page", "params": {"parent_page_id": 1, "title": "Blog"}})"));
        REQUIRE(response.value(QStringLiteral("ok")).toBool());
        REQUIRE(response.value(QStringLiteral("id")).toInt() == 7);
        REQUIRE(response.value(QStringLiteral("result")).toObject()
                    .value(QStringLiteral("path")).toString() == QStringLiteral("/blog"));
    }

    SECTION("String ids are echoed too") {
        const auto response = parse(session->handle_line(R"({"id": "abc", "method": "list_pages"})"));
        REQUIRE(response.value(QStringLiteral("ok")).toBool());
        REQUIRE(response.value(QStringLiteral("id")).toString() == QStringLiteral("abc"));
    }

    SECTION("Invalid JSON") {
        const auto response = parse(session->handle_line("{not json"));
        REQUIRE_FALSE(response.value(QStringLiteral("ok")).toBool());
        REQUIRE(response.value(QStringLiteral("id")).isNull());
        REQUIRE(error_kind(response) == QStringLiteral("ValidationError"));
    }

    SECTION("Non-object requests") {
        REQUIRE(error_kind(parse(session->handle_line("[1, 2]"))) == QStringLiteral("ValidationError"));
        REQUIRE(error_kind(parse(session->handle_line(R"({"id": 1})"))) == QStringLiteral("ValidationError"));
        REQUIRE(error_kind(parse(session->handle_line(R"({"id": 1, "method": "list_pages", "params": 3})"))) ==
                QStringLiteral("ValidationError"));
    }

    SECTION("Responses are a single line") {
        const auto line = session->handle_line(R"({"id": 1, "method": "list_pages"})");
        REQUIRE_FALSE(line.contains('\n'));
    }
}

TEST_CASE("Session: serve reads until end of input", "[rpc][session]") {
    auto session = open_session();

    QByteArray input =
        R"({"id": 1, "method": "create_page", "params": {"parent_page_id": 1, "title": "A"}})" "\n"
        "\n"
        R"({"id": 2, "method": "get_page_by_path", "params": {"path": "/a"}})" "\n"
        R"({"id": 3, "method": "delete_page", "params": {"page_id": 1}})";
    QBuffer in(&input);
    REQUIRE(in.open(QIODevice::ReadOnly));

    QByteArray output;
    QBuffer out(&output);
    REQUIRE(out.open(QIODevice::WriteOnly));

    REQUIRE(session->serve(in, out) == 3);

    const auto lines = output.split('\n');
    REQUIRE(lines.size() == 4);  // trailing newline
    REQUIRE(lines[3].isEmpty());
    REQUIRE(parse(lines[0]).value(QStringLiteral("ok")).toBool());
    REQUIRE(parse(lines[1]).value(QStringLiteral("id")).toInt() == 2);
    REQUIRE(parse(lines[1]).value(QStringLiteral("ok")).toBool());
    REQUIRE(error_kind(parse(lines[2])) == QStringLiteral("InvalidOperation"));
}

TEST_CASE("Session: changes persist across sessions", "[rpc][session]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto path = dir.filePath(QStringLiteral("nested/site.db"));

    qint64 page_id = 0;
    {
        auto session = open_session(path);
        REQUIRE(session->is_persistent());

        auto created = session->call(QStringLiteral("create_page"),
                                     QJsonObject{{"parent_page_id", 1}, {"title", "Docs"}});
        REQUIRE(created.value(QStringLiteral("ok")).toBool());
        page_id = created.value(QStringLiteral("result")).toObject().value(QStringLiteral("id")).toInteger();

        REQUIRE(session->call(QStringLiteral("create_component"),
                              QJsonObject{{"page_id", page_id}, {"body", "Read me"}})
                    .value(QStringLiteral("ok")).toBool());
        REQUIRE(session->call(QStringLiteral("publish_draft"), QJsonObject{{"page_id", page_id}})
                    .value(QStringLiteral("ok")).toBool());
        REQUIRE(session->call(QStringLiteral("create_component"),
                              QJsonObject{{"page_id", page_id}, {"body", "Draft only"}})
                    .value(QStringLiteral("ok")).toBool());
    }

    auto reopened = open_session(path);
    const auto page = reopened->call(QStringLiteral("get_page_by_path"), QJsonObject{{"path", "/docs"}});
    REQUIRE(page.value(QStringLiteral("ok")).toBool());
    REQUIRE(page.value(QStringLiteral("result")).toObject().value(QStringLiteral("id")).toInteger() == page_id);

    const auto status = reopened->call(QStringLiteral("get_version_status"), QJsonObject{{"page_id", page_id}})
                            .value(QStringLiteral("result")).toObject();
    REQUIRE(status.value(QStringLiteral("has_published")).toBool());
    REQUIRE(status.value(QStringLiteral("draft_count")).toInteger() == 2);
    REQUIRE(status.value(QStringLiteral("published_count")).toInteger() == 1);

    // Counters survive: the next component id follows the two already made.
    const auto next = reopened->call(QStringLiteral("create_component"),
                                     QJsonObject{{"page_id", page_id}, {"body", "Third"}});
    REQUIRE(next.value(QStringLiteral("result")).toObject().value(QStringLiteral("id")).toInteger() == 3);
}

TEST_CASE("Session: failed calls do not save", "[rpc][session]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto path = dir.filePath(QStringLiteral("site.db"));

    {
        auto session = open_session(path);
        const auto response = session->call(QStringLiteral("delete_page"), QJsonObject{{"page_id", 1}});
        REQUIRE(error_kind(response) == QStringLiteral("InvalidOperation"));
    }

    auto reopened = open_session(path);
    const auto tree = reopened->call(QStringLiteral("list_pages"), {});
    REQUIRE(tree.value(QStringLiteral("result")).toObject().value(QStringLiteral("title")).toString() ==
            QStringLiteral("Home"));
}

TEST_CASE("Session: a change that cannot be saved is undone", "[rpc][session]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto path = dir.filePath(QStringLiteral("site.db"));

    auto session = open_session(path);
    REQUIRE(session->call(QStringLiteral("create_page"),
                          QJsonObject{{"parent_page_id", 1}, {"title", "Blog"}})
                .value(QStringLiteral("ok")).toBool());
    const auto before = session->engine().list_pages();
    const auto snapshot_before = session->engine().snapshot();

    // Break the schema behind the session's back so the next save fails.
    {
        auto other = folio::storage::Database::open(path.toStdString()).unwrap();
        REQUIRE(other.execute("DROP TABLE site_meta;").is_ok());
    }

    const auto failed = session->call(QStringLiteral("create_page"),
                                      QJsonObject{{"parent_page_id", 1}, {"title", "News"}});
    REQUIRE_FALSE(failed.value(QStringLiteral("ok")).toBool());
    REQUIRE(error_kind(failed) == QStringLiteral("StorageError"));
    REQUIRE(session->engine().list_pages() == before);
    REQUIRE(session->engine().snapshot().next_page_id == snapshot_before.next_page_id);

    // Retrying fails the same way instead of piling up "news-2", "news-3".
    const auto retried = session->call(QStringLiteral("create_page"),
                                       QJsonObject{{"parent_page_id", 1}, {"title", "News"}});
    REQUIRE(error_kind(retried) == QStringLiteral("StorageError"));
    REQUIRE(session->engine().list_pages() == before);

    // Reads are not affected.
    REQUIRE(session->call(QStringLiteral("get_page_by_path"), QJsonObject{{"path", "/blog"}})
                .value(QStringLiteral("ok")).toBool());
}
