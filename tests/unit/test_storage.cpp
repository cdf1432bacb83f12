#include <catch2/catch_test_macros.hpp>
#include "storage/database.hpp"
#include "storage/migrations.hpp"
#include "storage/site_repository.hpp"

using namespace folio;
using namespace folio::storage;
using namespace folio::components;

namespace {

Database migrated_memory_db() {
    auto db = Database::open_memory().unwrap();
    REQUIRE(initialize_database(db).is_ok());
    return db;
}

int count_rows(Database& db, const std::string& table) {
    auto stmt = db.prepare("SELECT COUNT(*) FROM " + table + ";").unwrap();
    REQUIRE(stmt.step().unwrap());
    return stmt.column_int(0);
}

} // namespace

TEST_CASE("Database basic operations", "[storage]") {
    auto db_result = Database::open_memory();
    REQUIRE(db_result.is_ok());
    auto db = std::move(db_result).unwrap();

    SECTION("Execute creates table") {
        auto result = db.execute("CREATE TABLE test (id INTEGER PRIMARY KEY);");
        REQUIRE(result.is_ok());
    }

    SECTION("Invalid SQL is a StorageError") {
        auto result = db.execute("CREATE TABLE (;");
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().kind == ErrorKind::StorageError);
        REQUIRE(result.unwrap_err().code != 0);
    }

    SECTION("Prepare and step") {
        REQUIRE(db.execute("CREATE TABLE test (id INTEGER, name TEXT);").is_ok());
        REQUIRE(db.execute("INSERT INTO test VALUES (1, 'Alice');").is_ok());
        REQUIRE(db.execute("INSERT INTO test VALUES (2, NULL);").is_ok());

        auto stmt = db.prepare("SELECT id, name FROM test ORDER BY id;").unwrap();

        REQUIRE(stmt.step().unwrap() == true);
        REQUIRE(stmt.column_int(0) == 1);
        REQUIRE(stmt.column_text(1) == "Alice");

        REQUIRE(stmt.step().unwrap() == true);
        REQUIRE(stmt.column_int64(0) == 2);
        REQUIRE(stmt.column_is_null(1));

        REQUIRE(stmt.step().unwrap() == false);
    }

    SECTION("Bind parameters") {
        REQUIRE(db.execute("CREATE TABLE test (id INTEGER, name TEXT);").is_ok());

        auto insert = db.prepare("INSERT INTO test VALUES (?, ?);").unwrap();
        REQUIRE(insert.bind_int64(1, 42).is_ok());
        REQUIRE(insert.bind_text(2, "Answer").is_ok());
        REQUIRE(insert.step().is_ok());
        REQUIRE(db.changes() == 1);

        std::vector<std::string> names;
        auto result = db.query("SELECT name FROM test;", [&](Statement& row) {
            names.push_back(row.column_text(0));
        });
        REQUIRE(result.is_ok());
        REQUIRE(names == std::vector<std::string>{"Answer"});
    }

    SECTION("Transaction commits") {
        REQUIRE(db.execute("CREATE TABLE test (id INTEGER);").is_ok());

        auto result = db.transaction([&]() {
            return db.execute("INSERT INTO test VALUES (1);");
        });
        REQUIRE(result.is_ok());
        REQUIRE(count_rows(db, "test") == 1);
    }

    SECTION("Transaction rolls back on error") {
        REQUIRE(db.execute("CREATE TABLE test (id INTEGER);").is_ok());

        auto result = db.transaction([&]() {
            return db.execute("INSERT INTO test VALUES (1);")
                .and_then([&]() { return db.execute("INSERT INTO missing VALUES (1);"); });
        });
        REQUIRE(result.is_err());
        REQUIRE(count_rows(db, "test") == 0);
    }

    SECTION("A commit rejected by a deferred constraint is rolled back") {
        REQUIRE(db.execute(R"SQL(
            CREATE TABLE parent (id INTEGER PRIMARY KEY);
            CREATE TABLE child (
                id INTEGER PRIMARY KEY,
                parent_id INTEGER NOT NULL REFERENCES parent(id) DEFERRABLE INITIALLY DEFERRED
            );
        )SQL").is_ok());

        auto failed = db.transaction([&]() {
            return db.execute("INSERT INTO child VALUES (1, 99);");
        });
        REQUIRE(failed.is_err());
        REQUIRE(failed.unwrap_err().kind == ErrorKind::StorageError);
        REQUIRE(count_rows(db, "child") == 0);

        // The connection is usable for the next transaction.
        auto next = db.transaction([&]() {
            return db.execute("INSERT INTO parent VALUES (99);")
                .and_then([&]() { return db.execute("INSERT INTO child VALUES (1, 99);"); });
        });
        REQUIRE(next.is_ok());
        REQUIRE(count_rows(db, "child") == 1);
    }
}

TEST_CASE("Migrations", "[storage]") {
    auto db = Database::open_memory().unwrap();
    MigrationRunner runner(db);

    SECTION("Initial version is 0") {
        auto version = runner.current_version();
        REQUIRE(version.is_ok());
        REQUIRE(version.unwrap() == 0);
    }

    SECTION("Migrate to latest") {
        REQUIRE(runner.migrate().is_ok());
        REQUIRE(runner.current_version().unwrap() == MigrationRunner::latest_version());
        REQUIRE(MigrationRunner::latest_version() == 3);
        REQUIRE(count_rows(db, "published_components") == 0);
    }

    SECTION("Migrate is idempotent") {
        REQUIRE(runner.migrate().is_ok());
        REQUIRE(runner.migrate().is_ok());
        REQUIRE(runner.current_version().unwrap() == MigrationRunner::latest_version());
    }

    SECTION("Migrate step by step and roll back") {
        REQUIRE(runner.migrate_to(1).is_ok());
        REQUIRE(runner.current_version().unwrap() == 1);
        REQUIRE(db.execute("SELECT * FROM published_versions;").is_err());

        REQUIRE(runner.migrate().is_ok());
        REQUIRE(db.execute("SELECT keywords FROM pages;").is_ok());
        REQUIRE(runner.rollback().is_ok());
        REQUIRE(runner.current_version().unwrap() == 2);
        REQUIRE(db.execute("SELECT keywords FROM pages;").is_err());

        REQUIRE(runner.rollback().is_ok());
        REQUIRE(runner.current_version().unwrap() == 1);
        REQUIRE(db.execute("SELECT * FROM published_versions;").is_err());

        REQUIRE(runner.rollback_to(0).is_ok());
        REQUIRE(runner.current_version().unwrap() == 0);
        REQUIRE(db.execute("SELECT * FROM pages;").is_err());
    }
}

TEST_CASE("SiteRepository", "[storage]") {
    auto db = migrated_memory_db();
    SiteRepository repo(db);

    SECTION("Nothing saved yet") {
        auto loaded = repo.load();
        REQUIRE(loaded.is_ok());
        REQUIRE_FALSE(loaded.unwrap().has_value());
    }

    SECTION("Round trip reproduces the site") {
        ContentEngine engine;
        auto about = engine.create_page(NewPage{.parent_id = PageTree::ROOT_ID, .title = "About"})
                         .unwrap().page.id;
        auto team = engine.create_page(NewPage{.parent_id = about, .title = "Team",
                                               .description = "Who we are",
                                               .keywords = "people, staff"})
                        .unwrap().page.id;
        REQUIRE(engine.create_component(about, NewComponent{.body = "Hello", .title = "Intro"}).is_ok());
        REQUIRE(engine.create_component(about, NewComponent{.body = "<p>x</p>",
                                                            .type = ComponentType::Html}).is_ok());
        REQUIRE(engine.create_component(team, NewComponent{.body = "People"}).is_ok());
        REQUIRE(engine.publish_draft(about).is_ok());
        REQUIRE(engine.create_component(about, NewComponent{.body = "Unpublished"}).is_ok());

        const auto snapshot = engine.snapshot();
        REQUIRE(repo.save(snapshot).is_ok());

        auto loaded = repo.load().unwrap();
        REQUIRE(loaded.has_value());
        REQUIRE(loaded->next_page_id == snapshot.next_page_id);
        REQUIRE(loaded->next_component_id == snapshot.next_component_id);
        REQUIRE(loaded->published == snapshot.published);

        ContentEngine restored;
        REQUIRE(restored.restore(*loaded).is_ok());
        REQUIRE(restored.list_pages() == engine.list_pages());
        REQUIRE(restored.get_page(team).unwrap().page.keywords == "people, staff");
        REQUIRE_FALSE(restored.get_page(about).unwrap().page.keywords.has_value());
        REQUIRE(restored.get_draft_content(about).unwrap() == engine.get_draft_content(about).unwrap());
        REQUIRE(restored.get_draft_content(team).unwrap() == engine.get_draft_content(team).unwrap());
        auto status = restored.version_status(about).unwrap();
        REQUIRE(status.has_published);
        REQUIRE(status.has_draft_changes);
        REQUIRE(status.published_count == 2);
        REQUIRE(status.draft_count == 3);
    }

    SECTION("Saving again replaces the stored rows") {
        ContentEngine engine;
        auto page = engine.create_page(NewPage{.parent_id = PageTree::ROOT_ID, .title = "Old"})
                        .unwrap().page.id;
        REQUIRE(engine.create_component(page, NewComponent{.body = "x"}).is_ok());
        REQUIRE(repo.save(engine.snapshot()).is_ok());

        REQUIRE(engine.delete_page(page).is_ok());
        REQUIRE(repo.save(engine.snapshot()).is_ok());

        REQUIRE(count_rows(db, "pages") == 1);
        REQUIRE(count_rows(db, "components") == 0);

        auto loaded = repo.load().unwrap();
        REQUIRE(loaded.has_value());
        REQUIRE(loaded->pages.size() == 1);
        REQUIRE(loaded->next_page_id == page + 1);
    }
}
