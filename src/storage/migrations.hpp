#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include <string>
#include <vector>

namespace folio::storage {

/**
 * Migration - A database schema migration.
 */
struct Migration {
    int version;
    std::string name;
    std::string up_sql;
    std::string down_sql;  // Optional - for rollback
};

/**
 * All migrations in order.
 */
inline const std::vector<Migration> ALL_MIGRATIONS = {
    {
        .version = 1,
        .name = "initial_schema",
        .up_sql = R"SQL(
            -- Page tree. Parents may be written after their children inside
            -- one transaction, hence the deferred reference.
            CREATE TABLE IF NOT EXISTS pages (
                id INTEGER PRIMARY KEY,
                parent_id INTEGER REFERENCES pages(id)
                    ON DELETE CASCADE DEFERRABLE INITIALLY DEFERRED,
                title TEXT NOT NULL DEFAULT '',
                slug TEXT NOT NULL,
                position INTEGER NOT NULL DEFAULT 0,
                template TEXT NOT NULL DEFAULT 'default',
                description TEXT,
                created_at INTEGER NOT NULL,
                updated_at INTEGER NOT NULL
            );
            CREATE INDEX IF NOT EXISTS idx_pages_parent ON pages(parent_id, position);

            -- Draft components
            CREATE TABLE IF NOT EXISTS components (
                id INTEGER PRIMARY KEY,
                page_id INTEGER NOT NULL REFERENCES pages(id)
                    ON DELETE CASCADE DEFERRABLE INITIALLY DEFERRED,
                position INTEGER NOT NULL DEFAULT 0,
                component_type TEXT NOT NULL DEFAULT 'markdown',
                title TEXT,
                body TEXT NOT NULL DEFAULT '',
                template TEXT NOT NULL DEFAULT 'default',
                created_at INTEGER NOT NULL,
                updated_at INTEGER NOT NULL
            );
            CREATE INDEX IF NOT EXISTS idx_components_page ON components(page_id, position);

            -- Id counters and other site-wide values
            CREATE TABLE IF NOT EXISTS site_meta (
                key TEXT PRIMARY KEY,
                value INTEGER NOT NULL
            );
        )SQL",
        .down_sql = R"SQL(
            DROP TABLE IF EXISTS site_meta;
            DROP TABLE IF EXISTS components;
            DROP TABLE IF EXISTS pages;
        )SQL"
    },
    {
        .version = 2,
        .name = "published_versions",
        .up_sql = R"SQL(
            CREATE TABLE IF NOT EXISTS published_versions (
                page_id INTEGER PRIMARY KEY REFERENCES pages(id)
                    ON DELETE CASCADE DEFERRABLE INITIALLY DEFERRED,
                published_at INTEGER NOT NULL
            );

            -- Published copies keep the ids of the drafts they were taken from.
            CREATE TABLE IF NOT EXISTS published_components (
                page_id INTEGER NOT NULL REFERENCES published_versions(page_id)
                    ON DELETE CASCADE DEFERRABLE INITIALLY DEFERRED,
                id INTEGER NOT NULL,
                position INTEGER NOT NULL DEFAULT 0,
                component_type TEXT NOT NULL DEFAULT 'markdown',
                title TEXT,
                body TEXT NOT NULL DEFAULT '',
                template TEXT NOT NULL DEFAULT 'default',
                created_at INTEGER NOT NULL,
                updated_at INTEGER NOT NULL,
                PRIMARY KEY (page_id, id)
            );
        )SQL",
        .down_sql = R"SQL(
            DROP TABLE IF EXISTS published_components;
            DROP TABLE IF EXISTS published_versions;
        )SQL"
    },
    {
        .version = 3,
        .name = "page_keywords",
        .up_sql = R"SQL(
            ALTER TABLE pages ADD COLUMN keywords TEXT;
        )SQL",
        .down_sql = R"SQL(
            ALTER TABLE pages DROP COLUMN keywords;
        )SQL"
    }
};

/**
 * MigrationRunner - Runs database migrations.
 */
class MigrationRunner {
public:
    explicit MigrationRunner(Database& db) : db_(db) {}

    /**
     * Run all pending migrations.
     */
    [[nodiscard]] Result<void> migrate();

    /**
     * Migrate to a specific version.
     */
    [[nodiscard]] Result<void> migrate_to(int target_version);

    /**
     * Rollback the last migration.
     */
    [[nodiscard]] Result<void> rollback();

    /**
     * Rollback to a specific version.
     */
    [[nodiscard]] Result<void> rollback_to(int target_version);

    /**
     * Get the current schema version.
     */
    [[nodiscard]] Result<int> current_version();

    [[nodiscard]] static int latest_version() {
        return ALL_MIGRATIONS.empty() ? 0 : ALL_MIGRATIONS.back().version;
    }

private:
    Database& db_;

    [[nodiscard]] Result<void> ensure_migrations_table();
    [[nodiscard]] Result<void> run_migration(const Migration& m);
    [[nodiscard]] Result<void> run_rollback(const Migration& m);
    [[nodiscard]] Result<void> set_version(int version);
};

/**
 * Initialize a database with all migrations.
 */
[[nodiscard]] inline Result<void> initialize_database(Database& db) {
    MigrationRunner runner(db);
    return runner.migrate();
}

} // namespace folio::storage
