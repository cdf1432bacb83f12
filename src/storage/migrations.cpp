#include "storage/migrations.hpp"

#include "core/types.hpp"

namespace folio::storage {

Result<void> MigrationRunner::ensure_migrations_table() {
    return db_.execute(R"SQL(
        CREATE TABLE IF NOT EXISTS schema_migrations (
            version INTEGER PRIMARY KEY,
            name TEXT NOT NULL,
            applied_at INTEGER NOT NULL
        );
    )SQL");
}

Result<int> MigrationRunner::current_version() {
    auto ensure_result = ensure_migrations_table();
    if (ensure_result.is_err()) {
        return Result<int>::err(ensure_result.unwrap_err());
    }

    auto stmt_result = db_.prepare(
        "SELECT COALESCE(MAX(version), 0) FROM schema_migrations;");
    if (stmt_result.is_err()) {
        return Result<int>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<int>::err(step_result.unwrap_err());
    }

    return Result<int>::ok(stmt.column_int(0));
}

Result<void> MigrationRunner::set_version(int version) {
    std::string name = "unknown";
    for (const auto& m : ALL_MIGRATIONS) {
        if (m.version == version) {
            name = m.name;
            break;
        }
    }

    auto stmt_result = db_.prepare(
        "INSERT INTO schema_migrations (version, name, applied_at) VALUES (?, ?, ?);");
    if (stmt_result.is_err()) {
        return Result<void>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_int(1, version)
        .and_then([&] { return stmt.bind_text(2, name); })
        .and_then([&] { return stmt.bind_int64(3, Timestamp::now().millis()); });
    if (bound.is_err()) {
        return bound;
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<void>::err(step_result.unwrap_err());
    }

    return Result<void>::ok();
}

Result<void> MigrationRunner::run_migration(const Migration& m) {
    auto exec_result = db_.execute(m.up_sql);
    if (exec_result.is_err()) {
        const auto& cause = exec_result.unwrap_err();
        return Result<void>::err(Error::storage(
            "Migration " + std::to_string(m.version) + " (" + m.name + ") failed: " +
            cause.message, cause.code));
    }

    return set_version(m.version);
}

Result<void> MigrationRunner::run_rollback(const Migration& m) {
    if (m.down_sql.empty()) {
        return Result<void>::err(Error::storage(
            "Migration " + std::to_string(m.version) + " has no rollback SQL"));
    }

    auto exec_result = db_.execute(m.down_sql);
    if (exec_result.is_err()) {
        const auto& cause = exec_result.unwrap_err();
        return Result<void>::err(Error::storage(
            "Rollback of migration " + std::to_string(m.version) + " failed: " +
            cause.message, cause.code));
    }

    return db_.execute(
        "DELETE FROM schema_migrations WHERE version = " +
        std::to_string(m.version) + ";");
}

Result<void> MigrationRunner::migrate() {
    return migrate_to(latest_version());
}

Result<void> MigrationRunner::migrate_to(int target_version) {
    auto current_result = current_version();
    if (current_result.is_err()) {
        return Result<void>::err(current_result.unwrap_err());
    }

    int current = current_result.unwrap();

    if (current >= target_version) {
        return Result<void>::ok();  // Already at or past target
    }

    return db_.transaction([&]() -> Result<void> {
        for (const auto& m : ALL_MIGRATIONS) {
            if (m.version > current && m.version <= target_version) {
                auto result = run_migration(m);
                if (result.is_err()) {
                    return result;
                }
            }
        }
        return Result<void>::ok();
    });
}

Result<void> MigrationRunner::rollback() {
    auto current_result = current_version();
    if (current_result.is_err()) {
        return Result<void>::err(current_result.unwrap_err());
    }

    int current = current_result.unwrap();
    if (current == 0) {
        return Result<void>::ok();  // Nothing to rollback
    }

    return rollback_to(current - 1);
}

Result<void> MigrationRunner::rollback_to(int target_version) {
    auto current_result = current_version();
    if (current_result.is_err()) {
        return Result<void>::err(current_result.unwrap_err());
    }

    int current = current_result.unwrap();

    if (current <= target_version) {
        return Result<void>::ok();  // Already at or before target
    }

    // Reverse order, one transaction
    return db_.transaction([&]() -> Result<void> {
        for (auto it = ALL_MIGRATIONS.rbegin(); it != ALL_MIGRATIONS.rend(); ++it) {
            if (it->version <= current && it->version > target_version) {
                auto result = run_rollback(*it);
                if (result.is_err()) {
                    return result;
                }
            }
        }
        return Result<void>::ok();
    });
}

} // namespace folio::storage
