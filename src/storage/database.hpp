#pragma once

#include "core/result.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace folio::storage {

/**
 * SQLite statement wrapper with RAII.
 */
class Statement {
public:
    Statement() = default;
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt, sqlite3_finalize) {}

    [[nodiscard]] sqlite3_stmt* get() const { return stmt_.get(); }
    [[nodiscard]] explicit operator bool() const { return stmt_ != nullptr; }

    // Bind helpers
    [[nodiscard]] Result<void> bind_text(int index, std::string_view text);
    [[nodiscard]] Result<void> bind_int(int index, int value);
    [[nodiscard]] Result<void> bind_int64(int index, int64_t value);
    [[nodiscard]] Result<void> bind_null(int index);

    // Column getters
    [[nodiscard]] std::string column_text(int index) const;
    [[nodiscard]] int column_int(int index) const;
    [[nodiscard]] int64_t column_int64(int index) const;
    [[nodiscard]] bool column_is_null(int index) const;

    // Execute
    [[nodiscard]] Result<bool> step();  // Returns true if there's a row
    [[nodiscard]] Result<void> reset();

private:
    std::shared_ptr<sqlite3_stmt> stmt_;
};

/**
 * Database - SQLite database wrapper.
 *
 * Provides:
 * - RAII connection management
 * - Transaction support
 * - Error handling via Result, every failure as ErrorKind::StorageError
 *   carrying the SQLite result code
 */
class Database {
public:
    Database() = default;
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;

    /**
     * Open (or create) a database file.
     */
    [[nodiscard]] static Result<Database> open(const std::string& path);

    /**
     * Open an in-memory database (for testing).
     */
    [[nodiscard]] static Result<Database> open_memory();

    [[nodiscard]] bool is_open() const { return db_ != nullptr; }

    void close();

    [[nodiscard]] sqlite3* handle() const { return db_; }

    [[nodiscard]] Result<Statement> prepare(const std::string& sql);

    /**
     * Execute one or more SQL statements without results.
     */
    [[nodiscard]] Result<void> execute(const std::string& sql);

    /**
     * Execute a query and hand every row to a callback.
     */
    template<typename F>
    [[nodiscard]] Result<void> query(const std::string& sql, F&& callback) {
        auto stmt_result = prepare(sql);
        if (stmt_result.is_err()) {
            return Result<void>::err(stmt_result.unwrap_err());
        }

        auto stmt = std::move(stmt_result).unwrap();
        while (true) {
            auto step_result = stmt.step();
            if (step_result.is_err()) {
                return Result<void>::err(step_result.unwrap_err());
            }
            if (!step_result.unwrap()) break;
            callback(stmt);
        }

        return Result<void>::ok();
    }

    [[nodiscard]] Result<void> begin_transaction();
    [[nodiscard]] Result<void> commit();
    [[nodiscard]] Result<void> rollback();

    /**
     * Execute a function within a transaction.
     * Commits on success, rolls back on failure (including a failed commit);
     * the original error wins over a failed rollback.
     */
    template<typename F>
    [[nodiscard]] auto transaction(F&& f) -> decltype(f()) {
        using ResultType = decltype(f());

        auto begin_result = begin_transaction();
        if (begin_result.is_err()) {
            return ResultType::err(begin_result.unwrap_err());
        }

        auto result = f();

        if (result.is_err()) {
            auto rolled_back = rollback();
            if (rolled_back.is_err()) {
                auto error = result.unwrap_err();
                error.message += " (rollback failed: " + rolled_back.unwrap_err().message + ")";
                return ResultType::err(std::move(error));
            }
            return result;
        }

        // Deferred constraints are checked at COMMIT; a failed commit leaves
        // the transaction open.
        auto commit_result = commit();
        if (commit_result.is_err()) {
            auto error = commit_result.unwrap_err();
            auto rolled_back = rollback();
            if (rolled_back.is_err()) {
                error.message += " (rollback failed: " + rolled_back.unwrap_err().message + ")";
            }
            return ResultType::err(std::move(error));
        }

        return result;
    }

    [[nodiscard]] int changes() const;

    [[nodiscard]] std::string last_error() const;

private:
    explicit Database(sqlite3* db) : db_(db) {}

    sqlite3* db_ = nullptr;
};

} // namespace folio::storage
