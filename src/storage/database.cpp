#include "storage/database.hpp"

namespace folio::storage {

// ============================================================================
// Statement implementation
// ============================================================================

namespace {

[[nodiscard]] Result<void> bind_status(int rc, const char* what) {
    if (rc != SQLITE_OK) {
        return Result<void>::err(Error::storage(std::string("Failed to bind ") + what, rc));
    }
    return Result<void>::ok();
}

} // namespace

Result<void> Statement::bind_text(int index, std::string_view text) {
    return bind_status(sqlite3_bind_text(stmt_.get(), index, text.data(),
                                         static_cast<int>(text.size()), SQLITE_TRANSIENT),
                       "text");
}

Result<void> Statement::bind_int(int index, int value) {
    return bind_status(sqlite3_bind_int(stmt_.get(), index, value), "int");
}

Result<void> Statement::bind_int64(int index, int64_t value) {
    return bind_status(sqlite3_bind_int64(stmt_.get(), index, value), "int64");
}

Result<void> Statement::bind_null(int index) {
    return bind_status(sqlite3_bind_null(stmt_.get(), index), "null");
}

std::string Statement::column_text(int index) const {
    const unsigned char* text = sqlite3_column_text(stmt_.get(), index);
    if (!text) return "";
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<std::size_t>(sqlite3_column_bytes(stmt_.get(), index)));
}

int Statement::column_int(int index) const {
    return sqlite3_column_int(stmt_.get(), index);
}

int64_t Statement::column_int64(int index) const {
    return sqlite3_column_int64(stmt_.get(), index);
}

bool Statement::column_is_null(int index) const {
    return sqlite3_column_type(stmt_.get(), index) == SQLITE_NULL;
}

Result<bool> Statement::step() {
    int rc = sqlite3_step(stmt_.get());
    if (rc == SQLITE_ROW) {
        return Result<bool>::ok(true);
    }
    if (rc == SQLITE_DONE) {
        return Result<bool>::ok(false);
    }
    return Result<bool>::err(Error::storage(
        std::string("Step failed: ") + sqlite3_errmsg(sqlite3_db_handle(stmt_.get())), rc));
}

Result<void> Statement::reset() {
    int rc = sqlite3_reset(stmt_.get());
    if (rc != SQLITE_OK) {
        return Result<void>::err(Error::storage("Reset failed", rc));
    }
    sqlite3_clear_bindings(stmt_.get());
    return Result<void>::ok();
}

// ============================================================================
// Database implementation
// ============================================================================

Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept : db_(other.db_) {
    other.db_ = nullptr;
}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = other.db_;
        other.db_ = nullptr;
    }
    return *this;
}

Result<Database> Database::open(const std::string& path) {
    sqlite3* handle = nullptr;
    int rc = sqlite3_open(path.c_str(), &handle);
    if (rc != SQLITE_OK) {
        std::string error = handle ? sqlite3_errmsg(handle) : "Unknown error";
        if (handle) sqlite3_close(handle);
        return Result<Database>::err(Error::storage("Cannot open " + path + ": " + error, rc));
    }

    Database db(handle);

    auto fk = db.execute("PRAGMA foreign_keys = ON;");
    if (fk.is_err()) {
        return Result<Database>::err(fk.unwrap_err());
    }

    // WAL is not available for in-memory databases; the pragma then reports
    // "memory" instead of failing, so only hard errors matter here.
    auto wal = db.execute("PRAGMA journal_mode = WAL;");
    if (wal.is_err()) {
        return Result<Database>::err(wal.unwrap_err());
    }

    return Result<Database>::ok(std::move(db));
}

Result<Database> Database::open_memory() {
    return open(":memory:");
}

void Database::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

Result<Statement> Database::prepare(const std::string& sql) {
    if (!db_) {
        return Result<Statement>::err(Error::storage("Database not open", SQLITE_MISUSE));
    }
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(),
                                static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<Statement>::err(Error::storage(last_error(), rc));
    }
    return Result<Statement>::ok(Statement(stmt));
}

Result<void> Database::execute(const std::string& sql) {
    if (!db_) {
        return Result<void>::err(Error::storage("Database not open", SQLITE_MISUSE));
    }
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        std::string error = error_msg ? error_msg : "Unknown error";
        sqlite3_free(error_msg);
        return Result<void>::err(Error::storage(error, rc));
    }
    return Result<void>::ok();
}

Result<void> Database::begin_transaction() {
    return execute("BEGIN TRANSACTION;");
}

Result<void> Database::commit() {
    return execute("COMMIT;");
}

Result<void> Database::rollback() {
    return execute("ROLLBACK;");
}

int Database::changes() const {
    return sqlite3_changes(db_);
}

std::string Database::last_error() const {
    return db_ ? sqlite3_errmsg(db_) : "Database not open";
}

} // namespace folio::storage
