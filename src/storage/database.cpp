#include "storage/database.hpp"

namespace docsync::storage {

namespace {

Result<void, Error> check(int rc, const char* what, sqlite3_stmt* stmt) {
    if (rc == SQLITE_OK) return Result<void, Error>::ok();
    std::string message = what;
    if (stmt) {
        message += ": ";
        message += sqlite3_errmsg(sqlite3_db_handle(stmt));
    }
    return Result<void, Error>::err(Error::storage(std::move(message), rc));
}

} // namespace

// ============================================================================
// Statement
// ============================================================================

Result<void, Error> Statement::bind(int index, std::string_view text) {
    return check(sqlite3_bind_text(stmt_.get(), index, text.data(),
                                   static_cast<int>(text.size()), SQLITE_TRANSIENT),
                 "Failed to bind text", stmt_.get());
}

Result<void, Error> Statement::bind(int index, std::int64_t value) {
    return check(sqlite3_bind_int64(stmt_.get(), index, value),
                 "Failed to bind integer", stmt_.get());
}

Result<void, Error> Statement::bind(int index, std::nullopt_t) {
    return check(sqlite3_bind_null(stmt_.get(), index), "Failed to bind null", stmt_.get());
}

std::string Statement::column_text(int index) const {
    const unsigned char* text = sqlite3_column_text(stmt_.get(), index);
    if (!text) return {};
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_.get(), index)));
}

std::optional<std::string> Statement::column_optional_text(int index) const {
    if (column_is_null(index)) return std::nullopt;
    return column_text(index);
}

std::int64_t Statement::column_int64(int index) const {
    return sqlite3_column_int64(stmt_.get(), index);
}

int Statement::column_int(int index) const {
    return sqlite3_column_int(stmt_.get(), index);
}

std::optional<Timestamp> Statement::column_optional_timestamp(int index) const {
    if (column_is_null(index)) return std::nullopt;
    return Timestamp(column_int64(index));
}

bool Statement::column_is_null(int index) const {
    return sqlite3_column_type(stmt_.get(), index) == SQLITE_NULL;
}

Result<bool, Error> Statement::step() {
    const int rc = sqlite3_step(stmt_.get());
    if (rc == SQLITE_ROW) return Result<bool, Error>::ok(true);
    if (rc == SQLITE_DONE) return Result<bool, Error>::ok(false);
    auto failed = check(rc, "Step failed", stmt_.get());
    return Result<bool, Error>::err(failed.unwrap_err());
}

Result<void, Error> Statement::run() {
    auto stepped = step();
    if (stepped.is_err()) return propagate<void>(stepped);
    return Result<void, Error>::ok();
}

// ============================================================================
// Database
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

Result<Database, Error> Database::open(const std::string& path) {
    sqlite3* raw = nullptr;
    const int rc = sqlite3_open_v2(path.c_str(), &raw,
                                   SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        std::string message = raw ? sqlite3_errmsg(raw) : "Unknown error";
        if (raw) sqlite3_close(raw);
        return Result<Database, Error>::err(
            Error::storage("Cannot open database '" + path + "': " + message, rc));
    }

    Database db(raw);
    sqlite3_busy_timeout(raw, 5000);

    auto fk = db.execute("PRAGMA foreign_keys = ON;");
    if (fk.is_err()) return propagate<Database>(fk);

    // In-memory databases report "memory"; only files switch to WAL.
    if (path != ":memory:") {
        auto wal = db.execute("PRAGMA journal_mode = WAL;");
        if (wal.is_err()) return propagate<Database>(wal);
    }
    return Result<Database, Error>::ok(std::move(db));
}

Result<Database, Error> Database::open_memory() {
    return open(":memory:");
}

void Database::close() {
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

Result<Statement, Error> Database::prepare(std::string_view sql) {
    if (!db_) {
        return Result<Statement, Error>::err(Error::storage("Database not open"));
    }
    sqlite3_stmt* stmt = nullptr;
    const int rc = sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<Statement, Error>::err(Error::storage(last_error(), rc));
    }
    return Result<Statement, Error>::ok(Statement(stmt));
}

Result<void, Error> Database::execute(const std::string& sql) {
    if (!db_) {
        return Result<void, Error>::err(Error::storage("Database not open"));
    }
    char* error_msg = nullptr;
    const int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        std::string message = error_msg ? error_msg : "Unknown error";
        sqlite3_free(error_msg);
        return Result<void, Error>::err(Error::storage(std::move(message), rc));
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Database::begin_transaction() {
    return execute("BEGIN IMMEDIATE TRANSACTION;");
}

Result<void, Error> Database::commit() {
    return execute("COMMIT;");
}

Result<void, Error> Database::rollback() {
    return execute("ROLLBACK;");
}

std::int64_t Database::last_insert_rowid() const {
    return sqlite3_last_insert_rowid(db_);
}

int Database::changes() const {
    return sqlite3_changes(db_);
}

std::string Database::last_error() const {
    return db_ ? sqlite3_errmsg(db_) : "Database not open";
}

} // namespace docsync::storage
