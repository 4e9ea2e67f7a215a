#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace docsync::storage {

/**
 * SQLite prepared statement with RAII finalization.
 *
 * Binding goes through bind(), overloaded for the column types the
 * repositories use; optional values bind NULL when empty. bind_all() binds
 * positional parameters 1..N and stops at the first failure.
 */
class Statement {
public:
    Statement() = default;
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt, sqlite3_finalize) {}

    [[nodiscard]] sqlite3_stmt* get() const { return stmt_.get(); }
    [[nodiscard]] explicit operator bool() const { return stmt_ != nullptr; }

    [[nodiscard]] Result<void, Error> bind(int index, std::string_view text);
    [[nodiscard]] Result<void, Error> bind(int index, const std::string& text) {
        return bind(index, std::string_view(text));
    }
    [[nodiscard]] Result<void, Error> bind(int index, const char* text) {
        return bind(index, std::string_view(text));
    }
    [[nodiscard]] Result<void, Error> bind(int index, std::int64_t value);
    [[nodiscard]] Result<void, Error> bind(int index, int value) {
        return bind(index, static_cast<std::int64_t>(value));
    }
    [[nodiscard]] Result<void, Error> bind(int index, bool value) {
        return bind(index, static_cast<std::int64_t>(value ? 1 : 0));
    }
    [[nodiscard]] Result<void, Error> bind(int index, Timestamp value) {
        return bind(index, value.millis());
    }
    [[nodiscard]] Result<void, Error> bind(int index, std::nullopt_t);

    template<typename T>
    [[nodiscard]] Result<void, Error> bind(int index, const std::optional<T>& value) {
        if (!value) return bind(index, std::nullopt);
        return bind(index, *value);
    }

    template<typename... Args>
    [[nodiscard]] Result<void, Error> bind_all(const Args&... args) {
        auto result = Result<void, Error>::ok();
        int index = 1;
        // Left-to-right fold; later binds are skipped after a failure.
        ((result.is_ok() ? (void)(result = bind(index++, args)) : (void)0), ...);
        return result;
    }

    [[nodiscard]] std::string column_text(int index) const;
    [[nodiscard]] std::optional<std::string> column_optional_text(int index) const;
    [[nodiscard]] std::int64_t column_int64(int index) const;
    [[nodiscard]] int column_int(int index) const;
    [[nodiscard]] bool column_bool(int index) const { return column_int64(index) != 0; }
    [[nodiscard]] Timestamp column_timestamp(int index) const {
        return Timestamp(column_int64(index));
    }
    [[nodiscard]] std::optional<Timestamp> column_optional_timestamp(int index) const;
    [[nodiscard]] bool column_is_null(int index) const;

    /**
     * Advance; ok(true) when a row is available.
     */
    [[nodiscard]] Result<bool, Error> step();

    /**
     * Step a statement that returns no rows.
     */
    [[nodiscard]] Result<void, Error> run();

private:
    std::shared_ptr<sqlite3_stmt> stmt_;
};

/**
 * Database - owning SQLite connection.
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
     * Open (creating if needed) a database file. Enables foreign keys and
     * WAL journaling.
     */
    [[nodiscard]] static Result<Database, Error> open(const std::string& path);

    /**
     * Private in-memory database, used by tests and dry runs.
     */
    [[nodiscard]] static Result<Database, Error> open_memory();

    [[nodiscard]] bool is_open() const { return db_ != nullptr; }
    void close();

    [[nodiscard]] Result<Statement, Error> prepare(std::string_view sql);
    [[nodiscard]] Result<void, Error> execute(const std::string& sql);

    /**
     * Prepare, bind the arguments and collect every row through `row`.
     */
    template<typename T, typename RowFn, typename... Args>
    [[nodiscard]] Result<std::vector<T>, Error> query(std::string_view sql,
                                                      RowFn&& row,
                                                      const Args&... args) {
        auto stmt_result = prepare(sql);
        if (stmt_result.is_err()) return propagate<std::vector<T>>(stmt_result);
        auto stmt = std::move(stmt_result).unwrap();

        auto bound = stmt.bind_all(args...);
        if (bound.is_err()) return propagate<std::vector<T>>(bound);

        std::vector<T> rows;
        while (true) {
            auto step_result = stmt.step();
            if (step_result.is_err()) return propagate<std::vector<T>>(step_result);
            if (!step_result.unwrap()) break;
            rows.push_back(row(stmt));
        }
        return Result<std::vector<T>, Error>::ok(std::move(rows));
    }

    /**
     * Prepare, bind and run a statement that returns no rows.
     * Returns the number of rows changed.
     */
    template<typename... Args>
    [[nodiscard]] Result<int, Error> run(std::string_view sql, const Args&... args) {
        auto stmt_result = prepare(sql);
        if (stmt_result.is_err()) return propagate<int>(stmt_result);
        auto stmt = std::move(stmt_result).unwrap();

        auto bound = stmt.bind_all(args...);
        if (bound.is_err()) return propagate<int>(bound);

        auto ran = stmt.run();
        if (ran.is_err()) return propagate<int>(ran);
        return Result<int, Error>::ok(changes());
    }

    [[nodiscard]] Result<void, Error> begin_transaction();
    [[nodiscard]] Result<void, Error> commit();
    [[nodiscard]] Result<void, Error> rollback();

    /**
     * Run `f` inside a transaction: commit when it returns ok, roll back
     * otherwise. A failed rollback is reported in place of f's error.
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
            auto rollback_result = rollback();
            if (rollback_result.is_err()) {
                return ResultType::err(rollback_result.unwrap_err());
            }
            return result;
        }

        auto commit_result = commit();
        if (commit_result.is_err()) {
            return ResultType::err(commit_result.unwrap_err());
        }
        return result;
    }

    [[nodiscard]] std::int64_t last_insert_rowid() const;
    [[nodiscard]] int changes() const;
    [[nodiscard]] std::string last_error() const;

private:
    explicit Database(sqlite3* db) : db_(db) {}

    sqlite3* db_ = nullptr;
};

} // namespace docsync::storage
