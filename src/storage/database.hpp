#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include <sqlite3.h>
#include <string>
#include <memory>
#include <optional>
#include <vector>

namespace quire::storage {

/**
 * SQLite statement wrapper with RAII.
 *
 * A failed bind is remembered and reported by the next step(), so a
 * sequence of binds can be checked once.
 */
class Statement {
public:
    Statement() = default;
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt, sqlite3_finalize) {}

    [[nodiscard]] sqlite3_stmt* get() const { return stmt_.get(); }
    [[nodiscard]] explicit operator bool() const { return stmt_ != nullptr; }

    Result<void, Error> bind_text(int index, std::string_view text);
    Result<void, Error> bind_int(int index, int value);
    Result<void, Error> bind_int64(int index, int64_t value);
    Result<void, Error> bind_blob(int index, const void* data, size_t size);
    Result<void, Error> bind_null(int index);

    // Convenience binds for the id and time types used throughout the store
    Result<void, Error> bind_uuid(int index, const Uuid& id);
    Result<void, Error> bind_timestamp(int index, Timestamp ts);

    [[nodiscard]] std::string column_text(int index) const;
    [[nodiscard]] int column_int(int index) const;
    [[nodiscard]] int64_t column_int64(int index) const;
    [[nodiscard]] std::vector<uint8_t> column_blob(int index) const;
    [[nodiscard]] bool column_is_null(int index) const;
    [[nodiscard]] Uuid column_uuid(int index) const;
    [[nodiscard]] Timestamp column_timestamp(int index) const;

    Result<bool, Error> step();  // true if there's a row
    Result<void, Error> reset();

private:
    Result<void, Error> check_bind(int rc, const char* what);

    std::shared_ptr<sqlite3_stmt> stmt_;
    std::optional<Error> bind_error_;
};

/**
 * Database - SQLite connection.
 *
 * Move-only; the connection closes with the last owner.
 */
class Database {
public:
    Database() = default;
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;

    [[nodiscard]] static Result<Database, Error> open(const std::string& path);

    /**
     * Open an in-memory database (for testing).
     */
    [[nodiscard]] static Result<Database, Error> open_memory();

    [[nodiscard]] bool is_open() const { return db_ != nullptr; }

    void close();

    [[nodiscard]] sqlite3* handle() const { return db_; }

    [[nodiscard]] Result<Statement, Error> prepare(const std::string& sql);

    [[nodiscard]] Result<void, Error> execute(const std::string& sql);

    /**
     * Run a query and hand each row to `callback`.
     */
    template<typename F>
    [[nodiscard]] Result<void, Error> query(const std::string& sql, F&& callback) {
        auto stmt_result = prepare(sql);
        if (stmt_result.is_err()) {
            return Result<void, Error>::err(stmt_result.unwrap_err());
        }

        auto stmt = std::move(stmt_result).unwrap();
        while (true) {
            auto step_result = stmt.step();
            if (step_result.is_err()) {
                return Result<void, Error>::err(step_result.unwrap_err());
            }
            if (!step_result.unwrap()) break;
            callback(stmt);
        }

        return Result<void, Error>::ok();
    }

    [[nodiscard]] Result<void, Error> begin_transaction();
    [[nodiscard]] Result<void, Error> commit();
    [[nodiscard]] Result<void, Error> rollback();

    /**
     * True while a BEGIN is open on this connection.
     */
    [[nodiscard]] bool in_transaction() const;

    /**
     * Execute a function within a transaction.
     * Commits on success, rolls back on failure.
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
                return ResultType::err(rollback_result.unwrap_err().with_context(
                    "Rollback after \"" + result.unwrap_err().message + "\" failed"));
            }
            return result;
        }

        auto commit_result = commit();
        if (commit_result.is_err()) {
            auto rollback_result = rollback();
            if (rollback_result.is_err()) {
                return ResultType::err(commit_result.unwrap_err().with_context(
                    "Commit failed and rollback failed (" + rollback_result.unwrap_err().message + ")"));
            }
            return ResultType::err(commit_result.unwrap_err());
        }

        return result;
    }

    /**
     * Result rows of PRAGMA quick_check; a healthy database yields {"ok"}.
     */
    [[nodiscard]] Result<std::vector<std::string>, Error> quick_check();

    [[nodiscard]] int changes() const;

    [[nodiscard]] std::string last_error() const;

private:
    explicit Database(sqlite3* db) : db_(db) {}

    sqlite3* db_ = nullptr;
};

} // namespace quire::storage
