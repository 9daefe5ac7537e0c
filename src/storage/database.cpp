#include "storage/database.hpp"

namespace quire::storage {

// ============================================================================
// Statement implementation
// ============================================================================

Result<void, Error> Statement::check_bind(int rc, const char* what) {
    if (rc != SQLITE_OK) {
        auto error = Error::storage(std::string("Failed to bind ") + what, rc);
        if (!bind_error_) bind_error_ = error;
        return Result<void, Error>::err(std::move(error));
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Statement::bind_text(int index, std::string_view text) {
    return check_bind(sqlite3_bind_text(stmt_.get(), index, text.data(),
                                        static_cast<int>(text.size()), SQLITE_TRANSIENT),
                      "text");
}

Result<void, Error> Statement::bind_int(int index, int value) {
    return check_bind(sqlite3_bind_int(stmt_.get(), index, value), "int");
}

Result<void, Error> Statement::bind_int64(int index, int64_t value) {
    return check_bind(sqlite3_bind_int64(stmt_.get(), index, value), "int64");
}

Result<void, Error> Statement::bind_blob(int index, const void* data, size_t size) {
    if (size > 0 && !data) {
        return check_bind(SQLITE_MISUSE, "blob (null data)");
    }
    const char* empty = "";
    const void* safe_data = (size == 0) ? static_cast<const void*>(empty) : data;
    return check_bind(sqlite3_bind_blob(stmt_.get(), index, safe_data,
                                        static_cast<int>(size), SQLITE_TRANSIENT),
                      "blob");
}

Result<void, Error> Statement::bind_null(int index) {
    return check_bind(sqlite3_bind_null(stmt_.get(), index), "null");
}

Result<void, Error> Statement::bind_uuid(int index, const Uuid& id) {
    return bind_text(index, id.to_string());
}

Result<void, Error> Statement::bind_timestamp(int index, Timestamp ts) {
    return bind_int64(index, ts.millis());
}

std::string Statement::column_text(int index) const {
    const unsigned char* text = sqlite3_column_text(stmt_.get(), index);
    if (!text) return "";
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_.get(), index)));
}

int Statement::column_int(int index) const {
    return sqlite3_column_int(stmt_.get(), index);
}

int64_t Statement::column_int64(int index) const {
    return sqlite3_column_int64(stmt_.get(), index);
}

std::vector<uint8_t> Statement::column_blob(int index) const {
    const void* data = sqlite3_column_blob(stmt_.get(), index);
    int size = sqlite3_column_bytes(stmt_.get(), index);
    if (!data || size <= 0) return {};

    const auto* bytes = static_cast<const uint8_t*>(data);
    return std::vector<uint8_t>(bytes, bytes + size);
}

bool Statement::column_is_null(int index) const {
    return sqlite3_column_type(stmt_.get(), index) == SQLITE_NULL;
}

Uuid Statement::column_uuid(int index) const {
    return Uuid::parse(column_text(index)).value_or(Uuid{});
}

Timestamp Statement::column_timestamp(int index) const {
    return Timestamp(column_int64(index));
}

Result<bool, Error> Statement::step() {
    if (bind_error_) {
        return Result<bool, Error>::err(*bind_error_);
    }
    int rc = sqlite3_step(stmt_.get());
    if (rc == SQLITE_ROW) {
        return Result<bool, Error>::ok(true);
    }
    if (rc == SQLITE_DONE) {
        return Result<bool, Error>::ok(false);
    }
    sqlite3* db = sqlite3_db_handle(stmt_.get());
    return Result<bool, Error>::err(Error::storage(db ? sqlite3_errmsg(db) : "Step failed", rc));
}

Result<void, Error> Statement::reset() {
    bind_error_.reset();
    int rc = sqlite3_reset(stmt_.get());
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(Error::storage("Reset failed", rc));
    }
    return Result<void, Error>::ok();
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

Result<Database, Error> Database::open(const std::string& path) {
    sqlite3* raw = nullptr;
    int rc = sqlite3_open(path.c_str(), &raw);
    if (rc != SQLITE_OK) {
        std::string error = raw ? sqlite3_errmsg(raw) : "Unknown error";
        if (raw) sqlite3_close(raw);
        return Result<Database, Error>::err(Error::storage(error, rc));
    }

    Database db(raw);

    // Links carry no foreign keys; relationship integrity is enforced above the store.
    auto journal = db.execute("PRAGMA journal_mode = WAL;");
    if (journal.is_err()) {
        return Result<Database, Error>::err(journal.unwrap_err());
    }
    sqlite3_busy_timeout(raw, 2000);

    return Result<Database, Error>::ok(std::move(db));
}

Result<Database, Error> Database::open_memory() {
    return open(":memory:");
}

void Database::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

Result<Statement, Error> Database::prepare(const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(),
                                static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<Statement, Error>::err(Error::storage(last_error(), rc));
    }
    return Result<Statement, Error>::ok(Statement(stmt));
}

Result<void, Error> Database::execute(const std::string& sql) {
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        std::string error = error_msg ? error_msg : "Unknown error";
        sqlite3_free(error_msg);
        return Result<void, Error>::err(Error::storage(error, rc));
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

bool Database::in_transaction() const {
    return db_ && sqlite3_get_autocommit(db_) == 0;
}

Result<std::vector<std::string>, Error> Database::quick_check() {
    std::vector<std::string> rows;
    auto result = query("PRAGMA quick_check;", [&](Statement& stmt) {
        rows.push_back(stmt.column_text(0));
    });
    if (result.is_err()) {
        return Result<std::vector<std::string>, Error>::err(result.unwrap_err());
    }
    return Result<std::vector<std::string>, Error>::ok(std::move(rows));
}

int Database::changes() const {
    return sqlite3_changes(db_);
}

std::string Database::last_error() const {
    return db_ ? sqlite3_errmsg(db_) : "Database not open";
}

} // namespace quire::storage
