#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <cstring>
#include <thread>
#include <vecstore/metadata/database.h>

namespace vecstore::metadata {

namespace {
constexpr int kMaxRetries = 5;
constexpr auto kInitialBackoff = std::chrono::milliseconds(10);

bool isTransient(int rc) {
    int primary = rc & 0xff;
    return primary == SQLITE_BUSY || primary == SQLITE_LOCKED;
}
} // namespace

// Statement implementation
Statement::Statement(sqlite3* db, const std::string& sql) {
    const char* tail;
    int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, &tail);
    if (rc != SQLITE_OK) {
        throw std::runtime_error("Failed to prepare statement: " + std::string(sqlite3_errmsg(db)));
    }
}

Statement::~Statement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

Statement::Statement(Statement&& other) noexcept : stmt_(other.stmt_) {
    other.stmt_ = nullptr;
}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
        stmt_ = other.stmt_;
        other.stmt_ = nullptr;
    }
    return *this;
}

Result<void> Statement::bind(int index, std::nullptr_t) {
    int rc = sqlite3_bind_null(stmt_, index);
    if (rc != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to bind null"};
    }
    return {};
}

Result<void> Statement::bind(int index, int64_t value) {
    int rc = sqlite3_bind_int64(stmt_, index, value);
    if (rc != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to bind int64"};
    }
    return {};
}

Result<void> Statement::bind(int index, double value) {
    int rc = sqlite3_bind_double(stmt_, index, value);
    if (rc != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to bind double"};
    }
    return {};
}

Result<void> Statement::bind(int index, const std::string& value) {
    int rc = sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()),
                               SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to bind string"};
    }
    return {};
}

Result<void> Statement::bind(int index, std::string_view value) {
    int rc = sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()),
                               SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to bind string_view"};
    }
    return {};
}

Result<void> Statement::bind(int index, std::span<const std::byte> blob) {
    int rc = sqlite3_bind_blob(stmt_, index, blob.data(), static_cast<int>(blob.size()),
                               SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to bind blob"};
    }
    return {};
}

Result<void> Statement::execute() {
    auto backoff = kInitialBackoff;
    for (int attempt = 0; attempt < kMaxRetries; ++attempt) {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_DONE || rc == SQLITE_ROW) {
            return {};
        }
        if (isTransient(rc) && attempt + 1 < kMaxRetries) {
            sqlite3_reset(stmt_);
            std::this_thread::sleep_for(backoff);
            backoff *= 2;
            continue;
        }
        std::string errMsg = "Failed to execute statement: " + std::string(sqlite3_errstr(rc));
        if ((rc & 0xff) == SQLITE_CONSTRAINT) {
            // Include first 100 chars of SQL for context
            if (const char* sql = sqlite3_sql(stmt_)) {
                std::string sqlSnippet(sql, std::min(strlen(sql), size_t{100}));
                errMsg += " [SQL: " + sqlSnippet + (strlen(sql) > 100 ? "..." : "") + "]";
            }
            return Error{ErrorCode::IntegrityError, errMsg};
        }
        return Error{ErrorCode::DatabaseError, errMsg};
    }
    return Error{ErrorCode::DatabaseError, "Failed to execute statement: max retries exceeded"};
}

Result<bool> Statement::step() {
    auto backoff = kInitialBackoff;
    for (int attempt = 0; attempt < kMaxRetries; ++attempt) {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) {
            return true;
        } else if (rc == SQLITE_DONE) {
            return false;
        }
        if (isTransient(rc) && attempt + 1 < kMaxRetries) {
            sqlite3_reset(stmt_);
            std::this_thread::sleep_for(backoff);
            backoff *= 2;
            continue;
        }
        return Error{ErrorCode::DatabaseError,
                     "Failed to step statement: " + std::string(sqlite3_errstr(rc))};
    }
    return Error{ErrorCode::DatabaseError, "Failed to step statement: max retries exceeded"};
}

int Statement::getInt(int column) const {
    return sqlite3_column_int(stmt_, column);
}

int64_t Statement::getInt64(int column) const {
    return sqlite3_column_int64(stmt_, column);
}

double Statement::getDouble(int column) const {
    return sqlite3_column_double(stmt_, column);
}

std::string Statement::getString(int column) const {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, column));
    if (!text)
        return "";
    return std::string(text);
}

bool Statement::isNull(int column) const {
    return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

Result<void> Statement::reset() {
    if (!stmt_) {
        return Error{ErrorCode::DatabaseError, "Statement is null"};
    }
    int rc = sqlite3_reset(stmt_);
    if (rc != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to reset statement"};
    }
    return {};
}

// Database implementation
Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept
    : db_(other.db_), path_(std::move(other.path_)), inTransaction_(other.inTransaction_) {
    other.db_ = nullptr;
    other.inTransaction_ = false;
}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = other.db_;
        path_ = std::move(other.path_);
        inTransaction_ = other.inTransaction_;
        other.db_ = nullptr;
        other.inTransaction_ = false;
    }
    return *this;
}

Result<void> Database::open(const std::string& path, ConnectionMode mode) {
    if (db_) {
        return Error{ErrorCode::InvalidState, "Database already open: " + path_};
    }

    int flags = 0;
    switch (mode) {
        case ConnectionMode::ReadWrite:
            flags = SQLITE_OPEN_READWRITE;
            break;
        case ConnectionMode::Create:
            flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
            break;
        case ConnectionMode::Memory:
            flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_MEMORY;
            break;
    }

    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "Unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        return Error{ErrorCode::DatabaseError, "Failed to open database: " + error};
    }

    sqlite3_extended_result_codes(db_, 1);
    // Set busy timeout to avoid indefinite blocking
    sqlite3_busy_timeout(db_, 5000);

    path_ = path;
    return {};
}

void Database::close() {
    if (db_) {
        if (inTransaction_) {
            sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
        }
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
    path_.clear();
    inTransaction_ = false;
}

Result<Statement> Database::prepare(const std::string& sql) {
    if (!db_) {
        return Error{ErrorCode::InvalidState, "Database not open"};
    }

    try {
        return Statement(db_, sql);
    } catch (const std::exception& e) {
        return Error{ErrorCode::DatabaseError, e.what()};
    }
}

Result<void> Database::execute(const std::string& sql) {
    if (!db_) {
        return Error{ErrorCode::InvalidState, "Database not open"};
    }

    auto backoff = kInitialBackoff;
    for (int attempt = 0;; ++attempt) {
        char* errMsg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errMsg);
        if (rc == SQLITE_OK) {
            return {};
        }
        std::string error = errMsg ? errMsg : "Unknown error";
        sqlite3_free(errMsg);

        if (isTransient(rc) && attempt + 1 < kMaxRetries) {
            spdlog::warn("SQL busy/locked (rc={}): {}. Retrying attempt {}/{}", rc, error,
                         attempt + 1, kMaxRetries);
            std::this_thread::sleep_for(backoff);
            backoff *= 2;
            continue;
        }

        spdlog::debug("SQL exec failed ({}): {}", error, sql);
        if ((rc & 0xff) == SQLITE_CONSTRAINT) {
            return Error{ErrorCode::IntegrityError, "Failed to execute SQL: " + error};
        }
        return Error{ErrorCode::DatabaseError, "Failed to execute SQL: " + error};
    }
}

Result<void> Database::beginTransaction(TransactionMode mode) {
    if (inTransaction_) {
        return Error{ErrorCode::InvalidState, "Already in transaction"};
    }

    auto result = execute(mode == TransactionMode::Immediate ? "BEGIN IMMEDIATE" : "BEGIN");
    if (result) {
        inTransaction_ = true;
    }
    return result;
}

Result<void> Database::commit() {
    if (!inTransaction_) {
        return Error{ErrorCode::InvalidState, "Not in transaction"};
    }

    auto result = execute("COMMIT");
    if (result) {
        inTransaction_ = false;
    }
    return result;
}

Result<void> Database::rollback() {
    if (!inTransaction_) {
        return Error{ErrorCode::InvalidState, "Not in transaction"};
    }

    auto result = execute("ROLLBACK");
    inTransaction_ = false; // Always clear flag, even on error
    return result;
}

int64_t Database::lastInsertRowId() const {
    return db_ ? sqlite3_last_insert_rowid(db_) : 0;
}

int Database::changes() const {
    return db_ ? sqlite3_changes(db_) : 0;
}

Result<bool> Database::tableExists(const std::string& table) {
    // Virtual tables are recorded with type='table' in sqlite_master as well
    auto stmtResult = prepare("SELECT COUNT(*) FROM sqlite_master "
                              "WHERE type='table' AND name=?");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto bindResult = stmt.bind(1, table);
    if (!bindResult)
        return bindResult.error();

    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();

    return stmt.getInt(0) > 0;
}

Result<void> Database::setBusyTimeout(std::chrono::milliseconds timeout) {
    if (!db_) {
        return Error{ErrorCode::InvalidState, "Database not open"};
    }

    int rc = sqlite3_busy_timeout(db_, static_cast<int>(timeout.count()));
    if (rc != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to set busy timeout"};
    }
    return {};
}

Result<void> Database::enableWAL() {
    return execute("PRAGMA journal_mode=WAL");
}

Result<void> Database::checkpoint() {
    if (!db_) {
        return Error{ErrorCode::InvalidState, "Database not open"};
    }
    int rc = sqlite3_wal_checkpoint_v2(db_, nullptr, SQLITE_CHECKPOINT_PASSIVE, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "WAL checkpoint failed: " + getErrorMessage()};
    }
    return {};
}

Result<void> Database::optimize() {
    auto result = execute("VACUUM");
    if (!result)
        return result;
    return execute("ANALYZE");
}

Result<void> Database::backupTo(const std::string& destPath) {
    if (!db_) {
        return Error{ErrorCode::InvalidState, "Database not open"};
    }

    Database dest;
    auto openResult = dest.open(destPath, ConnectionMode::Create);
    if (!openResult)
        return openResult;

    sqlite3_backup* backup = sqlite3_backup_init(dest.db_, "main", db_, "main");
    if (!backup) {
        return Error{ErrorCode::DatabaseError, "Failed to start backup: " + dest.getErrorMessage()};
    }
    int rc = sqlite3_backup_step(backup, -1);
    sqlite3_backup_finish(backup);
    if (rc != SQLITE_DONE) {
        return Error{ErrorCode::DatabaseError,
                     "Backup failed: " + std::string(sqlite3_errstr(rc))};
    }
    return {};
}

Result<void> Database::restoreFrom(const std::string& srcPath) {
    if (!db_) {
        return Error{ErrorCode::InvalidState, "Database not open"};
    }
    if (inTransaction_) {
        return Error{ErrorCode::InvalidState, "Cannot restore inside a transaction"};
    }

    Database src;
    auto openResult = src.open(srcPath, ConnectionMode::ReadWrite);
    if (!openResult)
        return openResult;

    sqlite3_backup* backup = sqlite3_backup_init(db_, "main", src.db_, "main");
    if (!backup) {
        return Error{ErrorCode::DatabaseError, "Failed to start restore: " + getErrorMessage()};
    }
    int rc = sqlite3_backup_step(backup, -1);
    sqlite3_backup_finish(backup);
    if (rc != SQLITE_DONE) {
        return Error{ErrorCode::DatabaseError,
                     "Restore failed: " + std::string(sqlite3_errstr(rc))};
    }
    return {};
}

std::string Database::version() {
    return sqlite3_libversion();
}

std::string Database::getErrorMessage() const {
    return db_ ? sqlite3_errmsg(db_) : "No database connection";
}

} // namespace vecstore::metadata
