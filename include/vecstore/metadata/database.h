#pragma once

#include <vecstore/core/types.h>

#include <sqlite3.h>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace vecstore::metadata {

/**
 * @brief Database connection mode
 */
enum class ConnectionMode {
    ReadWrite, ///< Read-write mode (default)
    Memory,    ///< In-memory database
    Create     ///< Create if not exists
};

/**
 * @brief Transaction locking behaviour
 */
enum class TransactionMode {
    Deferred, ///< BEGIN
    Immediate ///< BEGIN IMMEDIATE, takes the write lock up front
};

/**
 * @brief SQLite statement wrapper with RAII
 */
class Statement {
public:
    Statement() = default;
    Statement(sqlite3* db, const std::string& sql);
    ~Statement();

    // Move-only
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    /**
     * @brief Bind parameters to statement (1-based index)
     */
    Result<void> bind(int index, std::nullptr_t);
    Result<void> bind(int index, int64_t value);
    Result<void> bind(int index, double value);
    Result<void> bind(int index, const std::string& value);
    Result<void> bind(int index, std::string_view value);
    Result<void> bind(int index, std::span<const std::byte> blob);
    Result<void> bind(int index, const char* value) { return bind(index, std::string_view(value)); }

    /**
     * @brief Bind multiple parameters using variadic templates
     */
    template <typename... Args> Result<void> bindAll(Args&&... args) {
        return bindHelper(1, std::forward<Args>(args)...);
    }

    /**
     * @brief Execute statement (for non-SELECT queries)
     *
     * Constraint violations are reported as ErrorCode::IntegrityError.
     */
    Result<void> execute();

    /**
     * @brief Step through results (for SELECT queries)
     * @return true if row available, false if done
     */
    Result<bool> step();

    int getInt(int column) const;
    int64_t getInt64(int column) const;
    double getDouble(int column) const;
    std::string getString(int column) const;
    bool isNull(int column) const;

    Result<void> reset();

private:
    sqlite3_stmt* stmt_ = nullptr;

    template <typename T, typename... Rest>
    Result<void> bindHelper(int index, T&& value, Rest&&... rest) {
        auto result = bind(index, std::forward<T>(value));
        if (!result)
            return result;
        if constexpr (sizeof...(rest) > 0) {
            return bindHelper(index + 1, std::forward<Rest>(rest)...);
        }
        return {};
    }

    Result<void> bindHelper(int) { return {}; }
};

/**
 * @brief Database connection wrapper
 */
class Database {
public:
    Database() = default;
    ~Database();

    // Move-only
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    /**
     * @brief Open database connection
     */
    Result<void> open(const std::string& path, ConnectionMode mode = ConnectionMode::ReadWrite);

    void close();

    [[nodiscard]] bool isOpen() const { return db_ != nullptr; }

    /**
     * @brief Prepare SQL statement
     */
    Result<Statement> prepare(const std::string& sql);

    /**
     * @brief Execute SQL directly (for non-SELECT queries)
     */
    Result<void> execute(const std::string& sql);

    Result<void> beginTransaction(TransactionMode mode = TransactionMode::Deferred);
    Result<void> commit();
    Result<void> rollback();

    /**
     * @brief Execute within transaction; rolls back when func returns an error
     */
    template <typename Func>
    Result<void> transaction(Func&& func, TransactionMode mode = TransactionMode::Deferred) {
        auto beginResult = beginTransaction(mode);
        if (!beginResult)
            return beginResult;

        try {
            Result<void> result = func();
            if (!result) {
                rollback();
                return result;
            }
            return commit();
        } catch (...) {
            rollback();
            throw;
        }
    }

    int64_t lastInsertRowId() const;

    /**
     * @brief Get number of rows affected by last query
     */
    int changes() const;

    /**
     * @brief Check if a table (plain or virtual) exists
     */
    Result<bool> tableExists(const std::string& table);

    Result<void> setBusyTimeout(std::chrono::milliseconds timeout);

    Result<void> enableWAL();

    /**
     * @brief Flush the WAL into the main database file
     */
    Result<void> checkpoint();

    /**
     * @brief VACUUM and ANALYZE
     */
    Result<void> optimize();

    /**
     * @brief Online copy of the main database into a new file
     */
    Result<void> backupTo(const std::string& destPath);

    /**
     * @brief Replace the contents of the main database with those of another file
     */
    Result<void> restoreFrom(const std::string& srcPath);

    /**
     * @brief Raw handle for extension registration and user functions
     */
    [[nodiscard]] sqlite3* handle() const { return db_; }

    static std::string version();

    [[nodiscard]] const std::string& path() const { return path_; }

private:
    sqlite3* db_ = nullptr;
    std::string path_;
    bool inTransaction_ = false;

    std::string getErrorMessage() const;
};

} // namespace vecstore::metadata
