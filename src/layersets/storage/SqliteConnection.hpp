#pragma once

#include <layersets/core/Error.hpp>

#include <sqlite3.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace LS::Storage {

// Maps an sqlite result code to the store's error taxonomy.
[[nodiscard]] auto sqliteError(sqlite3* db, int rc, std::string_view what) -> Error;

class SqliteStatement {
public:
    SqliteStatement() = default;
    SqliteStatement(sqlite3* db, sqlite3_stmt* stmt);
    ~SqliteStatement();

    SqliteStatement(SqliteStatement const&)            = delete;
    SqliteStatement& operator=(SqliteStatement const&) = delete;
    SqliteStatement(SqliteStatement&& other) noexcept;
    SqliteStatement& operator=(SqliteStatement&& other) noexcept;

    // Parameter indices are 1-based.
    auto bind(int index, std::int64_t value) -> Expected<void>;
    auto bind(int index, std::string_view value) -> Expected<void>;
    auto bindNull(int index) -> Expected<void>;

    // true while a row is available, false once the statement is done.
    [[nodiscard]] auto step() -> Expected<bool>;
    // Runs a statement that returns no rows.
    [[nodiscard]] auto run() -> Expected<void>;

    [[nodiscard]] auto columnInt64(int column) const -> std::int64_t;
    [[nodiscard]] auto columnText(int column) const -> std::string;
    [[nodiscard]] auto columnIsNull(int column) const -> bool;

    auto reset() -> void;

private:
    sqlite3*      db_   = nullptr;
    sqlite3_stmt* stmt_ = nullptr;
};

class SqliteConnection {
public:
    SqliteConnection() = default;
    ~SqliteConnection();

    SqliteConnection(SqliteConnection const&)            = delete;
    SqliteConnection& operator=(SqliteConnection const&) = delete;

    [[nodiscard]] static auto open(std::string const& path) -> Expected<std::unique_ptr<SqliteConnection>>;

    [[nodiscard]] auto prepare(std::string_view sql) -> Expected<SqliteStatement>;
    [[nodiscard]] auto execute(std::string_view sql) -> Expected<void>;

    [[nodiscard]] auto changes() const -> std::int64_t;
    [[nodiscard]] auto lastInsertRowId() const -> std::int64_t;

    auto setBusyTimeout(std::chrono::milliseconds timeout) -> void;
    [[nodiscard]] auto busyTimeout() const -> std::chrono::milliseconds { return busyTimeout_; }

    [[nodiscard]] auto handle() const -> sqlite3* { return db_; }

    // Open transaction nesting level, maintained by SqliteTransaction.
    [[nodiscard]] auto transactionDepth() const -> int { return depth_; }

private:
    friend class SqliteTransaction;

    sqlite3*                  db_    = nullptr;
    int                       depth_ = 0;
    std::chrono::milliseconds busyTimeout_{0};
};

/*
 * Scoped transaction. The outermost level issues BEGIN IMMEDIATE so the write lock is
 * taken before any read; nested levels use savepoints. Destruction without commit()
 * rolls the level back.
 */
class SqliteTransaction {
public:
    [[nodiscard]] static auto begin(SqliteConnection& connection) -> Expected<SqliteTransaction>;

    SqliteTransaction(SqliteTransaction const&)            = delete;
    SqliteTransaction& operator=(SqliteTransaction const&) = delete;
    SqliteTransaction(SqliteTransaction&& other) noexcept;
    SqliteTransaction& operator=(SqliteTransaction&&) = delete;
    ~SqliteTransaction();

    [[nodiscard]] auto commit() -> Expected<void>;
    auto               rollback() -> void;

    [[nodiscard]] auto active() const -> bool { return connection_ != nullptr; }

private:
    SqliteTransaction(SqliteConnection& connection, int level);

    [[nodiscard]] auto savepointName() const -> std::string;

    SqliteConnection* connection_ = nullptr;
    int               level_      = 0;
};

} // namespace LS::Storage
