#include "SqliteConnection.hpp"

#include <utility>

namespace LS::Storage {

auto sqliteError(sqlite3* db, int rc, std::string_view what) -> Error {
    std::string message{what};
    message.append(" failed: ");
    message.append(db != nullptr ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
    message.append(" (rc=" + std::to_string(rc) + ")");

    switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
        return Error{Error::Code::Timeout, std::move(message)};
    case SQLITE_CONSTRAINT:
        if (rc == SQLITE_CONSTRAINT_UNIQUE || rc == SQLITE_CONSTRAINT_PRIMARYKEY)
            return Error{Error::Code::Conflict, std::move(message)};
        return Error{Error::Code::StorageFailure, std::move(message)};
    default:
        return Error{Error::Code::StorageFailure, std::move(message)};
    }
}

SqliteStatement::SqliteStatement(sqlite3* db, sqlite3_stmt* stmt)
    : db_(db)
    , stmt_(stmt) {}

SqliteStatement::~SqliteStatement() {
    if (stmt_)
        sqlite3_finalize(stmt_);
}

SqliteStatement::SqliteStatement(SqliteStatement&& other) noexcept
    : db_(std::exchange(other.db_, nullptr))
    , stmt_(std::exchange(other.stmt_, nullptr)) {}

SqliteStatement& SqliteStatement::operator=(SqliteStatement&& other) noexcept {
    if (this != &other) {
        if (stmt_)
            sqlite3_finalize(stmt_);
        db_   = std::exchange(other.db_, nullptr);
        stmt_ = std::exchange(other.stmt_, nullptr);
    }
    return *this;
}

auto SqliteStatement::bind(int index, std::int64_t value) -> Expected<void> {
    int rc = sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value));
    if (rc != SQLITE_OK)
        return std::unexpected(sqliteError(db_, rc, "bind"));
    return {};
}

auto SqliteStatement::bind(int index, std::string_view value) -> Expected<void> {
    int rc = sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    if (rc != SQLITE_OK)
        return std::unexpected(sqliteError(db_, rc, "bind"));
    return {};
}

auto SqliteStatement::bindNull(int index) -> Expected<void> {
    int rc = sqlite3_bind_null(stmt_, index);
    if (rc != SQLITE_OK)
        return std::unexpected(sqliteError(db_, rc, "bind"));
    return {};
}

auto SqliteStatement::step() -> Expected<bool> {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW)
        return true;
    if (rc == SQLITE_DONE)
        return false;
    return std::unexpected(sqliteError(db_, rc, "step"));
}

auto SqliteStatement::run() -> Expected<void> {
    auto stepped = step();
    if (!stepped)
        return std::unexpected(stepped.error());
    return {};
}

auto SqliteStatement::columnInt64(int column) const -> std::int64_t {
    return static_cast<std::int64_t>(sqlite3_column_int64(stmt_, column));
}

auto SqliteStatement::columnText(int column) const -> std::string {
    auto const* text  = sqlite3_column_text(stmt_, column);
    auto const  bytes = sqlite3_column_bytes(stmt_, column);
    if (text == nullptr)
        return {};
    return std::string(reinterpret_cast<char const*>(text), static_cast<std::size_t>(bytes));
}

auto SqliteStatement::columnIsNull(int column) const -> bool {
    return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

auto SqliteStatement::reset() -> void {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

SqliteConnection::~SqliteConnection() {
    if (db_)
        sqlite3_close(db_);
}

auto SqliteConnection::open(std::string const& path) -> Expected<std::unique_ptr<SqliteConnection>> {
    auto     connection = std::make_unique<SqliteConnection>();
    sqlite3* db         = nullptr;
    int      flags      = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX;
    int      rc         = sqlite3_open_v2(path.c_str(), &db, flags, nullptr);
    connection->db_     = db;
    if (rc != SQLITE_OK) {
        return std::unexpected(sqliteError(db, rc, "open " + path));
    }
    sqlite3_extended_result_codes(db, 1);
    return connection;
}

auto SqliteConnection::prepare(std::string_view sql) -> Expected<SqliteStatement> {
    sqlite3_stmt* stmt = nullptr;
    int           rc   = sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        if (stmt)
            sqlite3_finalize(stmt);
        return std::unexpected(sqliteError(db_, rc, "prepare"));
    }
    return SqliteStatement{db_, stmt};
}

auto SqliteConnection::execute(std::string_view sql) -> Expected<void> {
    std::string owned{sql};
    char*       err = nullptr;
    int         rc  = sqlite3_exec(db_, owned.c_str(), nullptr, nullptr, &err);
    if (err)
        sqlite3_free(err);
    if (rc != SQLITE_OK)
        return std::unexpected(sqliteError(db_, rc, "exec"));
    return {};
}

auto SqliteConnection::changes() const -> std::int64_t {
    return static_cast<std::int64_t>(sqlite3_changes(db_));
}

auto SqliteConnection::lastInsertRowId() const -> std::int64_t {
    return static_cast<std::int64_t>(sqlite3_last_insert_rowid(db_));
}

auto SqliteConnection::setBusyTimeout(std::chrono::milliseconds timeout) -> void {
    sqlite3_busy_timeout(db_, static_cast<int>(timeout.count()));
    busyTimeout_ = timeout;
}

SqliteTransaction::SqliteTransaction(SqliteConnection& connection, int level)
    : connection_(&connection)
    , level_(level) {}

SqliteTransaction::SqliteTransaction(SqliteTransaction&& other) noexcept
    : connection_(std::exchange(other.connection_, nullptr))
    , level_(std::exchange(other.level_, 0)) {}

SqliteTransaction::~SqliteTransaction() {
    rollback();
}

auto SqliteTransaction::savepointName() const -> std::string {
    return "ls_sp_" + std::to_string(level_);
}

auto SqliteTransaction::begin(SqliteConnection& connection) -> Expected<SqliteTransaction> {
    int const level = connection.depth_ + 1;
    if (level == 1) {
        if (auto begun = connection.execute("BEGIN IMMEDIATE"); !begun)
            return std::unexpected(begun.error());
    } else {
        if (auto begun = connection.execute("SAVEPOINT ls_sp_" + std::to_string(level)); !begun)
            return std::unexpected(begun.error());
    }
    connection.depth_ = level;
    return SqliteTransaction{connection, level};
}

auto SqliteTransaction::commit() -> Expected<void> {
    if (!connection_) {
        return std::unexpected(Error{Error::Code::StorageFailure, "Transaction is no longer active"});
    }
    auto result = level_ == 1 ? connection_->execute("COMMIT") : connection_->execute("RELEASE " + savepointName());
    if (!result) {
        rollback();
        return result;
    }
    connection_->depth_ = level_ - 1;
    connection_         = nullptr;
    return {};
}

auto SqliteTransaction::rollback() -> void {
    if (!connection_)
        return;
    // sqlite may already have rolled back on its own after a hard failure.
    if (level_ == 1) {
        (void)connection_->execute("ROLLBACK");
    } else {
        (void)connection_->execute("ROLLBACK TO " + savepointName());
        (void)connection_->execute("RELEASE " + savepointName());
    }
    connection_->depth_ = level_ - 1;
    connection_         = nullptr;
}

} // namespace LS::Storage
