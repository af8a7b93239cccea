#include <kgrag/storage/database.h>

#include <spdlog/spdlog.h>

#include <cstring>
#include <thread>
#include <utility>

namespace kgrag::storage {

namespace {

bool isBusy(int rc) {
    const int primary = rc & 0xff;
    return primary == SQLITE_BUSY || primary == SQLITE_LOCKED;
}

std::string sqlOf(sqlite3_stmt* stmt) {
    const char* sql = stmt ? sqlite3_sql(stmt) : nullptr;
    if (!sql)
        return {};
    std::string text(sql, strnlen(sql, 120));
    for (auto& c : text) {
        if (c == '\n' || c == '\t')
            c = ' ';
    }
    return text;
}

} // namespace

Error sqliteError(int rc, std::string_view what, sqlite3* db) {
    std::string detail = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
    auto message = fmt::format("{}: {}", what, detail);
    switch (rc & 0xff) {
        case SQLITE_CONSTRAINT:
            return Error{ErrorCode::InvalidData, std::move(message)};
        case SQLITE_READONLY:
        case SQLITE_PERM:
        case SQLITE_AUTH:
            return Error{ErrorCode::PermissionDenied, std::move(message)};
        case SQLITE_FULL:
        case SQLITE_NOMEM:
            return Error{ErrorCode::ResourceExhausted, std::move(message)};
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            return Error{ErrorCode::CorruptedData, std::move(message)};
        case SQLITE_CANTOPEN:
            return Error{ErrorCode::FileNotFound, std::move(message)};
        case SQLITE_MISUSE:
        case SQLITE_RANGE:
            return Error{ErrorCode::InternalError, std::move(message)};
        default:
            return Error{ErrorCode::DatabaseError, std::move(message)};
    }
}

// Statement

Statement::Statement(Statement&& other) noexcept
    : stmt_(std::exchange(other.stmt_, nullptr)), retry_(other.retry_), yielded_(other.yielded_) {}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        sqlite3_finalize(stmt_);
        stmt_ = std::exchange(other.stmt_, nullptr);
        retry_ = other.retry_;
        yielded_ = other.yielded_;
    }
    return *this;
}

Statement::~Statement() {
    sqlite3_finalize(stmt_);
}

Result<void> Statement::checkBind(int rc, int index) const {
    if (rc == SQLITE_OK)
        return {};
    return sqliteError(rc, fmt::format("bind parameter {} of [{}]", index, sqlOf(stmt_)),
                       sqlite3_db_handle(stmt_));
}

Result<bool> Statement::step() {
    int rc = sqlite3_step(stmt_);
    // A busy statement is only re-run before it has produced rows; restarting mid-scan
    // would hand the caller duplicates.
    for (int attempt = 1; isBusy(rc) && !yielded_ && attempt <= retry_.extraAttempts;
         ++attempt) {
        sqlite3_reset(stmt_);
        std::this_thread::sleep_for(retry_.step * (1 << (attempt - 1)));
        rc = sqlite3_step(stmt_);
    }

    if (rc == SQLITE_ROW) {
        yielded_ = true;
        return true;
    }
    if (rc == SQLITE_DONE)
        return false;

    if (isBusy(rc)) {
        return Error{ErrorCode::DatabaseError,
                     fmt::format("database is locked after {} attempts [{}]",
                                 retry_.extraAttempts + 1, sqlOf(stmt_))};
    }
    return sqliteError(rc, fmt::format("step [{}]", sqlOf(stmt_)), sqlite3_db_handle(stmt_));
}

Result<void> Statement::execute() {
    auto r = step();
    if (!r)
        return r.error();
    return {};
}

Result<void> Statement::reset() {
    yielded_ = false;
    // sqlite3_reset repeats the last step error; that error was already reported by step()
    sqlite3_reset(stmt_);
    return {};
}

std::int64_t Statement::columnInt64(int column) const {
    return sqlite3_column_int64(stmt_, column);
}

double Statement::columnDouble(int column) const {
    return sqlite3_column_double(stmt_, column);
}

std::string Statement::columnText(int column) const {
    const auto* text = sqlite3_column_text(stmt_, column);
    if (!text)
        return {};
    const int bytes = sqlite3_column_bytes(stmt_, column);
    return std::string(reinterpret_cast<const char*>(text), static_cast<std::size_t>(bytes));
}

std::vector<std::byte> Statement::columnBlob(int column) const {
    const auto* data = static_cast<const std::byte*>(sqlite3_column_blob(stmt_, column));
    const int bytes = sqlite3_column_bytes(stmt_, column);
    if (!data || bytes <= 0)
        return {};
    return std::vector<std::byte>(data, data + bytes);
}

bool Statement::columnIsNull(int column) const {
    return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

// Database

Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept
    : db_(std::exchange(other.db_, nullptr)), path_(std::move(other.path_)), retry_(other.retry_),
      inTransaction_(std::exchange(other.inTransaction_, false)) {}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = std::exchange(other.db_, nullptr);
        path_ = std::move(other.path_);
        retry_ = other.retry_;
        inTransaction_ = std::exchange(other.inTransaction_, false);
    }
    return *this;
}

Result<void> Database::open(const std::string& path, const OpenOptions& options) {
    if (db_)
        return Error{ErrorCode::InvalidState, "Database already open at " + path_};

    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX;
    sqlite3* handle = nullptr;
    const int rc = sqlite3_open_v2(path.c_str(), &handle, flags, nullptr);
    if (rc != SQLITE_OK) {
        auto err = sqliteError(rc, "open " + path, handle);
        sqlite3_close(handle);
        return err;
    }
    db_ = handle;
    path_ = path;
    retry_ = options.retry;
    sqlite3_extended_result_codes(db_, 1);
    sqlite3_busy_timeout(db_, static_cast<int>(options.busyTimeout.count()));

    if (options.wal && path != ":memory:") {
        auto wal = execute("PRAGMA journal_mode=WAL");
        if (!wal)
            spdlog::warn("[Database] WAL unavailable for {}: {}", path, wal.error().message);
    }
    if (options.foreignKeys) {
        auto fk = execute("PRAGMA foreign_keys=ON");
        if (!fk) {
            close();
            return fk;
        }
    }
    return {};
}

void Database::close() {
    if (db_) {
        // sqlite3_close_v2 defers the close until outstanding statements are finalized
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
    path_.clear();
    inTransaction_ = false;
}

Result<Statement> Database::prepare(std::string_view sql) {
    if (!db_)
        return Error{ErrorCode::NotInitialized, "Database is not open"};

    sqlite3_stmt* stmt = nullptr;
    const int rc =
        sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_finalize(stmt);
        return sqliteError(rc, fmt::format("prepare [{}]", sql.substr(0, 120)), db_);
    }
    return Statement(stmt, retry_);
}

Result<void> Database::execute(const std::string& sql) {
    if (!db_)
        return Error{ErrorCode::NotInitialized, "Database is not open"};

    char* errmsg = nullptr;
    const int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
    if (rc == SQLITE_OK)
        return {};

    std::string reason = errmsg ? errmsg : sqlite3_errstr(rc);
    sqlite3_free(errmsg);
    spdlog::debug("[Database] exec failed on {}: {}", path_, reason);
    auto err = sqliteError(rc, "exec", nullptr);
    err.message = "exec: " + reason;
    return err;
}

Result<void> Database::begin() {
    if (inTransaction_)
        return Error{ErrorCode::InvalidState, "Transaction already open on " + path_};
    auto r = execute("BEGIN IMMEDIATE");
    if (r)
        inTransaction_ = true;
    return r;
}

Result<void> Database::commit() {
    auto r = execute("COMMIT");
    if (!r) {
        rollback();
        return r;
    }
    inTransaction_ = false;
    return {};
}

void Database::rollback() {
    inTransaction_ = false;
    auto r = execute("ROLLBACK");
    if (!r)
        spdlog::warn("[Database] rollback on {} failed: {}", path_, r.error().message);
}

int Database::changes() const {
    return db_ ? sqlite3_changes(db_) : 0;
}

} // namespace kgrag::storage
