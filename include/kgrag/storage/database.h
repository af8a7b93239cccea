#pragma once

#include <kgrag/core/types.h>
#include <sqlite3.h>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace kgrag::storage {

/// Maps a SQLite result code to the kgrag error taxonomy. @p what names the failed step.
Error sqliteError(int rc, std::string_view what, sqlite3* db = nullptr);

/**
 * @brief Busy handling on top of sqlite3_busy_timeout
 *
 * A statement that reports SQLITE_BUSY or SQLITE_LOCKED before yielding its first row is
 * re-run up to @c extraAttempts times, sleeping @c step, then 2*step, and so on between runs.
 */
struct BusyRetry {
    int extraAttempts = 3;
    std::chrono::milliseconds step{20};
};

/**
 * @brief Connection settings applied right after sqlite3_open_v2
 */
struct OpenOptions {
    std::chrono::milliseconds busyTimeout{2000};
    bool wal = true;
    bool foreignKeys = true;
    BusyRetry retry;
};

/**
 * @brief Prepared statement owned by the Database that made it
 *
 * Parameters are 1-based, columns 0-based.
 */
class Statement {
public:
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;
    ~Statement();

    // Integers (bool included) bind as INTEGER, floating point as REAL, anything viewable as
    // text as TEXT, byte spans as BLOB and nullptr as NULL.
    template <typename T> Result<void> bind(int index, const T& value) {
        using V = std::remove_cvref_t<T>;
        int rc = SQLITE_OK;
        if constexpr (std::is_same_v<V, std::nullptr_t>) {
            rc = sqlite3_bind_null(stmt_, index);
        } else if constexpr (std::is_integral_v<V>) {
            rc = sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value));
        } else if constexpr (std::is_floating_point_v<V>) {
            rc = sqlite3_bind_double(stmt_, index, static_cast<double>(value));
        } else if constexpr (std::is_convertible_v<const T&, std::string_view>) {
            const std::string_view text = value;
            rc = sqlite3_bind_text(stmt_, index, text.data(), static_cast<int>(text.size()),
                                   SQLITE_TRANSIENT);
        } else if constexpr (std::is_convertible_v<const T&, std::span<const std::byte>>) {
            const std::span<const std::byte> bytes = value;
            rc = sqlite3_bind_blob(stmt_, index, bytes.data(), static_cast<int>(bytes.size()),
                                   SQLITE_TRANSIENT);
        } else {
            static_assert(sizeof(V) == 0, "no SQLite binding for this type");
        }
        return checkBind(rc, index);
    }

    /// Binds @p args to parameters 1..N, stopping at the first failure.
    template <typename... Args> Result<void> bindAll(const Args&... args) {
        Result<void> status;
        int index = 0;
        ((status = bind(++index, args), static_cast<bool>(status)) && ...);
        return status;
    }

    /// @return true while a row is available
    Result<bool> step();

    /// Runs the statement to its first row or completion.
    Result<void> execute();

    /// Rewinds for another run; bindings are kept.
    Result<void> reset();

    std::int64_t columnInt64(int column) const;
    double columnDouble(int column) const;
    std::string columnText(int column) const;
    std::vector<std::byte> columnBlob(int column) const;
    bool columnIsNull(int column) const;

private:
    friend class Database;
    Statement(sqlite3_stmt* stmt, BusyRetry retry) : stmt_(stmt), retry_(retry) {}

    Result<void> checkBind(int rc, int index) const;

    sqlite3_stmt* stmt_ = nullptr;
    BusyRetry retry_;
    bool yielded_ = false;
};

/**
 * @brief One SQLite connection; not thread-safe, hand it out through ConnectionPool
 *
 * The path ":memory:" opens a private in-memory database.
 */
class Database {
public:
    Database() = default;
    ~Database();

    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    Result<void> open(const std::string& path, const OpenOptions& options = {});
    void close();
    [[nodiscard]] bool isOpen() const { return db_ != nullptr; }
    [[nodiscard]] const std::string& path() const { return path_; }

    Result<Statement> prepare(std::string_view sql);

    /// Runs one or more ';'-separated statements that return no rows.
    Result<void> execute(const std::string& sql);

    /**
     * @brief Runs @p func inside BEGIN IMMEDIATE ... COMMIT
     *
     * An error result or an exception from @p func rolls back; the exception is rethrown.
     * Transactions do not nest.
     */
    template <typename Func> Result<void> transaction(Func&& func) {
        auto begun = begin();
        if (!begun)
            return begun;
        try {
            Result<void> outcome = func();
            if (!outcome) {
                rollback();
                return outcome;
            }
        } catch (...) {
            rollback();
            throw;
        }
        return commit();
    }

    /// Rows written by the most recent INSERT, UPDATE or DELETE.
    [[nodiscard]] int changes() const;

private:
    Result<void> begin();
    Result<void> commit();
    void rollback();

    sqlite3* db_ = nullptr;
    std::string path_;
    BusyRetry retry_;
    bool inTransaction_ = false;
};

} // namespace kgrag::storage
