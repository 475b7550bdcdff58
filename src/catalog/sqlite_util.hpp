#pragma once

// Thin RAII helpers over the sqlite3 C API used by the catalog.

#include <sqlite3.h>

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

#include "cairn/error.hpp"

namespace cairn::catalog::detail {

/** \brief Map a SQLite result code to the library taxonomy. */
inline auto sqlite_error(sqlite3* db, int rc, std::string_view what) -> core::error {
    using core::error_code;
    error_code code = error_code::io_failed;
    switch (rc & 0xff) {
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            code = error_code::data_integrity;
            break;
        case SQLITE_READONLY:
        case SQLITE_PERM:
        case SQLITE_AUTH:
            code = error_code::permission_denied;
            break;
        case SQLITE_CONSTRAINT:
            code = error_code::already_exists;
            break;
        case SQLITE_MISUSE:
        case SQLITE_RANGE:
            code = error_code::internal;
            break;
        default:
            break;
    }
    std::string msg(what);
    msg += ": ";
    msg += db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
    return core::error{code, std::move(msg), "catalog.sqlite"};
}

/** \brief Run one or more statements without results. */
inline auto exec(sqlite3* db, const char* sql, std::string_view what) -> std::expected<void, core::error> {
    char* err = nullptr;
    const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
    if (err) sqlite3_free(err);
    if (rc != SQLITE_OK) return std::unexpected(sqlite_error(db, rc, what));
    return {};
}

/** \brief Prepared statement; finalized on destruction. */
class Statement {
public:
    static auto prepare(sqlite3* db, std::string_view sql) -> std::expected<Statement, core::error> {
        sqlite3_stmt* stmt = nullptr;
        const int rc = sqlite3_prepare_v2(db, sql.data(), static_cast<int>(sql.size()), &stmt, nullptr);
        if (rc != SQLITE_OK) {
            if (stmt) sqlite3_finalize(stmt);
            return std::unexpected(sqlite_error(db, rc, "prepare"));
        }
        return Statement(db, stmt);
    }

    ~Statement() { if (stmt_) sqlite3_finalize(stmt_); }
    Statement(Statement&& o) noexcept : db_(o.db_), stmt_(o.stmt_) { o.stmt_ = nullptr; }
    Statement& operator=(Statement&& o) noexcept {
        if (this != &o) {
            if (stmt_) sqlite3_finalize(stmt_);
            db_ = o.db_;
            stmt_ = o.stmt_;
            o.stmt_ = nullptr;
        }
        return *this;
    }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    // Bind indices are 1-based, as in SQLite.
    void bind_int64(int i, std::int64_t v) { sqlite3_bind_int64(stmt_, i, v); }
    void bind_double(int i, double v) { sqlite3_bind_double(stmt_, i, v); }
    void bind_text(int i, std::string_view v) {
        sqlite3_bind_text(stmt_, i, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
    }
    void bind_null(int i) { sqlite3_bind_null(stmt_, i); }
    void bind_optional(int i, const std::optional<std::string>& v) {
        if (v) bind_text(i, *v); else bind_null(i);
    }

    /** \brief Step once: true when a row is available, false when done. */
    auto step() -> std::expected<bool, core::error> {
        const int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        return std::unexpected(sqlite_error(db_, rc, "step"));
    }

    /** \brief Run a statement that returns no rows. */
    auto run() -> std::expected<void, core::error> {
        auto r = step();
        if (!r) return std::unexpected(r.error());
        return {};
    }

    auto reset() -> void {
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }

    [[nodiscard]] auto column_int64(int i) const -> std::int64_t { return sqlite3_column_int64(stmt_, i); }
    [[nodiscard]] auto column_double(int i) const -> double { return sqlite3_column_double(stmt_, i); }
    [[nodiscard]] auto column_is_null(int i) const -> bool { return sqlite3_column_type(stmt_, i) == SQLITE_NULL; }
    [[nodiscard]] auto column_text(int i) const -> std::string {
        const auto* p = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, i));
        const int n = sqlite3_column_bytes(stmt_, i);
        return p ? std::string(p, static_cast<std::size_t>(n)) : std::string();
    }
    [[nodiscard]] auto changes() const -> int { return sqlite3_changes(db_); }
    [[nodiscard]] auto get() const noexcept -> sqlite3_stmt* { return stmt_; }

private:
    Statement(sqlite3* db, sqlite3_stmt* stmt) noexcept : db_(db), stmt_(stmt) {}

    sqlite3* db_{nullptr};
    sqlite3_stmt* stmt_{nullptr};
};

} // namespace cairn::catalog::detail
