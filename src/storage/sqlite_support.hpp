/**
 * @file sqlite_support.hpp
 * @brief Shared SQLite helpers for the storage backends
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <tenantguard/compat/format.hpp>
#include <tenantguard/core/result.hpp>

#include <sqlite3.h>

#include <memory>
#include <string>
#include <string_view>

namespace tenantguard::storage::detail {

/**
 * @brief Open a database with foreign keys enabled and WAL for file databases
 */
inline auto open_database(const std::string& db_path) -> Result<sqlite3*> {
    sqlite3* db = nullptr;

    auto rc = sqlite3_open(db_path.c_str(), &db);
    if (rc != SQLITE_OK) {
        std::string error_msg = db ? sqlite3_errmsg(db) : "Failed to allocate memory";
        if (db) {
            sqlite3_close(db);
        }
        return tenantguard_error<sqlite3*>(
            error_codes::database_open_error,
            compat::format("Failed to open database: {}", error_msg), db_path);
    }

    rc = sqlite3_exec(db, "PRAGMA foreign_keys = ON;", nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_close(db);
        return tenantguard_error<sqlite3*>(error_codes::database_open_error,
                                           "Failed to enable foreign keys", db_path);
    }

    if (db_path != ":memory:") {
        rc = sqlite3_exec(db, "PRAGMA journal_mode = WAL;", nullptr, nullptr, nullptr);
        if (rc != SQLITE_OK) {
            sqlite3_close(db);
            return tenantguard_error<sqlite3*>(error_codes::database_open_error,
                                               "Failed to enable WAL mode", db_path);
        }
    }

    sqlite3_busy_timeout(db, 5000);
    return db;
}

/**
 * @brief Run one or more statements without results
 */
inline auto exec(sqlite3* db, const char* sql, const char* what) -> VoidResult {
    char* err_msg = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err_msg) != SQLITE_OK) {
        std::string error = err_msg ? err_msg : "Unknown error";
        sqlite3_free(err_msg);
        return tenantguard_void_error(error_codes::database_query_error,
                                      compat::format("{}: {}", what, error));
    }
    return ok();
}

/**
 * @brief Error result for a failed prepare/step
 */
template <typename T>
inline auto query_error(sqlite3* db, const char* what) -> Result<T> {
    return tenantguard_error<T>(error_codes::database_query_error,
                                compat::format("{}: {}", what, sqlite3_errmsg(db)));
}

inline auto query_void_error(sqlite3* db, const char* what) -> VoidResult {
    return tenantguard_void_error(error_codes::database_query_error,
                                  compat::format("{}: {}", what, sqlite3_errmsg(db)));
}

struct statement_deleter {
    void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};

/// Finalizes the statement on scope exit
using statement_ptr = std::unique_ptr<sqlite3_stmt, statement_deleter>;

inline auto prepare(sqlite3* db, const char* sql) -> Result<statement_ptr> {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return query_error<statement_ptr>(db, "Failed to prepare statement");
    }
    return statement_ptr(stmt);
}

inline void bind_text(sqlite3_stmt* stmt, int index, std::string_view value) {
    sqlite3_bind_text(stmt, index, value.data(), static_cast<int>(value.size()),
                      SQLITE_TRANSIENT);
}

/**
 * @brief BEGIN IMMEDIATE / COMMIT scope that rolls back unless committed
 */
class transaction {
public:
    explicit transaction(sqlite3* db) : db_(db) {}
    ~transaction() {
        if (open_) {
            sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        }
    }

    transaction(const transaction&) = delete;
    transaction& operator=(const transaction&) = delete;

    [[nodiscard]] auto begin() -> VoidResult {
        auto result = exec(db_, "BEGIN IMMEDIATE;", "Failed to begin transaction");
        open_ = result.is_ok();
        return result;
    }

    [[nodiscard]] auto commit() -> VoidResult {
        auto result = exec(db_, "COMMIT;", "Failed to commit transaction");
        if (result.is_ok()) {
            open_ = false;
        }
        return result;
    }

private:
    sqlite3* db_;
    bool open_{false};
};

/// Column text as std::string, empty for NULL
inline auto column_text(sqlite3_stmt* stmt, int col) -> std::string {
    const auto* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

} // namespace tenantguard::storage::detail
