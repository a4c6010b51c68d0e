/**
 * @file sqlite_policy_repository.cpp
 * @brief Implementation of SQLite policy document storage
 *
 * @copyright Copyright (c) 2025
 */

#include <tenantguard/storage/sqlite_policy_repository.hpp>

#include "sqlite_support.hpp"

namespace tenantguard::storage {

using security::industry_vertical;

auto sqlite_policy_repository::open(const std::string& db_path)
    -> Result<std::unique_ptr<sqlite_policy_repository>> {
    auto db = detail::open_database(db_path);
    if (db.is_err()) {
        return db.error();
    }

    auto instance = std::unique_ptr<sqlite_policy_repository>(
        new sqlite_policy_repository(db.value()));
    auto init = instance->initialize_tables();
    if (init.is_err()) {
        return init.error();
    }
    return instance;
}

sqlite_policy_repository::sqlite_policy_repository(sqlite3* db) : db_(db) {}

sqlite_policy_repository::~sqlite_policy_repository() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

auto sqlite_policy_repository::initialize_tables() -> VoidResult {
    return detail::exec(db_, R"(
        CREATE TABLE IF NOT EXISTS policy_documents (
            industry  TEXT    NOT NULL,
            version   INTEGER NOT NULL,
            body      TEXT    NOT NULL,
            stored_at TEXT    NOT NULL DEFAULT (datetime('now')),
            PRIMARY KEY (industry, version)
        );
    )", "Failed to init tables");
}

auto sqlite_policy_repository::save_document(industry_vertical industry,
                                             std::uint64_t version,
                                             const std::string& body) -> VoidResult {
    std::lock_guard lock(mutex_);

    const char* sql =
        "INSERT INTO policy_documents (industry, version, body) VALUES (?, ?, ?);";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return detail::query_void_error(db_, "Failed to prepare statement");
    }

    auto name = std::string(security::to_string(industry));
    sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(version));
    sqlite3_bind_text(stmt, 3, body.c_str(), -1, SQLITE_TRANSIENT);

    auto rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc == SQLITE_CONSTRAINT) {
        return tenantguard_void_error(
            error_codes::policy_version_conflict,
            compat::format("Policy version {} already stored", version), name);
    }
    if (rc != SQLITE_DONE) {
        return detail::query_void_error(db_, "Failed to store policy document");
    }
    return ok();
}

auto sqlite_policy_repository::load_document(industry_vertical industry,
                                             std::uint64_t version)
    -> Result<std::string> {
    std::lock_guard lock(mutex_);

    const char* sql =
        "SELECT body FROM policy_documents WHERE industry = ? AND version = ?;";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return detail::query_error<std::string>(db_, "Failed to prepare statement");
    }

    auto name = std::string(security::to_string(industry));
    sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(version));

    auto rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        auto body = detail::column_text(stmt, 0);
        sqlite3_finalize(stmt);
        return body;
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return detail::query_error<std::string>(db_, "Failed to load policy document");
    }
    return tenantguard_error<std::string>(
        error_codes::policy_not_loaded,
        compat::format("Policy version {} is not stored", version), name);
}

auto sqlite_policy_repository::latest_version(industry_vertical industry)
    -> Result<std::optional<std::uint64_t>> {
    std::lock_guard lock(mutex_);

    const char* sql = "SELECT MAX(version) FROM policy_documents WHERE industry = ?;";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return detail::query_error<std::optional<std::uint64_t>>(
            db_, "Failed to prepare statement");
    }

    auto name = std::string(security::to_string(industry));
    sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);

    std::optional<std::uint64_t> latest;
    auto rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW && sqlite3_column_type(stmt, 0) != SQLITE_NULL) {
        latest = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        return detail::query_error<std::optional<std::uint64_t>>(
            db_, "Failed to query latest policy version");
    }
    return latest;
}

auto sqlite_policy_repository::list_versions(industry_vertical industry)
    -> Result<std::vector<std::uint64_t>> {
    std::lock_guard lock(mutex_);

    const char* sql =
        "SELECT version FROM policy_documents WHERE industry = ? ORDER BY version;";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return detail::query_error<std::vector<std::uint64_t>>(
            db_, "Failed to prepare statement");
    }

    auto name = std::string(security::to_string(industry));
    sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);

    std::vector<std::uint64_t> versions;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        versions.push_back(static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 0)));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return detail::query_error<std::vector<std::uint64_t>>(
            db_, "Failed to list policy versions");
    }
    return versions;
}

} // namespace tenantguard::storage
