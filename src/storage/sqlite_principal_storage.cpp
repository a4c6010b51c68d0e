/**
 * @file sqlite_principal_storage.cpp
 * @brief Implementation of the SQLite principal directory
 *
 * @copyright Copyright (c) 2025
 */

#include <tenantguard/storage/sqlite_principal_storage.hpp>

#include "sqlite_support.hpp"

namespace tenantguard::storage {

using namespace security;

auto sqlite_principal_storage::open(const std::string& db_path)
    -> Result<std::unique_ptr<sqlite_principal_storage>> {
    auto db = detail::open_database(db_path);
    if (db.is_err()) {
        return db.error();
    }

    auto instance = std::unique_ptr<sqlite_principal_storage>(
        new sqlite_principal_storage(db.value()));
    auto init = instance->initialize_tables();
    if (init.is_err()) {
        return init.error();
    }
    return instance;
}

sqlite_principal_storage::sqlite_principal_storage(sqlite3* db) : db_(db) {}

sqlite_principal_storage::~sqlite_principal_storage() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

auto sqlite_principal_storage::initialize_tables() -> VoidResult {
    return detail::exec(db_, R"(
        CREATE TABLE IF NOT EXISTS tenants (
            id       TEXT PRIMARY KEY,
            industry TEXT NOT NULL,
            plan     TEXT NOT NULL,
            status   TEXT NOT NULL DEFAULT 'active'
        );
        CREATE TABLE IF NOT EXISTS principals (
            id                 TEXT PRIMARY KEY,
            kind               TEXT NOT NULL,
            active             INTEGER NOT NULL DEFAULT 1,
            multi_tenant_grant INTEGER NOT NULL DEFAULT 0
        );
        CREATE TABLE IF NOT EXISTS principal_bindings (
            principal_id  TEXT NOT NULL,
            tenant_id     TEXT NOT NULL,
            base_role     TEXT NOT NULL,
            industry_role TEXT NOT NULL DEFAULT '',
            active        INTEGER NOT NULL DEFAULT 1,
            PRIMARY KEY (principal_id, tenant_id),
            FOREIGN KEY(principal_id) REFERENCES principals(id) ON DELETE CASCADE
        );
        CREATE INDEX IF NOT EXISTS idx_bindings_tenant
            ON principal_bindings(tenant_id);
        CREATE TABLE IF NOT EXISTS principal_cross_tenant_scope (
            principal_id TEXT NOT NULL,
            tenant_id    TEXT NOT NULL,
            PRIMARY KEY (principal_id, tenant_id),
            FOREIGN KEY(principal_id) REFERENCES principals(id) ON DELETE CASCADE
        );
    )", "Failed to init tables");
}

auto sqlite_principal_storage::create_principal(const principal& p) -> VoidResult {
    std::lock_guard lock(mutex_);
    return write_principal(p, false);
}

auto sqlite_principal_storage::update_principal(const principal& p) -> VoidResult {
    std::lock_guard lock(mutex_);
    return write_principal(p, true);
}

auto sqlite_principal_storage::write_principal(const principal& p, bool replace)
    -> VoidResult {
    if (p.id.empty()) {
        return tenantguard_void_error(error_codes::principal_not_found,
                                      "Principal id is required");
    }

    detail::transaction tx(db_);
    if (auto begun = tx.begin(); begun.is_err()) {
        return begun;
    }

    const char* sql =
        replace ? "UPDATE principals SET kind = ?2, active = ?3, multi_tenant_grant = ?4 "
                  "WHERE id = ?1;"
                : "INSERT INTO principals (id, kind, active, multi_tenant_grant) "
                  "VALUES (?1, ?2, ?3, ?4);";
    {
        auto prepared = detail::prepare(db_, sql);
        if (prepared.is_err()) {
            return prepared.error();
        }
        auto stmt = std::move(prepared.value());
        detail::bind_text(stmt.get(), 1, p.id);
        detail::bind_text(stmt.get(), 2, to_string(p.kind));
        sqlite3_bind_int(stmt.get(), 3, p.active ? 1 : 0);
        sqlite3_bind_int(stmt.get(), 4, p.multi_tenant_grant ? 1 : 0);
        if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
            return detail::query_void_error(db_, "Failed to write principal");
        }
        if (replace && sqlite3_changes(db_) == 0) {
            return tenantguard_void_error(error_codes::principal_not_found,
                                          "Principal not found", p.id);
        }
    }

    if (replace) {
        for (const char* clear :
             {"DELETE FROM principal_bindings WHERE principal_id = ?;",
              "DELETE FROM principal_cross_tenant_scope WHERE principal_id = ?;"}) {
            auto prepared = detail::prepare(db_, clear);
            if (prepared.is_err()) {
                return prepared.error();
            }
            auto stmt = std::move(prepared.value());
            detail::bind_text(stmt.get(), 1, p.id);
            if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
                return detail::query_void_error(db_, "Failed to clear principal bindings");
            }
        }
    }

    for (const auto& binding : p.bindings) {
        auto prepared = detail::prepare(
            db_,
            "INSERT INTO principal_bindings "
            "(principal_id, tenant_id, base_role, industry_role, active) "
            "VALUES (?, ?, ?, ?, ?);");
        if (prepared.is_err()) {
            return prepared.error();
        }
        auto stmt = std::move(prepared.value());
        detail::bind_text(stmt.get(), 1, p.id);
        detail::bind_text(stmt.get(), 2, binding.tenant_id);
        detail::bind_text(stmt.get(), 3, binding.base_role);
        detail::bind_text(stmt.get(), 4, binding.industry_role);
        sqlite3_bind_int(stmt.get(), 5, binding.active ? 1 : 0);
        if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
            return detail::query_void_error(db_, "Failed to insert tenant binding");
        }
    }

    for (const auto& tenant_id : p.cross_tenant_scope) {
        auto prepared = detail::prepare(
            db_,
            "INSERT OR IGNORE INTO principal_cross_tenant_scope (principal_id, tenant_id) "
            "VALUES (?, ?);");
        if (prepared.is_err()) {
            return prepared.error();
        }
        auto stmt = std::move(prepared.value());
        detail::bind_text(stmt.get(), 1, p.id);
        detail::bind_text(stmt.get(), 2, tenant_id);
        if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
            return detail::query_void_error(db_, "Failed to insert cross-tenant scope");
        }
    }

    return tx.commit();
}

auto sqlite_principal_storage::get_principal(std::string_view id) -> Result<principal> {
    std::lock_guard lock(mutex_);
    return load_principal(id);
}

auto sqlite_principal_storage::load_principal(std::string_view id) -> Result<principal> {
    principal p;
    {
        auto prepared = detail::prepare(
            db_, "SELECT id, kind, active, multi_tenant_grant FROM principals WHERE id = ?;");
        if (prepared.is_err()) {
            return prepared.error();
        }
        auto stmt = std::move(prepared.value());
        detail::bind_text(stmt.get(), 1, id);

        auto rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_DONE) {
            return tenantguard_error<principal>(error_codes::principal_not_found,
                                                "Principal not found", std::string(id));
        }
        if (rc != SQLITE_ROW) {
            return detail::query_error<principal>(db_, "Failed to load principal");
        }
        p.id = detail::column_text(stmt.get(), 0);
        p.kind = parse_principal_kind(detail::column_text(stmt.get(), 1))
                     .value_or(principal_kind::user);
        p.active = sqlite3_column_int(stmt.get(), 2) != 0;
        p.multi_tenant_grant = sqlite3_column_int(stmt.get(), 3) != 0;
    }

    {
        auto prepared = detail::prepare(
            db_,
            "SELECT tenant_id, base_role, industry_role, active FROM principal_bindings "
            "WHERE principal_id = ? ORDER BY tenant_id;");
        if (prepared.is_err()) {
            return prepared.error();
        }
        auto stmt = std::move(prepared.value());
        detail::bind_text(stmt.get(), 1, id);

        int rc;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
            tenant_binding binding;
            binding.tenant_id = detail::column_text(stmt.get(), 0);
            binding.base_role = detail::column_text(stmt.get(), 1);
            binding.industry_role = detail::column_text(stmt.get(), 2);
            binding.active = sqlite3_column_int(stmt.get(), 3) != 0;
            p.bindings.push_back(std::move(binding));
        }
        if (rc != SQLITE_DONE) {
            return detail::query_error<principal>(db_, "Failed to load tenant bindings");
        }
    }

    {
        auto prepared = detail::prepare(
            db_,
            "SELECT tenant_id FROM principal_cross_tenant_scope WHERE principal_id = ? "
            "ORDER BY tenant_id;");
        if (prepared.is_err()) {
            return prepared.error();
        }
        auto stmt = std::move(prepared.value());
        detail::bind_text(stmt.get(), 1, id);

        int rc;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
            p.cross_tenant_scope.push_back(detail::column_text(stmt.get(), 0));
        }
        if (rc != SQLITE_DONE) {
            return detail::query_error<principal>(db_, "Failed to load cross-tenant scope");
        }
    }

    return p;
}

auto sqlite_principal_storage::delete_principal(std::string_view id) -> VoidResult {
    std::lock_guard lock(mutex_);

    auto prepared = detail::prepare(db_, "DELETE FROM principals WHERE id = ?;");
    if (prepared.is_err()) {
        return prepared.error();
    }
    auto stmt = std::move(prepared.value());
    detail::bind_text(stmt.get(), 1, id);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        return detail::query_void_error(db_, "Failed to delete principal");
    }
    if (sqlite3_changes(db_) == 0) {
        return tenantguard_void_error(error_codes::principal_not_found,
                                      "Principal not found", std::string(id));
    }
    return ok();
}

auto sqlite_principal_storage::get_principals_by_tenant(std::string_view tenant_id)
    -> Result<std::vector<principal>> {
    std::lock_guard lock(mutex_);

    std::vector<std::string> ids;
    {
        auto prepared = detail::prepare(
            db_,
            "SELECT principal_id FROM principal_bindings "
            "WHERE tenant_id = ? AND active = 1 ORDER BY principal_id;");
        if (prepared.is_err()) {
            return prepared.error();
        }
        auto stmt = std::move(prepared.value());
        detail::bind_text(stmt.get(), 1, tenant_id);

        int rc;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
            ids.push_back(detail::column_text(stmt.get(), 0));
        }
        if (rc != SQLITE_DONE) {
            return detail::query_error<std::vector<principal>>(
                db_, "Failed to query principals by tenant");
        }
    }

    std::vector<principal> result;
    result.reserve(ids.size());
    for (const auto& id : ids) {
        auto p = load_principal(id);
        if (p.is_err()) {
            return p.error();
        }
        result.push_back(std::move(p.value()));
    }
    return result;
}

auto sqlite_principal_storage::create_tenant(const tenant& t) -> VoidResult {
    std::lock_guard lock(mutex_);

    auto prepared = detail::prepare(
        db_, "INSERT INTO tenants (id, industry, plan, status) VALUES (?, ?, ?, ?);");
    if (prepared.is_err()) {
        return prepared.error();
    }
    auto stmt = std::move(prepared.value());
    detail::bind_text(stmt.get(), 1, t.id);
    detail::bind_text(stmt.get(), 2, to_string(t.industry));
    detail::bind_text(stmt.get(), 3, to_string(t.plan));
    detail::bind_text(stmt.get(), 4, to_string(t.status));
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        return detail::query_void_error(db_, "Failed to insert tenant");
    }
    return ok();
}

auto sqlite_principal_storage::get_tenant(std::string_view id) -> Result<tenant> {
    std::lock_guard lock(mutex_);

    auto prepared = detail::prepare(
        db_, "SELECT id, industry, plan, status FROM tenants WHERE id = ?;");
    if (prepared.is_err()) {
        return prepared.error();
    }
    auto stmt = std::move(prepared.value());
    detail::bind_text(stmt.get(), 1, id);

    auto rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) {
        return tenantguard_error<tenant>(error_codes::tenant_not_found,
                                         "Tenant not found", std::string(id));
    }
    if (rc != SQLITE_ROW) {
        return detail::query_error<tenant>(db_, "Failed to load tenant");
    }

    tenant t;
    t.id = detail::column_text(stmt.get(), 0);
    auto industry = parse_industry(detail::column_text(stmt.get(), 1));
    auto plan = parse_plan_tier(detail::column_text(stmt.get(), 2));
    auto status = parse_tenant_status(detail::column_text(stmt.get(), 3));
    if (!industry || !plan || !status) {
        return tenantguard_error<tenant>(error_codes::database_query_error,
                                         "Tenant row holds unknown enum value",
                                         std::string(id));
    }
    t.industry = *industry;
    t.plan = *plan;
    t.status = *status;
    return t;
}

auto sqlite_principal_storage::update_tenant(const tenant& t) -> VoidResult {
    std::lock_guard lock(mutex_);

    auto prepared = detail::prepare(
        db_, "UPDATE tenants SET industry = ?2, plan = ?3, status = ?4 WHERE id = ?1;");
    if (prepared.is_err()) {
        return prepared.error();
    }
    auto stmt = std::move(prepared.value());
    detail::bind_text(stmt.get(), 1, t.id);
    detail::bind_text(stmt.get(), 2, to_string(t.industry));
    detail::bind_text(stmt.get(), 3, to_string(t.plan));
    detail::bind_text(stmt.get(), 4, to_string(t.status));
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        return detail::query_void_error(db_, "Failed to update tenant");
    }
    if (sqlite3_changes(db_) == 0) {
        return tenantguard_void_error(error_codes::tenant_not_found, "Tenant not found",
                                      t.id);
    }
    return ok();
}

} // namespace tenantguard::storage
