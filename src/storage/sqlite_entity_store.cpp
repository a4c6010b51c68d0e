/**
 * @file sqlite_entity_store.cpp
 * @brief Implementation of the SQLite entity store
 *
 * @copyright Copyright (c) 2025
 */

#include <tenantguard/storage/sqlite_entity_store.hpp>

#include "sqlite_support.hpp"

#include <sstream>

namespace tenantguard::storage {

using namespace isolation;

namespace {

constexpr const char* select_columns =
    "SELECT tenant_id, entity_type, entity_id, payload, state, created_at, "
    "updated_at, deleted_at FROM entities";

auto to_millis(std::chrono::system_clock::time_point tp) -> sqlite3_int64 {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch())
        .count();
}

auto from_millis(sqlite3_int64 ms) -> std::chrono::system_clock::time_point {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

auto parse_entity_row(sqlite3_stmt* stmt) -> entity_record {
    entity_record record;
    record.tenant_id = detail::column_text(stmt, 0);
    record.entity_type = detail::column_text(stmt, 1);
    record.entity_id = detail::column_text(stmt, 2);
    record.payload = detail::column_text(stmt, 3);
    record.state =
        parse_entity_state(detail::column_text(stmt, 4)).value_or(entity_state::active);
    record.created_at = from_millis(sqlite3_column_int64(stmt, 5));
    record.updated_at = from_millis(sqlite3_column_int64(stmt, 6));
    if (sqlite3_column_type(stmt, 7) != SQLITE_NULL) {
        record.deleted_at = from_millis(sqlite3_column_int64(stmt, 7));
    }
    return record;
}

} // namespace

auto sqlite_entity_store::open(const std::string& db_path)
    -> Result<std::unique_ptr<sqlite_entity_store>> {
    auto db = detail::open_database(db_path);
    if (db.is_err()) {
        return db.error();
    }

    auto instance =
        std::unique_ptr<sqlite_entity_store>(new sqlite_entity_store(db.value()));
    auto init = instance->initialize_tables();
    if (init.is_err()) {
        return init.error();
    }
    return instance;
}

sqlite_entity_store::sqlite_entity_store(sqlite3* db) : db_(db) {}

sqlite_entity_store::~sqlite_entity_store() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

auto sqlite_entity_store::initialize_tables() -> VoidResult {
    return detail::exec(db_, R"(
        CREATE TABLE IF NOT EXISTS entities (
            entity_type TEXT    NOT NULL,
            entity_id   TEXT    NOT NULL,
            tenant_id   TEXT    NOT NULL,
            payload     TEXT    NOT NULL DEFAULT '{}',
            state       TEXT    NOT NULL DEFAULT 'active'
                        CHECK (state IN ('active', 'soft_deleted', 'purge_eligible')),
            created_at  INTEGER NOT NULL,
            updated_at  INTEGER NOT NULL,
            deleted_at  INTEGER,
            PRIMARY KEY (entity_type, entity_id)
        );
        CREATE INDEX IF NOT EXISTS idx_entities_tenant
            ON entities(tenant_id, entity_type, state);
        CREATE TRIGGER IF NOT EXISTS entities_tenant_immutable
            BEFORE UPDATE OF tenant_id ON entities
            WHEN NEW.tenant_id <> OLD.tenant_id
        BEGIN
            SELECT RAISE(ABORT, 'tenant_id is immutable');
        END;
    )", "Failed to init tables");
}

auto sqlite_entity_store::find(std::string_view tenant_id, const entity_query& query)
    -> Result<std::vector<entity_record>> {
    std::lock_guard lock(mutex_);

    std::ostringstream sql;
    sql << select_columns << " WHERE tenant_id = ? AND entity_type = ?";
    if (query.entity_id) {
        sql << " AND entity_id = ?";
    }
    if (!query.include_deleted) {
        sql << " AND state = 'active'";
    }
    sql << " ORDER BY entity_id ASC";
    if (query.limit > 0) {
        sql << " LIMIT " << query.limit;
    }
    sql << ";";

    auto text = sql.str();
    auto prepared = detail::prepare(db_, text.c_str());
    if (prepared.is_err()) {
        return prepared.error();
    }
    auto stmt = std::move(prepared.value());

    detail::bind_text(stmt.get(), 1, tenant_id);
    detail::bind_text(stmt.get(), 2, query.entity_type);
    if (query.entity_id) {
        detail::bind_text(stmt.get(), 3, *query.entity_id);
    }

    std::vector<entity_record> results;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        results.push_back(parse_entity_row(stmt.get()));
    }
    if (rc != SQLITE_DONE) {
        return detail::query_error<std::vector<entity_record>>(db_,
                                                               "Failed to query entities");
    }
    return results;
}

auto sqlite_entity_store::upsert(std::string_view tenant_id,
                                 const entity_mutation& mutation,
                                 std::chrono::system_clock::time_point now)
    -> Result<entity_record> {
    std::lock_guard lock(mutex_);

    detail::transaction tx(db_);
    if (auto begun = tx.begin(); begun.is_err()) {
        return begun.error();
    }

    auto lookup = detail::prepare(
        db_, "SELECT tenant_id, state FROM entities WHERE entity_type = ? AND entity_id = ?;");
    if (lookup.is_err()) {
        return lookup.error();
    }
    auto select_stmt = std::move(lookup.value());
    detail::bind_text(select_stmt.get(), 1, mutation.entity_type);
    detail::bind_text(select_stmt.get(), 2, mutation.entity_id);

    auto rc = sqlite3_step(select_stmt.get());
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        return detail::query_error<entity_record>(db_, "Failed to look up entity");
    }

    const char* write_sql = nullptr;
    if (rc == SQLITE_DONE) {
        write_sql =
            "INSERT INTO entities (payload, updated_at, created_at, tenant_id, "
            "entity_type, entity_id) VALUES (?, ?, ?, ?, ?, ?);";
    } else {
        auto owner = detail::column_text(select_stmt.get(), 0);
        auto state = detail::column_text(select_stmt.get(), 1);
        if (owner != tenant_id) {
            return tenantguard_error<entity_record>(
                error_codes::tenant_immutable,
                compat::format("Entity {}/{} belongs to another tenant",
                               mutation.entity_type, mutation.entity_id));
        }
        if (state != "active") {
            return tenantguard_error<entity_record>(
                error_codes::entity_not_found,
                compat::format("Entity {}/{} is deleted", mutation.entity_type,
                               mutation.entity_id));
        }
        write_sql =
            "UPDATE entities SET payload = ?, updated_at = ? "
            "WHERE tenant_id = ? AND entity_type = ? AND entity_id = ?;";
    }
    select_stmt.reset();

    auto prepared = detail::prepare(db_, write_sql);
    if (prepared.is_err()) {
        return prepared.error();
    }
    auto stmt = std::move(prepared.value());

    int index = 1;
    detail::bind_text(stmt.get(), index++, mutation.payload);
    sqlite3_bind_int64(stmt.get(), index++, to_millis(now));
    if (rc == SQLITE_DONE) {
        sqlite3_bind_int64(stmt.get(), index++, to_millis(now));
    }
    detail::bind_text(stmt.get(), index++, tenant_id);
    detail::bind_text(stmt.get(), index++, mutation.entity_type);
    detail::bind_text(stmt.get(), index++, mutation.entity_id);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        return detail::query_error<entity_record>(db_, "Failed to write entity");
    }
    stmt.reset();

    auto reload_sql = std::string(select_columns) +
                      " WHERE tenant_id = ? AND entity_type = ? AND entity_id = ?;";
    auto reload = detail::prepare(db_, reload_sql.c_str());
    if (reload.is_err()) {
        return reload.error();
    }
    auto reload_stmt = std::move(reload.value());
    detail::bind_text(reload_stmt.get(), 1, tenant_id);
    detail::bind_text(reload_stmt.get(), 2, mutation.entity_type);
    detail::bind_text(reload_stmt.get(), 3, mutation.entity_id);
    if (sqlite3_step(reload_stmt.get()) != SQLITE_ROW) {
        return detail::query_error<entity_record>(db_, "Failed to read back entity");
    }
    auto record = parse_entity_row(reload_stmt.get());
    reload_stmt.reset();

    if (auto committed = tx.commit(); committed.is_err()) {
        return committed.error();
    }
    return record;
}

auto sqlite_entity_store::soft_delete(std::string_view tenant_id,
                                      std::string_view entity_type,
                                      std::string_view entity_id,
                                      std::chrono::system_clock::time_point now)
    -> VoidResult {
    std::lock_guard lock(mutex_);

    auto prepared = detail::prepare(db_, R"(
        UPDATE entities SET state = 'soft_deleted', deleted_at = ?, updated_at = ?
        WHERE tenant_id = ? AND entity_type = ? AND entity_id = ? AND state = 'active';
    )");
    if (prepared.is_err()) {
        return prepared.error();
    }
    auto stmt = std::move(prepared.value());
    sqlite3_bind_int64(stmt.get(), 1, to_millis(now));
    sqlite3_bind_int64(stmt.get(), 2, to_millis(now));
    detail::bind_text(stmt.get(), 3, tenant_id);
    detail::bind_text(stmt.get(), 4, entity_type);
    detail::bind_text(stmt.get(), 5, entity_id);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        return detail::query_void_error(db_, "Failed to delete entity");
    }
    if (sqlite3_changes(db_) == 0) {
        return tenantguard_void_error(
            error_codes::entity_not_found,
            compat::format("No active entity {}/{}", entity_type, entity_id));
    }
    return ok();
}

auto sqlite_entity_store::mark_purge_eligible(
    std::string_view tenant_id, std::chrono::system_clock::time_point deleted_before)
    -> Result<std::size_t> {
    std::lock_guard lock(mutex_);

    auto prepared = detail::prepare(db_, R"(
        UPDATE entities SET state = 'purge_eligible'
        WHERE tenant_id = ? AND state = 'soft_deleted' AND deleted_at < ?;
    )");
    if (prepared.is_err()) {
        return prepared.error();
    }
    auto stmt = std::move(prepared.value());
    detail::bind_text(stmt.get(), 1, tenant_id);
    sqlite3_bind_int64(stmt.get(), 2, to_millis(deleted_before));

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        return detail::query_error<std::size_t>(db_, "Failed to mark entities for purge");
    }
    return static_cast<std::size_t>(sqlite3_changes(db_));
}

} // namespace tenantguard::storage
