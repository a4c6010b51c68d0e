/**
 * @file sqlite_audit_store.cpp
 * @brief Implementation of the SQLite audit log
 *
 * @copyright Copyright (c) 2025
 */

#include <tenantguard/storage/sqlite_audit_store.hpp>

#include "sqlite_support.hpp"

#include <tenantguard/audit/audit_codec.hpp>

#include <nlohmann/json.hpp>

#include <sstream>
#include <variant>

namespace tenantguard::storage {

using namespace audit;

namespace {

constexpr const char* select_columns =
    "SELECT tenant_id, sequence, timestamp_ms, event_type, severity, principal_id, "
    "resource, action, decision, rule_id, reason, session_id, policy_version, "
    "metadata, prev_hash, entry_hash FROM audit_log";

auto parse_audit_row(sqlite3_stmt* stmt) -> Result<audit_record> {
    audit_record record;
    record.tenant_id = detail::column_text(stmt, 0);
    record.sequence = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 1));
    record.timestamp = from_millis(sqlite3_column_int64(stmt, 2));

    auto type = parse_audit_event_type(detail::column_text(stmt, 3));
    auto severity = parse_audit_severity(detail::column_text(stmt, 4));
    if (!type || !severity) {
        return tenantguard_error<audit_record>(
            error_codes::database_query_error,
            compat::format("Audit row {} holds unknown enum value", record.sequence));
    }
    record.event_type = *type;
    record.severity = *severity;

    record.principal_id = detail::column_text(stmt, 5);
    record.resource = detail::column_text(stmt, 6);
    record.action = detail::column_text(stmt, 7);
    record.decision = detail::column_text(stmt, 8);
    record.rule_id = detail::column_text(stmt, 9);
    record.reason = detail::column_text(stmt, 10);
    record.session_id = detail::column_text(stmt, 11);
    record.policy_version = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 12));

    auto metadata = nlohmann::json::parse(detail::column_text(stmt, 13), nullptr, false);
    if (metadata.is_discarded() || !metadata.is_object()) {
        return tenantguard_error<audit_record>(
            error_codes::database_query_error,
            compat::format("Audit row {} holds malformed metadata", record.sequence));
    }
    for (auto it = metadata.begin(); it != metadata.end(); ++it) {
        if (it.value().is_string()) {
            record.metadata[it.key()] = it.value().get<std::string>();
        }
    }

    record.prev_hash = detail::column_text(stmt, 14);
    record.entry_hash = detail::column_text(stmt, 15);
    return record;
}

} // namespace

auto sqlite_audit_store::open(const std::string& db_path,
                              std::chrono::milliseconds busy_timeout)
    -> Result<std::unique_ptr<sqlite_audit_store>> {
    auto db = detail::open_database(db_path);
    if (db.is_err()) {
        return db.error();
    }
    sqlite3_busy_timeout(db.value(), static_cast<int>(busy_timeout.count()));

    auto instance =
        std::unique_ptr<sqlite_audit_store>(new sqlite_audit_store(db.value()));
    auto init = instance->initialize_tables();
    if (init.is_err()) {
        return init.error();
    }
    return instance;
}

sqlite_audit_store::sqlite_audit_store(sqlite3* db) : db_(db) {}

sqlite_audit_store::~sqlite_audit_store() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

auto sqlite_audit_store::initialize_tables() -> VoidResult {
    return detail::exec(db_, R"(
        CREATE TABLE IF NOT EXISTS audit_log (
            tenant_id      TEXT    NOT NULL,
            sequence       INTEGER NOT NULL,
            timestamp_ms   INTEGER NOT NULL,
            event_type     TEXT    NOT NULL,
            severity       TEXT    NOT NULL,
            principal_id   TEXT    NOT NULL DEFAULT '',
            resource       TEXT    NOT NULL DEFAULT '',
            action         TEXT    NOT NULL DEFAULT '',
            decision       TEXT    NOT NULL DEFAULT '',
            rule_id        TEXT    NOT NULL DEFAULT '',
            reason         TEXT    NOT NULL DEFAULT '',
            session_id     TEXT    NOT NULL DEFAULT '',
            policy_version INTEGER NOT NULL DEFAULT 0,
            metadata       TEXT    NOT NULL DEFAULT '{}',
            prev_hash      TEXT    NOT NULL DEFAULT '',
            entry_hash     TEXT    NOT NULL,
            PRIMARY KEY (tenant_id, sequence)
        );
        CREATE INDEX IF NOT EXISTS idx_audit_principal
            ON audit_log(tenant_id, principal_id);
        CREATE INDEX IF NOT EXISTS idx_audit_timestamp
            ON audit_log(tenant_id, timestamp_ms);
        CREATE TRIGGER IF NOT EXISTS audit_log_append_only
            BEFORE UPDATE ON audit_log
        BEGIN
            SELECT RAISE(ABORT, 'audit_log is append-only');
        END;
    )", "Failed to init tables");
}

auto sqlite_audit_store::append(const audit_record& record) -> VoidResult {
    std::lock_guard lock(mutex_);

    auto prepared = detail::prepare(db_, R"(
        INSERT INTO audit_log (
            tenant_id, sequence, timestamp_ms, event_type, severity,
            principal_id, resource, action, decision, rule_id, reason,
            session_id, policy_version, metadata, prev_hash, entry_hash
        ) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
    )");
    if (prepared.is_err()) {
        return prepared.error();
    }
    auto stmt = std::move(prepared.value());

    auto metadata = nlohmann::json(record.metadata).dump();
    detail::bind_text(stmt.get(), 1, record.tenant_id);
    sqlite3_bind_int64(stmt.get(), 2, static_cast<sqlite3_int64>(record.sequence));
    sqlite3_bind_int64(stmt.get(), 3, to_millis(record.timestamp));
    detail::bind_text(stmt.get(), 4, to_string(record.event_type));
    detail::bind_text(stmt.get(), 5, to_string(record.severity));
    detail::bind_text(stmt.get(), 6, record.principal_id);
    detail::bind_text(stmt.get(), 7, record.resource);
    detail::bind_text(stmt.get(), 8, record.action);
    detail::bind_text(stmt.get(), 9, record.decision);
    detail::bind_text(stmt.get(), 10, record.rule_id);
    detail::bind_text(stmt.get(), 11, record.reason);
    detail::bind_text(stmt.get(), 12, record.session_id);
    sqlite3_bind_int64(stmt.get(), 13, static_cast<sqlite3_int64>(record.policy_version));
    detail::bind_text(stmt.get(), 14, metadata);
    detail::bind_text(stmt.get(), 15, record.prev_hash);
    detail::bind_text(stmt.get(), 16, record.entry_hash);

    auto rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_CONSTRAINT) {
        return tenantguard_void_error(
            error_codes::audit_sequence_conflict,
            compat::format("Audit sequence {} already stored", record.sequence),
            record.tenant_id);
    }
    if (rc != SQLITE_DONE) {
        return tenantguard_void_error(
            error_codes::audit_write_failed,
            compat::format("Failed to insert audit log: {}", sqlite3_errmsg(db_)),
            record.tenant_id);
    }
    return ok();
}

auto sqlite_audit_store::query(const audit_query& query)
    -> Result<std::vector<audit_record>> {
    std::lock_guard lock(mutex_);

    std::ostringstream sql;
    sql << select_columns << " WHERE tenant_id = ?";

    std::vector<std::variant<std::string, std::int64_t>> params;
    params.emplace_back(query.tenant_id);

    if (query.principal_id) {
        sql << " AND principal_id = ?";
        params.emplace_back(*query.principal_id);
    }
    if (query.decision) {
        sql << " AND decision = ?";
        params.emplace_back(*query.decision);
    }
    if (query.event_type) {
        sql << " AND event_type = ?";
        params.emplace_back(to_string(*query.event_type));
    }
    if (query.from_sequence) {
        sql << " AND sequence >= ?";
        params.emplace_back(static_cast<std::int64_t>(*query.from_sequence));
    }
    if (query.to_sequence) {
        sql << " AND sequence <= ?";
        params.emplace_back(static_cast<std::int64_t>(*query.to_sequence));
    }
    if (query.since) {
        sql << " AND timestamp_ms >= ?";
        params.emplace_back(to_millis(*query.since));
    }
    if (query.until) {
        sql << " AND timestamp_ms <= ?";
        params.emplace_back(to_millis(*query.until));
    }

    sql << " ORDER BY sequence ASC";
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

    for (std::size_t i = 0; i < params.size(); ++i) {
        auto index = static_cast<int>(i + 1);
        if (const auto* s = std::get_if<std::string>(&params[i])) {
            detail::bind_text(stmt.get(), index, *s);
        } else {
            sqlite3_bind_int64(stmt.get(), index, std::get<std::int64_t>(params[i]));
        }
    }

    std::vector<audit_record> results;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        auto record = parse_audit_row(stmt.get());
        if (record.is_err()) {
            return record.error();
        }
        results.push_back(std::move(record.value()));
    }
    if (rc != SQLITE_DONE) {
        return detail::query_error<std::vector<audit_record>>(db_,
                                                              "Failed to query audit log");
    }
    return results;
}

auto sqlite_audit_store::last_entry(std::string_view tenant_id)
    -> Result<std::optional<audit_record>> {
    std::lock_guard lock(mutex_);

    auto sql = std::string(select_columns) +
               " WHERE tenant_id = ? ORDER BY sequence DESC LIMIT 1;";
    auto prepared = detail::prepare(db_, sql.c_str());
    if (prepared.is_err()) {
        return prepared.error();
    }
    auto stmt = std::move(prepared.value());
    detail::bind_text(stmt.get(), 1, tenant_id);

    auto rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) {
        return std::optional<audit_record>{};
    }
    if (rc != SQLITE_ROW) {
        return detail::query_error<std::optional<audit_record>>(
            db_, "Failed to read last audit entry");
    }
    auto record = parse_audit_row(stmt.get());
    if (record.is_err()) {
        return record.error();
    }
    return std::optional<audit_record>(std::move(record.value()));
}

auto sqlite_audit_store::delete_before(std::string_view tenant_id,
                                       std::chrono::system_clock::time_point cutoff)
    -> Result<std::size_t> {
    std::lock_guard lock(mutex_);

    auto prepared = detail::prepare(
        db_, "DELETE FROM audit_log WHERE tenant_id = ? AND timestamp_ms < ?;");
    if (prepared.is_err()) {
        return prepared.error();
    }
    auto stmt = std::move(prepared.value());
    detail::bind_text(stmt.get(), 1, tenant_id);
    sqlite3_bind_int64(stmt.get(), 2, to_millis(cutoff));

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        return detail::query_error<std::size_t>(db_, "Failed to cleanup old audit logs");
    }
    return static_cast<std::size_t>(sqlite3_changes(db_));
}

} // namespace tenantguard::storage
