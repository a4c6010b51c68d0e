/**
 * @file sqlite_audit_store.hpp
 * @brief SQLite implementation of the audit log
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <tenantguard/audit/audit_store_interface.hpp>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

// Forward declaration for SQLite3
struct sqlite3;

namespace tenantguard::storage {

/**
 * @brief SQLite backend for audit entries
 *
 * Table: audit_log, primary key (tenant_id, sequence). An update trigger
 * rejects any modification of stored rows.
 */
class sqlite_audit_store : public audit::audit_store_interface {
public:
    /**
     * @param db_path Database file or ":memory:"
     * @param busy_timeout Lock wait before a write fails
     */
    [[nodiscard]] static auto open(const std::string& db_path,
                                   std::chrono::milliseconds busy_timeout =
                                       std::chrono::milliseconds(2000))
        -> Result<std::unique_ptr<sqlite_audit_store>>;

    ~sqlite_audit_store() override;

    [[nodiscard]] auto append(const audit::audit_record& record) -> VoidResult override;

    [[nodiscard]] auto query(const audit::audit_query& query)
        -> Result<std::vector<audit::audit_record>> override;

    [[nodiscard]] auto last_entry(std::string_view tenant_id)
        -> Result<std::optional<audit::audit_record>> override;

    [[nodiscard]] auto delete_before(std::string_view tenant_id,
                                     std::chrono::system_clock::time_point cutoff)
        -> Result<std::size_t> override;

private:
    explicit sqlite_audit_store(sqlite3* db);

    [[nodiscard]] auto initialize_tables() -> VoidResult;

    sqlite3* db_{nullptr};
    std::mutex mutex_;
};

} // namespace tenantguard::storage
