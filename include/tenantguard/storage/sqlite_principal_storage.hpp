/**
 * @file sqlite_principal_storage.hpp
 * @brief SQLite implementation of the principal directory
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <tenantguard/security/principal_store_interface.hpp>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Forward declaration for SQLite3
struct sqlite3;

namespace tenantguard::storage {

/**
 * @brief SQLite backend for principals and tenants
 */
class sqlite_principal_storage : public security::principal_store_interface {
public:
    [[nodiscard]] static auto open(const std::string& db_path)
        -> Result<std::unique_ptr<sqlite_principal_storage>>;

    ~sqlite_principal_storage() override;

    // Principal management
    [[nodiscard]] auto create_principal(const security::principal& p)
        -> VoidResult override;
    [[nodiscard]] auto get_principal(std::string_view id)
        -> Result<security::principal> override;
    [[nodiscard]] auto update_principal(const security::principal& p)
        -> VoidResult override;
    [[nodiscard]] auto delete_principal(std::string_view id) -> VoidResult override;
    [[nodiscard]] auto get_principals_by_tenant(std::string_view tenant_id)
        -> Result<std::vector<security::principal>> override;

    // Tenant management
    [[nodiscard]] auto create_tenant(const security::tenant& t) -> VoidResult override;
    [[nodiscard]] auto get_tenant(std::string_view id)
        -> Result<security::tenant> override;
    [[nodiscard]] auto update_tenant(const security::tenant& t) -> VoidResult override;

private:
    explicit sqlite_principal_storage(sqlite3* db);

    [[nodiscard]] auto initialize_tables() -> VoidResult;
    [[nodiscard]] auto write_principal(const security::principal& p, bool replace)
        -> VoidResult;
    [[nodiscard]] auto load_principal(std::string_view id) -> Result<security::principal>;

    sqlite3* db_{nullptr};
    std::mutex mutex_;
};

} // namespace tenantguard::storage
