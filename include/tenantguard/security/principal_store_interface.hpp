/**
 * @file principal_store_interface.hpp
 * @brief Storage interface for principals, tenant bindings and tenants
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include "principal.hpp"
#include "tenant.hpp"

#include <tenantguard/core/result.hpp>

#include <string_view>
#include <vector>

namespace tenantguard::security {

/**
 * @brief Abstract interface for the principal directory
 */
class principal_store_interface {
public:
    virtual ~principal_store_interface() = default;

    // Principal management
    [[nodiscard]] virtual auto create_principal(const principal& p) -> VoidResult = 0;
    [[nodiscard]] virtual auto get_principal(std::string_view id) -> Result<principal> = 0;
    [[nodiscard]] virtual auto update_principal(const principal& p) -> VoidResult = 0;
    [[nodiscard]] virtual auto delete_principal(std::string_view id) -> VoidResult = 0;

    /// Principals holding an active binding to a tenant
    [[nodiscard]] virtual auto get_principals_by_tenant(std::string_view tenant_id)
        -> Result<std::vector<principal>> = 0;

    // Tenant management
    [[nodiscard]] virtual auto create_tenant(const tenant& t) -> VoidResult = 0;
    [[nodiscard]] virtual auto get_tenant(std::string_view id) -> Result<tenant> = 0;
    [[nodiscard]] virtual auto update_tenant(const tenant& t) -> VoidResult = 0;

protected:
    principal_store_interface() = default;
    principal_store_interface(const principal_store_interface&) = delete;
    principal_store_interface& operator=(const principal_store_interface&) = delete;
    principal_store_interface(principal_store_interface&&) = default;
    principal_store_interface& operator=(principal_store_interface&&) = default;
};

} // namespace tenantguard::security
