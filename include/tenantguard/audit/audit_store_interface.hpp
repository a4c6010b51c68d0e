/**
 * @file audit_store_interface.hpp
 * @brief Storage interface for the append-only audit log
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include "audit_record.hpp"

#include <tenantguard/core/result.hpp>

#include <chrono>
#include <optional>
#include <string_view>
#include <vector>

namespace tenantguard::audit {

/**
 * @brief Abstract interface for audit persistence
 *
 * Entries are never updated. append() fails with audit_sequence_conflict
 * when (tenant_id, sequence) is already stored.
 */
class audit_store_interface {
public:
    virtual ~audit_store_interface() = default;

    [[nodiscard]] virtual auto append(const audit_record& record) -> VoidResult = 0;

    /// Ordered by sequence
    [[nodiscard]] virtual auto query(const audit_query& query)
        -> Result<std::vector<audit_record>> = 0;

    /// Highest-sequence entry of a tenant
    [[nodiscard]] virtual auto last_entry(std::string_view tenant_id)
        -> Result<std::optional<audit_record>> = 0;

    /**
     * @brief Delete a tenant's entries older than a cutoff
     * @return Number of entries deleted
     */
    [[nodiscard]] virtual auto delete_before(std::string_view tenant_id,
                                             std::chrono::system_clock::time_point cutoff)
        -> Result<std::size_t> = 0;

protected:
    audit_store_interface() = default;
    audit_store_interface(const audit_store_interface&) = delete;
    audit_store_interface& operator=(const audit_store_interface&) = delete;
    audit_store_interface(audit_store_interface&&) = default;
    audit_store_interface& operator=(audit_store_interface&&) = default;
};

} // namespace tenantguard::audit
