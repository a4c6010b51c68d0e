/**
 * @file entity_store_interface.hpp
 * @brief Storage interface for tenant-scoped entities
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include "entity_record.hpp"

#include <tenantguard/core/result.hpp>

#include <chrono>
#include <optional>
#include <string_view>
#include <vector>

namespace tenantguard::isolation {

/**
 * @brief Abstract interface for entity persistence
 *
 * Every operation takes the tenant explicitly and must restrict itself to
 * rows of that tenant. Entities are keyed by (entity_type, entity_id)
 * across all tenants, so an id can never be claimed by a second tenant.
 */
class entity_store_interface {
public:
    virtual ~entity_store_interface() = default;

    /**
     * @brief Rows of one tenant matching the query
     *
     * query.tenant_id is ignored; soft-deleted rows are returned only when
     * query.include_deleted is set.
     */
    [[nodiscard]] virtual auto find(std::string_view tenant_id, const entity_query& query)
        -> Result<std::vector<entity_record>> = 0;

    /**
     * @brief Insert a new row or replace the payload of an active one
     *
     * @return The stored row, tenant_immutable if the key belongs to another
     *         tenant, or entity_not_found if the row is no longer active
     */
    [[nodiscard]] virtual auto upsert(std::string_view tenant_id,
                                      const entity_mutation& mutation,
                                      std::chrono::system_clock::time_point now)
        -> Result<entity_record> = 0;

    /**
     * @brief Transition an active row to soft_deleted
     * @return entity_not_found unless an active row of the tenant matches
     */
    [[nodiscard]] virtual auto soft_delete(std::string_view tenant_id,
                                           std::string_view entity_type,
                                           std::string_view entity_id,
                                           std::chrono::system_clock::time_point now)
        -> VoidResult = 0;

    /**
     * @brief Transition soft-deleted rows deleted before the cutoff
     * @return Number of rows transitioned
     */
    [[nodiscard]] virtual auto mark_purge_eligible(
        std::string_view tenant_id, std::chrono::system_clock::time_point deleted_before)
        -> Result<std::size_t> = 0;

protected:
    entity_store_interface() = default;
    entity_store_interface(const entity_store_interface&) = delete;
    entity_store_interface& operator=(const entity_store_interface&) = delete;
    entity_store_interface(entity_store_interface&&) = default;
    entity_store_interface& operator=(entity_store_interface&&) = default;
};

} // namespace tenantguard::isolation
