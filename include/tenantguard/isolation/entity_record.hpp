/**
 * @file entity_record.hpp
 * @brief Tenant-scoped entity rows and the operations on them
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace tenantguard::isolation {

/**
 * @brief Deletion lifecycle of an entity row
 *
 * active -> soft_deleted -> purge_eligible. The purge itself happens
 * outside the engine.
 */
enum class entity_state { active, soft_deleted, purge_eligible };

[[nodiscard]] inline auto to_string(entity_state state) -> std::string {
    switch (state) {
        case entity_state::active:
            return "active";
        case entity_state::soft_deleted:
            return "soft_deleted";
        case entity_state::purge_eligible:
            return "purge_eligible";
        default:
            return "unknown";
    }
}

[[nodiscard]] inline auto parse_entity_state(std::string_view str)
    -> std::optional<entity_state> {
    if (str == "active") {
        return entity_state::active;
    }
    if (str == "soft_deleted") {
        return entity_state::soft_deleted;
    }
    if (str == "purge_eligible") {
        return entity_state::purge_eligible;
    }
    return std::nullopt;
}

/**
 * @brief A generic business entity owned by exactly one tenant
 *
 * tenant_id is set on creation and never changes.
 */
struct entity_record {
    std::string tenant_id;
    std::string entity_type;
    std::string entity_id;

    /// Serialized JSON object
    std::string payload{"{}"};

    entity_state state{entity_state::active};

    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point updated_at;
    std::optional<std::chrono::system_clock::time_point> deleted_at;

    [[nodiscard]] bool is_active() const noexcept { return state == entity_state::active; }
};

/**
 * @brief Read request; the tenant is supplied by the gate
 */
struct entity_query {
    std::string entity_type;

    /// Single entity, or every entity of the type when empty
    std::optional<std::string> entity_id;

    /// Target tenant other than the session's (needs a cross-tenant grant)
    std::optional<std::string> tenant_id;

    /// Also return soft-deleted and purge-eligible rows
    bool include_deleted{false};

    /// Maximum number of results to return (0 = unlimited)
    std::size_t limit{0};
};

/**
 * @brief Create or replace the payload of an entity
 */
struct entity_mutation {
    std::string entity_type;
    std::string entity_id;
    std::string payload{"{}"};

    /// Target tenant other than the session's (needs a cross-tenant grant)
    std::optional<std::string> tenant_id;
};

/**
 * @brief Identifies the entity to remove
 */
struct entity_ref {
    std::string entity_type;
    std::string entity_id;

    /// Target tenant other than the session's (needs a cross-tenant grant)
    std::optional<std::string> tenant_id;
};

} // namespace tenantguard::isolation
