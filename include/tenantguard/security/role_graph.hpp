/**
 * @file role_graph.hpp
 * @brief Role inheritance graph (arena-indexed DAG)
 *
 * Roles are stored in a flat arena and referenced by integer id. Parent
 * edges point from a role to the roles it inherits from. The graph is
 * immutable once built, so it can be shared by policy snapshots.
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include "grant.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tenantguard::security {

using role_id = std::uint32_t;

/**
 * @brief Role as declared in a policy document
 */
struct role_definition {
    std::string name;
    std::vector<std::string> inherits;

    /// Idle timeout applied to sessions acting under this role
    std::chrono::seconds idle_timeout{std::chrono::minutes(30)};

    /// Industry extension role rather than a base role
    bool industry_role{false};
};

class role_graph {
public:
    struct node {
        std::string name;
        std::vector<role_id> parents;
        std::chrono::seconds idle_timeout{std::chrono::minutes(30)};
        bool industry_role{false};
    };

    role_graph() = default;

    /**
     * @brief Build and validate the graph
     *
     * Reports duplicate roles, undefined parents and every inheritance
     * cycle (naming the roles on it) into @p diagnostics.
     *
     * @return The graph, or nullopt when any diagnostic was produced
     */
    [[nodiscard]] static auto build(const std::vector<role_definition>& definitions,
                                    std::vector<policy_diagnostic>& diagnostics)
        -> std::optional<role_graph>;

    [[nodiscard]] auto find(std::string_view name) const -> std::optional<role_id>;

    [[nodiscard]] auto at(role_id id) const -> const node& { return nodes_.at(id); }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return nodes_.size(); }

    /**
     * @brief Roles in topological order, ancestors before descendants
     */
    [[nodiscard]] auto topological_order() const noexcept
        -> const std::vector<role_id>& {
        return topo_order_;
    }

    /**
     * @brief Breadth-first walk from a role up through its ancestors
     * @return (role, distance) pairs, starting with (id, 0); each role once
     *         at its shortest distance
     */
    [[nodiscard]] auto ancestors(role_id id) const
        -> std::vector<std::pair<role_id, std::uint32_t>>;

private:
    std::vector<node> nodes_;
    std::unordered_map<std::string, role_id> index_;
    std::vector<role_id> topo_order_;
};

} // namespace tenantguard::security
