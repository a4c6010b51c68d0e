/**
 * @file policy_set.hpp
 * @brief Immutable, versioned policy snapshot for one industry
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include "grant.hpp"
#include "role_graph.hpp"
#include "tenant.hpp"

#include <tenantguard/core/result.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace tenantguard::security {

/**
 * @brief Minimum authentication strength for a sensitivity level
 */
struct sensitivity_requirement {
    std::uint8_t level{1};
    std::uint8_t min_mfa_level{0};
    std::uint8_t min_device_trust{0};
};

/// Sensitivity level from which MFA is always required
constexpr std::uint8_t mfa_forced_sensitivity = 5;

/**
 * @brief Parsed (not yet validated) policy document
 */
struct policy_document {
    industry_vertical industry{industry_vertical::home_services};
    std::uint64_t version{0};

    std::vector<role_definition> roles;

    /// Declared resource types and the actions each supports
    std::map<std::string, std::set<std::string>> resources;

    std::vector<grant> grants;

    std::vector<sensitivity_requirement> sensitivity;

    /// Financial / critical actions whose denials are audited synchronously
    std::set<std::string> critical_actions;
};

/**
 * @brief Compiled policy snapshot
 *
 * Instances are immutable after compile() and shared between readers via
 * std::shared_ptr<const policy_set>. Effective permissions are a pure
 * function of the snapshot and the requested roles.
 */
class policy_set {
public:
    /**
     * @brief Validate and compile a document
     * @param document Parsed document
     * @param diagnostics Receives every validation finding
     * @return The snapshot, or nullptr when validation failed
     */
    [[nodiscard]] static auto compile(policy_document document,
                                      std::vector<policy_diagnostic>& diagnostics)
        -> std::shared_ptr<const policy_set>;

    [[nodiscard]] auto industry() const noexcept -> industry_vertical { return industry_; }
    [[nodiscard]] auto version() const noexcept -> std::uint64_t { return version_; }
    [[nodiscard]] auto roles() const noexcept -> const role_graph& { return graph_; }
    [[nodiscard]] auto grant_count() const noexcept -> std::size_t { return grant_count_; }

    /**
     * @brief Effective permissions for a base role plus optional industry role
     *
     * Breadth-first over the inheritance graph from both roles. For each
     * (resource_type, action) the grant of the closest role wins; distinct
     * grants at equal distance yield an ambiguous (never qualifying) entry.
     *
     * @return Sorted by (resource_type, action), or policy_undefined_role
     */
    [[nodiscard]] auto effective_permissions(std::string_view role,
                                             std::string_view industry_role = {}) const
        -> Result<std::vector<effective_grant>>;

    [[nodiscard]] bool has_role(std::string_view name) const {
        return graph_.find(name).has_value();
    }

    /**
     * @brief Idle timeout for a role; the shortest of base and industry role
     */
    [[nodiscard]] auto idle_timeout(std::string_view role,
                                    std::string_view industry_role = {}) const
        -> std::optional<std::chrono::seconds>;

    /**
     * @brief Requirement for a sensitivity level, with the MFA floor applied
     */
    [[nodiscard]] auto requirement_for(std::uint8_t sensitivity) const
        -> sensitivity_requirement;

    [[nodiscard]] bool is_critical_action(std::string_view action) const;

    [[nodiscard]] bool is_declared(std::string_view resource_type,
                                   std::string_view action) const;

private:
    policy_set() = default;

    industry_vertical industry_{industry_vertical::home_services};
    std::uint64_t version_{0};
    role_graph graph_;
    std::vector<std::vector<grant>> grants_by_role_;
    std::map<std::string, std::set<std::string>, std::less<>> resources_;
    std::map<std::uint8_t, sensitivity_requirement> sensitivity_;
    std::set<std::string, std::less<>> critical_actions_;
    std::size_t grant_count_{0};
};

} // namespace tenantguard::security
