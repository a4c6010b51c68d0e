/**
 * @file grant.hpp
 * @brief Permission grant definitions for RBAC
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include "constraint.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace tenantguard::security {

/**
 * @brief A (role, resource_type, action, constraints) permission tuple
 */
struct grant {
    std::string rule_id;
    std::string role;
    std::string resource_type;
    std::string action;
    std::vector<constraint> constraints;

    /// Permits reading soft-deleted rows through the isolation gate
    bool include_deleted{false};

    /// Usable by API partners under an explicit multi-tenant grant
    bool cross_tenant{false};

    [[nodiscard]] bool matches(const std::string& type,
                               const std::string& verb) const {
        return resource_type == type && action == verb;
    }

    bool operator==(const grant& other) const = default;
};

/**
 * @brief A grant as seen from a requesting role after inheritance
 */
struct effective_grant {
    grant source;

    /// Inheritance distance from the requesting role (0 = own grant)
    std::uint32_t distance{0};

    /// Set when equally specific roles disagree; never qualifies
    bool ambiguous{false};

    bool operator==(const effective_grant& other) const = default;
};

/**
 * @brief Diagnostic codes reported by policy validation
 */
enum class diagnostic_code {
    parse_error,
    invalid_document,
    duplicate_role,
    undefined_role,
    cycle_detected,
    undefined_resource,
    undefined_action,
    duplicate_rule,
    invalid_constraint,
    stale_version
};

constexpr std::string_view to_string(diagnostic_code code) {
    switch (code) {
        case diagnostic_code::parse_error: return "parse_error";
        case diagnostic_code::invalid_document: return "invalid_document";
        case diagnostic_code::duplicate_role: return "duplicate_role";
        case diagnostic_code::undefined_role: return "undefined_role";
        case diagnostic_code::cycle_detected: return "cycle_detected";
        case diagnostic_code::undefined_resource: return "undefined_resource";
        case diagnostic_code::undefined_action: return "undefined_action";
        case diagnostic_code::duplicate_rule: return "duplicate_rule";
        case diagnostic_code::invalid_constraint: return "invalid_constraint";
        case diagnostic_code::stale_version: return "stale_version";
    }
    return "unknown";
}

/**
 * @brief One validation finding
 *
 * For cycle_detected, subjects lists the roles on the cycle in
 * inheritance order.
 */
struct policy_diagnostic {
    diagnostic_code code{diagnostic_code::invalid_document};
    std::string message;
    std::vector<std::string> subjects;
};

} // namespace tenantguard::security
