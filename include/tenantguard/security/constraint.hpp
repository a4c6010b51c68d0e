/**
 * @file constraint.hpp
 * @brief Contextual constraints narrowing when a grant applies
 *
 * Constraints are a closed set of typed payloads held in a std::variant so
 * that every evaluation site handles every kind. All constraints of a grant
 * are conjunctive.
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include "access_request.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tenantguard::security {

/**
 * @brief Constraint category, the only detail surfaced on a failed check
 */
enum class constraint_category {
    geo_scope,
    time_window,
    mfa_required,
    device_trust,
    approval_ceiling,
    owner_only
};

constexpr std::string_view to_string(constraint_category category) {
    switch (category) {
        case constraint_category::geo_scope: return "geo_scope";
        case constraint_category::time_window: return "time_window";
        case constraint_category::mfa_required: return "mfa_required";
        case constraint_category::device_trust: return "device_trust";
        case constraint_category::approval_ceiling: return "approval_ceiling";
        case constraint_category::owner_only: return "owner_only";
    }
    return "unknown";
}

/**
 * @brief Allowed / blocked countries and regions
 *
 * Empty allow lists place no restriction; block lists always apply.
 */
struct geo_scope {
    std::vector<std::string> allowed_countries;
    std::vector<std::string> blocked_countries;
    std::vector<std::string> allowed_regions;

    bool operator==(const geo_scope& other) const = default;
};

/**
 * @brief Day-of-week and time-of-day window
 *
 * Days use bit 0 for Sunday through bit 6 for Saturday. When end_minute is
 * not after start_minute the window wraps past midnight.
 */
struct time_window {
    std::uint8_t days_mask{0x7F};
    std::uint16_t start_minute{0};
    std::uint16_t end_minute{24 * 60};
    std::int16_t utc_offset_minutes{0};

    bool operator==(const time_window& other) const = default;
};

struct mfa_requirement {
    std::uint8_t min_level{1};

    bool operator==(const mfa_requirement& other) const = default;
};

struct device_trust_requirement {
    std::uint8_t min_level{1};

    bool operator==(const device_trust_requirement& other) const = default;
};

/**
 * @brief Upper bound on the resource's monetary value (minor units)
 *
 * A resource without a monetary value fails this constraint.
 */
struct approval_ceiling {
    std::int64_t max_amount{0};

    bool operator==(const approval_ceiling& other) const = default;
};

/**
 * @brief Grant applies only to resources whose owner attribute names the
 *        acting principal
 */
struct owner_only {
    std::string attribute{"assigned_to"};

    bool operator==(const owner_only& other) const = default;
};

using constraint = std::variant<geo_scope, time_window, mfa_requirement,
                                device_trust_requirement, approval_ceiling,
                                owner_only>;

/**
 * @brief Category of a constraint value
 */
[[nodiscard]] auto category_of(const constraint& c) -> constraint_category;

/**
 * @brief Evaluate one constraint against a request
 * @param c Constraint to evaluate
 * @param principal_id Acting principal
 * @param resource Target resource
 * @param ctx Request context
 * @return true when the constraint holds
 */
[[nodiscard]] auto evaluate_constraint(const constraint& c,
                                       std::string_view principal_id,
                                       const resource_ref& resource,
                                       const request_context& ctx) -> bool;

/**
 * @brief Validate a constraint payload
 * @return Description of the problem, or nullopt if well-formed
 */
[[nodiscard]] auto validate_constraint(const constraint& c)
    -> std::optional<std::string>;

/**
 * @brief Result of evaluating a conjunctive constraint set
 */
struct constraint_check {
    bool satisfied{true};
    std::optional<constraint_category> failed;
};

/**
 * @brief Evaluate every constraint, stopping at the first failure
 */
[[nodiscard]] auto evaluate_constraints(const std::vector<constraint>& constraints,
                                        std::string_view principal_id,
                                        const resource_ref& resource,
                                        const request_context& ctx)
    -> constraint_check;

} // namespace tenantguard::security
