/**
 * @file access_decision.hpp
 * @brief Outcome of an authorization check
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include "constraint.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tenantguard::security {

enum class decision : std::uint8_t { allow, deny };

constexpr std::string_view to_string(decision d) {
    return d == decision::allow ? "allow" : "deny";
}

/**
 * @brief Why a decision was reached
 */
enum class reason_code : std::uint8_t {
    granted,
    unauthenticated,
    no_tenant_binding,
    constraint_failed,
    no_grant,
    policy_error,
    audit_write_failed,
    session_expired,
    session_revoked,
    tenant_inactive
};

constexpr std::string_view to_string(reason_code reason) {
    switch (reason) {
        case reason_code::granted: return "granted";
        case reason_code::unauthenticated: return "unauthenticated";
        case reason_code::no_tenant_binding: return "no_tenant_binding";
        case reason_code::constraint_failed: return "constraint_failed";
        case reason_code::no_grant: return "no_grant";
        case reason_code::policy_error: return "policy_error";
        case reason_code::audit_write_failed: return "audit_write_failed";
        case reason_code::session_expired: return "session_expired";
        case reason_code::session_revoked: return "session_revoked";
        case reason_code::tenant_inactive: return "tenant_inactive";
    }
    return "unknown";
}

/**
 * @brief How one candidate grant fared during evaluation
 */
struct grant_trace_entry {
    std::string rule_id;
    std::uint32_t distance{0};
    bool ambiguous{false};
    bool qualified{false};

    /// Set when the grant lacks the cross_tenant flag in a cross-tenant check
    bool cross_tenant_blocked{false};

    std::optional<constraint_category> failed;

    /// Set instead of rule_id when a partner binding's role is not defined
    /// in the target tenant's policy
    std::string skipped_role;
};

/**
 * @brief Result of an access check
 */
struct access_decision {
    decision outcome{decision::deny};
    reason_code reason{reason_code::no_grant};

    /// Category of the failed constraint, for constraint_failed only
    std::optional<constraint_category> failed_constraint;

    std::string rule_id;
    std::uint64_t policy_version{0};

    /// Allowed through the API-partner multi-tenant exception
    bool cross_tenant{false};

    /// Some qualifying grant carries the include_deleted privilege
    bool include_deleted{false};

    /// Subject the decision was issued for
    std::string principal_id;
    std::string tenant_id;
    std::string resource_type;
    std::string action;

    /// Issuer MAC over subject and outcome; empty unless the evaluator sealed it
    std::string seal;

    /// Evaluated grants in evaluation order, for owner tooling
    std::vector<grant_trace_entry> trace;

    static access_decision allow(std::string rule_id, std::uint64_t version) {
        access_decision d;
        d.outcome = decision::allow;
        d.reason = reason_code::granted;
        d.rule_id = std::move(rule_id);
        d.policy_version = version;
        return d;
    }

    static access_decision deny(reason_code reason, std::uint64_t version = 0) {
        access_decision d;
        d.reason = reason;
        d.policy_version = version;
        return d;
    }

    static access_decision deny_constraint(constraint_category category,
                                           std::uint64_t version) {
        auto d = deny(reason_code::constraint_failed, version);
        d.failed_constraint = category;
        return d;
    }

    /**
     * @brief Turn into a deny, keeping subject, policy version and trace
     */
    void downgrade(reason_code why) {
        outcome = decision::deny;
        reason = why;
        failed_constraint.reset();
        rule_id.clear();
        cross_tenant = false;
        include_deleted = false;
        seal.clear();
    }

    [[nodiscard]] bool allowed() const noexcept { return outcome == decision::allow; }

    explicit operator bool() const noexcept { return allowed(); }

    /**
     * @brief Full reason code, e.g. "constraint_failed:approval_ceiling"
     */
    [[nodiscard]] auto reason_string() const -> std::string {
        std::string text(to_string(reason));
        if (failed_constraint) {
            text += ":";
            text += to_string(*failed_constraint);
        }
        return text;
    }

    /**
     * @brief Reason as shown to the business caller
     *
     * Binding, tenant status, authentication and policy failures collapse
     * to a generic "denied"; constraint failures expose only the category.
     */
    [[nodiscard]] auto public_reason() const -> std::string {
        switch (reason) {
            case reason_code::granted:
            case reason_code::constraint_failed:
            case reason_code::no_grant:
            case reason_code::session_expired:
            case reason_code::session_revoked:
            case reason_code::audit_write_failed:
                return reason_string();
            case reason_code::unauthenticated:
            case reason_code::no_tenant_binding:
            case reason_code::policy_error:
            case reason_code::tenant_inactive:
                break;
        }
        return "denied";
    }
};

} // namespace tenantguard::security
