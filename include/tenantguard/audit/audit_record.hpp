/**
 * @file audit_record.hpp
 * @brief Audit log record data structures
 *
 * This file provides the audit_record and audit_query structures for the
 * append-only, per-tenant sequenced decision log.
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tenantguard::audit {

/**
 * @brief Audit event type enumeration
 */
enum class audit_event_type {
    access_decision,
    data_mutation,
    session_revoked,
    policy_reload,
    domain_event
};

/**
 * @brief Convert audit_event_type enum to string representation
 */
[[nodiscard]] inline auto to_string(audit_event_type type) -> std::string {
    switch (type) {
        case audit_event_type::access_decision:
            return "ACCESS_DECISION";
        case audit_event_type::data_mutation:
            return "DATA_MUTATION";
        case audit_event_type::session_revoked:
            return "SESSION_REVOKED";
        case audit_event_type::policy_reload:
            return "POLICY_RELOAD";
        case audit_event_type::domain_event:
            return "DOMAIN_EVENT";
        default:
            return "UNKNOWN";
    }
}

/**
 * @brief Parse string to audit_event_type enum
 */
[[nodiscard]] inline auto parse_audit_event_type(std::string_view str)
    -> std::optional<audit_event_type> {
    if (str == "ACCESS_DECISION") {
        return audit_event_type::access_decision;
    }
    if (str == "DATA_MUTATION") {
        return audit_event_type::data_mutation;
    }
    if (str == "SESSION_REVOKED") {
        return audit_event_type::session_revoked;
    }
    if (str == "POLICY_RELOAD") {
        return audit_event_type::policy_reload;
    }
    if (str == "DOMAIN_EVENT") {
        return audit_event_type::domain_event;
    }
    return std::nullopt;
}

/**
 * @brief Audit event severity
 */
enum class audit_severity { low, medium, high, critical };

[[nodiscard]] inline auto to_string(audit_severity severity) -> std::string {
    switch (severity) {
        case audit_severity::low:
            return "LOW";
        case audit_severity::medium:
            return "MEDIUM";
        case audit_severity::high:
            return "HIGH";
        case audit_severity::critical:
            return "CRITICAL";
        default:
            return "UNKNOWN";
    }
}

[[nodiscard]] inline auto parse_audit_severity(std::string_view str)
    -> std::optional<audit_severity> {
    if (str == "LOW") {
        return audit_severity::low;
    }
    if (str == "MEDIUM") {
        return audit_severity::medium;
    }
    if (str == "HIGH") {
        return audit_severity::high;
    }
    if (str == "CRITICAL") {
        return audit_severity::critical;
    }
    return std::nullopt;
}

/**
 * @brief Immutable audit log entry
 *
 * Keyed by (tenant_id, sequence). Sequence numbers start at 1 and are
 * strictly monotonic per tenant. entry_hash is the SHA-256 of prev_hash
 * followed by the canonical form of every other field.
 */
struct audit_record {
    /// Tenant partition; sequence is assigned within it
    std::string tenant_id;

    /// Assigned by the recorder
    std::uint64_t sequence{0};

    /// Millisecond precision
    std::chrono::system_clock::time_point timestamp;

    audit_event_type event_type{audit_event_type::access_decision};
    audit_severity severity{audit_severity::low};

    std::string principal_id;

    /// Resource reference ("work_order/wo-17")
    std::string resource;

    std::string action;

    /// "allow", "deny" or empty for non-decision events
    std::string decision;

    std::string rule_id;

    /// Full reason code ("constraint_failed:approval_ceiling")
    std::string reason;

    std::string session_id;
    std::uint64_t policy_version{0};

    /// Request metadata (request id, ip, user agent, mutation details)
    std::map<std::string, std::string> metadata;

    /// Hex SHA-256 of the previous entry in the tenant chain (empty for the first)
    std::string prev_hash;
    std::string entry_hash;

    [[nodiscard]] auto is_valid() const noexcept -> bool {
        return !tenant_id.empty() && sequence > 0;
    }
};

/**
 * @brief Acknowledgement of a recorded event
 */
struct audit_ack {
    std::string tenant_id;
    std::uint64_t sequence{0};
    std::string entry_hash;

    /// Not yet in the audit store; held in the local buffer or retry queue
    bool buffered{false};
};

/**
 * @brief Query parameters for audit log search
 */
struct audit_query {
    /// Tenant partition (required)
    std::string tenant_id;

    std::optional<std::string> principal_id;

    /// "allow" or "deny"
    std::optional<std::string> decision;

    std::optional<audit_event_type> event_type;

    /// Sequence range (inclusive)
    std::optional<std::uint64_t> from_sequence;
    std::optional<std::uint64_t> to_sequence;

    std::optional<std::chrono::system_clock::time_point> since;
    std::optional<std::chrono::system_clock::time_point> until;

    /// Maximum number of results to return (0 = unlimited)
    std::size_t limit{0};
};

/**
 * @brief Result of a hash chain verification
 */
struct chain_report {
    std::string tenant_id;
    std::size_t entries_checked{0};
    std::uint64_t last_sequence{0};

    /// Missing sequence ranges [first, last]
    std::vector<std::pair<std::uint64_t, std::uint64_t>> gaps;

    /// Sequences whose stored hash or link does not verify
    std::vector<std::uint64_t> mismatches;

    [[nodiscard]] bool intact() const noexcept {
        return gaps.empty() && mismatches.empty();
    }
};

} // namespace tenantguard::audit
