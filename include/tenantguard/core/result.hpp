/**
 * @file result.hpp
 * @brief Result<T> type aliases and helpers for TenantGuard
 *
 * This file provides standardized Result<T> types and error handling
 * utilities for the engine, integrating with common_system's
 * Result pattern.
 *
 * @see common_system/include/kcenon/common/patterns/result.h
 */

#pragma once

#include <kcenon/common/patterns/result.h>
#include <kcenon/common/error/error_codes.h>

#include <string>

namespace tenantguard {

/**
 * @brief Result type alias for engine operations
 * @tparam T The success value type
 */
template <typename T>
using Result = kcenon::common::Result<T>;

/**
 * @brief Result type for void operations
 */
using VoidResult = kcenon::common::VoidResult;

/**
 * @brief Error information type
 */
using error_info = kcenon::common::error_info;

/**
 * @namespace error_codes
 * @brief TenantGuard-specific error codes
 *
 * Error code range: -900 to -999
 */
namespace error_codes {
    using namespace kcenon::common::error::codes::common_errors;

    constexpr int tenantguard_base = -900;

    // Authentication / principal errors (-900 to -909)
    constexpr int unauthenticated = tenantguard_base - 0;
    constexpr int token_malformed = tenantguard_base - 1;
    constexpr int token_expired = tenantguard_base - 2;
    constexpr int token_signature_invalid = tenantguard_base - 3;
    constexpr int principal_not_found = tenantguard_base - 4;
    constexpr int principal_inactive = tenantguard_base - 5;

    // Policy errors (-910 to -929)
    constexpr int policy_error = tenantguard_base - 10;
    constexpr int policy_parse_error = tenantguard_base - 11;
    constexpr int policy_cycle_detected = tenantguard_base - 12;
    constexpr int policy_undefined_role = tenantguard_base - 13;
    constexpr int policy_undefined_resource = tenantguard_base - 14;
    constexpr int policy_invalid_constraint = tenantguard_base - 15;
    constexpr int policy_not_loaded = tenantguard_base - 16;
    constexpr int policy_version_conflict = tenantguard_base - 17;

    // Session errors (-930 to -939)
    constexpr int session_not_found = tenantguard_base - 30;
    constexpr int session_expired = tenantguard_base - 31;
    constexpr int session_revoked = tenantguard_base - 32;
    constexpr int session_tenant_mismatch = tenantguard_base - 33;
    constexpr int session_create_failed = tenantguard_base - 34;

    // Audit errors (-940 to -949)
    constexpr int audit_write_failed = tenantguard_base - 40;
    constexpr int audit_buffer_error = tenantguard_base - 41;
    constexpr int audit_sequence_conflict = tenantguard_base - 42;
    constexpr int audit_timeout = tenantguard_base - 43;

    // Isolation / data errors (-950 to -969)
    constexpr int tenant_mismatch = tenantguard_base - 50;
    constexpr int tenant_not_found = tenantguard_base - 51;
    constexpr int entity_not_found = tenantguard_base - 52;
    constexpr int access_denied = tenantguard_base - 53;
    constexpr int tenant_immutable = tenantguard_base - 54;

    // Storage errors (-970 to -979)
    constexpr int database_open_error = tenantguard_base - 70;
    constexpr int database_query_error = tenantguard_base - 71;
    constexpr int store_unavailable = tenantguard_base - 72;

    // Configuration errors (-980 to -989)
    constexpr int config_file_error = tenantguard_base - 80;
    constexpr int config_parse_error = tenantguard_base - 81;
} // namespace error_codes

using kcenon::common::ok;
using kcenon::common::make_error;
using kcenon::common::is_ok;
using kcenon::common::is_error;
using kcenon::common::get_value;
using kcenon::common::get_error;

/**
 * @brief Create an engine error result with module context
 * @tparam T The result value type
 * @param code Error code from tenantguard::error_codes
 * @param message Error message
 * @param details Optional additional details
 * @return Result<T> containing the error
 */
template <typename T>
inline Result<T> tenantguard_error(int code, const std::string& message,
                                   const std::string& details = "") {
    if (details.empty()) {
        return kcenon::common::make_error<T>(code, message, "tenantguard");
    }
    return kcenon::common::make_error<T>(code, message, "tenantguard", details);
}

/**
 * @brief Create an engine void error result
 */
inline VoidResult tenantguard_void_error(int code, const std::string& message,
                                         const std::string& details = "") {
    if (details.empty()) {
        return VoidResult(error_info{code, message, "tenantguard"});
    }
    return VoidResult(error_info{code, message, "tenantguard", details});
}

} // namespace tenantguard

/**
 * @brief Return early if expression is an error
 */
#define TENANTGUARD_RETURN_IF_ERROR(expr) COMMON_RETURN_IF_ERROR(expr)

/**
 * @brief Assign value or return error
 */
#define TENANTGUARD_ASSIGN_OR_RETURN(decl, expr) COMMON_ASSIGN_OR_RETURN(decl, expr)
