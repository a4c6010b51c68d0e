/**
 * @file access_request.hpp
 * @brief Resource references and request context for access checks
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include "principal.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace tenantguard::security {

/// Lowest and highest resource sensitivity levels
constexpr std::uint8_t min_sensitivity = 1;
constexpr std::uint8_t max_sensitivity = 6;

/**
 * @brief Addressable entity instance a request targets
 */
struct resource_ref {
    std::string tenant_id;
    std::string type;
    std::string id;

    /// 1 (public) .. 6 (most sensitive)
    std::uint8_t sensitivity{min_sensitivity};

    /// Monetary value in minor currency units, for financial actions
    std::optional<std::int64_t> monetary_value;

    /// Owner attributes, e.g. {"assigned_to", "tech-42"}
    std::map<std::string, std::string> owner_attributes;

    [[nodiscard]] auto describe() const -> std::string { return type + "/" + id; }
};

/**
 * @brief Contextual attributes of a single request
 *
 * Built fresh for every authorization call from the live session state,
 * never cached across calls.
 */
struct request_context {
    std::chrono::system_clock::time_point now{std::chrono::system_clock::now()};

    std::string session_id;

    /// 0 = no MFA; higher values are stronger factors
    std::uint8_t mfa_level{0};
    std::uint8_t device_trust_level{0};
    geo_location location;

    /// Free-form request metadata (request id, ip, user agent)
    std::map<std::string, std::string> metadata;

    [[nodiscard]] bool mfa_satisfied() const noexcept { return mfa_level > 0; }
};

} // namespace tenantguard::security
