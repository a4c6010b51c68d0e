/**
 * @file session.hpp
 * @brief Authenticated session state
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include "principal.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tenantguard::security {

enum class session_state : std::uint8_t { active, terminated };

/**
 * @brief Why a session left the active state
 */
enum class termination_cause : std::uint8_t {
    none,
    logout,
    idle_timeout,
    expired,
    revoked
};

constexpr std::string_view to_string(termination_cause cause) {
    switch (cause) {
        case termination_cause::none: return "none";
        case termination_cause::logout: return "logout";
        case termination_cause::idle_timeout: return "idle_timeout";
        case termination_cause::expired: return "expired";
        case termination_cause::revoked: return "revoked";
    }
    return "unknown";
}

/**
 * @brief Point-in-time copy of a session
 */
struct session_info {
    std::string id;
    std::string principal_id;
    std::string tenant_id;
    std::string base_role;
    std::string industry_role;

    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point last_activity_at;
    std::chrono::system_clock::time_point expires_at;
    std::chrono::seconds idle_timeout{std::chrono::minutes(30)};

    /// MFA level as currently counted (0 once the step-up window lapsed)
    std::uint8_t mfa_level{0};
    std::optional<std::chrono::system_clock::time_point> mfa_verified_at;
    std::uint8_t device_trust_level{0};
    geo_location location;

    session_state state{session_state::active};
    termination_cause cause{termination_cause::none};

    [[nodiscard]] bool is_active() const noexcept {
        return state == session_state::active;
    }

    [[nodiscard]] bool mfa_satisfied() const noexcept { return mfa_level > 0; }
};

/**
 * @brief Parameters for creating a session
 */
struct session_request {
    std::string principal_id;
    std::string tenant_id;
    std::string base_role;
    std::string industry_role;

    /// Role idle timeout from the policy; session_config default if empty
    std::optional<std::chrono::seconds> idle_timeout;

    std::uint8_t mfa_level{0};
    std::uint8_t device_trust_level{0};
    geo_location location;
};

} // namespace tenantguard::security
