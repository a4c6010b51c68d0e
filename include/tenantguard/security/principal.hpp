/**
 * @file principal.hpp
 * @brief Principal (authenticated actor) definitions
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tenantguard::security {

enum class principal_kind { user, api_partner };

constexpr std::string_view to_string(principal_kind kind) {
    switch (kind) {
        case principal_kind::user: return "user";
        case principal_kind::api_partner: return "api_partner";
    }
    return "unknown";
}

inline std::optional<principal_kind> parse_principal_kind(std::string_view str) {
    if (str == "user") return principal_kind::user;
    if (str == "api_partner") return principal_kind::api_partner;
    return std::nullopt;
}

/**
 * @brief Binding of a principal to one tenant
 */
struct tenant_binding {
    std::string tenant_id;
    std::string base_role;
    std::string industry_role; ///< empty when no industry extension
    bool active{true};

    bool operator==(const tenant_binding& other) const = default;
};

/**
 * @brief Geographic location reported for a request
 */
struct geo_location {
    std::string country; ///< ISO 3166-1 alpha-2
    std::string region;  ///< free-form subdivision code, e.g. "US-CA"

    bool operator==(const geo_location& other) const = default;
};

/**
 * @brief An authenticated actor (human user or API partner)
 *
 * Human users are bound to exactly one active tenant per session. API
 * partners may carry several bindings and, when explicitly granted, a
 * multi-tenant exception.
 */
struct principal {
    std::string id;
    principal_kind kind{principal_kind::user};
    std::vector<tenant_binding> bindings;
    bool active{true};

    /// Explicit multi-tenant grant, only honoured for API partners
    bool multi_tenant_grant{false};

    /// Tenant ids covered by the multi-tenant grant (empty = all bound)
    std::vector<std::string> cross_tenant_scope;

    /// Authentication state at resolution time
    std::uint8_t mfa_level{0};
    std::uint8_t device_trust_level{0};
    geo_location location;

    /// Session the resolution was performed for, when known
    std::string session_id;

    [[nodiscard]] auto binding_for(std::string_view tenant_id) const
        -> const tenant_binding* {
        auto it = std::ranges::find_if(bindings, [&](const tenant_binding& b) {
            return b.active && b.tenant_id == tenant_id;
        });
        return it == bindings.end() ? nullptr : &*it;
    }

    [[nodiscard]] bool is_bound_to(std::string_view tenant_id) const {
        return binding_for(tenant_id) != nullptr;
    }

    /**
     * @brief Whether the explicit API-partner exception covers a tenant
     */
    [[nodiscard]] bool has_cross_tenant_grant(std::string_view tenant_id) const {
        if (kind != principal_kind::api_partner || !multi_tenant_grant) {
            return false;
        }
        if (cross_tenant_scope.empty()) {
            return true;
        }
        return std::ranges::find(cross_tenant_scope, tenant_id) !=
               cross_tenant_scope.end();
    }
};

} // namespace tenantguard::security
