/**
 * @file tenant.hpp
 * @brief Tenant (business) definitions
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace tenantguard::security {

/**
 * @brief Industry vertical a tenant operates in
 */
enum class industry_vertical {
    home_services,
    restaurant,
    automotive,
    retail,
    courses,
    payroll,
    investigations
};

constexpr std::array<industry_vertical, 7> all_industries = {
    industry_vertical::home_services, industry_vertical::restaurant,
    industry_vertical::automotive,    industry_vertical::retail,
    industry_vertical::courses,       industry_vertical::payroll,
    industry_vertical::investigations};

constexpr std::string_view to_string(industry_vertical industry) {
    switch (industry) {
        case industry_vertical::home_services: return "home_services";
        case industry_vertical::restaurant: return "restaurant";
        case industry_vertical::automotive: return "automotive";
        case industry_vertical::retail: return "retail";
        case industry_vertical::courses: return "courses";
        case industry_vertical::payroll: return "payroll";
        case industry_vertical::investigations: return "investigations";
    }
    return "unknown";
}

inline std::optional<industry_vertical> parse_industry(std::string_view str) {
    if (str == "home_services") return industry_vertical::home_services;
    if (str == "restaurant") return industry_vertical::restaurant;
    if (str == "automotive") return industry_vertical::automotive;
    if (str == "retail") return industry_vertical::retail;
    if (str == "courses") return industry_vertical::courses;
    if (str == "payroll") return industry_vertical::payroll;
    if (str == "investigations") return industry_vertical::investigations;
    return std::nullopt;
}

enum class plan_tier { free, starter, professional, enterprise };

constexpr std::string_view to_string(plan_tier tier) {
    switch (tier) {
        case plan_tier::free: return "free";
        case plan_tier::starter: return "starter";
        case plan_tier::professional: return "professional";
        case plan_tier::enterprise: return "enterprise";
    }
    return "unknown";
}

inline std::optional<plan_tier> parse_plan_tier(std::string_view str) {
    if (str == "free") return plan_tier::free;
    if (str == "starter") return plan_tier::starter;
    if (str == "professional") return plan_tier::professional;
    if (str == "enterprise") return plan_tier::enterprise;
    return std::nullopt;
}

/**
 * @brief Tenant lifecycle status
 *
 * Tenants are never hard-deleted while audit retention applies;
 * cancellation is the soft-delete state.
 */
enum class tenant_status { active, suspended, cancelled };

constexpr std::string_view to_string(tenant_status status) {
    switch (status) {
        case tenant_status::active: return "active";
        case tenant_status::suspended: return "suspended";
        case tenant_status::cancelled: return "cancelled";
    }
    return "unknown";
}

inline std::optional<tenant_status> parse_tenant_status(std::string_view str) {
    if (str == "active") return tenant_status::active;
    if (str == "suspended") return tenant_status::suspended;
    if (str == "cancelled") return tenant_status::cancelled;
    return std::nullopt;
}

/**
 * @brief Root isolation boundary
 */
struct tenant {
    std::string id;
    industry_vertical industry{industry_vertical::home_services};
    plan_tier plan{plan_tier::free};
    tenant_status status{tenant_status::active};

    [[nodiscard]] bool is_active() const noexcept {
        return status == tenant_status::active;
    }
};

} // namespace tenantguard::security
