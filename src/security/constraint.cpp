/**
 * @file constraint.cpp
 * @brief Evaluation and validation of grant constraints
 *
 * @copyright Copyright (c) 2025
 */

#include <tenantguard/security/constraint.hpp>

#include <algorithm>
#include <chrono>
#include <type_traits>

namespace tenantguard::security {

namespace {

template <typename>
inline constexpr bool always_false_v = false;

auto contains(const std::vector<std::string>& list, std::string_view value) -> bool {
    return std::ranges::find(list, value) != list.end();
}

auto within_geo_scope(const geo_scope& scope, const geo_location& where) -> bool {
    if (contains(scope.blocked_countries, where.country)) {
        return false;
    }
    if (!scope.allowed_countries.empty() &&
        !contains(scope.allowed_countries, where.country)) {
        return false;
    }
    if (!scope.allowed_regions.empty() &&
        !contains(scope.allowed_regions, where.region)) {
        return false;
    }
    return true;
}

auto within_time_window(const time_window& window,
                        std::chrono::system_clock::time_point now) -> bool {
    using namespace std::chrono;

    auto local = now + minutes(window.utc_offset_minutes);
    auto day = floor<days>(local);
    auto weekday_index = weekday{sys_days{day}}.c_encoding();

    if ((window.days_mask & (1u << weekday_index)) == 0) {
        return false;
    }

    auto minute_of_day = static_cast<std::uint16_t>(
        duration_cast<minutes>(local - day).count());

    if (window.start_minute < window.end_minute) {
        return minute_of_day >= window.start_minute &&
               minute_of_day < window.end_minute;
    }
    // Wraps past midnight, e.g. 22:00-06:00
    return minute_of_day >= window.start_minute ||
           minute_of_day < window.end_minute;
}

} // namespace

auto category_of(const constraint& c) -> constraint_category {
    return std::visit([](const auto& value) -> constraint_category {
        using T = std::decay_t<decltype(value)>;

        if constexpr (std::is_same_v<T, geo_scope>) {
            return constraint_category::geo_scope;
        } else if constexpr (std::is_same_v<T, time_window>) {
            return constraint_category::time_window;
        } else if constexpr (std::is_same_v<T, mfa_requirement>) {
            return constraint_category::mfa_required;
        } else if constexpr (std::is_same_v<T, device_trust_requirement>) {
            return constraint_category::device_trust;
        } else if constexpr (std::is_same_v<T, approval_ceiling>) {
            return constraint_category::approval_ceiling;
        } else if constexpr (std::is_same_v<T, owner_only>) {
            return constraint_category::owner_only;
        } else {
            static_assert(always_false_v<T>, "unhandled constraint kind");
        }
    }, c);
}

auto evaluate_constraint(const constraint& c,
                         std::string_view principal_id,
                         const resource_ref& resource,
                         const request_context& ctx) -> bool {
    return std::visit([&](const auto& value) -> bool {
        using T = std::decay_t<decltype(value)>;

        if constexpr (std::is_same_v<T, geo_scope>) {
            return within_geo_scope(value, ctx.location);
        } else if constexpr (std::is_same_v<T, time_window>) {
            return within_time_window(value, ctx.now);
        } else if constexpr (std::is_same_v<T, mfa_requirement>) {
            return ctx.mfa_level >= value.min_level;
        } else if constexpr (std::is_same_v<T, device_trust_requirement>) {
            return ctx.device_trust_level >= value.min_level;
        } else if constexpr (std::is_same_v<T, approval_ceiling>) {
            if (!resource.monetary_value) {
                return false;
            }
            return *resource.monetary_value <= value.max_amount;
        } else if constexpr (std::is_same_v<T, owner_only>) {
            auto it = resource.owner_attributes.find(value.attribute);
            return it != resource.owner_attributes.end() &&
                   it->second == principal_id;
        } else {
            static_assert(always_false_v<T>, "unhandled constraint kind");
        }
    }, c);
}

auto validate_constraint(const constraint& c) -> std::optional<std::string> {
    return std::visit([](const auto& value) -> std::optional<std::string> {
        using T = std::decay_t<decltype(value)>;

        if constexpr (std::is_same_v<T, geo_scope>) {
            for (const auto& country : value.allowed_countries) {
                if (contains(value.blocked_countries, country)) {
                    return "country '" + country + "' is both allowed and blocked";
                }
            }
            return std::nullopt;
        } else if constexpr (std::is_same_v<T, time_window>) {
            if (value.days_mask == 0 || value.days_mask > 0x7F) {
                return std::string("time window day mask must select 1-7 days");
            }
            if (value.start_minute >= 24 * 60 || value.end_minute > 24 * 60) {
                return std::string("time window minutes out of range");
            }
            if (value.start_minute == value.end_minute) {
                return std::string("time window is empty");
            }
            if (value.utc_offset_minutes < -14 * 60 ||
                value.utc_offset_minutes > 14 * 60) {
                return std::string("time window utc offset out of range");
            }
            return std::nullopt;
        } else if constexpr (std::is_same_v<T, mfa_requirement>) {
            if (value.min_level == 0 || value.min_level > 3) {
                return std::string("mfa level must be between 1 and 3");
            }
            return std::nullopt;
        } else if constexpr (std::is_same_v<T, device_trust_requirement>) {
            if (value.min_level == 0 || value.min_level > 3) {
                return std::string("device trust level must be between 1 and 3");
            }
            return std::nullopt;
        } else if constexpr (std::is_same_v<T, approval_ceiling>) {
            if (value.max_amount < 0) {
                return std::string("approval ceiling must not be negative");
            }
            return std::nullopt;
        } else if constexpr (std::is_same_v<T, owner_only>) {
            if (value.attribute.empty()) {
                return std::string("owner_only attribute must not be empty");
            }
            return std::nullopt;
        } else {
            static_assert(always_false_v<T>, "unhandled constraint kind");
        }
    }, c);
}

auto evaluate_constraints(const std::vector<constraint>& constraints,
                          std::string_view principal_id,
                          const resource_ref& resource,
                          const request_context& ctx) -> constraint_check {
    for (const auto& c : constraints) {
        if (!evaluate_constraint(c, principal_id, resource, ctx)) {
            return {false, category_of(c)};
        }
    }
    return {true, std::nullopt};
}

} // namespace tenantguard::security
