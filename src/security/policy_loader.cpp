/**
 * @file policy_loader.cpp
 * @brief JSON policy document parsing
 *
 * @copyright Copyright (c) 2025
 */

#include <tenantguard/security/policy_loader.hpp>

#include <tenantguard/security/access_request.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <charconv>
#include <fstream>
#include <limits>
#include <sstream>

namespace tenantguard::security {

using json = nlohmann::json;

namespace {

/// Highest MFA and device trust level a policy may demand
constexpr std::int64_t max_assurance_level = 3;

/// One week
constexpr std::int64_t max_idle_timeout_minutes = 7 * 24 * 60;

constexpr std::array<std::string_view, 7> day_names = {
    "sun", "mon", "tue", "wed", "thu", "fri", "sat"};

/// Parse "HH:MM" into minutes since midnight; "24:00" is accepted
auto parse_clock(const std::string& text) -> std::optional<std::uint16_t> {
    auto colon = text.find(':');
    if (colon == std::string::npos) {
        return std::nullopt;
    }
    int hours = 0;
    int minutes = 0;
    auto [p1, e1] = std::from_chars(text.data(), text.data() + colon, hours);
    auto [p2, e2] = std::from_chars(text.data() + colon + 1,
                                    text.data() + text.size(), minutes);
    if (e1 != std::errc{} || e2 != std::errc{} || p1 != text.data() + colon ||
        p2 != text.data() + text.size()) {
        return std::nullopt;
    }
    if (hours < 0 || minutes < 0 || minutes > 59 || hours > 24 ||
        (hours == 24 && minutes != 0)) {
        return std::nullopt;
    }
    return static_cast<std::uint16_t>(hours * 60 + minutes);
}

/**
 * @brief Integer field read at full width and range-checked before narrowing
 *
 * Absent keys yield the fallback, or a diagnostic when there is none.
 */
template <typename T>
auto bounded_integer(const json& node, const char* key, std::int64_t lo, std::int64_t hi,
                     std::optional<T> fallback, const std::string& context,
                     diagnostic_code code, std::vector<policy_diagnostic>& diagnostics)
    -> std::optional<T> {
    if (!node.contains(key)) {
        if (!fallback) {
            diagnostics.push_back({code, context + ": missing '" + key + "'", {context, key}});
        }
        return fallback;
    }

    const auto& value = node.at(key);
    if (!value.is_number_integer()) {
        diagnostics.push_back(
            {code, context + ": '" + key + "' must be an integer", {context, key}});
        return std::nullopt;
    }

    bool in_range = false;
    std::int64_t raw = 0;
    if (value.is_number_unsigned()) {
        auto u = value.get<std::uint64_t>();
        in_range = u <= static_cast<std::uint64_t>(hi);
        raw = in_range ? static_cast<std::int64_t>(u) : 0;
        in_range = in_range && raw >= lo;
    } else {
        raw = value.get<std::int64_t>();
        in_range = raw >= lo && raw <= hi;
    }
    if (!in_range) {
        diagnostics.push_back({code,
                               context + ": '" + key + "' must be between " +
                                   std::to_string(lo) + " and " + std::to_string(hi),
                               {context, key}});
        return std::nullopt;
    }
    return static_cast<T>(raw);
}

auto string_list(const json& node, const char* key) -> std::vector<std::string> {
    std::vector<std::string> values;
    if (node.contains(key)) {
        for (const auto& item : node.at(key)) {
            values.push_back(item.get<std::string>());
        }
    }
    return values;
}

auto parse_constraint(const json& node, const std::string& rule_id,
                      std::vector<policy_diagnostic>& diagnostics)
    -> std::optional<constraint> {
    auto type = node.at("type").get<std::string>();

    if (type == "geo_scope") {
        geo_scope geo;
        geo.allowed_countries = string_list(node, "allowed_countries");
        geo.blocked_countries = string_list(node, "blocked_countries");
        geo.allowed_regions = string_list(node, "allowed_regions");
        return geo;
    }

    if (type == "time_window") {
        time_window window;
        if (node.contains("days")) {
            window.days_mask = 0;
            for (const auto& day : node.at("days")) {
                auto name = day.get<std::string>();
                auto it = std::find(day_names.begin(), day_names.end(), name);
                if (it == day_names.end()) {
                    diagnostics.push_back({diagnostic_code::invalid_constraint,
                                           "rule '" + rule_id + "': unknown day '" +
                                               name + "'",
                                           {rule_id, "time_window"}});
                    return std::nullopt;
                }
                window.days_mask |= static_cast<std::uint8_t>(
                    1u << static_cast<unsigned>(it - day_names.begin()));
            }
        }
        for (auto [key, target] : {std::pair{"start", &window.start_minute},
                                   std::pair{"end", &window.end_minute}}) {
            if (!node.contains(key)) {
                continue;
            }
            auto minutes = parse_clock(node.at(key).get<std::string>());
            if (!minutes) {
                diagnostics.push_back({diagnostic_code::invalid_constraint,
                                       "rule '" + rule_id + "': malformed " + key +
                                           " time, expected HH:MM",
                                       {rule_id, "time_window"}});
                return std::nullopt;
            }
            *target = *minutes;
        }
        auto offset = bounded_integer<std::int16_t>(
            node, "utc_offset_minutes", -14 * 60, 14 * 60, std::int16_t{0},
            "rule '" + rule_id + "'", diagnostic_code::invalid_constraint, diagnostics);
        if (!offset) {
            return std::nullopt;
        }
        window.utc_offset_minutes = *offset;
        return window;
    }

    if (type == "mfa_required" || type == "device_trust") {
        auto level = bounded_integer<std::uint8_t>(
            node, "min_level", 1, max_assurance_level, std::uint8_t{1},
            "rule '" + rule_id + "'", diagnostic_code::invalid_constraint, diagnostics);
        if (!level) {
            return std::nullopt;
        }
        if (type == "mfa_required") {
            return mfa_requirement{*level};
        }
        return device_trust_requirement{*level};
    }

    if (type == "approval_ceiling") {
        auto amount = bounded_integer<std::int64_t>(
            node, "max_amount", 0, std::numeric_limits<std::int64_t>::max(), std::nullopt,
            "rule '" + rule_id + "'", diagnostic_code::invalid_constraint, diagnostics);
        if (!amount) {
            return std::nullopt;
        }
        return approval_ceiling{*amount};
    }

    if (type == "owner_only") {
        return owner_only{node.value("attribute", std::string("assigned_to"))};
    }

    diagnostics.push_back({diagnostic_code::invalid_constraint,
                           "rule '" + rule_id + "': unknown constraint type '" +
                               type + "'",
                           {rule_id, type}});
    return std::nullopt;
}

} // namespace

auto parse_policy_document(std::string_view text,
                           std::vector<policy_diagnostic>& diagnostics)
    -> std::optional<policy_document> {
    const auto errors_before = diagnostics.size();
    policy_document document;

    try {
        auto root = json::parse(text);
        if (!root.is_object()) {
            diagnostics.push_back({diagnostic_code::invalid_document,
                                   "policy document must be a JSON object",
                                   {}});
            return std::nullopt;
        }

        auto industry_name = root.at("industry").get<std::string>();
        if (auto industry = parse_industry(industry_name)) {
            document.industry = *industry;
        } else {
            diagnostics.push_back({diagnostic_code::invalid_document,
                                   "unknown industry '" + industry_name + "'",
                                   {industry_name}});
        }
        if (auto version = bounded_integer<std::uint64_t>(
                root, "version", 0, std::numeric_limits<std::int64_t>::max(), std::nullopt,
                "document", diagnostic_code::invalid_document, diagnostics)) {
            document.version = *version;
        }

        for (const auto& node : root.at("roles")) {
            role_definition role;
            role.name = node.at("name").get<std::string>();
            role.inherits = string_list(node, "inherits");
            if (node.contains("idle_timeout_minutes")) {
                if (auto minutes = bounded_integer<std::uint32_t>(
                        node, "idle_timeout_minutes", 1, max_idle_timeout_minutes,
                        std::nullopt, "role '" + role.name + "'",
                        diagnostic_code::invalid_document, diagnostics)) {
                    role.idle_timeout = std::chrono::minutes(*minutes);
                }
            }
            role.industry_role = node.value("industry_role", false);
            document.roles.push_back(std::move(role));
        }

        if (root.contains("resources")) {
            for (auto it = root.at("resources").begin();
                 it != root.at("resources").end(); ++it) {
                auto& actions = document.resources[it.key()];
                for (const auto& action : it.value()) {
                    actions.insert(action.get<std::string>());
                }
            }
        }

        if (root.contains("grants")) {
            for (const auto& node : root.at("grants")) {
                grant g;
                g.rule_id = node.value("id", std::string{});
                g.role = node.at("role").get<std::string>();
                g.resource_type = node.at("resource").get<std::string>();
                g.action = node.at("action").get<std::string>();
                g.include_deleted = node.value("include_deleted", false);
                g.cross_tenant = node.value("cross_tenant", false);
                if (node.contains("constraints")) {
                    for (const auto& c : node.at("constraints")) {
                        if (auto parsed = parse_constraint(c, g.rule_id, diagnostics)) {
                            g.constraints.push_back(std::move(*parsed));
                        }
                    }
                }
                document.grants.push_back(std::move(g));
            }
        }

        if (root.contains("sensitivity")) {
            for (const auto& node : root.at("sensitivity")) {
                const std::string context = "sensitivity row";
                auto level = bounded_integer<std::uint8_t>(
                    node, "level", min_sensitivity, max_sensitivity, std::nullopt, context,
                    diagnostic_code::invalid_constraint, diagnostics);
                auto mfa = bounded_integer<std::uint8_t>(
                    node, "min_mfa_level", 0, max_assurance_level, std::uint8_t{0}, context,
                    diagnostic_code::invalid_constraint, diagnostics);
                auto trust = bounded_integer<std::uint8_t>(
                    node, "min_device_trust", 0, max_assurance_level, std::uint8_t{0},
                    context, diagnostic_code::invalid_constraint, diagnostics);
                if (level && mfa && trust) {
                    sensitivity_requirement req;
                    req.level = *level;
                    req.min_mfa_level = *mfa;
                    req.min_device_trust = *trust;
                    document.sensitivity.push_back(req);
                }
            }
        }

        for (auto& action : string_list(root, "critical_actions")) {
            document.critical_actions.insert(std::move(action));
        }
    }
    catch (const json::parse_error& ex) {
        diagnostics.push_back({diagnostic_code::parse_error, ex.what(), {}});
        return std::nullopt;
    }
    catch (const json::exception& ex) {
        diagnostics.push_back({diagnostic_code::invalid_document, ex.what(), {}});
        return std::nullopt;
    }

    if (diagnostics.size() != errors_before) {
        return std::nullopt;
    }
    return document;
}

auto read_policy_text(const std::filesystem::path& path) -> std::optional<std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

auto load_policy_file(const std::filesystem::path& path,
                      std::vector<policy_diagnostic>& diagnostics)
    -> std::optional<policy_document> {
    auto text = read_policy_text(path);
    if (!text) {
        diagnostics.push_back({diagnostic_code::parse_error,
                               "cannot read policy file " + path.string(),
                               {path.string()}});
        return std::nullopt;
    }
    return parse_policy_document(*text, diagnostics);
}

} // namespace tenantguard::security
