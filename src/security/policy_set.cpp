/**
 * @file policy_set.cpp
 * @brief Policy snapshot compilation and effective permission computation
 *
 * @copyright Copyright (c) 2025
 */

#include <tenantguard/security/policy_set.hpp>

#include <algorithm>
#include <limits>
#include <tuple>
#include <unordered_set>

namespace tenantguard::security {

namespace {

auto same_terms(const grant& a, const grant& b) -> bool {
    return a.constraints == b.constraints &&
           a.include_deleted == b.include_deleted &&
           a.cross_tenant == b.cross_tenant;
}

} // namespace

auto policy_set::compile(policy_document document,
                         std::vector<policy_diagnostic>& diagnostics)
    -> std::shared_ptr<const policy_set> {
    const auto errors_before = diagnostics.size();

    if (document.version == 0) {
        diagnostics.push_back({diagnostic_code::invalid_document,
                               "policy version must be greater than zero",
                               {}});
    }

    auto graph = role_graph::build(document.roles, diagnostics);

    std::set<std::string> declared_roles;
    for (const auto& role : document.roles) {
        declared_roles.insert(role.name);
    }

    std::set<std::string> all_actions;
    for (const auto& [type, actions] : document.resources) {
        all_actions.insert(actions.begin(), actions.end());
    }

    std::unordered_set<std::string> rule_ids;
    std::set<std::tuple<std::string, std::string, std::string>> role_keys;

    for (const auto& g : document.grants) {
        if (g.rule_id.empty()) {
            diagnostics.push_back({diagnostic_code::invalid_document,
                                   "grant without rule id for role '" + g.role + "'",
                                   {g.role}});
        } else if (!rule_ids.insert(g.rule_id).second) {
            diagnostics.push_back({diagnostic_code::duplicate_rule,
                                   "rule id '" + g.rule_id + "' is used twice",
                                   {g.rule_id}});
        }

        if (!declared_roles.contains(g.role)) {
            diagnostics.push_back({diagnostic_code::undefined_role,
                                   "rule '" + g.rule_id + "' references undefined role '" +
                                       g.role + "'",
                                   {g.rule_id, g.role}});
        }

        auto resource = document.resources.find(g.resource_type);
        if (resource == document.resources.end()) {
            diagnostics.push_back({diagnostic_code::undefined_resource,
                                   "rule '" + g.rule_id +
                                       "' references undefined resource type '" +
                                       g.resource_type + "'",
                                   {g.rule_id, g.resource_type}});
        } else if (!resource->second.contains(g.action)) {
            diagnostics.push_back({diagnostic_code::undefined_action,
                                   "rule '" + g.rule_id + "' references action '" +
                                       g.action + "' not declared for '" +
                                       g.resource_type + "'",
                                   {g.rule_id, g.resource_type, g.action}});
        }

        if (!role_keys.emplace(g.role, g.resource_type, g.action).second) {
            diagnostics.push_back({diagnostic_code::duplicate_rule,
                                   "role '" + g.role + "' has more than one grant for " +
                                       g.resource_type + ":" + g.action,
                                   {g.rule_id, g.role}});
        }

        for (const auto& c : g.constraints) {
            if (auto problem = validate_constraint(c)) {
                diagnostics.push_back({diagnostic_code::invalid_constraint,
                                       "rule '" + g.rule_id + "': " + *problem,
                                       {g.rule_id,
                                        std::string(to_string(category_of(c)))}});
            }
        }
    }

    for (const auto& req : document.sensitivity) {
        if (req.level < min_sensitivity || req.level > max_sensitivity) {
            diagnostics.push_back({diagnostic_code::invalid_constraint,
                                   "sensitivity level " + std::to_string(req.level) +
                                       " is outside 1-6",
                                   {}});
        }
    }

    for (const auto& action : document.critical_actions) {
        if (!all_actions.contains(action)) {
            diagnostics.push_back({diagnostic_code::undefined_action,
                                   "critical action '" + action + "' is not declared",
                                   {action}});
        }
    }

    if (diagnostics.size() != errors_before || !graph) {
        return nullptr;
    }

    std::shared_ptr<policy_set> set(new policy_set());
    set->industry_ = document.industry;
    set->version_ = document.version;
    set->graph_ = std::move(*graph);
    set->grants_by_role_.resize(set->graph_.size());
    for (auto& g : document.grants) {
        auto id = *set->graph_.find(g.role);
        set->grants_by_role_[id].push_back(std::move(g));
        ++set->grant_count_;
    }
    for (auto& [type, actions] : document.resources) {
        set->resources_.emplace(type, std::move(actions));
    }
    for (const auto& req : document.sensitivity) {
        set->sensitivity_[req.level] = req;
    }
    set->critical_actions_.insert(document.critical_actions.begin(),
                                  document.critical_actions.end());
    return set;
}

auto policy_set::effective_permissions(std::string_view role,
                                       std::string_view industry_role) const
    -> Result<std::vector<effective_grant>> {
    auto base = graph_.find(role);
    if (!base) {
        return tenantguard_error<std::vector<effective_grant>>(
            error_codes::policy_undefined_role,
            "Role is not defined in policy",
            std::string(role));
    }

    // Multi-source BFS: each reachable role at its shortest distance.
    std::map<role_id, std::uint32_t> distance;
    for (auto [id, d] : graph_.ancestors(*base)) {
        distance[id] = d;
    }
    if (!industry_role.empty()) {
        auto extension = graph_.find(industry_role);
        if (!extension) {
            return tenantguard_error<std::vector<effective_grant>>(
                error_codes::policy_undefined_role,
                "Industry role is not defined in policy",
                std::string(industry_role));
        }
        for (auto [id, d] : graph_.ancestors(*extension)) {
            auto [it, inserted] = distance.emplace(id, d);
            if (!inserted) {
                it->second = std::min(it->second, d);
            }
        }
    }

    struct candidate {
        const grant* source;
        std::uint32_t distance;
    };
    std::map<std::pair<std::string, std::string>, std::vector<candidate>> by_key;
    for (const auto& [id, d] : distance) {
        for (const auto& g : grants_by_role_[id]) {
            by_key[{g.resource_type, g.action}].push_back({&g, d});
        }
    }

    std::vector<effective_grant> result;
    result.reserve(by_key.size());
    for (auto& [key, candidates] : by_key) {
        auto closest = std::numeric_limits<std::uint32_t>::max();
        for (const auto& c : candidates) {
            closest = std::min(closest, c.distance);
        }

        std::vector<const grant*> winners;
        for (const auto& c : candidates) {
            if (c.distance == closest) {
                winners.push_back(c.source);
            }
        }
        std::ranges::sort(winners, [](const grant* a, const grant* b) {
            return a->rule_id < b->rule_id;
        });

        effective_grant eg;
        eg.source = *winners.front();
        eg.distance = closest;
        eg.ambiguous = std::ranges::any_of(winners, [&](const grant* g) {
            return !same_terms(*g, *winners.front());
        });
        result.push_back(std::move(eg));
    }

    return result;
}

auto policy_set::idle_timeout(std::string_view role,
                              std::string_view industry_role) const
    -> std::optional<std::chrono::seconds> {
    auto base = graph_.find(role);
    if (!base) {
        return std::nullopt;
    }
    auto timeout = graph_.at(*base).idle_timeout;
    if (!industry_role.empty()) {
        if (auto extension = graph_.find(industry_role)) {
            timeout = std::min(timeout, graph_.at(*extension).idle_timeout);
        }
    }
    return timeout;
}

auto policy_set::requirement_for(std::uint8_t sensitivity) const
    -> sensitivity_requirement {
    sensitivity_requirement req;
    req.level = sensitivity;
    if (auto it = sensitivity_.find(sensitivity); it != sensitivity_.end()) {
        req = it->second;
    }
    if (sensitivity >= mfa_forced_sensitivity && req.min_mfa_level == 0) {
        req.min_mfa_level = 1;
    }
    return req;
}

bool policy_set::is_critical_action(std::string_view action) const {
    return critical_actions_.find(action) != critical_actions_.end();
}

bool policy_set::is_declared(std::string_view resource_type,
                             std::string_view action) const {
    auto it = resources_.find(resource_type);
    return it != resources_.end() && it->second.contains(std::string(action));
}

} // namespace tenantguard::security
