/**
 * @file access_evaluator.cpp
 * @brief Implementation of access decisions
 *
 * @copyright Copyright (c) 2025
 */

#include <tenantguard/security/access_evaluator.hpp>

#include <algorithm>
#include <utility>

namespace tenantguard::security {

namespace {

struct role_pair {
    std::string base;
    std::string industry;

    /// Borrowed from another tenant's binding under the partner exception
    bool borrowed{false};
};

} // namespace

access_evaluator::access_evaluator(std::shared_ptr<const policy_store> policies,
                                   std::shared_ptr<const decision_sealer> sealer)
    : policies_(std::move(policies)), sealer_(std::move(sealer)) {}

auto access_evaluator::authorize(const principal& who,
                                 const tenant& target,
                                 const resource_ref& resource,
                                 std::string_view action,
                                 const request_context& ctx) const -> access_decision {
    auto result = evaluate(who, target, resource, action, ctx);
    result.principal_id = who.id;
    result.tenant_id = target.id;
    result.resource_type = resource.type;
    result.action = std::string(action);

    if (result.allowed() && sealer_) {
        if (auto sealed = sealer_->seal(result); sealed.is_err()) {
            result.downgrade(reason_code::policy_error);
        }
    }
    return result;
}

auto access_evaluator::evaluate(const principal& who,
                                const tenant& target,
                                const resource_ref& resource,
                                std::string_view action,
                                const request_context& ctx) const -> access_decision {
    // 1. Tenant binding, or the explicit API-partner exception.
    if (resource.tenant_id != target.id) {
        return access_decision::deny(reason_code::no_tenant_binding);
    }

    std::vector<role_pair> roles;
    bool cross_tenant = false;
    if (const auto* binding = who.binding_for(target.id)) {
        roles.push_back({binding->base_role, binding->industry_role});
    } else if (who.has_cross_tenant_grant(target.id)) {
        cross_tenant = true;
        for (const auto& b : who.bindings) {
            if (b.active) {
                roles.push_back({b.base_role, b.industry_role, true});
            }
        }
    }
    if (roles.empty()) {
        return access_decision::deny(reason_code::no_tenant_binding);
    }

    // 2. Tenant status.
    if (!target.is_active()) {
        return access_decision::deny(reason_code::tenant_inactive);
    }

    // 3. Policy snapshot for the tenant's industry.
    auto policy = policies_ ? policies_->snapshot(target.industry) : nullptr;
    if (!policy) {
        return access_decision::deny(reason_code::policy_error);
    }
    const auto version = policy->version();

    std::vector<effective_grant> candidates;
    std::vector<grant_trace_entry> skipped;
    for (const auto& r : roles) {
        // A partner's roles from other industries mean nothing here.
        if (r.borrowed && (!policy->has_role(r.base) ||
                           (!r.industry.empty() && !policy->has_role(r.industry)))) {
            grant_trace_entry entry;
            entry.skipped_role = r.industry.empty() ? r.base : r.base + "+" + r.industry;
            skipped.push_back(std::move(entry));
            continue;
        }
        auto effective = policy->effective_permissions(r.base, r.industry);
        if (effective.is_err()) {
            return access_decision::deny(reason_code::policy_error, version);
        }
        for (auto& eg : effective.value()) {
            if (eg.source.resource_type == resource.type && eg.source.action == action) {
                candidates.push_back(std::move(eg));
            }
        }
    }

    // 4. Sensitivity override, independent of grants. Out-of-range levels
    //    are treated as the most sensitive.
    auto level = resource.sensitivity;
    if (level < min_sensitivity || level > max_sensitivity) {
        level = max_sensitivity;
    }
    auto requirement = policy->requirement_for(level);
    if (ctx.mfa_level < requirement.min_mfa_level) {
        return access_decision::deny_constraint(constraint_category::mfa_required, version);
    }
    if (ctx.device_trust_level < requirement.min_device_trust) {
        return access_decision::deny_constraint(constraint_category::device_trust, version);
    }

    // 5. Closest grants first; the first constraint failure of the closest
    //    failing grant is the reported reason.
    std::ranges::stable_sort(candidates, {}, &effective_grant::distance);

    auto trace = std::move(skipped);
    const effective_grant* winner = nullptr;
    bool include_deleted = false;
    std::optional<constraint_category> first_failure;

    for (const auto& eg : candidates) {
        grant_trace_entry entry;
        entry.rule_id = eg.source.rule_id;
        entry.distance = eg.distance;
        entry.ambiguous = eg.ambiguous;

        if (eg.ambiguous) {
            trace.push_back(std::move(entry));
            continue;
        }
        if (cross_tenant && !eg.source.cross_tenant) {
            entry.cross_tenant_blocked = true;
            trace.push_back(std::move(entry));
            continue;
        }

        auto check = evaluate_constraints(eg.source.constraints, who.id, resource, ctx);
        if (check.satisfied) {
            entry.qualified = true;
            include_deleted = include_deleted || eg.source.include_deleted;
            if (!winner) {
                winner = &eg;
            }
        } else {
            entry.failed = check.failed;
            if (!first_failure) {
                first_failure = check.failed;
            }
        }
        trace.push_back(std::move(entry));
    }

    access_decision result;
    if (winner) {
        result = access_decision::allow(winner->source.rule_id, version);
        result.cross_tenant = cross_tenant;
        result.include_deleted = include_deleted;
    } else if (first_failure) {
        result = access_decision::deny_constraint(*first_failure, version);
    } else {
        result = access_decision::deny(reason_code::no_grant, version);
    }
    result.trace = std::move(trace);
    return result;
}

} // namespace tenantguard::security
