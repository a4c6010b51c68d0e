/**
 * @file access_evaluator.hpp
 * @brief Role, constraint and sensitivity based access decisions
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include "access_decision.hpp"
#include "access_request.hpp"
#include "decision_sealer.hpp"
#include "policy_store.hpp"
#include "principal.hpp"
#include "tenant.hpp"

#include <memory>
#include <string_view>

namespace tenantguard::security {

/**
 * @brief Decides whether a principal may perform an action on a resource
 *
 * Evaluation order:
 * 1. the principal must hold an active binding to the tenant, unless an
 *    API partner's multi-tenant grant covers it (only cross_tenant grants
 *    may then qualify)
 * 2. the tenant must be active
 * 3. the industry policy must be loaded
 * 4. the resource sensitivity requirement must be met
 * 5. some effective grant for (type, action) must satisfy all constraints
 *
 * Under the partner exception, roles of other bindings that the target
 * policy does not define are skipped and listed in the trace.
 *
 * Every decision names its subject. With a sealer, allows are sealed so
 * the isolation gate can verify where they came from.
 *
 * The evaluator has no side effects; auditing is done by the caller.
 */
class access_evaluator {
public:
    explicit access_evaluator(std::shared_ptr<const policy_store> policies,
                              std::shared_ptr<const decision_sealer> sealer = nullptr);

    [[nodiscard]] auto authorize(const principal& who,
                                 const tenant& target,
                                 const resource_ref& resource,
                                 std::string_view action,
                                 const request_context& ctx) const -> access_decision;

private:
    [[nodiscard]] auto evaluate(const principal& who,
                                const tenant& target,
                                const resource_ref& resource,
                                std::string_view action,
                                const request_context& ctx) const -> access_decision;

    std::shared_ptr<const policy_store> policies_;
    std::shared_ptr<const decision_sealer> sealer_;
};

} // namespace tenantguard::security
