/**
 * @file tenant_isolation_gate.hpp
 * @brief Tenant predicate enforcement around every data operation
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include "entity_record.hpp"
#include "entity_store_interface.hpp"

#include <tenantguard/audit/audit_recorder.hpp>
#include <tenantguard/core/result.hpp>
#include <tenantguard/security/access_decision.hpp>
#include <tenantguard/security/decision_sealer.hpp>
#include <tenantguard/security/session_manager.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tenantguard::isolation {

/**
 * @brief Wraps entity storage with the session's tenant predicate
 *
 * Every call resolves the session first and scopes the store call to the
 * session's tenant, whether or not the caller ran an access check. A
 * different tenant is reachable only with an allowing decision that was
 * made under a cross-tenant grant. Reading soft-deleted rows needs an
 * allowing decision whose grant carries the include_deleted privilege.
 *
 * A decision counts only if the evaluator sealed it and it was issued to
 * the session's principal, for the tenant being accessed and for the
 * entity type of the operation. Without a sealer no decision counts.
 *
 * Every successful write and remove is recorded as a DATA_MUTATION audit
 * event.
 *
 * Thread Safety: All methods are thread-safe if the store is.
 */
class tenant_isolation_gate {
public:
    using clock_type = std::function<std::chrono::system_clock::time_point()>;

    tenant_isolation_gate(std::shared_ptr<entity_store_interface> store,
                          std::shared_ptr<security::session_manager> sessions,
                          std::shared_ptr<audit::audit_recorder> recorder,
                          std::shared_ptr<const security::decision_sealer> sealer,
                          clock_type clock = {});

    /**
     * @param decision Decision that authorized the read, if any
     * @return Rows of the effective tenant; access_denied when a cross-tenant
     *         target or include_deleted is not backed by the decision
     */
    [[nodiscard]] auto read(std::string_view session_id,
                            const entity_query& query,
                            const security::access_decision* decision = nullptr)
        -> Result<std::vector<entity_record>>;

    /**
     * @brief Create an entity in the effective tenant or update its payload
     *
     * The payload must be a JSON object. An entity owned by another tenant
     * fails with tenant_immutable.
     */
    [[nodiscard]] auto write(std::string_view session_id,
                             const entity_mutation& mutation,
                             const security::access_decision* decision = nullptr)
        -> Result<entity_record>;

    /**
     * @brief Soft delete: active -> soft_deleted
     */
    [[nodiscard]] auto remove(std::string_view session_id,
                              const entity_ref& target,
                              const security::access_decision* decision = nullptr)
        -> VoidResult;

    /**
     * @brief Move rows soft-deleted longer than older_than to purge_eligible
     *
     * Administrative operation without a session; recorded under the
     * "system" principal.
     */
    [[nodiscard]] auto mark_purge_eligible(std::string_view tenant_id,
                                           std::chrono::seconds older_than)
        -> Result<std::size_t>;

private:
    /// Session tenant, or the requested one if the decision allows crossing
    [[nodiscard]] auto effective_tenant(const security::session_info& session,
                                        const std::optional<std::string>& requested,
                                        std::string_view entity_type,
                                        const security::access_decision* decision) const
        -> Result<std::string>;

    /// Sealed allow issued to this principal for this tenant and entity type
    [[nodiscard]] bool backed_by(const security::access_decision* decision,
                                 const security::session_info& session,
                                 std::string_view tenant_id,
                                 std::string_view entity_type) const;

    void record_mutation(const security::session_info* session,
                         const std::string& tenant_id,
                         const std::string& resource,
                         const std::string& action,
                         std::map<std::string, std::string> metadata);

    [[nodiscard]] auto now() const -> std::chrono::system_clock::time_point;

    std::shared_ptr<entity_store_interface> store_;
    std::shared_ptr<security::session_manager> sessions_;
    std::shared_ptr<audit::audit_recorder> recorder_;
    std::shared_ptr<const security::decision_sealer> sealer_;
    clock_type clock_;
};

} // namespace tenantguard::isolation
