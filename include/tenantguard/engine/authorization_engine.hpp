/**
 * @file authorization_engine.hpp
 * @brief Facade wiring principal resolution, policy evaluation, sessions,
 *        tenant isolation and auditing together
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include "engine_config.hpp"

#include <tenantguard/audit/audit_recorder.hpp>
#include <tenantguard/audit/audit_store_interface.hpp>
#include <tenantguard/core/result.hpp>
#include <tenantguard/isolation/entity_store_interface.hpp>
#include <tenantguard/isolation/tenant_isolation_gate.hpp>
#include <tenantguard/security/access_decision.hpp>
#include <tenantguard/security/access_evaluator.hpp>
#include <tenantguard/security/access_request.hpp>
#include <tenantguard/security/decision_sealer.hpp>
#include <tenantguard/security/policy_repository_interface.hpp>
#include <tenantguard/security/policy_store.hpp>
#include <tenantguard/security/principal_resolver.hpp>
#include <tenantguard/security/principal_store_interface.hpp>
#include <tenantguard/security/session_manager.hpp>
#include <tenantguard/security/token_codec.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace tenantguard::engine {

/**
 * @brief One authorization request from a business service
 *
 * The caller is identified by auth_token, or by principal_id (with an
 * optional session_id) when it was authenticated upstream.
 */
struct authorization_request {
    std::string auth_token;
    std::string principal_id;
    std::string session_id;

    /// Tenant the caller acts in
    std::string tenant_id;

    /// resource.tenant_id defaults to tenant_id when empty
    security::resource_ref resource;
    std::string action;

    /// Request id, ip, user agent
    std::map<std::string, std::string> metadata;
};

/**
 * @brief Outcome returned to the business caller
 */
struct authorization_response {
    security::access_decision decision;

    /// Reason safe to show the caller
    std::string public_reason;

    /// Audit entry recording the decision, when one was written
    std::optional<audit::audit_ack> audit;

    [[nodiscard]] bool allowed() const noexcept { return decision.allowed(); }
};

/**
 * @brief A newly created session and its bearer token
 */
struct session_handle {
    security::session_info session;

    /// Empty when no token secret is configured
    std::string token;
};

/**
 * @brief Storage backends and clock used by the engine
 */
struct engine_components {
    std::shared_ptr<security::principal_store_interface> principals;
    std::shared_ptr<security::policy_repository_interface> policies;
    std::shared_ptr<isolation::entity_store_interface> entities;
    std::shared_ptr<audit::audit_store_interface> audit;

    /// Defaults to the system clock
    std::function<std::chrono::system_clock::time_point()> clock;
};

/**
 * @brief Tenant Isolation and Access Control engine
 *
 * Every authorize() call produces exactly one audit entry. Decisions on
 * resources at or above the configured sensitivity threshold, or on
 * actions the policy marks critical, are audited synchronously; if that
 * write fails the request is denied with audit_write_failed.
 *
 * @example
 * @code
 * auto config = load_engine_config("tenantguard.json");
 * auto engine = authorization_engine::create(config.value());
 *
 * authorization_request request;
 * request.auth_token = token;
 * request.tenant_id = "biz-1";
 * request.resource = {"biz-1", "work_order", "wo-17", 2};
 * request.action = "complete_work_order";
 *
 * auto response = engine.value()->authorize(request);
 * if (!response.allowed()) {
 *     return forbidden(response.public_reason);
 * }
 * @endcode
 */
class authorization_engine {
public:
    /**
     * @brief Open SQLite backends, load policies and start the audit worker
     */
    [[nodiscard]] static auto create(const engine_config& config)
        -> Result<std::unique_ptr<authorization_engine>>;

    authorization_engine(engine_config config, engine_components components);
    ~authorization_engine();

    authorization_engine(const authorization_engine&) = delete;
    authorization_engine& operator=(const authorization_engine&) = delete;

    // =========================================================================
    // Authorization
    // =========================================================================

    [[nodiscard]] auto authorize(const authorization_request& request)
        -> authorization_response;

    /**
     * @brief Record a domain audit fact
     *
     * event_type defaults to DOMAIN_EVENT; sequence and hashes are assigned.
     */
    [[nodiscard]] auto record_event(audit::audit_record event,
                                    audit::write_mode mode = audit::write_mode::async)
        -> Result<audit::audit_ack>;

    // =========================================================================
    // Sessions
    // =========================================================================

    /**
     * @brief Open a session for a principal bound to an active tenant
     *
     * Roles default to the principal's binding; the idle timeout defaults
     * to the role's timeout in the tenant's industry policy.
     */
    [[nodiscard]] auto session_create(security::session_request request)
        -> Result<session_handle>;

    /**
     * @brief Forcibly terminate one session
     *
     * A SESSION_REVOKED audit entry is written before the session stops
     * validating.
     */
    [[nodiscard]] auto session_revoke(std::string_view session_id, std::string_view reason)
        -> Result<std::size_t>;

    /// Every session of a principal, optionally only within one tenant
    [[nodiscard]] auto session_revoke_principal(std::string_view principal_id,
                                                std::string_view reason,
                                                std::string_view tenant_id = {})
        -> Result<std::size_t>;

    [[nodiscard]] auto session_revoke_tenant(std::string_view tenant_id,
                                             std::string_view reason)
        -> Result<std::size_t>;

    [[nodiscard]] auto session_heartbeat(std::string_view session_id)
        -> Result<security::session_info>;

    [[nodiscard]] auto session_logout(std::string_view session_id) -> VoidResult;

    [[nodiscard]] auto elevate_mfa(std::string_view session_id, std::uint8_t level)
        -> Result<security::session_info>;

    // =========================================================================
    // Policy
    // =========================================================================

    /// Validate and activate a new document
    auto policy_reload(std::string_view document_json) -> security::reload_result;

    /// Activate a stored version (rollback included)
    auto policy_reload(security::industry_vertical industry, std::uint64_t version)
        -> security::reload_result;

    // =========================================================================
    // Components
    // =========================================================================

    [[nodiscard]] auto gate() -> isolation::tenant_isolation_gate& { return *gate_; }
    [[nodiscard]] auto recorder() -> audit::audit_recorder& { return *recorder_; }
    [[nodiscard]] auto sessions() -> security::session_manager& { return *sessions_; }
    [[nodiscard]] auto policies() -> security::policy_store& { return *policies_; }
    [[nodiscard]] auto resolver() -> security::principal_resolver& { return *resolver_; }
    [[nodiscard]] auto config() const noexcept -> const engine_config& { return config_; }

private:
    /// Principal for the request, or the deny reason if it cannot be resolved
    auto resolve_caller(const authorization_request& request)
        -> Result<security::principal>;

    auto audit_decision(const authorization_request& request,
                        const security::resource_ref& resource,
                        const std::optional<security::tenant>& target,
                        const std::string& principal_id,
                        const std::string& session_id,
                        security::access_decision& decision)
        -> std::optional<audit::audit_ack>;

    auto on_revocation(const security::session_info& session, std::string_view reason)
        -> VoidResult;

    void audit_policy_reload(const security::reload_result& result);

    [[nodiscard]] auto now() const -> std::chrono::system_clock::time_point;

    engine_config config_;
    engine_components components_;

    std::shared_ptr<security::policy_store> policies_;
    std::shared_ptr<security::session_manager> sessions_;
    std::shared_ptr<const security::token_codec> tokens_;
    std::shared_ptr<const security::decision_sealer> sealer_;
    std::shared_ptr<security::principal_resolver> resolver_;
    std::unique_ptr<security::access_evaluator> evaluator_;
    std::shared_ptr<audit::audit_recorder> recorder_;
    std::unique_ptr<isolation::tenant_isolation_gate> gate_;
};

} // namespace tenantguard::engine
