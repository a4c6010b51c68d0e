/**
 * @file authorization_engine.cpp
 * @brief Implementation of the authorization engine facade
 *
 * @copyright Copyright (c) 2025
 */

#include <tenantguard/engine/authorization_engine.hpp>

#include <tenantguard/compat/format.hpp>
#include <tenantguard/integration/logger_adapter.hpp>
#include <tenantguard/security/policy_loader.hpp>
#include <tenantguard/storage/sqlite_audit_store.hpp>
#include <tenantguard/storage/sqlite_entity_store.hpp>
#include <tenantguard/storage/sqlite_policy_repository.hpp>
#include <tenantguard/storage/sqlite_principal_storage.hpp>

#include <algorithm>
#include <vector>

namespace tenantguard::engine {

using integration::logger_adapter;
using integration::security_event_type;
using security::access_decision;
using security::reason_code;

namespace {

/// Audit partition for events not tied to one tenant
constexpr const char* platform_partition = "_platform";

auto deny_reason_for(int code) -> reason_code {
    if (code == error_codes::session_expired) {
        return reason_code::session_expired;
    }
    if (code == error_codes::session_revoked) {
        return reason_code::session_revoked;
    }
    return reason_code::unauthenticated;
}

auto severity_for(const access_decision& decision, bool critical_action)
    -> audit::audit_severity {
    if (critical_action) {
        return audit::audit_severity::critical;
    }
    if (decision.allowed()) {
        return audit::audit_severity::low;
    }
    switch (decision.reason) {
        case reason_code::policy_error:
        case reason_code::no_tenant_binding:
        case reason_code::audit_write_failed:
            return audit::audit_severity::high;
        default:
            return audit::audit_severity::medium;
    }
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

auto authorization_engine::create(const engine_config& config)
    -> Result<std::unique_ptr<authorization_engine>> {
    if (config.enable_logging) {
        logger_adapter::initialize(config.logging);
    }

    auto principals = storage::sqlite_principal_storage::open(config.database_path);
    if (principals.is_err()) {
        return principals.error();
    }
    auto policies = storage::sqlite_policy_repository::open(config.database_path);
    if (policies.is_err()) {
        return policies.error();
    }
    auto entities = storage::sqlite_entity_store::open(config.database_path);
    if (entities.is_err()) {
        return entities.error();
    }
    auto audit_store =
        storage::sqlite_audit_store::open(config.audit.database_path, config.audit.audit_timeout);
    if (audit_store.is_err()) {
        return audit_store.error();
    }

    engine_components components;
    components.principals = std::move(principals.value());
    components.policies = std::move(policies.value());
    components.entities = std::move(entities.value());
    components.audit = std::move(audit_store.value());

    auto engine = std::make_unique<authorization_engine>(config, std::move(components));

    auto loaded = engine->policies_->load_policies();
    if (loaded.is_err()) {
        return loaded.error();
    }
    logger_adapter::info("Activated stored policies for {} industries", loaded.value());

    if (!config.policy_directory.empty()) {
        std::error_code ec;
        std::vector<std::filesystem::path> files;
        for (const auto& entry : std::filesystem::directory_iterator(config.policy_directory, ec)) {
            if (entry.is_regular_file() && entry.path().extension() == ".json") {
                files.push_back(entry.path());
            }
        }
        if (ec) {
            return tenantguard_error<std::unique_ptr<authorization_engine>>(
                error_codes::config_file_error, "Cannot read policy directory",
                config.policy_directory.string());
        }
        std::sort(files.begin(), files.end());

        for (const auto& file : files) {
            auto text = security::read_policy_text(file);
            if (!text) {
                logger_adapter::error("Cannot read policy document {}", file.string());
                continue;
            }
            auto result = engine->policy_reload(*text);
            if (!result.success) {
                for (const auto& diag : result.diagnostics) {
                    logger_adapter::warn("{}: {}", file.filename().string(), diag.message);
                }
            }
        }
    }

    return engine;
}

authorization_engine::authorization_engine(engine_config config,
                                           engine_components components)
    : config_(std::move(config)), components_(std::move(components)) {
    auto clock = components_.clock;

    policies_ = std::make_shared<security::policy_store>(components_.policies);
    sessions_ = std::make_shared<security::session_manager>(config_.session, clock);
    if (!config_.token.secret.empty()) {
        tokens_ = std::make_shared<const security::token_codec>(config_.token);
    }
    resolver_ = std::make_shared<security::principal_resolver>(components_.principals,
                                                               tokens_, sessions_, clock);
    auto sealer = security::decision_sealer::create();
    if (sealer.is_ok()) {
        sealer_ = std::move(sealer.value());
    } else {
        logger_adapter::error("Decision sealing unavailable, gate exceptions disabled: {}",
                              sealer.error().message);
    }
    evaluator_ = std::make_unique<security::access_evaluator>(policies_, sealer_);
    recorder_ =
        std::make_shared<audit::audit_recorder>(components_.audit, config_.audit, clock);
    gate_ = std::make_unique<isolation::tenant_isolation_gate>(
        components_.entities, sessions_, recorder_, sealer_, clock);

    sessions_->set_revocation_hook(
        [this](const security::session_info& session, std::string_view reason) {
            return on_revocation(session, reason);
        });
}

authorization_engine::~authorization_engine() {
    sessions_->set_revocation_hook({});
    recorder_->stop();
}

// ============================================================================
// Authorization
// ============================================================================

auto authorization_engine::authorize(const authorization_request& request)
    -> authorization_response {
    auto resource = request.resource;
    if (resource.tenant_id.empty()) {
        resource.tenant_id = request.tenant_id;
    }

    std::string principal_id = request.principal_id;
    std::string session_id = request.session_id;
    std::optional<security::tenant> target;
    access_decision decision;

    // Only a tenant in the directory gets its own audit partition.
    auto loaded = components_.principals->get_tenant(request.tenant_id);
    if (loaded.is_ok()) {
        target = loaded.value();
    }

    auto caller = resolve_caller(request);
    if (caller.is_err()) {
        decision = access_decision::deny(deny_reason_for(caller.error().code));
    } else {
        const auto& who = caller.value();
        principal_id = who.id;
        if (!who.session_id.empty()) {
            session_id = who.session_id;
        }

        if (loaded.is_err()) {
            if (loaded.error().code == error_codes::tenant_not_found) {
                decision = access_decision::deny(reason_code::no_tenant_binding);
            } else {
                logger_adapter::error("Tenant lookup failed for {}: {}", request.tenant_id,
                                      loaded.error().message);
                decision = access_decision::deny(reason_code::policy_error);
            }
        } else {
            security::request_context ctx;
            ctx.now = now();
            ctx.session_id = session_id;
            ctx.mfa_level = who.mfa_level;
            ctx.device_trust_level = who.device_trust_level;
            ctx.location = who.location;
            ctx.metadata = request.metadata;

            decision = evaluator_->authorize(who, *target, resource, request.action, ctx);
        }

        if (decision.reason == reason_code::no_tenant_binding && !who.bindings.empty()) {
            logger_adapter::log_security_event(
                security_event_type::cross_tenant_attempt,
                compat::format("{} {} in tenant {}", request.action, resource.describe(),
                               resource.tenant_id),
                principal_id);
        }
    }

    auto ack = audit_decision(request, resource, target, principal_id, session_id, decision);

    logger_adapter::log_access_decision(principal_id, request.tenant_id, resource.describe(),
                                        request.action, decision.allowed(),
                                        decision.reason_string(), decision.rule_id);

    authorization_response response;
    response.public_reason = decision.public_reason();
    response.decision = std::move(decision);
    response.audit = std::move(ack);
    return response;
}

auto authorization_engine::record_event(audit::audit_record event, audit::write_mode mode)
    -> Result<audit::audit_ack> {
    if (event.event_type == audit::audit_event_type::access_decision) {
        event.event_type = audit::audit_event_type::domain_event;
    }
    return recorder_->record(std::move(event), mode);
}

auto authorization_engine::resolve_caller(const authorization_request& request)
    -> Result<security::principal> {
    if (!request.auth_token.empty()) {
        return resolver_->resolve(request.auth_token);
    }
    if (!request.principal_id.empty()) {
        return resolver_->resolve_id(request.principal_id, request.session_id);
    }
    return tenantguard_error<security::principal>(error_codes::unauthenticated,
                                                  "No credentials supplied");
}

auto authorization_engine::audit_decision(const authorization_request& request,
                                          const security::resource_ref& resource,
                                          const std::optional<security::tenant>& target,
                                          const std::string& principal_id,
                                          const std::string& session_id,
                                          access_decision& decision)
    -> std::optional<audit::audit_ack> {
    std::shared_ptr<const security::policy_set> snapshot;
    if (target) {
        snapshot = policies_->snapshot(target->industry);
    }
    bool critical = snapshot && snapshot->is_critical_action(request.action);
    bool synchronous =
        critical || resource.sensitivity >= config_.audit.sync_sensitivity_threshold;

    audit::audit_record event;
    event.tenant_id = target ? target->id : platform_partition;
    event.event_type = audit::audit_event_type::access_decision;
    event.severity = severity_for(decision, critical);
    event.principal_id = principal_id;
    event.resource = resource.describe();
    event.action = request.action;
    event.decision = std::string(security::to_string(decision.outcome));
    event.rule_id = decision.rule_id;
    event.reason = decision.reason_string();
    event.session_id = session_id;
    event.policy_version = decision.policy_version;
    event.metadata = request.metadata;
    if (!target && !request.tenant_id.empty()) {
        event.metadata["requested_tenant"] = request.tenant_id;
    }
    if (resource.tenant_id != request.tenant_id) {
        event.metadata["resource_tenant"] = resource.tenant_id;
    }

    auto ack = recorder_->record(std::move(event), synchronous ? audit::write_mode::sync
                                                               : audit::write_mode::async);
    if (ack.is_ok()) {
        return ack.value();
    }

    if (synchronous) {
        logger_adapter::log_security_event(
            security_event_type::audit_degraded,
            compat::format("Denying {} on {}: audit write failed: {}", request.action,
                           resource.describe(), ack.error().message),
            principal_id);
        decision.downgrade(reason_code::audit_write_failed);
    } else {
        logger_adapter::error("Access decision for {} not audited: {}", principal_id,
                              ack.error().message);
    }
    return std::nullopt;
}

// ============================================================================
// Sessions
// ============================================================================

auto authorization_engine::session_create(security::session_request request)
    -> Result<session_handle> {
    auto loaded = components_.principals->get_principal(request.principal_id);
    if (loaded.is_err()) {
        return loaded.error();
    }
    const auto& who = loaded.value();
    if (!who.active) {
        return tenantguard_error<session_handle>(error_codes::principal_inactive,
                                                 "Principal is inactive", who.id);
    }

    const auto* binding = who.binding_for(request.tenant_id);
    if (binding == nullptr) {
        logger_adapter::log_security_event(
            security_event_type::cross_tenant_attempt,
            compat::format("Session requested for unbound tenant {}", request.tenant_id),
            who.id);
        return tenantguard_error<session_handle>(error_codes::tenant_mismatch,
                                                 "Principal is not bound to tenant");
    }

    auto target = components_.principals->get_tenant(request.tenant_id);
    if (target.is_err()) {
        return target.error();
    }
    if (!target.value().is_active()) {
        return tenantguard_error<session_handle>(error_codes::access_denied,
                                                 "Tenant is not active", request.tenant_id);
    }

    if (request.base_role.empty()) {
        request.base_role = binding->base_role;
    }
    if (request.industry_role.empty()) {
        request.industry_role = binding->industry_role;
    }
    if (!request.idle_timeout) {
        if (auto snapshot = policies_->snapshot(target.value().industry)) {
            request.idle_timeout =
                snapshot->idle_timeout(request.base_role, request.industry_role);
        }
    }

    auto created = sessions_->create(request);
    if (created.is_err()) {
        return created.error();
    }

    session_handle handle;
    handle.session = std::move(created.value());

    if (tokens_) {
        auto token = resolver_->issue_token(handle.session.principal_id, handle.session.id,
                                            handle.session.expires_at);
        if (token.is_err()) {
            auto closed = sessions_->logout(handle.session.id);
            if (closed.is_err()) {
                logger_adapter::error("Failed to close session {}: {}", handle.session.id,
                                      closed.error().message);
            }
            return token.error();
        }
        handle.token = std::move(token.value());
    }
    return handle;
}

auto authorization_engine::session_revoke(std::string_view session_id,
                                          std::string_view reason) -> Result<std::size_t> {
    return sessions_->revoke(session_id, reason);
}

auto authorization_engine::session_revoke_principal(std::string_view principal_id,
                                                    std::string_view reason,
                                                    std::string_view tenant_id)
    -> Result<std::size_t> {
    if (tenant_id.empty()) {
        return sessions_->revoke_principal(principal_id, reason);
    }
    return sessions_->revoke_principal_in_tenant(principal_id, tenant_id, reason);
}

auto authorization_engine::session_revoke_tenant(std::string_view tenant_id,
                                                 std::string_view reason)
    -> Result<std::size_t> {
    return sessions_->revoke_tenant(tenant_id, reason);
}

auto authorization_engine::session_heartbeat(std::string_view session_id)
    -> Result<security::session_info> {
    return sessions_->heartbeat(session_id);
}

auto authorization_engine::session_logout(std::string_view session_id) -> VoidResult {
    return sessions_->logout(session_id);
}

auto authorization_engine::elevate_mfa(std::string_view session_id, std::uint8_t level)
    -> Result<security::session_info> {
    return sessions_->elevate_mfa(session_id, level);
}

auto authorization_engine::on_revocation(const security::session_info& session,
                                         std::string_view reason) -> VoidResult {
    audit::audit_record event;
    event.tenant_id = session.tenant_id;
    event.event_type = audit::audit_event_type::session_revoked;
    event.severity = audit::audit_severity::high;
    event.principal_id = session.principal_id;
    event.resource = "session/" + session.id;
    event.action = "revoke";
    event.reason = std::string(reason);
    event.session_id = session.id;

    auto ack = recorder_->record(std::move(event), audit::write_mode::sync);
    if (ack.is_err()) {
        return ack.error();
    }
    return ok();
}

// ============================================================================
// Policy
// ============================================================================

auto authorization_engine::policy_reload(std::string_view document_json)
    -> security::reload_result {
    auto result = policies_->reload(document_json);
    audit_policy_reload(result);
    return result;
}

auto authorization_engine::policy_reload(security::industry_vertical industry,
                                         std::uint64_t version) -> security::reload_result {
    auto result = policies_->activate_version(industry, version);
    audit_policy_reload(result);
    return result;
}

void authorization_engine::audit_policy_reload(const security::reload_result& result) {
    auto industry =
        result.industry ? std::string(security::to_string(*result.industry)) : "unknown";

    audit::audit_record event;
    event.tenant_id = platform_partition;
    event.event_type = audit::audit_event_type::policy_reload;
    event.severity = result.success ? audit::audit_severity::medium
                                    : audit::audit_severity::high;
    event.resource = "policy/" + industry;
    event.action = "reload";
    event.reason = result.success ? "installed" : "rejected";
    event.policy_version = result.version;
    event.metadata["active_version"] = std::to_string(result.active_version);
    event.metadata["diagnostics"] = std::to_string(result.diagnostics.size());

    auto ack = recorder_->record(std::move(event), audit::write_mode::async);
    if (ack.is_err()) {
        logger_adapter::error("Policy reload of {} not audited: {}", industry,
                              ack.error().message);
    }
}

auto authorization_engine::now() const -> std::chrono::system_clock::time_point {
    return components_.clock ? components_.clock() : std::chrono::system_clock::now();
}

} // namespace tenantguard::engine
