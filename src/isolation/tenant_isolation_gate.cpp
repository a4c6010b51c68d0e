/**
 * @file tenant_isolation_gate.cpp
 * @brief Implementation of the tenant isolation gate
 *
 * @copyright Copyright (c) 2025
 */

#include <tenantguard/isolation/tenant_isolation_gate.hpp>

#include <tenantguard/compat/format.hpp>
#include <tenantguard/integration/logger_adapter.hpp>

#include <nlohmann/json.hpp>

namespace tenantguard::isolation {

using integration::logger_adapter;
using integration::security_event_type;
using json = nlohmann::json;

namespace {

constexpr const char* system_principal = "system";

auto validate_payload(const std::string& payload) -> VoidResult {
    try {
        auto parsed = json::parse(payload);
        if (!parsed.is_object()) {
            return tenantguard_void_error(error_codes::invalid_argument,
                                          "Entity payload must be a JSON object");
        }
    }
    catch (const json::parse_error& ex) {
        return tenantguard_void_error(error_codes::invalid_argument,
                                      "Entity payload is not valid JSON", ex.what());
    }
    return ok();
}

} // namespace

tenant_isolation_gate::tenant_isolation_gate(
    std::shared_ptr<entity_store_interface> store,
    std::shared_ptr<security::session_manager> sessions,
    std::shared_ptr<audit::audit_recorder> recorder,
    std::shared_ptr<const security::decision_sealer> sealer,
    clock_type clock)
    : store_(std::move(store)),
      sessions_(std::move(sessions)),
      recorder_(std::move(recorder)),
      sealer_(std::move(sealer)),
      clock_(std::move(clock)) {}

auto tenant_isolation_gate::read(std::string_view session_id,
                                 const entity_query& query,
                                 const security::access_decision* decision)
    -> Result<std::vector<entity_record>> {
    auto session = sessions_->validate(session_id);
    if (session.is_err()) {
        return session.error();
    }

    auto tenant_id =
        effective_tenant(session.value(), query.tenant_id, query.entity_type, decision);
    if (tenant_id.is_err()) {
        return tenant_id.error();
    }

    if (query.include_deleted &&
        !(backed_by(decision, session.value(), tenant_id.value(), query.entity_type) &&
          decision->include_deleted)) {
        logger_adapter::log_security_event(
            security_event_type::access_denied,
            compat::format("Read of deleted {} rows in tenant {} without privilege",
                           query.entity_type, tenant_id.value()),
            session.value().principal_id);
        return tenantguard_error<std::vector<entity_record>>(
            error_codes::access_denied, "Reading deleted rows requires a privileged grant");
    }

    return store_->find(tenant_id.value(), query);
}

auto tenant_isolation_gate::write(std::string_view session_id,
                                  const entity_mutation& mutation,
                                  const security::access_decision* decision)
    -> Result<entity_record> {
    auto session = sessions_->validate(session_id);
    if (session.is_err()) {
        return session.error();
    }

    auto tenant_id = effective_tenant(session.value(), mutation.tenant_id,
                                      mutation.entity_type, decision);
    if (tenant_id.is_err()) {
        return tenant_id.error();
    }

    if (auto valid = validate_payload(mutation.payload); valid.is_err()) {
        return valid.error();
    }

    auto written = store_->upsert(tenant_id.value(), mutation, now());
    if (written.is_err()) {
        if (written.error().code == error_codes::tenant_immutable) {
            logger_adapter::log_security_event(
                security_event_type::cross_tenant_attempt,
                compat::format("Write to {}/{} owned by another tenant from tenant {}",
                               mutation.entity_type, mutation.entity_id, tenant_id.value()),
                session.value().principal_id);
        }
        return written;
    }

    const auto& record = written.value();
    record_mutation(&session.value(), record.tenant_id,
                    record.entity_type + "/" + record.entity_id, "write",
                    {{"operation", record.created_at == record.updated_at ? "create" : "update"},
                     {"entity_state", to_string(record.state)}});
    return written;
}

auto tenant_isolation_gate::remove(std::string_view session_id,
                                   const entity_ref& target,
                                   const security::access_decision* decision)
    -> VoidResult {
    auto session = sessions_->validate(session_id);
    if (session.is_err()) {
        return session.error();
    }

    auto tenant_id =
        effective_tenant(session.value(), target.tenant_id, target.entity_type, decision);
    if (tenant_id.is_err()) {
        return tenant_id.error();
    }

    auto removed =
        store_->soft_delete(tenant_id.value(), target.entity_type, target.entity_id, now());
    if (removed.is_err()) {
        return removed;
    }

    record_mutation(&session.value(), tenant_id.value(),
                    target.entity_type + "/" + target.entity_id, "remove",
                    {{"operation", "soft_delete"},
                     {"entity_state", to_string(entity_state::soft_deleted)}});
    return ok();
}

auto tenant_isolation_gate::mark_purge_eligible(std::string_view tenant_id,
                                                std::chrono::seconds older_than)
    -> Result<std::size_t> {
    auto marked = store_->mark_purge_eligible(tenant_id, now() - older_than);
    if (marked.is_err() || marked.value() == 0) {
        return marked;
    }

    record_mutation(nullptr, std::string(tenant_id), "*", "mark_purge_eligible",
                    {{"operation", "mark_purge_eligible"},
                     {"count", std::to_string(marked.value())}});
    return marked;
}

auto tenant_isolation_gate::effective_tenant(
    const security::session_info& session,
    const std::optional<std::string>& requested,
    std::string_view entity_type,
    const security::access_decision* decision) const -> Result<std::string> {
    if (!requested || *requested == session.tenant_id) {
        return session.tenant_id;
    }

    if (backed_by(decision, session, *requested, entity_type) && decision->cross_tenant) {
        return *requested;
    }

    logger_adapter::log_security_event(
        security_event_type::cross_tenant_attempt,
        compat::format("Session tenant {} requested tenant {}", session.tenant_id,
                       *requested),
        session.principal_id);
    return tenantguard_error<std::string>(error_codes::tenant_mismatch,
                                          "Target tenant differs from session tenant");
}

bool tenant_isolation_gate::backed_by(const security::access_decision* decision,
                                      const security::session_info& session,
                                      std::string_view tenant_id,
                                      std::string_view entity_type) const {
    if (decision == nullptr || !decision->allowed()) {
        return false;
    }
    if (!sealer_ || !sealer_->verify(*decision)) {
        logger_adapter::log_security_event(
            security_event_type::access_denied,
            compat::format("Unsealed decision presented for {} in tenant {}", entity_type,
                           tenant_id),
            session.principal_id);
        return false;
    }
    return decision->principal_id == session.principal_id &&
           decision->tenant_id == tenant_id && decision->resource_type == entity_type;
}

void tenant_isolation_gate::record_mutation(const security::session_info* session,
                                            const std::string& tenant_id,
                                            const std::string& resource,
                                            const std::string& action,
                                            std::map<std::string, std::string> metadata) {
    audit::audit_record event;
    event.tenant_id = tenant_id;
    event.event_type = audit::audit_event_type::data_mutation;
    event.severity = audit::audit_severity::medium;
    event.principal_id = session ? session->principal_id : system_principal;
    event.session_id = session ? session->id : "";
    event.resource = resource;
    event.action = action;
    event.metadata = std::move(metadata);

    auto ack = recorder_->record(std::move(event), audit::write_mode::async);
    if (ack.is_err()) {
        logger_adapter::error("Mutation of {} in tenant {} not audited: {}", resource,
                              tenant_id, ack.error().message);
    }
}

auto tenant_isolation_gate::now() const -> std::chrono::system_clock::time_point {
    return clock_ ? clock_() : std::chrono::system_clock::now();
}

} // namespace tenantguard::isolation
