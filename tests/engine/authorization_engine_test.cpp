/**
 * @file authorization_engine_test.cpp
 * @brief End-to-end tests of the authorization engine over in-memory stores
 */

#include <catch2/catch_test_macros.hpp>

#include "mocks/in_memory_stores.hpp"
#include "mocks/temp_directory.hpp"
#include "mocks/test_policies.hpp"

#include <tenantguard/engine/authorization_engine.hpp>

using namespace tenantguard::engine;
using namespace tenantguard::security;
using namespace std::chrono_literals;
using tenantguard::audit::audit_event_type;
using tenantguard::audit::audit_severity;
using tenantguard::test::cyclic_policy;
using tenantguard::test::home_services_policy;
using tenantguard::test::ManualClock;
using tenantguard::test::MockAuditStore;
using tenantguard::test::MockEntityStore;
using tenantguard::test::MockPolicyRepository;
using tenantguard::test::MockPrincipalStore;
using tenantguard::test::temp_directory;
namespace codes = tenantguard::error_codes;

namespace {

principal staff(const std::string &id, const std::string &tenant, const std::string &role) {
  principal p;
  p.id = id;
  p.bindings.push_back({tenant, role, "", true});
  return p;
}

tenant home_services_tenant(const std::string &id) {
  tenant t;
  t.id = id;
  t.industry = industry_vertical::home_services;
  t.plan = plan_tier::professional;
  return t;
}

/**
 * Engine over in-memory stores with two home services tenants.
 *
 * biz-1: tech-1 (Technician), mgr-1 (Manager), own-1 (Owner)
 * biz-2: tech-2 (Technician)
 */
struct engine_fixture {
  explicit engine_fixture(bool with_buffer = true) {
    principals->principals["tech-1"] = staff("tech-1", "biz-1", "Technician");
    principals->principals["mgr-1"] = staff("mgr-1", "biz-1", "Manager");
    principals->principals["own-1"] = staff("own-1", "biz-1", "Owner");
    principals->principals["tech-2"] = staff("tech-2", "biz-2", "Technician");
    principals->tenants["biz-1"] = home_services_tenant("biz-1");
    principals->tenants["biz-2"] = home_services_tenant("biz-2");

    engine_config config;
    config.token.secret = "engine-test-secret";
    config.audit.database_path = ":memory:";
    if (with_buffer) {
      config.audit.buffer_path = dir.path() / "audit.jsonl";
    } else {
      config.audit.buffer_path.clear();
    }

    engine_components components;
    components.principals = principals;
    components.policies = policies;
    components.entities = entities;
    components.audit = audit;
    components.clock = clock.fn();

    engine = std::make_unique<authorization_engine>(config, components);
    auto installed = engine->policy_reload(home_services_policy(1));
    REQUIRE(installed.success);
  }

  auto login(const std::string &principal_id, const std::string &tenant_id)
      -> session_handle {
    session_request req;
    req.principal_id = principal_id;
    req.tenant_id = tenant_id;
    auto handle = engine->session_create(req);
    REQUIRE(handle.is_ok());
    return handle.value();
  }

  temp_directory dir;
  ManualClock clock;
  std::shared_ptr<MockPrincipalStore> principals = std::make_shared<MockPrincipalStore>();
  std::shared_ptr<MockPolicyRepository> policies = std::make_shared<MockPolicyRepository>();
  std::shared_ptr<MockEntityStore> entities = std::make_shared<MockEntityStore>();
  std::shared_ptr<MockAuditStore> audit = std::make_shared<MockAuditStore>();
  std::unique_ptr<authorization_engine> engine;
};

authorization_request work_order_request(const std::string &token,
                                         const std::string &tenant,
                                         const std::string &assignee,
                                         std::uint8_t sensitivity = 2) {
  authorization_request request;
  request.auth_token = token;
  request.tenant_id = tenant;
  request.resource.type = "work_order";
  request.resource.id = "wo-17";
  request.resource.sensitivity = sensitivity;
  request.resource.owner_attributes["assigned_to"] = assignee;
  request.action = "complete_work_order";
  request.metadata["request_id"] = "req-1";
  return request;
}

authorization_request estimate_request(const std::string &principal_id,
                                       std::int64_t amount) {
  authorization_request request;
  request.principal_id = principal_id;
  request.tenant_id = "biz-1";
  request.resource.type = "estimate";
  request.resource.id = "est-3";
  request.resource.monetary_value = amount;
  request.action = "approve_estimate";
  return request;
}

} // namespace

TEST_CASE("AuthorizationEngine: Technician scenarios", "[engine]") {
  engine_fixture f;
  auto tech = f.login("tech-1", "biz-1");
  REQUIRE_FALSE(tech.token.empty());
  REQUIRE(tech.session.idle_timeout == 15min);
  REQUIRE(tech.session.base_role == "Technician");

  SECTION("Completing an assigned work order is allowed and audited") {
    auto response = f.engine->authorize(work_order_request(tech.token, "biz-1", "tech-1"));
    REQUIRE(response.allowed());
    REQUIRE(response.public_reason == "granted");
    REQUIRE(response.decision.rule_id == "hs.tech.complete");
    REQUIRE(response.audit.has_value());
    REQUIRE(response.audit->tenant_id == "biz-1");

    auto entries = f.audit->tenant_entries("biz-1");
    REQUIRE(entries.size() == 1);
    const auto &e = entries.front();
    REQUIRE(e.event_type == audit_event_type::access_decision);
    REQUIRE(e.principal_id == "tech-1");
    REQUIRE(e.session_id == tech.session.id);
    REQUIRE(e.resource == "work_order/wo-17");
    REQUIRE(e.decision == "allow");
    REQUIRE(e.rule_id == "hs.tech.complete");
    REQUIRE(e.policy_version == 1);
    REQUIRE(e.metadata.at("request_id") == "req-1");
  }

  SECTION("Work order of another tenant is denied without detail") {
    auto response = f.engine->authorize(work_order_request(tech.token, "biz-2", "tech-1"));
    REQUIRE_FALSE(response.allowed());
    REQUIRE(response.decision.reason == reason_code::no_tenant_binding);
    REQUIRE(response.public_reason == "denied");

    auto entries = f.audit->tenant_entries("biz-2");
    REQUIRE(entries.size() == 1);
    REQUIRE(entries.front().reason == "no_tenant_binding");
    REQUIRE(entries.front().severity == audit_severity::high);
  }

  SECTION("Sensitive work order without MFA is denied and audited synchronously") {
    auto response =
        f.engine->authorize(work_order_request(tech.token, "biz-1", "tech-1", 5));
    REQUIRE(response.decision.failed_constraint == constraint_category::mfa_required);
    REQUIRE(response.public_reason == "constraint_failed:mfa_required");
    REQUIRE(response.audit.has_value());
    REQUIRE_FALSE(response.audit->buffered);

    REQUIRE(f.engine->elevate_mfa(tech.session.id, 1).is_ok());
    auto elevated =
        f.engine->authorize(work_order_request(tech.token, "biz-1", "tech-1", 5));
    REQUIRE(elevated.allowed());
  }

  SECTION("Idle session is rejected after the role timeout") {
    f.clock.advance(16min);
    auto response = f.engine->authorize(work_order_request(tech.token, "biz-1", "tech-1"));
    REQUIRE_FALSE(response.allowed());
    REQUIRE(response.decision.reason == reason_code::session_expired);
    REQUIRE(response.public_reason == "session_expired");
    REQUIRE(f.audit->tenant_entries("biz-1").back().reason == "session_expired");
  }

  SECTION("Activity keeps the session alive") {
    for (int i = 0; i < 4; ++i) {
      f.clock.advance(10min);
      REQUIRE(f.engine->authorize(work_order_request(tech.token, "biz-1", "tech-1"))
                  .allowed());
    }
  }

  SECTION("Forged token") {
    auto forged = tech.token;
    forged.back() = forged.back() == 'a' ? 'b' : 'a';
    auto response = f.engine->authorize(work_order_request(forged, "biz-1", "tech-1"));
    REQUIRE(response.decision.reason == reason_code::unauthenticated);
    REQUIRE(response.public_reason == "denied");
  }
}

TEST_CASE("AuthorizationEngine: Manager approval ceiling", "[engine]") {
  engine_fixture f;

  auto above = f.engine->authorize(estimate_request("mgr-1", 750000));
  REQUIRE_FALSE(above.allowed());
  REQUIRE(above.public_reason == "constraint_failed:approval_ceiling");

  auto within = f.engine->authorize(estimate_request("mgr-1", 250000));
  REQUIRE(within.allowed());

  auto owner = f.engine->authorize(estimate_request("own-1", 750000));
  REQUIRE(owner.allowed());

  // Critical action entries are written synchronously with critical severity
  auto entries = f.audit->tenant_entries("biz-1");
  REQUIRE(entries.size() == 3);
  for (const auto &e : entries) {
    REQUIRE(e.severity == audit_severity::critical);
  }
  REQUIRE(entries[0].decision == "deny");
  REQUIRE(entries[2].principal_id == "own-1");
}

TEST_CASE("AuthorizationEngine: Caller resolution failures", "[engine]") {
  engine_fixture f;

  SECTION("No credentials") {
    auto request = estimate_request("", 100);
    auto response = f.engine->authorize(request);
    REQUIRE(response.decision.reason == reason_code::unauthenticated);
    REQUIRE(f.audit->tenant_entries("biz-1").size() == 1);
  }

  SECTION("Unknown tenant") {
    auto request = estimate_request("own-1", 100);
    request.tenant_id = "biz-404";
    auto response = f.engine->authorize(request);
    REQUIRE(response.decision.reason == reason_code::no_tenant_binding);
  }

  SECTION("Tenant ids outside the directory are audited on the platform partition") {
    auto request = estimate_request("own-1", 100);
    request.tenant_id = "biz-404";
    REQUIRE_FALSE(f.engine->authorize(request).allowed());

    auto anonymous = estimate_request("", 100);
    anonymous.tenant_id = "made-up-tenant";
    REQUIRE(f.engine->authorize(anonymous).decision.reason == reason_code::unauthenticated);

    REQUIRE(f.audit->tenant_entries("biz-404").empty());
    REQUIRE(f.audit->tenant_entries("made-up-tenant").empty());
    REQUIRE_FALSE(f.engine->recorder().has_partition("biz-404"));
    REQUIRE_FALSE(f.engine->recorder().has_partition("made-up-tenant"));

    auto platform = f.audit->tenant_entries("_platform");
    REQUIRE(platform.size() == 3); // policy install plus both denials
    REQUIRE(platform[1].metadata.at("requested_tenant") == "biz-404");
    REQUIRE(platform[1].reason == "no_tenant_binding");
    REQUIRE(platform[2].metadata.at("requested_tenant") == "made-up-tenant");
    REQUIRE(f.engine->recorder().verify_chain("_platform").value().intact());
  }

  SECTION("Forged credentials against a real tenant stay in that tenant") {
    auto request = work_order_request("not-a-token", "biz-2", "tech-1");
    REQUIRE_FALSE(f.engine->authorize(request).allowed());
    REQUIRE(f.audit->tenant_entries("biz-2").size() == 1);
    REQUIRE(f.audit->tenant_entries("_platform").size() == 1);
  }

  SECTION("Directory failure fails closed") {
    f.principals->fail_reads = true;
    auto response = f.engine->authorize(estimate_request("own-1", 100));
    REQUIRE_FALSE(response.allowed());
  }
}

TEST_CASE("AuthorizationEngine: Audit failure denies synchronous decisions", "[engine]") {
  engine_fixture f(false);
  f.audit->fail_appends = true;

  auto critical = f.engine->authorize(estimate_request("mgr-1", 250000));
  REQUIRE_FALSE(critical.allowed());
  REQUIRE(critical.decision.reason == reason_code::audit_write_failed);
  REQUIRE(critical.public_reason == "audit_write_failed");
  REQUIRE_FALSE(critical.audit.has_value());

  // Routine decisions are queued instead
  authorization_request routine = estimate_request("own-1", 100);
  routine.resource.type = "work_order";
  routine.resource.id = "wo-1";
  routine.action = "view";
  auto response = f.engine->authorize(routine);
  REQUIRE(response.allowed());
  REQUIRE(response.audit.has_value());
  REQUIRE(response.audit->buffered);

  // Nothing is lost once the store recovers
  f.audit->fail_appends = false;
  REQUIRE(f.engine->recorder().flush() == 0);
  auto entries = f.audit->tenant_entries("biz-1");
  REQUIRE(entries.size() == 2);
  REQUIRE(entries[0].sequence == 1);
  REQUIRE(entries[1].sequence == 2);
}

TEST_CASE("AuthorizationEngine: Sessions", "[engine][session]") {
  engine_fixture f;

  SECTION("Tenant the principal is not bound to") {
    session_request req;
    req.principal_id = "tech-1";
    req.tenant_id = "biz-2";
    auto created = f.engine->session_create(req);
    REQUIRE(created.is_err());
    REQUIRE(created.error().code == codes::tenant_mismatch);
  }

  SECTION("Suspended tenant") {
    f.principals->tenants["biz-1"].status = tenant_status::suspended;
    session_request req;
    req.principal_id = "tech-1";
    req.tenant_id = "biz-1";
    REQUIRE(f.engine->session_create(req).error().code == codes::access_denied);
  }

  SECTION("Unknown principal") {
    session_request req;
    req.principal_id = "ghost";
    req.tenant_id = "biz-1";
    REQUIRE(f.engine->session_create(req).error().code == codes::principal_not_found);
  }

  SECTION("Revocation is audited before the session stops working") {
    auto tech = f.login("tech-1", "biz-1");
    auto revoked = f.engine->session_revoke(tech.session.id, "lost device");
    REQUIRE(revoked.is_ok());
    REQUIRE(revoked.value() == 1);

    auto entries = f.audit->tenant_entries("biz-1");
    REQUIRE(entries.size() == 1);
    REQUIRE(entries.front().event_type == audit_event_type::session_revoked);
    REQUIRE(entries.front().reason == "lost device");
    REQUIRE(entries.front().session_id == tech.session.id);

    auto response = f.engine->authorize(work_order_request(tech.token, "biz-1", "tech-1"));
    REQUIRE(response.decision.reason == reason_code::session_revoked);
  }

  SECTION("Tenant-wide revocation") {
    auto a = f.login("tech-1", "biz-1");
    auto b = f.login("mgr-1", "biz-1");
    auto c = f.login("tech-2", "biz-2");
    REQUIRE(f.engine->session_revoke_tenant("biz-1", "suspended").value() == 2);
    REQUIRE(f.engine->session_heartbeat(a.session.id).is_err());
    REQUIRE(f.engine->session_heartbeat(b.session.id).is_err());
    REQUIRE(f.engine->session_heartbeat(c.session.id).is_ok());
  }

  SECTION("Logout") {
    auto tech = f.login("tech-1", "biz-1");
    REQUIRE(f.engine->session_logout(tech.session.id).is_ok());
    REQUIRE(f.engine->session_logout(tech.session.id).is_ok());
    REQUIRE(f.audit->tenant_entries("biz-1").empty());
  }

  SECTION("Data access through the gate uses the session tenant") {
    auto tech = f.login("tech-1", "biz-1");
    tenantguard::isolation::entity_mutation m;
    m.entity_type = "work_order";
    m.entity_id = "wo-17";
    m.payload = R"({"assigned_to":"tech-1"})";
    REQUIRE(f.engine->gate().write(tech.session.id, m).is_ok());
    REQUIRE(f.entities->rows.at({"work_order", "wo-17"}).tenant_id == "biz-1");
  }
}

TEST_CASE("AuthorizationEngine: Terminated sessions leave memory", "[engine][session]") {
  engine_fixture f;

  auto a = f.login("tech-1", "biz-1");
  auto b = f.login("mgr-1", "biz-1");
  REQUIRE(f.engine->session_logout(a.session.id).is_ok());
  REQUIRE(f.engine->session_revoke(b.session.id, "lost device").is_ok());
  REQUIRE(f.engine->sessions().size() == 2);

  f.clock.advance(f.engine->config().session.sweep_interval);
  auto c = f.login("tech-2", "biz-2");
  REQUIRE(f.engine->sessions().size() == 1);
  REQUIRE(f.engine->session_heartbeat(c.session.id).is_ok());

  auto stale = f.engine->authorize(work_order_request(a.token, "biz-1", "tech-1"));
  REQUIRE_FALSE(stale.allowed());
}

TEST_CASE("AuthorizationEngine: Partner decisions open other tenants only to the partner",
          "[engine][isolation]") {
  engine_fixture f;
  principal partner;
  partner.id = "partner-1";
  partner.kind = principal_kind::api_partner;
  partner.bindings.push_back({"biz-1", "Partner", "", true});
  partner.multi_tenant_grant = true;
  partner.cross_tenant_scope = {"biz-2"};
  f.principals->principals["partner-1"] = partner;

  auto tech2 = f.login("tech-2", "biz-2");
  tenantguard::isolation::entity_mutation m;
  m.entity_type = "work_order";
  m.entity_id = "wo-2";
  m.payload = R"({"assigned_to":"tech-2"})";
  REQUIRE(f.engine->gate().write(tech2.session.id, m).is_ok());

  auto handle = f.login("partner-1", "biz-1");
  authorization_request request;
  request.auth_token = handle.token;
  request.tenant_id = "biz-2";
  request.resource.type = "work_order";
  request.resource.id = "wo-2";
  request.action = "view";
  auto response = f.engine->authorize(request);
  REQUIRE(response.allowed());
  REQUIRE(response.decision.cross_tenant);

  tenantguard::isolation::entity_query q;
  q.entity_type = "work_order";
  q.tenant_id = "biz-2";

  SECTION("The partner reads the other tenant with its own decision") {
    auto rows = f.engine->gate().read(handle.session.id, q, &response.decision);
    REQUIRE(rows.is_ok());
    REQUIRE(rows.value().size() == 1);
    REQUIRE(rows.value().front().tenant_id == "biz-2");
  }

  SECTION("A staff session cannot borrow the partner's decision") {
    auto tech = f.login("tech-1", "biz-1");
    auto rows = f.engine->gate().read(tech.session.id, q, &response.decision);
    REQUIRE(rows.is_err());
    REQUIRE(rows.error().code == codes::tenant_mismatch);
  }

  SECTION("Widening the decision breaks its seal") {
    auto widened = response.decision;
    widened.include_deleted = true;
    q.include_deleted = true;
    auto rows = f.engine->gate().read(handle.session.id, q, &widened);
    REQUIRE(rows.is_err());
  }
}

TEST_CASE("AuthorizationEngine: Policy reload", "[engine][policy]") {
  engine_fixture f;

  SECTION("Cyclic document is rejected and the old version keeps serving") {
    auto result = f.engine->policy_reload(cyclic_policy(2));
    REQUIRE_FALSE(result.success);
    REQUIRE(result.active_version == 1);
    REQUIRE(f.engine->policies().active_version(industry_vertical::home_services) == 1u);

    REQUIRE(f.engine->authorize(estimate_request("mgr-1", 250000)).allowed());

    auto platform = f.audit->tenant_entries("_platform");
    REQUIRE(platform.size() == 2);
    REQUIRE(platform[0].event_type == audit_event_type::policy_reload);
    REQUIRE(platform[0].reason == "installed");
    REQUIRE(platform[1].reason == "rejected");
    REQUIRE(platform[1].severity == audit_severity::high);
  }

  SECTION("Rollback to a stored version") {
    REQUIRE(f.engine->policy_reload(home_services_policy(2)).success);
    auto rollback = f.engine->policy_reload(industry_vertical::home_services, 1);
    REQUIRE(rollback.success);
    REQUIRE(f.engine->policies().active_version(industry_vertical::home_services) == 1u);
    REQUIRE(f.audit->tenant_entries("_platform").size() == 3);
  }
}

TEST_CASE("AuthorizationEngine: Domain events", "[engine]") {
  engine_fixture f;

  tenantguard::audit::audit_record event;
  event.tenant_id = "biz-1";
  event.principal_id = "own-1";
  event.resource = "invoice/inv-9";
  event.action = "send";
  auto ack = f.engine->record_event(event, tenantguard::audit::write_mode::sync);
  REQUIRE(ack.is_ok());
  REQUIRE(ack.value().sequence == 1);

  auto entries = f.audit->tenant_entries("biz-1");
  REQUIRE(entries.front().event_type == audit_event_type::domain_event);
  REQUIRE(f.engine->recorder().verify_chain("biz-1").value().intact());
}
