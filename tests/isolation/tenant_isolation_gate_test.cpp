/**
 * @file tenant_isolation_gate_test.cpp
 * @brief Unit tests for tenant-scoped data access
 */

#include <catch2/catch_test_macros.hpp>

#include "mocks/in_memory_stores.hpp"
#include "mocks/temp_directory.hpp"

#include <tenantguard/isolation/tenant_isolation_gate.hpp>

using namespace tenantguard::isolation;
using namespace std::chrono_literals;
using tenantguard::audit::audit_event_type;
using tenantguard::security::access_decision;
using tenantguard::security::decision_sealer;
using tenantguard::security::reason_code;
using tenantguard::security::session_manager;
using tenantguard::security::session_request;
using tenantguard::test::ManualClock;
using tenantguard::test::MockAuditStore;
using tenantguard::test::MockEntityStore;
using tenantguard::test::temp_directory;
namespace codes = tenantguard::error_codes;

namespace {

entity_mutation work_order(const std::string &id, const std::string &payload = "{}") {
  entity_mutation m;
  m.entity_type = "work_order";
  m.entity_id = id;
  m.payload = payload;
  return m;
}

entity_query work_orders() {
  entity_query q;
  q.entity_type = "work_order";
  return q;
}

// Decision as the evaluator issues it
access_decision issued(const decision_sealer &sealer, const std::string &principal,
                       const std::string &tenant, const std::string &rule,
                       bool cross_tenant = false, bool include_deleted = false) {
  auto d = access_decision::allow(rule, 1);
  d.principal_id = principal;
  d.tenant_id = tenant;
  d.resource_type = "work_order";
  d.action = "view";
  d.cross_tenant = cross_tenant;
  d.include_deleted = include_deleted;
  REQUIRE(sealer.seal(d).is_ok());
  return d;
}

} // namespace

TEST_CASE("TenantIsolationGate: Session tenant predicate", "[isolation]") {
  temp_directory dir;
  ManualClock clock;
  auto entities = std::make_shared<MockEntityStore>();
  auto audit_store = std::make_shared<MockAuditStore>();
  auto sessions = std::make_shared<session_manager>(
      tenantguard::security::session_config{}, clock.fn());

  tenantguard::audit::audit_config audit_config;
  audit_config.buffer_path = dir.path() / "audit.jsonl";
  auto recorder = std::make_shared<tenantguard::audit::audit_recorder>(
      audit_store, audit_config, clock.fn());

  auto sealer = decision_sealer::create().value();
  tenant_isolation_gate gate(entities, sessions, recorder, sealer, clock.fn());

  session_request req;
  req.principal_id = "tech-1";
  req.tenant_id = "biz-1";
  auto biz1 = sessions->create(req).value();
  req.principal_id = "tech-2";
  req.tenant_id = "biz-2";
  auto biz2 = sessions->create(req).value();
  req.principal_id = "partner-1";
  req.tenant_id = "biz-1";
  auto partner = sessions->create(req).value();

  REQUIRE(gate.write(biz1.id, work_order("wo-1", R"({"status":"open"})")).is_ok());
  REQUIRE(gate.write(biz2.id, work_order("wo-2")).is_ok());

  SECTION("Reads only see the session tenant") {
    auto rows = gate.read(biz1.id, work_orders());
    REQUIRE(rows.is_ok());
    REQUIRE(rows.value().size() == 1);
    REQUIRE(rows.value().front().entity_id == "wo-1");
    REQUIRE(rows.value().front().tenant_id == "biz-1");
  }

  SECTION("Explicit other tenant without a cross-tenant decision") {
    auto q = work_orders();
    q.tenant_id = "biz-2";
    auto rows = gate.read(biz1.id, q);
    REQUIRE(rows.is_err());
    REQUIRE(rows.error().code == codes::tenant_mismatch);

    auto plain = issued(*sealer, "tech-1", "biz-2", "hs.viewer.wo");
    REQUIRE(gate.read(biz1.id, q, &plain).error().code == codes::tenant_mismatch);
  }

  SECTION("Cross-tenant decision opens the other tenant") {
    auto q = work_orders();
    q.tenant_id = "biz-2";
    auto d = issued(*sealer, "partner-1", "biz-2", "hs.partner.view", true);
    auto rows = gate.read(partner.id, q, &d);
    REQUIRE(rows.is_ok());
    REQUIRE(rows.value().front().entity_id == "wo-2");

    auto denied = access_decision::deny(reason_code::no_grant, 1);
    denied.cross_tenant = true;
    REQUIRE(gate.read(partner.id, q, &denied).is_err());
  }

  SECTION("Cross-tenant decision must be the evaluator's and match the request") {
    auto q = work_orders();
    q.tenant_id = "biz-2";

    // Built by hand, never sealed
    auto forged = access_decision::allow("hs.partner.view", 1);
    forged.principal_id = "tech-1";
    forged.tenant_id = "biz-2";
    forged.resource_type = "work_order";
    forged.cross_tenant = true;
    REQUIRE(gate.read(biz1.id, q, &forged).error().code == codes::tenant_mismatch);

    // Sealed by a different key
    auto foreign = decision_sealer::create().value();
    auto other_key = issued(*foreign, "partner-1", "biz-2", "hs.partner.view", true);
    REQUIRE(gate.read(partner.id, q, &other_key).error().code == codes::tenant_mismatch);

    // Flag widened after sealing
    auto widened = issued(*sealer, "partner-1", "biz-2", "hs.partner.view");
    widened.cross_tenant = true;
    REQUIRE(gate.read(partner.id, q, &widened).error().code == codes::tenant_mismatch);

    // Partner's decision presented with another principal's session
    auto borrowed = issued(*sealer, "partner-1", "biz-2", "hs.partner.view", true);
    REQUIRE(gate.read(biz1.id, q, &borrowed).error().code == codes::tenant_mismatch);

    // Decision for another tenant
    auto elsewhere = issued(*sealer, "partner-1", "biz-3", "hs.partner.view", true);
    REQUIRE(gate.read(partner.id, q, &elsewhere).error().code == codes::tenant_mismatch);

    // Decision for another entity type
    auto invoices = issued(*sealer, "partner-1", "biz-2", "hs.partner.view", true);
    invoices.resource_type = "invoice";
    REQUIRE(sealer->seal(invoices).is_ok());
    REQUIRE(gate.read(partner.id, q, &invoices).error().code == codes::tenant_mismatch);
  }

  SECTION("Naming the session tenant explicitly is allowed") {
    auto q = work_orders();
    q.tenant_id = "biz-1";
    REQUIRE(gate.read(biz1.id, q).value().size() == 1);
  }

  SECTION("Entity of another tenant cannot be taken over") {
    auto takeover = gate.write(biz1.id, work_order("wo-2"));
    REQUIRE(takeover.is_err());
    REQUIRE(takeover.error().code == codes::tenant_immutable);
    REQUIRE(entities->rows.at({"work_order", "wo-2"}).tenant_id == "biz-2");
  }

  SECTION("Payload must be a JSON object") {
    auto bad = gate.write(biz1.id, work_order("wo-3", "[1,2]"));
    REQUIRE(bad.error().code == tenantguard::error_codes::invalid_argument);
    REQUIRE(gate.write(biz1.id, work_order("wo-3", "{oops")).is_err());
    REQUIRE_FALSE(entities->rows.contains({"work_order", "wo-3"}));
  }

  SECTION("Soft-deleted rows are hidden") {
    REQUIRE(gate.remove(biz1.id, {"work_order", "wo-1", std::nullopt}).is_ok());
    REQUIRE(gate.read(biz1.id, work_orders()).value().empty());

    // Removing twice finds nothing active
    auto again = gate.remove(biz1.id, {"work_order", "wo-1", std::nullopt});
    REQUIRE(again.error().code == codes::entity_not_found);

    auto q = work_orders();
    q.include_deleted = true;
    REQUIRE(gate.read(biz1.id, q).error().code == codes::access_denied);

    auto viewer = issued(*sealer, "tech-1", "biz-1", "hs.viewer.wo");
    REQUIRE(gate.read(biz1.id, q, &viewer).error().code == codes::access_denied);

    auto forged = access_decision::allow("hs.owner.wo", 1);
    forged.principal_id = "tech-1";
    forged.tenant_id = "biz-1";
    forged.resource_type = "work_order";
    forged.include_deleted = true;
    REQUIRE(gate.read(biz1.id, q, &forged).error().code == codes::access_denied);

    auto someone_else = issued(*sealer, "own-1", "biz-1", "hs.owner.wo", false, true);
    REQUIRE(gate.read(biz1.id, q, &someone_else).error().code == codes::access_denied);

    auto owner = issued(*sealer, "tech-1", "biz-1", "hs.owner.wo", false, true);
    auto rows = gate.read(biz1.id, q, &owner);
    REQUIRE(rows.value().size() == 1);
    REQUIRE(rows.value().front().state == entity_state::soft_deleted);
  }

  SECTION("Without a sealer no decision opens anything") {
    tenant_isolation_gate strict(entities, sessions, recorder, nullptr, clock.fn());
    auto q = work_orders();
    q.tenant_id = "biz-2";
    auto d = issued(*sealer, "partner-1", "biz-2", "hs.partner.view", true);
    REQUIRE(strict.read(partner.id, q, &d).error().code == codes::tenant_mismatch);
  }

  SECTION("Removing another tenant's entity finds nothing") {
    auto removed = gate.remove(biz1.id, {"work_order", "wo-2", std::nullopt});
    REQUIRE(removed.error().code == codes::entity_not_found);
  }

  SECTION("Mutations are audited") {
    clock.advance(1min);
    REQUIRE(gate.write(biz1.id, work_order("wo-1", R"({"status":"done"})")).is_ok());
    REQUIRE(gate.remove(biz1.id, {"work_order", "wo-1", std::nullopt}).is_ok());

    auto entries = audit_store->tenant_entries("biz-1");
    REQUIRE(entries.size() == 3);
    for (const auto &e : entries) {
      REQUIRE(e.event_type == audit_event_type::data_mutation);
      REQUIRE(e.principal_id == "tech-1");
      REQUIRE(e.session_id == biz1.id);
      REQUIRE(e.resource == "work_order/wo-1");
    }
    REQUIRE(entries[0].metadata.at("operation") == "create");
    REQUIRE(entries[1].metadata.at("operation") == "update");
    REQUIRE(entries[2].metadata.at("operation") == "soft_delete");
  }

  SECTION("Purge eligibility after the grace period") {
    REQUIRE(gate.remove(biz1.id, {"work_order", "wo-1", std::nullopt}).is_ok());
    REQUIRE(gate.mark_purge_eligible("biz-1", 24h).value() == 0);

    clock.advance(25h);
    REQUIRE(gate.mark_purge_eligible("biz-1", 24h).value() == 1);
    REQUIRE(entities->rows.at({"work_order", "wo-1"}).state ==
            entity_state::purge_eligible);

    auto last = audit_store->tenant_entries("biz-1").back();
    REQUIRE(last.principal_id == "system");
    REQUIRE(last.metadata.at("count") == "1");
  }

  SECTION("Expired or ended sessions are rejected") {
    REQUIRE(sessions->logout(biz1.id).is_ok());
    REQUIRE(gate.read(biz1.id, work_orders()).error().code == codes::session_revoked);

    clock.advance(31min);
    auto w = gate.write(biz2.id, work_order("wo-9"));
    REQUIRE(w.error().code == codes::session_expired);
  }
}
