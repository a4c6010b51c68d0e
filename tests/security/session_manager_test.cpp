/**
 * @file session_manager_test.cpp
 * @brief Unit tests for the session lifecycle
 */

#include <catch2/catch_test_macros.hpp>

#include "mocks/in_memory_stores.hpp"

#include <tenantguard/security/session_manager.hpp>

#include <atomic>
#include <thread>
#include <vector>

using namespace tenantguard::security;
using namespace std::chrono_literals;
using tenantguard::test::ManualClock;

namespace {

session_request technician_session(std::chrono::seconds idle = 15min) {
  session_request req;
  req.principal_id = "tech-1";
  req.tenant_id = "biz-1";
  req.base_role = "Technician";
  req.idle_timeout = idle;
  return req;
}

} // namespace

TEST_CASE("SessionManager: Create and validate", "[security][session]") {
  ManualClock clock;
  session_config config;
  config.sweep_interval = 0s; // keep terminated sessions inspectable
  session_manager sessions(config, clock.fn());

  auto created = sessions.create(technician_session());
  REQUIRE(created.is_ok());
  const auto &s = created.value();
  REQUIRE(s.id.size() >= 32);
  REQUIRE(s.is_active());
  REQUIRE(s.tenant_id == "biz-1");
  REQUIRE(s.expires_at == clock.now + std::chrono::hours(8));

  SECTION("Missing tenant is rejected") {
    auto req = technician_session();
    req.tenant_id.clear();
    auto bad = sessions.create(req);
    REQUIRE(bad.is_err());
    REQUIRE(bad.error().code == tenantguard::error_codes::session_create_failed);
  }

  SECTION("Unknown session") {
    auto missing = sessions.validate("nope");
    REQUIRE(missing.is_err());
    REQUIRE(missing.error().code == tenantguard::error_codes::session_not_found);
  }

  SECTION("Idle past the role timeout expires the session") {
    clock.advance(16min);
    auto v = sessions.validate(s.id);
    REQUIRE(v.is_err());
    REQUIRE(v.error().code == tenantguard::error_codes::session_expired);

    auto info = sessions.get(s.id);
    REQUIRE(info.value().cause == termination_cause::idle_timeout);
  }

  SECTION("Heartbeat keeps the session alive") {
    clock.advance(10min);
    REQUIRE(sessions.heartbeat(s.id).is_ok());
    clock.advance(10min);
    REQUIRE(sessions.validate(s.id).is_ok());
  }

  SECTION("Absolute lifetime is enforced despite activity") {
    for (int i = 0; i < 40; ++i) {
      clock.advance(14min);
      (void)sessions.heartbeat(s.id);
    }
    auto v = sessions.validate(s.id);
    REQUIRE(v.is_err());
    REQUIRE(sessions.get(s.id).value().cause == termination_cause::expired);
  }

  SECTION("Logout is idempotent") {
    REQUIRE(sessions.logout(s.id).is_ok());
    REQUIRE(sessions.logout(s.id).is_ok());
    REQUIRE(sessions.get(s.id).value().cause == termination_cause::logout);
  }

  SECTION("Revoked session reports session_revoked") {
    auto revoked = sessions.revoke(s.id, "stolen device");
    REQUIRE(revoked.is_ok());
    REQUIRE(revoked.value() == 1);

    auto v = sessions.validate(s.id);
    REQUIRE(v.error().code == tenantguard::error_codes::session_revoked);

    // Already terminated
    REQUIRE(sessions.revoke(s.id, "again").value() == 0);
  }
}

TEST_CASE("SessionManager: Step-up MFA window", "[security][session]") {
  ManualClock clock;
  session_config config;
  config.step_up_window = 4h;
  session_manager sessions(config, clock.fn());

  auto req = technician_session(8h);
  auto s = sessions.create(req).value();
  REQUIRE(s.mfa_level == 0);

  auto elevated = sessions.elevate_mfa(s.id, 2);
  REQUIRE(elevated.is_ok());
  REQUIRE(elevated.value().mfa_level == 2);

  clock.advance(3h);
  REQUIRE(sessions.heartbeat(s.id).value().mfa_level == 2);

  clock.advance(2h);
  auto lapsed = sessions.heartbeat(s.id);
  REQUIRE(lapsed.is_ok());
  REQUIRE(lapsed.value().mfa_level == 0);
}

TEST_CASE("SessionManager: Bulk revocation", "[security][session]") {
  ManualClock clock;
  session_config config;
  config.max_concurrent_sessions = 0;
  session_manager sessions(config, clock.fn());

  std::vector<std::string> hook_calls;
  sessions.set_revocation_hook(
      [&](const session_info &info, std::string_view reason) -> tenantguard::VoidResult {
        hook_calls.push_back(info.id + ":" + std::string(reason));
        return tenantguard::ok();
      });

  auto a = sessions.create(technician_session()).value();
  auto req_b = technician_session();
  req_b.tenant_id = "biz-2";
  auto b = sessions.create(req_b).value();
  auto req_c = technician_session();
  req_c.principal_id = "tech-2";
  auto c = sessions.create(req_c).value();

  SECTION("Every session of a principal") {
    REQUIRE(sessions.revoke_principal("tech-1", "offboarded").value() == 2);
    REQUIRE(hook_calls.size() == 2);
    REQUIRE(sessions.validate(c.id).is_ok());
  }

  SECTION("Principal within one tenant") {
    REQUIRE(sessions.revoke_principal_in_tenant("tech-1", "biz-2", "binding removed")
                .value() == 1);
    REQUIRE(sessions.validate(a.id).is_ok());
    REQUIRE(sessions.validate(b.id).is_err());
  }

  SECTION("Every session of a tenant") {
    REQUIRE(sessions.revoke_tenant("biz-1", "tenant suspended").value() == 2);
    REQUIRE(sessions.validate(b.id).is_ok());
    REQUIRE(sessions.active_sessions("tech-1").size() == 1);
  }

  SECTION("Hook failure is reported but revocation still happens") {
    sessions.set_revocation_hook([](const session_info &, std::string_view) {
      return tenantguard::tenantguard_void_error(
          tenantguard::error_codes::audit_write_failed, "Audit offline");
    });
    auto revoked = sessions.revoke(a.id, "incident");
    REQUIRE(revoked.is_err());
    REQUIRE(revoked.error().code == tenantguard::error_codes::audit_write_failed);
    REQUIRE(sessions.validate(a.id).error().code ==
            tenantguard::error_codes::session_revoked);
  }

  SECTION("Sweep drops terminated sessions") {
    REQUIRE(sessions.logout(a.id).is_ok());
    REQUIRE(sessions.sweep() == 1);
    REQUIRE(sessions.get(a.id).is_err());
  }
}

TEST_CASE("SessionManager: Terminated sessions are swept on activity",
          "[security][session]") {
  ManualClock clock;
  session_config config;
  config.sweep_interval = 5min;
  session_manager sessions(config, clock.fn());

  auto a = sessions.create(technician_session()).value();
  auto req_b = technician_session(8h);
  req_b.principal_id = "tech-2";
  auto b = sessions.create(req_b).value();
  REQUIRE(sessions.logout(a.id).is_ok());
  REQUIRE(sessions.size() == 2);

  SECTION("Not before the interval elapses") {
    clock.advance(4min);
    REQUIRE(sessions.heartbeat(b.id).is_ok());
    REQUIRE(sessions.size() == 2);
  }

  SECTION("Heartbeat after the interval drops them") {
    clock.advance(5min);
    REQUIRE(sessions.heartbeat(b.id).is_ok());
    REQUIRE(sessions.size() == 1);
    REQUIRE(sessions.get(a.id).error().code ==
            tenantguard::error_codes::session_not_found);
  }

  SECTION("Idle sessions are swept too") {
    auto c = sessions.create(technician_session(10min)).value();
    clock.advance(20min);
    REQUIRE(sessions.heartbeat(b.id).is_ok());
    REQUIRE(sessions.size() == 1);
    REQUIRE(sessions.validate(c.id).is_err());
  }

  SECTION("Create sweeps as well") {
    clock.advance(6min);
    REQUIRE(sessions.create(technician_session()).is_ok());
    REQUIRE(sessions.size() == 2);
  }

  SECTION("Zero interval leaves sweeping to the caller") {
    session_config manual;
    manual.sweep_interval = 0s;
    session_manager kept(manual, clock.fn());
    auto x = kept.create(technician_session()).value();
    REQUIRE(kept.logout(x.id).is_ok());
    clock.advance(1h);
    REQUIRE(kept.create(req_b).is_ok());
    REQUIRE(kept.size() == 2);
    REQUIRE(kept.sweep() == 1);
  }
}

TEST_CASE("SessionManager: Concurrent session limit", "[security][session]") {
  ManualClock clock;
  session_config config;
  config.max_concurrent_sessions = 2;
  session_manager sessions(config, clock.fn());

  auto first = sessions.create(technician_session()).value();
  clock.advance(1s);
  auto second = sessions.create(technician_session()).value();
  clock.advance(1s);
  auto third = sessions.create(technician_session()).value();

  REQUIRE(sessions.validate(first.id).error().code ==
          tenantguard::error_codes::session_revoked);
  REQUIRE(sessions.validate(second.id).is_ok());
  REQUIRE(sessions.validate(third.id).is_ok());
}

TEST_CASE("SessionManager: Racing terminations resolve to one cause",
          "[security][session][concurrency]") {
  session_manager sessions;
  std::atomic<int> revoked{0};

  for (int round = 0; round < 20; ++round) {
    auto req = technician_session();
    req.principal_id = "racer-" + std::to_string(round);
    auto s = sessions.create(req).value();

    std::thread logout([&] { (void)sessions.logout(s.id); });
    std::thread revoke([&] {
      auto r = sessions.revoke(s.id, "race");
      if (r.is_ok())
        revoked += static_cast<int>(r.value());
    });
    logout.join();
    revoke.join();

    auto info = sessions.get(s.id).value();
    REQUIRE_FALSE(info.is_active());
    REQUIRE((info.cause == termination_cause::logout ||
             info.cause == termination_cause::revoked));
  }
  REQUIRE(revoked.load() <= 20);
}
