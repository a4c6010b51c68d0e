/**
 * @file logger_adapter_test.cpp
 * @brief Unit tests for logger_adapter
 */

#include <catch2/catch_test_macros.hpp>

#include "mocks/temp_directory.hpp"

#include <tenantguard/integration/logger_adapter.hpp>

#include <nlohmann/json.hpp>

#include <fstream>
#include <string>
#include <vector>

using namespace tenantguard::integration;

namespace {

auto read_trail(const std::filesystem::path &path) -> std::vector<nlohmann::json> {
  std::vector<nlohmann::json> lines;
  std::ifstream in(path);
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty()) {
      lines.push_back(nlohmann::json::parse(line));
    }
  }
  return lines;
}

logger_config trail_only(const std::filesystem::path &dir) {
  logger_config config;
  config.log_directory = dir;
  config.enable_console = false;
  config.enable_file = false;
  config.enable_security_trail = true;
  config.async_mode = false;
  return config;
}

} // namespace

TEST_CASE("LoggerAdapter: Uninitialized calls are no-ops", "[integration][logger]") {
  REQUIRE_FALSE(logger_adapter::is_initialized());
  logger_adapter::info("nothing {}", 1);
  logger_adapter::log_access_decision("p", "t", "r/1", "view", false, "no_grant", "");
  logger_adapter::flush();
  REQUIRE_FALSE(logger_adapter::is_initialized());
}

TEST_CASE("LoggerAdapter: Security trail", "[integration][logger]") {
  tenantguard::test::temp_directory dir;
  logger_adapter::initialize(trail_only(dir.path()));
  REQUIRE(logger_adapter::is_initialized());

  logger_adapter::log_access_decision("tech-1", "biz-1", "work_order/wo-1", "view",
                                      true, "granted", "hs.tech.view");
  logger_adapter::log_access_decision("tech-1", "biz-2", "work_order/wo-9", "view",
                                      false, "no_tenant_binding", "");
  logger_adapter::log_session_event(session_event::revoked, "sess-1", "tech-1", "biz-1");
  logger_adapter::log_policy_reload("home_services", 2, false, 3);
  logger_adapter::shutdown();
  REQUIRE_FALSE(logger_adapter::is_initialized());

  auto lines = read_trail(dir.path() / "security.jsonl");
  REQUIRE(lines.size() == 3);

  SECTION("Allows stay out of the trail") {
    REQUIRE(lines[0]["event_type"] == "ACCESS_DECISION");
    REQUIRE(lines[0]["outcome"] == "deny");
    REQUIRE(lines[0]["tenant_id"] == "biz-2");
    REQUIRE(lines[0]["reason"] == "no_tenant_binding");
    REQUIRE(lines[0].contains("timestamp_ms"));
  }

  SECTION("Session and reload events") {
    REQUIRE(lines[1]["event_type"] == "SESSION");
    REQUIRE(lines[1]["outcome"] == "revoked");
    REQUIRE(lines[1]["session_id"] == "sess-1");

    REQUIRE(lines[2]["event_type"] == "POLICY_RELOAD");
    REQUIRE(lines[2]["outcome"] == "failure");
    REQUIRE(lines[2]["diagnostics"] == "3");
  }
}

TEST_CASE("LoggerAdapter: Level control", "[integration][logger]") {
  tenantguard::test::temp_directory dir;
  auto config = trail_only(dir.path());
  config.min_level = log_level::warn;
  logger_adapter::initialize(config);

  REQUIRE(logger_adapter::get_min_level() == log_level::warn);
  REQUIRE_FALSE(logger_adapter::is_level_enabled(log_level::info));
  REQUIRE(logger_adapter::is_level_enabled(log_level::error));

  logger_adapter::set_min_level(log_level::debug);
  REQUIRE(logger_adapter::is_level_enabled(log_level::debug));
  REQUIRE_FALSE(logger_adapter::is_level_enabled(log_level::off));
  REQUIRE(logger_adapter::get_config().log_directory == dir.path());

  logger_adapter::shutdown();
}

TEST_CASE("LoggerAdapter: Event names", "[integration][logger]") {
  REQUIRE(logger_adapter::session_event_to_string(session_event::idle_timeout) ==
          "idle_timeout");
  REQUIRE(logger_adapter::security_event_to_string(
              security_event_type::cross_tenant_attempt) == "cross_tenant_attempt");
}
