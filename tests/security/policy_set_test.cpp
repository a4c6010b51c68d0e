/**
 * @file policy_set_test.cpp
 * @brief Unit tests for policy parsing, validation and effective permissions
 */

#include <catch2/catch_test_macros.hpp>

#include "mocks/test_policies.hpp"

#include <tenantguard/security/policy_loader.hpp>
#include <tenantguard/security/policy_set.hpp>

#include <algorithm>

using namespace tenantguard::security;
using tenantguard::test::cyclic_policy;
using tenantguard::test::home_services_policy;

namespace {

auto compile_text(const std::string &text, std::vector<policy_diagnostic> &diags)
    -> std::shared_ptr<const policy_set> {
  auto document = parse_policy_document(text, diags);
  if (!document)
    return nullptr;
  return policy_set::compile(std::move(*document), diags);
}

auto find_grant(const std::vector<effective_grant> &grants,
                const std::string &type, const std::string &action)
    -> const effective_grant * {
  auto it = std::ranges::find_if(grants, [&](const effective_grant &eg) {
    return eg.source.matches(type, action);
  });
  return it == grants.end() ? nullptr : &*it;
}

role_definition role(std::string name, std::vector<std::string> inherits = {},
                     bool industry_role = false) {
  role_definition r;
  r.name = std::move(name);
  r.inherits = std::move(inherits);
  r.industry_role = industry_role;
  return r;
}

bool has_code(const std::vector<policy_diagnostic> &diags, diagnostic_code code) {
  return std::ranges::any_of(
      diags, [&](const policy_diagnostic &d) { return d.code == code; });
}

grant make_grant(std::string id, std::string role, std::string type,
                 std::string action, std::vector<constraint> constraints = {}) {
  grant g;
  g.rule_id = std::move(id);
  g.role = std::move(role);
  g.resource_type = std::move(type);
  g.action = std::move(action);
  g.constraints = std::move(constraints);
  return g;
}

} // namespace

TEST_CASE("PolicySet: Compile home services policy", "[security][policy]") {
  std::vector<policy_diagnostic> diags;
  auto policy = compile_text(home_services_policy(3), diags);

  REQUIRE(policy != nullptr);
  REQUIRE(diags.empty());
  REQUIRE(policy->industry() == industry_vertical::home_services);
  REQUIRE(policy->version() == 3);
  REQUIRE(policy->roles().size() == 6);
  REQUIRE(policy->grant_count() == 11);
  REQUIRE(policy->is_critical_action("approve_estimate"));
  REQUIRE_FALSE(policy->is_critical_action("view"));
  REQUIRE(policy->is_declared("estimate", "approve_estimate"));
  REQUIRE_FALSE(policy->is_declared("estimate", "delete"));

  SECTION("Topological order puts ancestors first") {
    const auto &graph = policy->roles();
    const auto &order = graph.topological_order();
    auto position = [&](std::string_view name) {
      auto id = graph.find(name);
      REQUIRE(id.has_value());
      return std::ranges::find(order, *id) - order.begin();
    };
    REQUIRE(position("Viewer") < position("Technician"));
    REQUIRE(position("Technician") < position("Manager"));
    REQUIRE(position("Manager") < position("Owner"));
  }
}

TEST_CASE("PolicySet: Effective permissions follow inheritance",
          "[security][policy]") {
  std::vector<policy_diagnostic> diags;
  auto policy = compile_text(home_services_policy(), diags);
  REQUIRE(policy != nullptr);

  SECTION("Technician inherits Viewer grants") {
    auto effective = policy->effective_permissions("Technician");
    REQUIRE(effective.is_ok());
    const auto &grants = effective.value();

    const auto *view = find_grant(grants, "work_order", "view");
    REQUIRE(view != nullptr);
    REQUIRE(view->source.rule_id == "hs.viewer.wo");
    REQUIRE(view->distance == 1);

    const auto *complete = find_grant(grants, "work_order", "complete_work_order");
    REQUIRE(complete != nullptr);
    REQUIRE(complete->distance == 0);
    REQUIRE(complete->source.constraints.size() == 1);

    REQUIRE(find_grant(grants, "estimate", "approve_estimate") == nullptr);
  }

  SECTION("Closest role wins") {
    auto effective = policy->effective_permissions("Owner");
    REQUIRE(effective.is_ok());

    const auto *approve =
        find_grant(effective.value(), "estimate", "approve_estimate");
    REQUIRE(approve != nullptr);
    REQUIRE(approve->source.rule_id == "hs.owner.approve");
    REQUIRE(approve->source.constraints.empty());

    const auto *complete =
        find_grant(effective.value(), "work_order", "complete_work_order");
    REQUIRE(complete != nullptr);
    REQUIRE(complete->source.rule_id == "hs.mgr.complete");
    REQUIRE(complete->distance == 1);
  }

  SECTION("Industry role adds its grants") {
    auto effective = policy->effective_permissions("Technician", "Dispatcher");
    REQUIRE(effective.is_ok());
    const auto *update = find_grant(effective.value(), "work_order", "update");
    REQUIRE(update != nullptr);
    REQUIRE(update->source.rule_id == "hs.dispatch.update");
  }

  SECTION("Result is sorted and deterministic") {
    auto first = policy->effective_permissions("Owner");
    auto second = policy->effective_permissions("Owner");
    REQUIRE(first.value() == second.value());
    REQUIRE(std::ranges::is_sorted(first.value(), {}, [](const effective_grant &eg) {
      return std::make_pair(eg.source.resource_type, eg.source.action);
    }));
  }

  SECTION("Unknown role is an error") {
    auto effective = policy->effective_permissions("Janitor");
    REQUIRE(effective.is_err());
    REQUIRE(effective.error().code == tenantguard::error_codes::policy_undefined_role);
  }

  SECTION("Idle timeout takes the shorter of base and industry role") {
    REQUIRE(policy->idle_timeout("Technician") == std::chrono::minutes(15));
    REQUIRE(policy->idle_timeout("Technician", "Dispatcher") ==
            std::chrono::minutes(10));
    REQUIRE_FALSE(policy->idle_timeout("Janitor").has_value());
  }

  SECTION("Sensitivity five and above always requires MFA") {
    REQUIRE(policy->requirement_for(4).min_mfa_level == 0);
    REQUIRE(policy->requirement_for(5).min_mfa_level == 1);
    REQUIRE(policy->requirement_for(6).min_mfa_level == 2);
    REQUIRE(policy->requirement_for(6).min_device_trust == 1);
  }
}

TEST_CASE("PolicySet: Equal distance disagreement is ambiguous",
          "[security][policy]") {
  policy_document doc;
  doc.version = 1;
  doc.roles = {role("Base"), role("Extension", {}, true)};
  doc.resources["invoice"] = {"view"};
  doc.grants.push_back(make_grant("r.base", "Base", "invoice", "view"));
  doc.grants.push_back(make_grant("r.ext", "Extension", "invoice", "view",
                                  {approval_ceiling{100}}));

  std::vector<policy_diagnostic> diags;
  auto policy = policy_set::compile(doc, diags);
  REQUIRE(policy != nullptr);

  auto effective = policy->effective_permissions("Base", "Extension");
  REQUIRE(effective.is_ok());
  REQUIRE(effective.value().size() == 1);
  REQUIRE(effective.value().front().ambiguous);

  auto alone = policy->effective_permissions("Base");
  REQUIRE_FALSE(alone.value().front().ambiguous);
}

TEST_CASE("PolicySet: Validation rejects broken documents", "[security][policy]") {
  std::vector<policy_diagnostic> diags;

  SECTION("Inheritance cycle names every role on it") {
    auto policy = compile_text(cyclic_policy(2), diags);
    REQUIRE(policy == nullptr);
    auto it = std::ranges::find_if(diags, [](const policy_diagnostic &d) {
      return d.code == diagnostic_code::cycle_detected;
    });
    REQUIRE(it != diags.end());
    REQUIRE(std::ranges::find(it->subjects, std::string("A")) != it->subjects.end());
    REQUIRE(std::ranges::find(it->subjects, std::string("B")) != it->subjects.end());
    REQUIRE(it->subjects.size() == 2);
  }

  SECTION("Grant on undefined role, resource and action") {
    policy_document doc;
    doc.version = 1;
    doc.roles = {role("Viewer")};
    doc.resources["work_order"] = {"view"};
    doc.grants.push_back(make_grant("g1", "Ghost", "work_order", "view"));
    doc.grants.push_back(make_grant("g2", "Viewer", "invoice", "view"));
    doc.grants.push_back(make_grant("g3", "Viewer", "work_order", "destroy"));

    REQUIRE(policy_set::compile(doc, diags) == nullptr);
    REQUIRE(has_code(diags, diagnostic_code::undefined_role));
    REQUIRE(has_code(diags, diagnostic_code::undefined_resource));
    REQUIRE(has_code(diags, diagnostic_code::undefined_action));
  }

  SECTION("Parent role that does not exist") {
    policy_document doc;
    doc.version = 1;
    doc.roles = {role("Manager", {"Supervisor"})};
    REQUIRE(policy_set::compile(doc, diags) == nullptr);
    REQUIRE(has_code(diags, diagnostic_code::undefined_role));
  }

  SECTION("Duplicate rule ids") {
    policy_document doc;
    doc.version = 1;
    doc.roles = {role("Viewer"), role("Editor")};
    doc.resources["work_order"] = {"view"};
    doc.grants.push_back(make_grant("same", "Viewer", "work_order", "view"));
    doc.grants.push_back(make_grant("same", "Editor", "work_order", "view"));
    REQUIRE(policy_set::compile(doc, diags) == nullptr);
    REQUIRE(has_code(diags, diagnostic_code::duplicate_rule));
  }

  SECTION("Malformed constraint payload") {
    policy_document doc;
    doc.version = 1;
    doc.roles = {role("Viewer")};
    doc.resources["work_order"] = {"view"};
    doc.grants.push_back(
        make_grant("g1", "Viewer", "work_order", "view", {mfa_requirement{0}}));
    REQUIRE(policy_set::compile(doc, diags) == nullptr);
    REQUIRE(has_code(diags, diagnostic_code::invalid_constraint));
  }

  SECTION("Version zero") {
    policy_document doc;
    doc.roles = {role("Viewer")};
    REQUIRE(policy_set::compile(doc, diags) == nullptr);
    REQUIRE(has_code(diags, diagnostic_code::invalid_document));
  }
}

TEST_CASE("PolicyLoader: Structural errors", "[security][policy]") {
  std::vector<policy_diagnostic> diags;

  SECTION("Invalid JSON") {
    REQUIRE_FALSE(parse_policy_document("{ not json", diags).has_value());
    REQUIRE(has_code(diags, diagnostic_code::parse_error));
  }

  SECTION("Unknown industry") {
    REQUIRE_FALSE(parse_policy_document(
                      R"({"industry": "mining", "version": 1, "roles": []})", diags)
                      .has_value());
    REQUIRE(has_code(diags, diagnostic_code::invalid_document));
  }

  SECTION("Unknown constraint type") {
    auto text = R"({"industry": "retail", "version": 1,
      "roles": [{"name": "Clerk"}],
      "resources": {"sale": ["refund"]},
      "grants": [{"id": "r1", "role": "Clerk", "resource": "sale", "action": "refund",
                  "constraints": [{"type": "moon_phase"}]}]})";
    REQUIRE_FALSE(parse_policy_document(text, diags).has_value());
    REQUIRE(has_code(diags, diagnostic_code::invalid_constraint));
  }

  SECTION("Malformed time window") {
    auto text = R"({"industry": "retail", "version": 1,
      "roles": [{"name": "Clerk"}],
      "resources": {"sale": ["refund"]},
      "grants": [{"id": "r1", "role": "Clerk", "resource": "sale", "action": "refund",
                  "constraints": [{"type": "time_window", "start": "7am"}]}]})";
    REQUIRE_FALSE(parse_policy_document(text, diags).has_value());
    REQUIRE(has_code(diags, diagnostic_code::invalid_constraint));
  }

  SECTION("Out-of-range numbers are rejected, not narrowed") {
    auto with_sensitivity = [](const std::string &row) {
      return R"({"industry": "retail", "version": 1, "roles": [{"name": "Clerk"}],
                 "sensitivity": [)" + row + "]}";
    };

    // 261 would narrow to 5 and 256 to 0
    REQUIRE_FALSE(parse_policy_document(with_sensitivity(R"({"level": 261})"), diags)
                      .has_value());
    REQUIRE(has_code(diags, diagnostic_code::invalid_constraint));

    diags.clear();
    REQUIRE_FALSE(parse_policy_document(
                      with_sensitivity(R"({"level": 5, "min_mfa_level": 256})"), diags)
                      .has_value());
    REQUIRE(has_code(diags, diagnostic_code::invalid_constraint));

    diags.clear();
    REQUIRE_FALSE(parse_policy_document(
                      with_sensitivity(R"({"level": 4, "min_device_trust": -1})"), diags)
                      .has_value());

    diags.clear();
    REQUIRE_FALSE(parse_policy_document(
                      with_sensitivity(R"({"level": 4, "min_mfa_level": 1.5})"), diags)
                      .has_value());

    diags.clear();
    auto row = parse_policy_document(
        with_sensitivity(R"({"level": 6, "min_mfa_level": 3, "min_device_trust": 2})"), diags);
    REQUIRE(row.has_value());
    REQUIRE(row->sensitivity.front().min_mfa_level == 3);
  }

  SECTION("Negative idle timeout does not wrap") {
    auto text = R"({"industry": "retail", "version": 1,
      "roles": [{"name": "Clerk", "idle_timeout_minutes": -5}]})";
    REQUIRE_FALSE(parse_policy_document(text, diags).has_value());
    REQUIRE(has_code(diags, diagnostic_code::invalid_document));
  }

  SECTION("Constraint levels and offsets") {
    auto grant_with = [](const std::string &c) {
      return R"({"industry": "retail", "version": 1,
        "roles": [{"name": "Clerk"}],
        "resources": {"sale": ["refund"]},
        "grants": [{"id": "r1", "role": "Clerk", "resource": "sale", "action": "refund",
                    "constraints": [)" + c + "]}]}";
    };
    REQUIRE_FALSE(parse_policy_document(
                      grant_with(R"({"type": "mfa_required", "min_level": 257})"), diags)
                      .has_value());
    REQUIRE_FALSE(
        parse_policy_document(
            grant_with(R"({"type": "time_window", "utc_offset_minutes": 65536})"), diags)
            .has_value());
    REQUIRE_FALSE(parse_policy_document(
                      grant_with(R"({"type": "approval_ceiling", "max_amount": -1})"), diags)
                      .has_value());
    REQUIRE(has_code(diags, diagnostic_code::invalid_constraint));
    REQUIRE_FALSE(has_code(diags, diagnostic_code::invalid_document));
  }

  SECTION("Negative version") {
    REQUIRE_FALSE(parse_policy_document(
                      R"({"industry": "retail", "version": -1, "roles": []})", diags)
                      .has_value());
    REQUIRE(has_code(diags, diagnostic_code::invalid_document));
  }

  SECTION("Missing file") {
    REQUIRE_FALSE(load_policy_file("/nonexistent/policy.json", diags).has_value());
    REQUIRE(has_code(diags, diagnostic_code::parse_error));
  }
}
