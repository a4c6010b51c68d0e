/**
 * @file sqlite_policy_repository_test.cpp
 * @brief Unit tests for stored policy documents
 */

#include <catch2/catch_test_macros.hpp>

#include <tenantguard/storage/sqlite_policy_repository.hpp>

using namespace tenantguard::security;
using namespace tenantguard::storage;

TEST_CASE("SqlitePolicyRepository: Versioned documents", "[storage][policy]") {
  auto repo = sqlite_policy_repository::open(":memory:");
  REQUIRE(repo.is_ok());
  auto &store = *repo.value();

  SECTION("Empty repository") {
    auto latest = store.latest_version(industry_vertical::retail);
    REQUIRE(latest.is_ok());
    REQUIRE_FALSE(latest.value().has_value());
    REQUIRE(store.list_versions(industry_vertical::retail).value().empty());
  }

  SECTION("Versions are kept per industry") {
    REQUIRE(store.save_document(industry_vertical::retail, 2, R"({"version":2})").is_ok());
    REQUIRE(store.save_document(industry_vertical::retail, 1, R"({"version":1})").is_ok());
    REQUIRE(store.save_document(industry_vertical::payroll, 7, "{}").is_ok());

    REQUIRE(store.latest_version(industry_vertical::retail).value() == 2u);
    REQUIRE(store.list_versions(industry_vertical::retail).value() ==
            std::vector<std::uint64_t>{1, 2});
    REQUIRE(store.load_document(industry_vertical::retail, 1).value() ==
            R"({"version":1})");
    REQUIRE(store.latest_version(industry_vertical::payroll).value() == 7u);
  }

  SECTION("Stored versions are immutable") {
    REQUIRE(store.save_document(industry_vertical::courses, 1, "{}").is_ok());
    auto again = store.save_document(industry_vertical::courses, 1, R"({"x":1})");
    REQUIRE(again.is_err());
    REQUIRE(again.error().code == tenantguard::error_codes::policy_version_conflict);
    REQUIRE(store.load_document(industry_vertical::courses, 1).value() == "{}");
  }

  SECTION("Missing version") {
    auto missing = store.load_document(industry_vertical::courses, 3);
    REQUIRE(missing.is_err());
    REQUIRE(missing.error().code == tenantguard::error_codes::policy_not_loaded);
  }
}
