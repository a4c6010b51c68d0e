/**
 * @file sqlite_policy_repository.hpp
 * @brief SQLite implementation of the policy repository
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <tenantguard/security/policy_repository_interface.hpp>

#include <memory>
#include <mutex>
#include <string>

// Forward declaration for SQLite3
struct sqlite3;

namespace tenantguard::storage {

/**
 * @brief SQLite backend for policy documents
 *
 * Table: policy_documents(industry, version, body, stored_at)
 */
class sqlite_policy_repository : public security::policy_repository_interface {
public:
    [[nodiscard]] static auto open(const std::string& db_path)
        -> Result<std::unique_ptr<sqlite_policy_repository>>;

    ~sqlite_policy_repository() override;

    [[nodiscard]] auto save_document(security::industry_vertical industry,
                                     std::uint64_t version,
                                     const std::string& body) -> VoidResult override;

    [[nodiscard]] auto load_document(security::industry_vertical industry,
                                     std::uint64_t version)
        -> Result<std::string> override;

    [[nodiscard]] auto latest_version(security::industry_vertical industry)
        -> Result<std::optional<std::uint64_t>> override;

    [[nodiscard]] auto list_versions(security::industry_vertical industry)
        -> Result<std::vector<std::uint64_t>> override;

private:
    explicit sqlite_policy_repository(sqlite3* db);

    [[nodiscard]] auto initialize_tables() -> VoidResult;

    sqlite3* db_{nullptr};
    std::mutex mutex_;
};

} // namespace tenantguard::storage
