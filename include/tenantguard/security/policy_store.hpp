/**
 * @file policy_store.hpp
 * @brief Per-industry active policy snapshots with atomic reload
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include "policy_repository_interface.hpp"
#include "policy_set.hpp"

#include <tenantguard/core/result.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string_view>
#include <vector>

namespace tenantguard::security {

/**
 * @brief Outcome of a policy reload
 */
struct reload_result {
    bool success{false};
    std::optional<industry_vertical> industry;
    std::uint64_t version{0};

    /// Version that is active after the call (unchanged on failure)
    std::uint64_t active_version{0};

    std::vector<policy_diagnostic> diagnostics;
};

/**
 * @brief Holds the last-known-good policy snapshot for every industry
 *
 * Readers take a shared_ptr copy of the snapshot and evaluate against it
 * without further locking, so a reload never changes the policy seen by an
 * in-flight request. A failed reload leaves the previous snapshot active.
 */
class policy_store {
public:
    explicit policy_store(std::shared_ptr<policy_repository_interface> repository = nullptr);

    /**
     * @brief Validate and activate a new policy document
     *
     * The version must be greater than the active version for the industry.
     * On success the document is persisted to the repository (when one is
     * configured) and swapped in.
     */
    auto reload(std::string_view document_json) -> reload_result;

    /**
     * @brief Activate a stored version, older versions included
     */
    auto activate_version(industry_vertical industry, std::uint64_t version)
        -> reload_result;

    /**
     * @brief Activate the latest stored version for every industry
     * @return Number of industries loaded
     */
    [[nodiscard]] auto load_policies() -> Result<std::size_t>;

    /**
     * @brief Current snapshot, or nullptr if none is loaded
     */
    [[nodiscard]] auto snapshot(industry_vertical industry) const
        -> std::shared_ptr<const policy_set>;

    [[nodiscard]] auto active_version(industry_vertical industry) const
        -> std::optional<std::uint64_t>;

    /**
     * @brief Effective permissions against the active snapshot
     */
    [[nodiscard]] auto effective_permissions(industry_vertical industry,
                                             std::string_view role,
                                             std::string_view industry_role = {}) const
        -> Result<std::vector<effective_grant>>;

private:
    auto install(std::string_view document_json, bool require_newer, bool persist)
        -> reload_result;

    std::shared_ptr<policy_repository_interface> repository_;

    mutable std::shared_mutex snapshots_mutex_;
    std::map<industry_vertical, std::shared_ptr<const policy_set>> snapshots_;

    /// Serializes writers; readers only touch snapshots_mutex_
    std::mutex reload_mutex_;
};

} // namespace tenantguard::security
