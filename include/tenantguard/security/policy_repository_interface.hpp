/**
 * @file policy_repository_interface.hpp
 * @brief Storage interface for versioned policy documents
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include "tenant.hpp"

#include <tenantguard/core/result.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tenantguard::security {

/**
 * @brief Abstract interface for persisting policy document versions
 *
 * Documents are stored as their original JSON text keyed by
 * (industry, version). Stored versions are never rewritten.
 */
class policy_repository_interface {
public:
    virtual ~policy_repository_interface() = default;

    [[nodiscard]] virtual auto save_document(industry_vertical industry,
                                             std::uint64_t version,
                                             const std::string& body) -> VoidResult = 0;

    [[nodiscard]] virtual auto load_document(industry_vertical industry,
                                             std::uint64_t version)
        -> Result<std::string> = 0;

    /// Highest stored version, or nullopt when none is stored
    [[nodiscard]] virtual auto latest_version(industry_vertical industry)
        -> Result<std::optional<std::uint64_t>> = 0;

    [[nodiscard]] virtual auto list_versions(industry_vertical industry)
        -> Result<std::vector<std::uint64_t>> = 0;

protected:
    policy_repository_interface() = default;
    policy_repository_interface(const policy_repository_interface&) = delete;
    policy_repository_interface& operator=(const policy_repository_interface&) = delete;
    policy_repository_interface(policy_repository_interface&&) = default;
    policy_repository_interface& operator=(policy_repository_interface&&) = default;
};

} // namespace tenantguard::security
