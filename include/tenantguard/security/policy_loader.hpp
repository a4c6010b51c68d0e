/**
 * @file policy_loader.hpp
 * @brief JSON policy document parsing
 *
 * Document layout:
 * @code
 * {
 *   "industry": "home_services",
 *   "version": 3,
 *   "roles": [
 *     { "name": "technician", "inherits": ["viewer"],
 *       "idle_timeout_minutes": 60, "industry_role": false }
 *   ],
 *   "resources": { "work_order": ["read", "complete_work_order"] },
 *   "grants": [
 *     { "id": "hs.tech.complete", "role": "technician",
 *       "resource": "work_order", "action": "complete_work_order",
 *       "constraints": [ { "type": "owner_only" } ] }
 *   ],
 *   "sensitivity": [ { "level": 5, "min_mfa_level": 1 } ],
 *   "critical_actions": [ "approve_estimate" ]
 * }
 * @endcode
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include "policy_set.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tenantguard::security {

/**
 * @brief Parse a policy document from JSON text
 *
 * Structural problems (bad JSON, wrong types, unknown constraint types) are
 * reported as diagnostics; semantic validation happens in
 * policy_set::compile().
 *
 * @return The document, or nullopt if any diagnostic was produced
 */
[[nodiscard]] auto parse_policy_document(std::string_view json,
                                         std::vector<policy_diagnostic>& diagnostics)
    -> std::optional<policy_document>;

/**
 * @brief Read and parse a policy document file
 */
[[nodiscard]] auto load_policy_file(const std::filesystem::path& path,
                                    std::vector<policy_diagnostic>& diagnostics)
    -> std::optional<policy_document>;

/**
 * @brief Read a file into a string
 * @return File contents, or nullopt if the file cannot be read
 */
[[nodiscard]] auto read_policy_text(const std::filesystem::path& path)
    -> std::optional<std::string>;

} // namespace tenantguard::security
