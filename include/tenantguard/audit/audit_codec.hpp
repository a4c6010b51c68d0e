/**
 * @file audit_codec.hpp
 * @brief JSON encoding and hashing of audit records
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include "audit_record.hpp"

#include <tenantguard/core/result.hpp>

#include <string>
#include <string_view>

namespace tenantguard::audit {

/**
 * @brief One-line JSON form including sequence and hashes
 */
[[nodiscard]] auto to_json_line(const audit_record& record) -> std::string;

[[nodiscard]] auto from_json_line(std::string_view line) -> Result<audit_record>;

/**
 * @brief Deterministic serialization of every field except entry_hash
 */
[[nodiscard]] auto canonical_form(const audit_record& record) -> std::string;

/**
 * @brief SHA-256 over prev_hash and the canonical form
 */
[[nodiscard]] auto compute_entry_hash(const audit_record& record) -> Result<std::string>;

/// Milliseconds since the epoch
[[nodiscard]] auto to_millis(std::chrono::system_clock::time_point tp) -> std::int64_t;

[[nodiscard]] auto from_millis(std::int64_t ms) -> std::chrono::system_clock::time_point;

} // namespace tenantguard::audit
