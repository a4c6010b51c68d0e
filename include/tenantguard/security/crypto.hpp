/**
 * @file crypto.hpp
 * @brief SHA-256 and HMAC-SHA256 helpers over OpenSSL
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <tenantguard/core/result.hpp>

#include <string>
#include <string_view>

namespace tenantguard::security {

/**
 * @brief SHA-256 digest of data as lowercase hex
 */
[[nodiscard]] auto sha256_hex(std::string_view data) -> Result<std::string>;

/**
 * @brief HMAC-SHA256 of data under key as lowercase hex
 */
[[nodiscard]] auto hmac_sha256_hex(std::string_view key, std::string_view data)
    -> Result<std::string>;

/**
 * @brief Constant-time comparison of two equal-length strings
 */
[[nodiscard]] bool constant_time_equals(std::string_view a, std::string_view b);

[[nodiscard]] auto to_hex(std::string_view bytes) -> std::string;

/// Decode hex into bytes; false on odd length or non-hex input
[[nodiscard]] bool from_hex(std::string_view hex, std::string& out);

} // namespace tenantguard::security
