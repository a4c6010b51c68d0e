/**
 * @file token_codec.hpp
 * @brief HMAC-SHA256 signed bearer tokens
 *
 * Token layout: hex(principal_id "\n" session_id "\n" expiry_unix_seconds)
 * followed by "." and the hex HMAC-SHA256 of the payload.
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <tenantguard/core/result.hpp>

#include <chrono>
#include <string>
#include <string_view>

namespace tenantguard::security {

/**
 * @brief Token signing settings
 */
struct token_config {
    /// HMAC key; must be set before tokens are issued or verified
    std::string secret;

    /// Lifetime applied by issue() when no expiry is given
    std::chrono::seconds default_lifetime{std::chrono::hours(8)};
};

/**
 * @brief Claims carried by a token
 */
struct token_claims {
    std::string principal_id;
    std::string session_id;
    std::chrono::system_clock::time_point expires_at;
};

class token_codec {
public:
    explicit token_codec(token_config config);

    [[nodiscard]] auto issue(const token_claims& claims) const -> Result<std::string>;

    /**
     * @brief Verify signature and expiry
     * @return token_malformed, token_signature_invalid or token_expired on failure
     */
    [[nodiscard]] auto verify(std::string_view token,
                              std::chrono::system_clock::time_point now) const
        -> Result<token_claims>;

    [[nodiscard]] auto config() const noexcept -> const token_config& { return config_; }

private:
    token_config config_;
};

} // namespace tenantguard::security
