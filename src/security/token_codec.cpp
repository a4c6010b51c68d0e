/**
 * @file token_codec.cpp
 * @brief Bearer token signing and verification
 *
 * @copyright Copyright (c) 2025
 */

#include <tenantguard/security/token_codec.hpp>

#include <tenantguard/security/crypto.hpp>

#include <charconv>

namespace tenantguard::security {

namespace {

constexpr char field_separator = '\n';
constexpr char mac_separator = '.';

} // namespace

token_codec::token_codec(token_config config) : config_(std::move(config)) {}

auto token_codec::issue(const token_claims& claims) const -> Result<std::string> {
    if (config_.secret.empty()) {
        return tenantguard_error<std::string>(error_codes::token_signature_invalid,
                                              "Token secret is not configured");
    }
    if (claims.principal_id.empty() ||
        claims.principal_id.find(field_separator) != std::string::npos ||
        claims.session_id.find(field_separator) != std::string::npos) {
        return tenantguard_error<std::string>(error_codes::token_malformed,
                                              "Token claims contain invalid identifiers");
    }

    auto expiry = std::chrono::duration_cast<std::chrono::seconds>(
                      claims.expires_at.time_since_epoch())
                      .count();
    std::string payload = claims.principal_id;
    payload += field_separator;
    payload += claims.session_id;
    payload += field_separator;
    payload += std::to_string(expiry);

    auto mac = hmac_sha256_hex(config_.secret, payload);
    if (mac.is_err()) {
        return mac;
    }
    return to_hex(payload) + mac_separator + mac.value();
}

auto token_codec::verify(std::string_view token,
                         std::chrono::system_clock::time_point now) const
    -> Result<token_claims> {
    if (config_.secret.empty()) {
        return tenantguard_error<token_claims>(error_codes::token_signature_invalid,
                                               "Token secret is not configured");
    }

    auto dot = token.find(mac_separator);
    if (dot == std::string_view::npos || dot == 0 || dot + 1 >= token.size()) {
        return tenantguard_error<token_claims>(error_codes::token_malformed,
                                               "Token is malformed");
    }

    std::string payload;
    if (!from_hex(token.substr(0, dot), payload)) {
        return tenantguard_error<token_claims>(error_codes::token_malformed,
                                               "Token payload is not hex encoded");
    }

    auto expected = hmac_sha256_hex(config_.secret, payload);
    if (expected.is_err()) {
        return expected.error();
    }
    if (!constant_time_equals(expected.value(), token.substr(dot + 1))) {
        return tenantguard_error<token_claims>(error_codes::token_signature_invalid,
                                               "Token signature does not verify");
    }

    auto first = payload.find(field_separator);
    auto second = first == std::string::npos ? std::string::npos
                                             : payload.find(field_separator, first + 1);
    if (second == std::string::npos) {
        return tenantguard_error<token_claims>(error_codes::token_malformed,
                                               "Token payload is incomplete");
    }

    std::int64_t expiry = 0;
    const char* begin = payload.data() + second + 1;
    const char* end = payload.data() + payload.size();
    auto [ptr, ec] = std::from_chars(begin, end, expiry);
    if (ec != std::errc{} || ptr != end) {
        return tenantguard_error<token_claims>(error_codes::token_malformed,
                                               "Token expiry is not numeric");
    }

    token_claims claims;
    claims.principal_id = payload.substr(0, first);
    claims.session_id = payload.substr(first + 1, second - first - 1);
    claims.expires_at = std::chrono::system_clock::time_point(std::chrono::seconds(expiry));

    if (claims.principal_id.empty()) {
        return tenantguard_error<token_claims>(error_codes::token_malformed,
                                               "Token has no principal");
    }
    if (now >= claims.expires_at) {
        return tenantguard_error<token_claims>(error_codes::token_expired,
                                               "Token expired");
    }
    return claims;
}

} // namespace tenantguard::security
