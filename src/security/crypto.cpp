/**
 * @file crypto.cpp
 * @brief OpenSSL digest and MAC helpers
 *
 * @copyright Copyright (c) 2025
 */

#include <tenantguard/security/crypto.hpp>

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <memory>

namespace tenantguard::security {

namespace {

/**
 * @brief Get OpenSSL error string
 */
auto get_openssl_error() -> std::string {
    unsigned long err = ERR_get_error();
    if (err == 0) {
        return "Unknown error";
    }
    char buf[256];
    ERR_error_string_n(err, buf, sizeof(buf));
    return std::string(buf);
}

/**
 * @brief RAII wrapper for EVP_MD_CTX
 */
struct evp_md_ctx_deleter {
    void operator()(EVP_MD_CTX* ctx) const {
        if (ctx) EVP_MD_CTX_free(ctx);
    }
};
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, evp_md_ctx_deleter>;

constexpr char hex_digits[] = "0123456789abcdef";

auto hex_value(char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

auto to_hex(std::string_view bytes) -> std::string {
    std::string out;
    out.reserve(bytes.size() * 2);
    for (auto c : bytes) {
        auto byte = static_cast<unsigned char>(c);
        out.push_back(hex_digits[byte >> 4]);
        out.push_back(hex_digits[byte & 0x0F]);
    }
    return out;
}

bool from_hex(std::string_view hex, std::string& out) {
    if (hex.size() % 2 != 0) {
        return false;
    }
    out.clear();
    out.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        auto hi = hex_value(hex[i]);
        auto lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return false;
        }
        out.push_back(static_cast<char>((hi << 4) | lo));
    }
    return true;
}

auto sha256_hex(std::string_view data) -> Result<std::string> {
    evp_md_ctx_ptr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return tenantguard_error<std::string>(
            error_codes::audit_write_failed,
            "Failed to create digest context: " + get_openssl_error());
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
        return tenantguard_error<std::string>(
            error_codes::audit_write_failed,
            "Failed to compute digest: " + get_openssl_error());
    }

    return to_hex(std::string_view(reinterpret_cast<const char*>(digest), digest_len));
}

auto hmac_sha256_hex(std::string_view key, std::string_view data) -> Result<std::string> {
    unsigned char mac[EVP_MAX_MD_SIZE];
    unsigned int mac_len = 0;
    auto* result = HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
                        reinterpret_cast<const unsigned char*>(data.data()), data.size(),
                        mac, &mac_len);
    if (!result) {
        return tenantguard_error<std::string>(
            error_codes::token_signature_invalid,
            "Failed to compute HMAC: " + get_openssl_error());
    }
    return to_hex(std::string_view(reinterpret_cast<const char*>(mac), mac_len));
}

bool constant_time_equals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace tenantguard::security
