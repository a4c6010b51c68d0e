/**
 * @file decision_sealer.cpp
 * @brief Implementation of decision sealing
 *
 * @copyright Copyright (c) 2025
 */

#include <tenantguard/security/decision_sealer.hpp>

#include <tenantguard/security/crypto.hpp>

#include <openssl/rand.h>

namespace tenantguard::security {

namespace {

constexpr std::size_t key_size = 32;

/// Length-prefixed so that no two field lists share an encoding
void append_field(std::string& out, std::string_view field) {
    out += std::to_string(field.size());
    out += ':';
    out += field;
}

} // namespace

auto decision_sealer::create() -> Result<std::shared_ptr<const decision_sealer>> {
    unsigned char bytes[key_size];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        return tenantguard_error<std::shared_ptr<const decision_sealer>>(
            error_codes::policy_error, "Failed to generate decision sealing key");
    }
    return std::make_shared<const decision_sealer>(
        std::string(reinterpret_cast<const char*>(bytes), sizeof(bytes)));
}

decision_sealer::decision_sealer(std::string key) : key_(std::move(key)) {}

auto decision_sealer::seal(access_decision& decision) const -> VoidResult {
    auto mac = hmac_sha256_hex(key_, canonical(decision));
    if (mac.is_err()) {
        return mac.error();
    }
    decision.seal = std::move(mac.value());
    return ok();
}

bool decision_sealer::verify(const access_decision& decision) const {
    if (decision.seal.empty()) {
        return false;
    }
    auto mac = hmac_sha256_hex(key_, canonical(decision));
    return mac.is_ok() && constant_time_equals(mac.value(), decision.seal);
}

auto decision_sealer::canonical(const access_decision& decision) -> std::string {
    std::string out;
    append_field(out, decision.principal_id);
    append_field(out, decision.tenant_id);
    append_field(out, decision.resource_type);
    append_field(out, decision.action);
    append_field(out, to_string(decision.outcome));
    append_field(out, decision.rule_id);
    append_field(out, std::to_string(decision.policy_version));
    append_field(out, decision.cross_tenant ? "cross_tenant" : "");
    append_field(out, decision.include_deleted ? "include_deleted" : "");
    return out;
}

} // namespace tenantguard::security
