/**
 * @file decision_sealer.hpp
 * @brief Issuer MAC binding an access decision to its subject
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include "access_decision.hpp"

#include <tenantguard/core/result.hpp>

#include <memory>
#include <string>

namespace tenantguard::security {

/**
 * @brief Seals decisions issued by the evaluator so downstream layers can
 *        tell them from hand-built ones
 *
 * The seal is an HMAC-SHA256 over the decision's subject (principal,
 * tenant, resource type, action) and its outcome flags, under a key that
 * never leaves this object. Changing any covered field after sealing
 * invalidates the seal.
 *
 * Thread Safety: Immutable after construction.
 */
class decision_sealer {
public:
    /**
     * @brief Sealer with a fresh 256-bit key from the OpenSSL CSPRNG
     */
    [[nodiscard]] static auto create() -> Result<std::shared_ptr<const decision_sealer>>;

    explicit decision_sealer(std::string key);

    /// Set decision.seal; fails only if OpenSSL does
    [[nodiscard]] auto seal(access_decision& decision) const -> VoidResult;

    [[nodiscard]] bool verify(const access_decision& decision) const;

private:
    [[nodiscard]] static auto canonical(const access_decision& decision) -> std::string;

    std::string key_;
};

} // namespace tenantguard::security
