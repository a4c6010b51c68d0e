/**
 * @file principal_resolver.hpp
 * @brief Maps an authentication token to a principal with its tenant bindings
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include "principal.hpp"
#include "principal_store_interface.hpp"
#include "session_manager.hpp"
#include "token_codec.hpp"

#include <tenantguard/core/result.hpp>

#include <memory>
#include <string_view>

namespace tenantguard::security {

/**
 * @brief Resolves bearer tokens against the principal directory
 *
 * Only active bindings are returned. A human user resolved through a
 * session keeps only the binding of the session's tenant. Naming a target
 * tenant the principal is not bound to does not fail resolution; the
 * evaluator denies the request later so the attempt is still audited.
 */
class principal_resolver {
public:
    using clock_type = std::function<std::chrono::system_clock::time_point()>;

    principal_resolver(std::shared_ptr<principal_store_interface> store,
                       std::shared_ptr<const token_codec> codec,
                       std::shared_ptr<session_manager> sessions,
                       clock_type clock = {});

    /**
     * @brief Verify a token, load the principal and heartbeat its session
     * @return Token errors (-901..-903), principal_not_found,
     *         principal_inactive, or session errors
     */
    [[nodiscard]] auto resolve(std::string_view auth_token) -> Result<principal>;

    /**
     * @brief Resolve a principal already authenticated by the caller
     * @param session_id Session to heartbeat and take MFA/device state from;
     *        may be empty
     */
    [[nodiscard]] auto resolve_id(std::string_view principal_id,
                                  std::string_view session_id) -> Result<principal>;

    [[nodiscard]] auto issue_token(std::string_view principal_id,
                                   std::string_view session_id,
                                   std::chrono::system_clock::time_point expires_at) const
        -> Result<std::string>;

private:
    std::shared_ptr<principal_store_interface> store_;
    std::shared_ptr<const token_codec> codec_;
    std::shared_ptr<session_manager> sessions_;
    clock_type clock_;
};

} // namespace tenantguard::security
