/**
 * @file principal_resolver.cpp
 * @brief Token to principal resolution
 *
 * @copyright Copyright (c) 2025
 */

#include <tenantguard/security/principal_resolver.hpp>

#include <tenantguard/integration/logger_adapter.hpp>

#include <algorithm>

namespace tenantguard::security {

using integration::logger_adapter;
using integration::security_event_type;

principal_resolver::principal_resolver(std::shared_ptr<principal_store_interface> store,
                                       std::shared_ptr<const token_codec> codec,
                                       std::shared_ptr<session_manager> sessions,
                                       clock_type clock)
    : store_(std::move(store)),
      codec_(std::move(codec)),
      sessions_(std::move(sessions)),
      clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
}

auto principal_resolver::resolve(std::string_view auth_token) -> Result<principal> {
    if (!codec_) {
        return tenantguard_error<principal>(error_codes::unauthenticated,
                                            "Token verification is not configured");
    }

    auto claims = codec_->verify(auth_token, clock_());
    if (claims.is_err()) {
        logger_adapter::log_security_event(security_event_type::authentication_failure,
                                           claims.error().message);
        return claims.error();
    }
    return resolve_id(claims.value().principal_id, claims.value().session_id);
}

auto principal_resolver::resolve_id(std::string_view principal_id,
                                    std::string_view session_id) -> Result<principal> {
    if (!store_) {
        return tenantguard_error<principal>(error_codes::store_unavailable,
                                            "Principal directory is not configured");
    }

    auto loaded = store_->get_principal(principal_id);
    if (loaded.is_err()) {
        logger_adapter::log_security_event(security_event_type::authentication_failure,
                                           "Unknown principal",
                                           std::string(principal_id));
        return loaded;
    }

    auto p = std::move(loaded.value());
    if (!p.active) {
        logger_adapter::log_security_event(security_event_type::authentication_failure,
                                           "Inactive principal", p.id);
        return tenantguard_error<principal>(error_codes::principal_inactive,
                                            "Principal is inactive", p.id);
    }

    std::erase_if(p.bindings, [](const tenant_binding& b) { return !b.active; });

    if (!session_id.empty() && sessions_) {
        auto session = sessions_->heartbeat(session_id);
        if (session.is_err()) {
            return session.error();
        }

        const auto& s = session.value();
        if (s.principal_id != p.id) {
            logger_adapter::log_security_event(security_event_type::authentication_failure,
                                               "Session belongs to another principal",
                                               p.id);
            return tenantguard_error<principal>(error_codes::unauthenticated,
                                                "Session does not belong to principal");
        }

        if (p.kind == principal_kind::user) {
            std::erase_if(p.bindings, [&](const tenant_binding& b) {
                return b.tenant_id != s.tenant_id;
            });
        }
        p.session_id = s.id;
        p.mfa_level = s.mfa_level;
        p.device_trust_level = s.device_trust_level;
        p.location = s.location;
    }

    return p;
}

auto principal_resolver::issue_token(std::string_view principal_id,
                                     std::string_view session_id,
                                     std::chrono::system_clock::time_point expires_at) const
    -> Result<std::string> {
    if (!codec_) {
        return tenantguard_error<std::string>(error_codes::unauthenticated,
                                              "Token signing is not configured");
    }
    return codec_->issue(
        token_claims{std::string(principal_id), std::string(session_id), expires_at});
}

} // namespace tenantguard::security
