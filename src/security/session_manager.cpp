/**
 * @file session_manager.cpp
 * @brief Session lifecycle implementation
 *
 * @copyright Copyright (c) 2025
 */

#include <tenantguard/security/session_manager.hpp>

#include <tenantguard/integration/logger_adapter.hpp>
#include <tenantguard/security/crypto.hpp>

#include <openssl/rand.h>

#include <algorithm>
#include <mutex>
#include <optional>

namespace tenantguard::security {

using integration::logger_adapter;
using integration::session_event;
using time_point = std::chrono::system_clock::time_point;

namespace {

auto to_ticks(time_point tp) -> std::int64_t {
    return tp.time_since_epoch().count();
}

auto from_ticks(std::int64_t ticks) -> time_point {
    return time_point(std::chrono::system_clock::duration(ticks));
}

auto event_for(termination_cause cause) -> session_event {
    switch (cause) {
        case termination_cause::logout: return session_event::logout;
        case termination_cause::idle_timeout: return session_event::idle_timeout;
        case termination_cause::expired: return session_event::expired;
        case termination_cause::revoked:
        case termination_cause::none: break;
    }
    return session_event::revoked;
}

auto generate_session_id() -> Result<std::string> {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        return tenantguard_error<std::string>(error_codes::session_create_failed,
                                              "Failed to generate session id");
    }
    return "ses_" + to_hex(std::string_view(reinterpret_cast<const char*>(bytes),
                                            sizeof(bytes)));
}

} // namespace

struct session_manager::entry {
    std::string id;
    std::string principal_id;
    std::string tenant_id;
    std::string base_role;
    std::string industry_role;
    time_point created_at;
    time_point expires_at;
    std::chrono::seconds idle_timeout{0};
    std::uint8_t device_trust_level{0};
    geo_location location;

    std::atomic<std::int64_t> last_activity{0};
    std::atomic<std::uint8_t> mfa_level{0};
    std::atomic<std::int64_t> mfa_verified_at{0}; ///< 0 = never verified
    std::atomic<termination_cause> cause{termination_cause::none};
};

session_manager::session_manager(session_config config, clock_type clock)
    : config_(config), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
    last_sweep_.store(to_ticks(clock_()));
}

session_manager::~session_manager() = default;

void session_manager::set_revocation_hook(revocation_hook hook) {
    std::unique_lock lock(mutex_);
    revocation_hook_ = std::move(hook);
}

auto session_manager::now() const -> time_point { return clock_(); }

auto session_manager::find(std::string_view session_id) const -> std::shared_ptr<entry> {
    std::shared_lock lock(mutex_);
    auto it = sessions_.find(std::string(session_id));
    return it == sessions_.end() ? nullptr : it->second;
}

bool session_manager::terminate(entry& e, termination_cause cause) {
    auto expected = termination_cause::none;
    return e.cause.compare_exchange_strong(expected, cause, std::memory_order_acq_rel);
}

auto session_manager::refresh(entry& e) -> session_state {
    if (e.cause.load(std::memory_order_acquire) != termination_cause::none) {
        return session_state::terminated;
    }

    const auto t = now();
    auto cause = termination_cause::none;
    if (t > e.expires_at) {
        cause = termination_cause::expired;
    } else if (t - from_ticks(e.last_activity.load(std::memory_order_acquire)) >
               e.idle_timeout) {
        cause = termination_cause::idle_timeout;
    }

    if (cause != termination_cause::none) {
        if (terminate(e, cause)) {
            logger_adapter::log_session_event(event_for(cause), e.id, e.principal_id,
                                              e.tenant_id);
        }
        return session_state::terminated;
    }
    return session_state::active;
}

auto session_manager::validate_entry(entry& e) -> Result<session_info> {
    if (refresh(e) == session_state::active) {
        return snapshot(e);
    }

    switch (e.cause.load(std::memory_order_acquire)) {
        case termination_cause::idle_timeout:
        case termination_cause::expired:
            return tenantguard_error<session_info>(error_codes::session_expired,
                                                   "Session expired");
        default:
            return tenantguard_error<session_info>(error_codes::session_revoked,
                                                   "Session revoked");
    }
}

void session_manager::maybe_sweep() {
    if (config_.sweep_interval.count() <= 0) {
        return;
    }
    const auto t = to_ticks(now());
    auto last = last_sweep_.load(std::memory_order_acquire);
    const auto interval =
        std::chrono::duration_cast<std::chrono::system_clock::duration>(config_.sweep_interval);
    if (t - last < interval.count()) {
        return;
    }
    // One caller per interval wins the sweep.
    if (last_sweep_.compare_exchange_strong(last, t, std::memory_order_acq_rel)) {
        if (auto removed = sweep(); removed > 0) {
            logger_adapter::debug("Swept {} terminated sessions", removed);
        }
    }
}

auto session_manager::snapshot(const entry& e) const -> session_info {
    session_info info;
    info.id = e.id;
    info.principal_id = e.principal_id;
    info.tenant_id = e.tenant_id;
    info.base_role = e.base_role;
    info.industry_role = e.industry_role;
    info.created_at = e.created_at;
    info.last_activity_at = from_ticks(e.last_activity.load(std::memory_order_acquire));
    info.expires_at = e.expires_at;
    info.idle_timeout = e.idle_timeout;
    info.device_trust_level = e.device_trust_level;
    info.location = e.location;

    info.mfa_level = e.mfa_level.load(std::memory_order_acquire);
    if (auto verified = e.mfa_verified_at.load(std::memory_order_acquire); verified != 0) {
        info.mfa_verified_at = from_ticks(verified);
        if (config_.step_up_window.count() > 0 &&
            now() - *info.mfa_verified_at > config_.step_up_window) {
            info.mfa_level = 0;
        }
    }

    info.cause = e.cause.load(std::memory_order_acquire);
    info.state = info.cause == termination_cause::none ? session_state::active
                                                       : session_state::terminated;
    return info;
}

auto session_manager::create(const session_request& request) -> Result<session_info> {
    if (request.principal_id.empty() || request.tenant_id.empty()) {
        return tenantguard_error<session_info>(error_codes::session_create_failed,
                                               "Session requires principal and tenant");
    }

    auto id = generate_session_id();
    if (id.is_err()) {
        return id.error();
    }
    maybe_sweep();

    auto e = std::make_shared<entry>();
    e->id = id.value();
    e->principal_id = request.principal_id;
    e->tenant_id = request.tenant_id;
    e->base_role = request.base_role;
    e->industry_role = request.industry_role;
    e->created_at = now();
    e->expires_at = e->created_at + config_.absolute_lifetime;
    e->idle_timeout = request.idle_timeout.value_or(config_.default_idle_timeout);
    e->device_trust_level = request.device_trust_level;
    e->location = request.location;
    e->last_activity.store(to_ticks(e->created_at));
    e->mfa_level.store(request.mfa_level);
    if (request.mfa_level > 0) {
        e->mfa_verified_at.store(to_ticks(e->created_at));
    }

    // Enforce the concurrent session limit by revoking the oldest sessions.
    std::optional<error_info> limit_error;
    if (config_.max_concurrent_sessions > 0) {
        auto active = active_sessions(request.principal_id);
        if (active.size() >= config_.max_concurrent_sessions) {
            std::ranges::sort(active, {}, &session_info::created_at);
            auto excess = active.size() - config_.max_concurrent_sessions + 1;
            std::vector<std::shared_ptr<entry>> oldest;
            for (std::size_t i = 0; i < excess; ++i) {
                if (auto found = find(active[i].id)) {
                    oldest.push_back(std::move(found));
                }
            }
            auto revoked = revoke_entries(oldest, "max_concurrent_sessions");
            if (revoked.is_err()) {
                limit_error = revoked.error();
            }
        }
    }

    {
        std::unique_lock lock(mutex_);
        sessions_.emplace(e->id, e);
        by_principal_[e->principal_id].insert(e->id);
        by_tenant_[e->tenant_id].insert(e->id);
    }

    logger_adapter::log_session_event(session_event::created, e->id, e->principal_id,
                                      e->tenant_id);
    if (limit_error) {
        logger_adapter::warn("Session limit revocation for {} was not audited: {}",
                             e->principal_id, limit_error->message);
    }
    return snapshot(*e);
}

auto session_manager::get(std::string_view session_id) -> Result<session_info> {
    auto e = find(session_id);
    if (!e) {
        return tenantguard_error<session_info>(error_codes::session_not_found,
                                               "Session not found");
    }
    refresh(*e);
    return snapshot(*e);
}

auto session_manager::validate(std::string_view session_id) -> Result<session_info> {
    auto e = find(session_id);
    if (!e) {
        return tenantguard_error<session_info>(error_codes::session_not_found,
                                               "Session not found");
    }
    return validate_entry(*e);
}

auto session_manager::heartbeat(std::string_view session_id) -> Result<session_info> {
    auto e = find(session_id);
    if (!e) {
        return tenantguard_error<session_info>(error_codes::session_not_found,
                                               "Session not found");
    }
    maybe_sweep();
    auto validated = validate_entry(*e);
    if (validated.is_err()) {
        return validated;
    }

    auto t = to_ticks(now());
    auto previous = e->last_activity.load(std::memory_order_acquire);
    while (previous < t &&
           !e->last_activity.compare_exchange_weak(previous, t, std::memory_order_acq_rel)) {
    }
    return snapshot(*e);
}

auto session_manager::logout(std::string_view session_id) -> VoidResult {
    auto e = find(session_id);
    if (!e) {
        return tenantguard_void_error(error_codes::session_not_found, "Session not found");
    }
    if (refresh(*e) == session_state::active && terminate(*e, termination_cause::logout)) {
        logger_adapter::log_session_event(session_event::logout, e->id, e->principal_id,
                                          e->tenant_id);
    }
    return ok();
}

auto session_manager::revoke_entries(const std::vector<std::shared_ptr<entry>>& entries,
                                     std::string_view reason) -> Result<std::size_t> {
    revocation_hook hook;
    {
        std::shared_lock lock(mutex_);
        hook = revocation_hook_;
    }

    std::optional<error_info> first_error;
    std::size_t count = 0;
    for (const auto& e : entries) {
        if (refresh(*e) != session_state::active) {
            continue;
        }
        if (hook) {
            auto audited = hook(snapshot(*e), reason);
            if (audited.is_err() && !first_error) {
                first_error = audited.error();
            }
        }
        if (terminate(*e, termination_cause::revoked)) {
            ++count;
            logger_adapter::log_session_event(session_event::revoked, e->id,
                                              e->principal_id, e->tenant_id);
        }
    }

    if (first_error) {
        return Result<std::size_t>(*first_error);
    }
    return count;
}

auto session_manager::revoke(std::string_view session_id, std::string_view reason)
    -> Result<std::size_t> {
    auto e = find(session_id);
    if (!e) {
        return tenantguard_error<std::size_t>(error_codes::session_not_found,
                                              "Session not found");
    }
    return revoke_entries({e}, reason);
}

auto session_manager::revoke_principal(std::string_view principal_id,
                                       std::string_view reason) -> Result<std::size_t> {
    std::vector<std::shared_ptr<entry>> targets;
    {
        std::shared_lock lock(mutex_);
        if (auto it = by_principal_.find(std::string(principal_id)); it != by_principal_.end()) {
            for (const auto& id : it->second) {
                targets.push_back(sessions_.at(id));
            }
        }
    }
    return revoke_entries(targets, reason);
}

auto session_manager::revoke_principal_in_tenant(std::string_view principal_id,
                                                 std::string_view tenant_id,
                                                 std::string_view reason)
    -> Result<std::size_t> {
    std::vector<std::shared_ptr<entry>> targets;
    {
        std::shared_lock lock(mutex_);
        if (auto it = by_principal_.find(std::string(principal_id)); it != by_principal_.end()) {
            for (const auto& id : it->second) {
                const auto& e = sessions_.at(id);
                if (e->tenant_id == tenant_id) {
                    targets.push_back(e);
                }
            }
        }
    }
    return revoke_entries(targets, reason);
}

auto session_manager::revoke_tenant(std::string_view tenant_id, std::string_view reason)
    -> Result<std::size_t> {
    std::vector<std::shared_ptr<entry>> targets;
    {
        std::shared_lock lock(mutex_);
        if (auto it = by_tenant_.find(std::string(tenant_id)); it != by_tenant_.end()) {
            for (const auto& id : it->second) {
                targets.push_back(sessions_.at(id));
            }
        }
    }
    return revoke_entries(targets, reason);
}

auto session_manager::elevate_mfa(std::string_view session_id, std::uint8_t level)
    -> Result<session_info> {
    if (level == 0) {
        return tenantguard_error<session_info>(error_codes::session_create_failed,
                                               "Step-up requires an MFA level above 0");
    }

    auto e = find(session_id);
    if (!e) {
        return tenantguard_error<session_info>(error_codes::session_not_found,
                                               "Session not found");
    }
    auto validated = validate_entry(*e);
    if (validated.is_err()) {
        return validated;
    }

    e->mfa_level.store(std::max(e->mfa_level.load(), level), std::memory_order_release);
    e->mfa_verified_at.store(to_ticks(now()), std::memory_order_release);
    logger_adapter::log_session_event(session_event::step_up, e->id, e->principal_id,
                                      e->tenant_id);
    return snapshot(*e);
}

auto session_manager::active_sessions(std::string_view principal_id)
    -> std::vector<session_info> {
    std::vector<std::shared_ptr<entry>> candidates;
    {
        std::shared_lock lock(mutex_);
        if (auto it = by_principal_.find(std::string(principal_id)); it != by_principal_.end()) {
            for (const auto& id : it->second) {
                candidates.push_back(sessions_.at(id));
            }
        }
    }

    std::vector<session_info> result;
    for (const auto& e : candidates) {
        if (refresh(*e) == session_state::active) {
            result.push_back(snapshot(*e));
        }
    }
    return result;
}

auto session_manager::size() const -> std::size_t {
    std::shared_lock lock(mutex_);
    return sessions_.size();
}

auto session_manager::sweep() -> std::size_t {
    std::vector<std::shared_ptr<entry>> all;
    {
        std::shared_lock lock(mutex_);
        all.reserve(sessions_.size());
        for (const auto& [id, e] : sessions_) {
            all.push_back(e);
        }
    }
    for (const auto& e : all) {
        refresh(*e);
    }

    std::unique_lock lock(mutex_);
    std::size_t removed = 0;
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        const auto& e = it->second;
        if (e->cause.load(std::memory_order_acquire) == termination_cause::none) {
            ++it;
            continue;
        }
        if (auto p = by_principal_.find(e->principal_id); p != by_principal_.end()) {
            p->second.erase(e->id);
            if (p->second.empty()) {
                by_principal_.erase(p);
            }
        }
        if (auto t = by_tenant_.find(e->tenant_id); t != by_tenant_.end()) {
            t->second.erase(e->id);
            if (t->second.empty()) {
                by_tenant_.erase(t);
            }
        }
        it = sessions_.erase(it);
        ++removed;
    }
    return removed;
}

} // namespace tenantguard::security
