/**
 * @file session_manager.hpp
 * @brief Session lifecycle: creation, heartbeat, expiry and revocation
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include "session.hpp"

#include <tenantguard/core/result.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace tenantguard::security {

/**
 * @brief Session policy settings
 */
struct session_config {
    /// Absolute lifetime from creation
    std::chrono::seconds absolute_lifetime{std::chrono::hours(8)};

    /// Idle timeout used when the role defines none
    std::chrono::seconds default_idle_timeout{std::chrono::minutes(30)};

    /// Oldest session is revoked when a principal exceeds this (0 = unlimited)
    std::size_t max_concurrent_sessions{5};

    /// MFA counts as unsatisfied this long after the last verification (0 = never)
    std::chrono::seconds step_up_window{std::chrono::hours(4)};

    /// Terminated sessions are swept on create/heartbeat at most this often (0 = manual only)
    std::chrono::seconds sweep_interval{std::chrono::minutes(5)};
};

/**
 * @brief Tracks sessions keyed by id with principal and tenant indexes
 *
 * Session state is an atomic; every transition out of active is a single
 * compare-and-set, so concurrent logout, revocation and expiry resolve to
 * exactly one termination cause. Expiry is evaluated lazily on access.
 */
class session_manager {
public:
    using clock_type = std::function<std::chrono::system_clock::time_point()>;

    /**
     * @brief Invoked before a session is revoked
     *
     * Runs before the state flip is visible. The revocation proceeds even if
     * the hook fails; its error is returned to the caller.
     */
    using revocation_hook =
        std::function<VoidResult(const session_info& session, std::string_view reason)>;

    explicit session_manager(session_config config = {}, clock_type clock = {});
    ~session_manager();

    session_manager(const session_manager&) = delete;
    session_manager& operator=(const session_manager&) = delete;

    void set_revocation_hook(revocation_hook hook);

    [[nodiscard]] auto create(const session_request& request) -> Result<session_info>;

    /**
     * @brief Current state, terminating the session if it has lapsed
     */
    [[nodiscard]] auto get(std::string_view session_id) -> Result<session_info>;

    /**
     * @brief Require an active session
     * @return session_not_found, session_expired or session_revoked on failure
     */
    [[nodiscard]] auto validate(std::string_view session_id) -> Result<session_info>;

    /**
     * @brief Validate and refresh last activity
     */
    [[nodiscard]] auto heartbeat(std::string_view session_id) -> Result<session_info>;

    [[nodiscard]] auto logout(std::string_view session_id) -> VoidResult;

    [[nodiscard]] auto revoke(std::string_view session_id, std::string_view reason)
        -> Result<std::size_t>;

    [[nodiscard]] auto revoke_principal(std::string_view principal_id,
                                        std::string_view reason) -> Result<std::size_t>;

    [[nodiscard]] auto revoke_principal_in_tenant(std::string_view principal_id,
                                                  std::string_view tenant_id,
                                                  std::string_view reason)
        -> Result<std::size_t>;

    [[nodiscard]] auto revoke_tenant(std::string_view tenant_id, std::string_view reason)
        -> Result<std::size_t>;

    /**
     * @brief Record a successful step-up authentication
     */
    [[nodiscard]] auto elevate_mfa(std::string_view session_id, std::uint8_t level)
        -> Result<session_info>;

    [[nodiscard]] auto active_sessions(std::string_view principal_id)
        -> std::vector<session_info>;

    /**
     * @brief Drop terminated sessions from memory
     * @return Number removed
     */
    auto sweep() -> std::size_t;

    /// Sessions held in memory, terminated ones included until swept
    [[nodiscard]] auto size() const -> std::size_t;

    [[nodiscard]] auto config() const noexcept -> const session_config& { return config_; }

private:
    struct entry;

    [[nodiscard]] auto now() const -> std::chrono::system_clock::time_point;
    [[nodiscard]] auto find(std::string_view session_id) const -> std::shared_ptr<entry>;
    [[nodiscard]] auto snapshot(const entry& e) const -> session_info;

    /// Apply lazy expiry; returns the resulting state
    auto refresh(entry& e) -> session_state;

    /// Refresh and map a terminated entry to its error
    auto validate_entry(entry& e) -> Result<session_info>;

    /// Run sweep() when sweep_interval has elapsed since the last one
    void maybe_sweep();

    /// Compare-and-set active -> cause; false if already terminated
    static bool terminate(entry& e, termination_cause cause);

    auto revoke_entries(const std::vector<std::shared_ptr<entry>>& entries,
                        std::string_view reason) -> Result<std::size_t>;

    session_config config_;
    clock_type clock_;
    revocation_hook revocation_hook_;
    std::atomic<std::int64_t> last_sweep_{0};

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<entry>> sessions_;
    std::unordered_map<std::string, std::unordered_set<std::string>> by_principal_;
    std::unordered_map<std::string, std::unordered_set<std::string>> by_tenant_;
};

} // namespace tenantguard::security
