/**
 * @file logger_adapter.hpp
 * @brief Adapter for engine and security logging using logger_system
 *
 * This file provides the logger_adapter class for integrating logger_system
 * with the authorization engine. It supports standard logging plus
 * security-specific entry points for access decisions, policy reloads and
 * session lifecycle events.
 */

#pragma once

#include <tenantguard/compat/format.hpp>

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace tenantguard::integration {

/**
 * @enum log_level
 * @brief Log severity levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5,
    off = 6
};

/**
 * @enum security_event_type
 * @brief Types of security events for the operational log
 */
enum class security_event_type {
    authentication_failure,
    access_denied,
    cross_tenant_attempt,
    policy_error,
    policy_reloaded,
    session_revoked,
    audit_degraded
};

/**
 * @enum session_event
 * @brief Session lifecycle transitions worth logging
 */
enum class session_event {
    created,
    logout,
    idle_timeout,
    expired,
    revoked,
    step_up
};

/**
 * @struct logger_config
 * @brief Configuration options for the logger adapter
 */
struct logger_config {
    /// Directory for log files
    std::filesystem::path log_directory{"logs"};

    /// Minimum log level to output
    log_level min_level{log_level::info};

    /// Enable console output
    bool enable_console{true};

    /// Enable file output
    bool enable_file{true};

    /// Enable separate JSON security trail
    bool enable_security_trail{true};

    /// Maximum log file size in megabytes before rotation
    std::size_t max_file_size_mb{100};

    /// Maximum number of rotated log files to keep
    std::size_t max_files{10};

    /// Use asynchronous logging
    bool async_mode{true};

    /// Buffer size for async logging
    std::size_t buffer_size{8192};
};

/**
 * @class logger_adapter
 * @brief Process-wide logging facade over logger_system
 *
 * Every method is a no-op until initialize() is called.
 *
 * Thread Safety: All methods are thread-safe.
 *
 * @example
 * @code
 * logger_config config;
 * config.log_directory = "/var/log/tenantguard";
 * logger_adapter::initialize(config);
 *
 * logger_adapter::info("Policy store ready, {} industries", count);
 * logger_adapter::shutdown();
 * @endcode
 */
class logger_adapter {
public:
    static void initialize(const logger_config& config);

    static void shutdown();

    [[nodiscard]] static auto is_initialized() noexcept -> bool;

    template <typename... Args>
    static void trace(compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::trace, compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void debug(compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::debug, compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void info(compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::info, compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void warn(compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::warn, compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void error(compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::error, compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void fatal(compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::fatal, compat::format(fmt, std::forward<Args>(args)...));
    }

    /**
     * @brief Log a message at the specified level
     */
    static void log(log_level level, const std::string& message);

    [[nodiscard]] static auto is_level_enabled(log_level level) noexcept -> bool;

    static void flush();

    // ─────────────────────────────────────────────────────
    // Security Logging
    // ─────────────────────────────────────────────────────

    /**
     * @brief Log the outcome of an authorization decision
     *
     * Allows are logged at debug, denials at info, cross-tenant denials at
     * warn and policy errors at error level.
     *
     * @param principal_id Acting principal
     * @param tenant_id Target tenant
     * @param resource Resource type and id ("work_order/wo-17")
     * @param action Requested action
     * @param allowed Final decision
     * @param reason Reason code string
     * @param rule_id Matched rule id (may be empty)
     */
    static void log_access_decision(const std::string& principal_id,
                                    const std::string& tenant_id,
                                    const std::string& resource,
                                    const std::string& action,
                                    bool allowed,
                                    const std::string& reason,
                                    const std::string& rule_id);

    /**
     * @brief Log a policy reload attempt
     * @param industry Industry vertical of the document
     * @param version Document version
     * @param success Whether the snapshot was installed
     * @param diagnostics Number of diagnostics produced
     */
    static void log_policy_reload(const std::string& industry,
                                  std::uint64_t version,
                                  bool success,
                                  std::size_t diagnostics);

    /**
     * @brief Log a session lifecycle transition
     */
    static void log_session_event(session_event event,
                                  const std::string& session_id,
                                  const std::string& principal_id,
                                  const std::string& tenant_id);

    /**
     * @brief Log a security-related event
     * @param type Type of security event
     * @param description Human-readable description
     * @param principal_id Optional principal identifier
     */
    static void log_security_event(security_event_type type,
                                   const std::string& description,
                                   const std::string& principal_id = "");

    static void set_min_level(log_level level);

    [[nodiscard]] static auto get_min_level() noexcept -> log_level;

    [[nodiscard]] static auto get_config() -> const logger_config&;

    [[nodiscard]] static auto security_event_to_string(security_event_type type)
        -> std::string;
    [[nodiscard]] static auto session_event_to_string(session_event event)
        -> std::string;

private:
    static void write_security_trail(const std::string& event_type,
                                     const std::string& outcome,
                                     const std::map<std::string, std::string>& fields);

    class impl;
    static std::unique_ptr<impl> pimpl_;
};

}  // namespace tenantguard::integration
