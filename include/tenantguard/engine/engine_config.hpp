/**
 * @file engine_config.hpp
 * @brief Top-level configuration of the authorization engine
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <tenantguard/audit/audit_recorder.hpp>
#include <tenantguard/core/result.hpp>
#include <tenantguard/integration/logger_adapter.hpp>
#include <tenantguard/security/session_manager.hpp>
#include <tenantguard/security/token_codec.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace tenantguard::engine {

/**
 * @brief Engine settings; every member has a usable default
 *
 * JSON layout read by load_engine_config():
 * @code
 * {
 *   "database_path": "tenantguard.db",
 *   "policy_directory": "policies",
 *   "session": { "absolute_lifetime_seconds": 28800,
 *                "default_idle_timeout_seconds": 1800,
 *                "max_concurrent_sessions": 5,
 *                "step_up_window_seconds": 14400,
 *                "sweep_interval_seconds": 300 },
 *   "token": { "secret": "...", "default_lifetime_seconds": 28800 },
 *   "audit": { "database_path": "audit.db", "buffer_path": "audit.jsonl",
 *              "sync_sensitivity_threshold": 5, "retry_initial_delay_ms": 500,
 *              "retry_multiplier": 2.0, "retry_max_delay_ms": 60000,
 *              "timeout_ms": 2000, "retention_days": 2555, "auto_start": true },
 *   "logging": { "enabled": true, "directory": "logs", "level": "info",
 *                "console": true, "file": true, "security_trail": true,
 *                "max_file_size_mb": 100, "max_files": 10, "async": true }
 * }
 * @endcode
 */
struct engine_config {
    /// Principals, tenants, policy documents and entities
    std::string database_path{"tenantguard.db"};

    /// Policy documents (*.json) applied at startup; empty to skip
    std::filesystem::path policy_directory;

    security::session_config session;
    security::token_config token;
    audit::audit_config audit;

    /// Initialize logger_adapter when the engine is created
    bool enable_logging{false};
    integration::logger_config logging;
};

/**
 * @brief Parse a configuration document; missing keys keep their defaults
 * @return config_parse_error for malformed JSON or mistyped values
 */
[[nodiscard]] auto parse_engine_config(std::string_view text) -> Result<engine_config>;

/**
 * @brief Read and parse a configuration file
 * @return config_file_error if the file cannot be read
 */
[[nodiscard]] auto load_engine_config(const std::filesystem::path& path)
    -> Result<engine_config>;

[[nodiscard]] auto parse_log_level(std::string_view name)
    -> std::optional<integration::log_level>;

} // namespace tenantguard::engine
