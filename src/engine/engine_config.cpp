/**
 * @file engine_config.cpp
 * @brief JSON loading of engine configuration
 *
 * @copyright Copyright (c) 2025
 */

#include <tenantguard/engine/engine_config.hpp>

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace tenantguard::engine {

using json = nlohmann::json;

namespace {

template <typename T>
void read_value(const json& section, const char* key, T& target) {
    if (auto it = section.find(key); it != section.end()) {
        target = it->get<T>();
    }
}

template <typename Duration>
void read_duration(const json& section, const char* key, Duration& target) {
    if (auto it = section.find(key); it != section.end()) {
        target = Duration(it->get<typename Duration::rep>());
    }
}

void read_session(const json& j, security::session_config& config) {
    read_duration(j, "absolute_lifetime_seconds", config.absolute_lifetime);
    read_duration(j, "default_idle_timeout_seconds", config.default_idle_timeout);
    read_value(j, "max_concurrent_sessions", config.max_concurrent_sessions);
    read_duration(j, "step_up_window_seconds", config.step_up_window);
    read_duration(j, "sweep_interval_seconds", config.sweep_interval);
}

void read_token(const json& j, security::token_config& config) {
    read_value(j, "secret", config.secret);
    read_duration(j, "default_lifetime_seconds", config.default_lifetime);
}

void read_audit(const json& j, audit::audit_config& config) {
    read_value(j, "database_path", config.database_path);
    if (auto it = j.find("buffer_path"); it != j.end()) {
        config.buffer_path = it->get<std::string>();
    }
    read_value(j, "sync_sensitivity_threshold", config.sync_sensitivity_threshold);
    read_duration(j, "retry_initial_delay_ms", config.retry_initial_delay);
    read_value(j, "retry_multiplier", config.retry_multiplier);
    read_duration(j, "retry_max_delay_ms", config.retry_max_delay);
    read_duration(j, "timeout_ms", config.audit_timeout);
    if (auto it = j.find("retention_days"); it != j.end()) {
        config.retention = std::chrono::hours(24 * it->get<std::int64_t>());
    }
    read_value(j, "auto_start", config.auto_start);
}

auto read_logging(const json& j, engine_config& config) -> VoidResult {
    auto& logging = config.logging;
    read_value(j, "enabled", config.enable_logging);
    if (auto it = j.find("directory"); it != j.end()) {
        logging.log_directory = it->get<std::string>();
    }
    if (auto it = j.find("level"); it != j.end()) {
        auto level = parse_log_level(it->get<std::string>());
        if (!level) {
            return tenantguard_void_error(error_codes::config_parse_error,
                                          "Unknown log level", it->get<std::string>());
        }
        logging.min_level = *level;
    }
    read_value(j, "console", logging.enable_console);
    read_value(j, "file", logging.enable_file);
    read_value(j, "security_trail", logging.enable_security_trail);
    read_value(j, "max_file_size_mb", logging.max_file_size_mb);
    read_value(j, "max_files", logging.max_files);
    read_value(j, "async", logging.async_mode);
    read_value(j, "buffer_size", logging.buffer_size);
    return ok();
}

} // namespace

auto parse_log_level(std::string_view name) -> std::optional<integration::log_level> {
    using integration::log_level;
    if (name == "trace") return log_level::trace;
    if (name == "debug") return log_level::debug;
    if (name == "info") return log_level::info;
    if (name == "warn") return log_level::warn;
    if (name == "error") return log_level::error;
    if (name == "fatal") return log_level::fatal;
    if (name == "off") return log_level::off;
    return std::nullopt;
}

auto parse_engine_config(std::string_view text) -> Result<engine_config> {
    engine_config config;
    try {
        auto j = json::parse(text);
        if (!j.is_object()) {
            return tenantguard_error<engine_config>(error_codes::config_parse_error,
                                                    "Configuration must be a JSON object");
        }

        read_value(j, "database_path", config.database_path);
        if (auto it = j.find("policy_directory"); it != j.end()) {
            config.policy_directory = it->get<std::string>();
        }
        if (auto it = j.find("session"); it != j.end()) {
            read_session(*it, config.session);
        }
        if (auto it = j.find("token"); it != j.end()) {
            read_token(*it, config.token);
        }
        if (auto it = j.find("audit"); it != j.end()) {
            read_audit(*it, config.audit);
        }
        if (auto it = j.find("logging"); it != j.end()) {
            auto logging = read_logging(*it, config);
            if (logging.is_err()) {
                return logging.error();
            }
        }
    }
    catch (const json::parse_error& ex) {
        return tenantguard_error<engine_config>(error_codes::config_parse_error,
                                                "Malformed configuration", ex.what());
    }
    catch (const json::exception& ex) {
        return tenantguard_error<engine_config>(error_codes::config_parse_error,
                                                "Invalid configuration value", ex.what());
    }
    return config;
}

auto load_engine_config(const std::filesystem::path& path) -> Result<engine_config> {
    std::ifstream in(path);
    if (!in) {
        return tenantguard_error<engine_config>(error_codes::config_file_error,
                                                "Cannot open configuration file",
                                                path.string());
    }

    std::ostringstream content;
    content << in.rdbuf();
    return parse_engine_config(content.str());
}

} // namespace tenantguard::engine
