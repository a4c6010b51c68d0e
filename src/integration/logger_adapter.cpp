/**
 * @file logger_adapter.cpp
 * @brief Implementation of the engine logging adapter
 */

#include <tenantguard/integration/logger_adapter.hpp>

#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/interfaces/logger_types.h>
#include <kcenon/logger/writers/console_writer.h>
#include <kcenon/logger/writers/rotating_file_writer.h>

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <fstream>
#include <mutex>

namespace tenantguard::integration {

namespace {

constexpr auto to_backend(log_level level) -> kcenon::logger::log_level {
    using backend = kcenon::logger::log_level;
    switch (level) {
        case log_level::trace: return backend::trace;
        case log_level::debug: return backend::debug;
        case log_level::info: return backend::info;
        case log_level::warn: return backend::warn;
        case log_level::error: return backend::error;
        case log_level::fatal: return backend::fatal;
        case log_level::off: break;
    }
    return backend::off;
}

/// Append-only JSON-lines file of security events, one object per line.
class security_trail {
public:
    void open(std::filesystem::path path) {
        std::lock_guard lock(mutex_);
        path_ = std::move(path);
    }

    void close() {
        std::lock_guard lock(mutex_);
        path_.clear();
    }

    void append(const std::string& event_type,
                const std::string& outcome,
                const std::map<std::string, std::string>& fields) {
        std::lock_guard lock(mutex_);
        if (path_.empty()) {
            return;
        }

        nlohmann::json line = fields;
        line["event_type"] = event_type;
        line["outcome"] = outcome;
        line["timestamp_ms"] = std::chrono::duration_cast<std::chrono::milliseconds>(
                                   std::chrono::system_clock::now().time_since_epoch())
                                   .count();

        std::ofstream out(path_, std::ios::app);
        if (out) {
            out << line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
                << '\n';
        }
    }

private:
    std::mutex mutex_;
    std::filesystem::path path_;
};

}  // namespace

class logger_adapter::impl {
public:
    ~impl() { shutdown(); }

    void initialize(const logger_config& config) {
        std::lock_guard lock(mutex_);
        if (backend_) {
            return;
        }

        if (config.enable_file || config.enable_security_trail) {
            std::error_code ec;
            std::filesystem::create_directories(config.log_directory, ec);
        }

        auto backend = std::make_unique<kcenon::logger::logger>(config.async_mode,
                                                                config.buffer_size);
        backend->set_min_level(to_backend(config.min_level));
        if (config.enable_console) {
            backend->add_writer(std::make_unique<kcenon::logger::console_writer>());
        }
        if (config.enable_file) {
            backend->add_writer(std::make_unique<kcenon::logger::rotating_file_writer>(
                (config.log_directory / "tenantguard.log").string(),
                config.max_file_size_mb * 1024 * 1024, config.max_files));
        }
        backend->start();

        if (config.enable_security_trail) {
            trail_.open(config.log_directory / "security.jsonl");
        }

        config_ = config;
        min_level_.store(config.min_level);
        backend_ = std::move(backend);
        ready_.store(true);
    }

    void shutdown() {
        std::lock_guard lock(mutex_);
        if (!backend_) {
            return;
        }
        ready_.store(false);
        trail_.close();
        backend_->flush();
        backend_->stop();
        backend_.reset();
    }

    [[nodiscard]] auto ready() const noexcept -> bool { return ready_.load(); }

    [[nodiscard]] auto enabled(log_level level) const noexcept -> bool {
        return level != log_level::off &&
               static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level, const std::string& message) {
        if (!ready_.load() || !enabled(level)) {
            return;
        }
        std::lock_guard lock(mutex_);
        if (backend_) {
            backend_->log(to_backend(level), message);
        }
    }

    void flush() {
        std::lock_guard lock(mutex_);
        if (backend_) {
            backend_->flush();
        }
    }

    void set_min_level(log_level level) {
        min_level_.store(level);
        std::lock_guard lock(mutex_);
        if (backend_) {
            backend_->set_min_level(to_backend(level));
        }
    }

    [[nodiscard]] auto min_level() const noexcept -> log_level { return min_level_.load(); }

    [[nodiscard]] auto config() const -> const logger_config& { return config_; }

    void trail(const std::string& event_type,
               const std::string& outcome,
               const std::map<std::string, std::string>& fields) {
        if (ready_.load()) {
            trail_.append(event_type, outcome, fields);
        }
    }

private:
    std::mutex mutex_;
    std::atomic<bool> ready_{false};
    std::atomic<log_level> min_level_{log_level::info};
    logger_config config_;
    std::unique_ptr<kcenon::logger::logger> backend_;
    security_trail trail_;
};

// =============================================================================
// Static Member Initialization
// =============================================================================

std::unique_ptr<logger_adapter::impl> logger_adapter::pimpl_ =
    std::make_unique<logger_adapter::impl>();

void logger_adapter::initialize(const logger_config& config) {
    pimpl_->initialize(config);
}

void logger_adapter::shutdown() { pimpl_->shutdown(); }

auto logger_adapter::is_initialized() noexcept -> bool { return pimpl_->ready(); }

void logger_adapter::log(log_level level, const std::string& message) {
    pimpl_->log(level, message);
}

auto logger_adapter::is_level_enabled(log_level level) noexcept -> bool {
    return pimpl_->enabled(level);
}

void logger_adapter::flush() { pimpl_->flush(); }

// =============================================================================
// Security Logging
// =============================================================================

void logger_adapter::log_access_decision(const std::string& principal_id,
                                         const std::string& tenant_id,
                                         const std::string& resource,
                                         const std::string& action,
                                         bool allowed,
                                         const std::string& reason,
                                         const std::string& rule_id) {
    if (allowed) {
        debug("Allow: principal={} tenant={} {} on {} rule={}",
              principal_id, tenant_id, action, resource, rule_id);
        return;
    }

    if (reason == "policy_error") {
        error("Deny (policy error): principal={} tenant={} {} on {}",
              principal_id, tenant_id, action, resource);
    } else if (reason == "no_tenant_binding") {
        warn("Deny (cross-tenant): principal={} tenant={} {} on {}",
             principal_id, tenant_id, action, resource);
    } else {
        info("Deny: principal={} tenant={} {} on {} reason={}",
             principal_id, tenant_id, action, resource, reason);
    }

    write_security_trail("ACCESS_DECISION", "deny",
                         {{"principal_id", principal_id},
                          {"tenant_id", tenant_id},
                          {"resource", resource},
                          {"action", action},
                          {"reason", reason},
                          {"rule_id", rule_id}});
}

void logger_adapter::log_policy_reload(const std::string& industry,
                                       std::uint64_t version,
                                       bool success,
                                       std::size_t diagnostics) {
    if (success) {
        info("Policy reloaded: industry={} version={}", industry, version);
    } else {
        error("Policy reload rejected: industry={} version={} diagnostics={}",
              industry, version, diagnostics);
    }

    write_security_trail("POLICY_RELOAD", success ? "success" : "failure",
                         {{"industry", industry},
                          {"version", std::to_string(version)},
                          {"diagnostics", std::to_string(diagnostics)}});
}

void logger_adapter::log_session_event(session_event event,
                                       const std::string& session_id,
                                       const std::string& principal_id,
                                       const std::string& tenant_id) {
    auto event_str = session_event_to_string(event);

    switch (event) {
        case session_event::revoked:
            warn("Session {}: {} principal={} tenant={}",
                 event_str, session_id, principal_id, tenant_id);
            break;
        case session_event::created:
        case session_event::logout:
        case session_event::step_up:
            info("Session {}: {} principal={} tenant={}",
                 event_str, session_id, principal_id, tenant_id);
            break;
        case session_event::idle_timeout:
        case session_event::expired:
            debug("Session {}: {} principal={} tenant={}",
                  event_str, session_id, principal_id, tenant_id);
            break;
    }

    write_security_trail("SESSION", event_str,
                         {{"session_id", session_id},
                          {"principal_id", principal_id},
                          {"tenant_id", tenant_id}});
}

void logger_adapter::log_security_event(security_event_type type,
                                        const std::string& description,
                                        const std::string& principal_id) {
    auto type_str = security_event_to_string(type);

    switch (type) {
        case security_event_type::policy_reloaded:
            info("Security event: {} - {}", type_str, description);
            break;
        case security_event_type::authentication_failure:
        case security_event_type::access_denied:
        case security_event_type::cross_tenant_attempt:
        case security_event_type::session_revoked:
        case security_event_type::audit_degraded:
            warn("Security event: {} - {}", type_str, description);
            break;
        case security_event_type::policy_error:
            error("Security event: {} - {}", type_str, description);
            break;
    }

    std::map<std::string, std::string> fields = {
        {"security_event", type_str}, {"description", description}};

    if (!principal_id.empty()) {
        fields["principal_id"] = principal_id;
    }

    write_security_trail("SECURITY", type_str, fields);
}

// =============================================================================
// Configuration
// =============================================================================

void logger_adapter::set_min_level(log_level level) {
    pimpl_->set_min_level(level);
}

auto logger_adapter::get_min_level() noexcept -> log_level { return pimpl_->min_level(); }

auto logger_adapter::get_config() -> const logger_config& { return pimpl_->config(); }

// =============================================================================
// Private Helpers
// =============================================================================

void logger_adapter::write_security_trail(
    const std::string& event_type,
    const std::string& outcome,
    const std::map<std::string, std::string>& fields) {
    pimpl_->trail(event_type, outcome, fields);
}

auto logger_adapter::security_event_to_string(security_event_type type) -> std::string {
    switch (type) {
        case security_event_type::authentication_failure:
            return "authentication_failure";
        case security_event_type::access_denied:
            return "access_denied";
        case security_event_type::cross_tenant_attempt:
            return "cross_tenant_attempt";
        case security_event_type::policy_error:
            return "policy_error";
        case security_event_type::policy_reloaded:
            return "policy_reloaded";
        case security_event_type::session_revoked:
            return "session_revoked";
        case security_event_type::audit_degraded:
            return "audit_degraded";
        default:
            return "unknown";
    }
}

auto logger_adapter::session_event_to_string(session_event event) -> std::string {
    switch (event) {
        case session_event::created:
            return "created";
        case session_event::logout:
            return "logout";
        case session_event::idle_timeout:
            return "idle_timeout";
        case session_event::expired:
            return "expired";
        case session_event::revoked:
            return "revoked";
        case session_event::step_up:
            return "step_up";
        default:
            return "unknown";
    }
}

}  // namespace tenantguard::integration
