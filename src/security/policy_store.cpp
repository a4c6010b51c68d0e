/**
 * @file policy_store.cpp
 * @brief Policy snapshot activation and lookup
 *
 * @copyright Copyright (c) 2025
 */

#include <tenantguard/security/policy_store.hpp>

#include <tenantguard/compat/format.hpp>
#include <tenantguard/integration/logger_adapter.hpp>
#include <tenantguard/security/policy_loader.hpp>

namespace tenantguard::security {

using integration::logger_adapter;

policy_store::policy_store(std::shared_ptr<policy_repository_interface> repository)
    : repository_(std::move(repository)) {}

auto policy_store::reload(std::string_view document_json) -> reload_result {
    return install(document_json, true, true);
}

auto policy_store::activate_version(industry_vertical industry, std::uint64_t version)
    -> reload_result {
    reload_result result;
    result.industry = industry;
    result.version = version;
    result.active_version = active_version(industry).value_or(0);

    if (!repository_) {
        result.diagnostics.push_back({diagnostic_code::invalid_document,
                                      "no policy repository configured",
                                      {}});
        return result;
    }

    auto body = repository_->load_document(industry, version);
    if (body.is_err()) {
        result.diagnostics.push_back(
            {diagnostic_code::invalid_document, body.error().message, {}});
        logger_adapter::log_policy_reload(std::string(to_string(industry)), version,
                                          false, result.diagnostics.size());
        return result;
    }
    return install(body.value(), false, false);
}

auto policy_store::load_policies() -> Result<std::size_t> {
    if (!repository_) {
        return std::size_t{0};
    }

    std::size_t loaded = 0;
    for (auto industry : all_industries) {
        auto latest = repository_->latest_version(industry);
        if (latest.is_err()) {
            return Result<std::size_t>(latest.error());
        }
        if (!latest.value()) {
            continue;
        }
        auto result = activate_version(industry, *latest.value());
        if (!result.success) {
            return tenantguard_error<std::size_t>(
                error_codes::policy_error,
                compat::format("Stored policy {} v{} failed validation",
                               to_string(industry), *latest.value()),
                result.diagnostics.empty() ? "" : result.diagnostics.front().message);
        }
        ++loaded;
    }
    return loaded;
}

auto policy_store::install(std::string_view document_json, bool require_newer,
                           bool persist) -> reload_result {
    std::lock_guard writer(reload_mutex_);
    reload_result result;

    auto document = parse_policy_document(document_json, result.diagnostics);
    if (!document) {
        logger_adapter::log_policy_reload("unknown", 0, false, result.diagnostics.size());
        return result;
    }

    const auto industry = document->industry;
    const auto industry_name = std::string(to_string(industry));
    result.industry = industry;
    result.version = document->version;
    result.active_version = active_version(industry).value_or(0);

    if (require_newer && result.active_version != 0 &&
        document->version <= result.active_version) {
        result.diagnostics.push_back(
            {diagnostic_code::stale_version,
             compat::format("version {} is not newer than active version {}",
                            document->version, result.active_version),
             {industry_name}});
        logger_adapter::log_policy_reload(industry_name, result.version, false,
                                          result.diagnostics.size());
        return result;
    }

    auto compiled = policy_set::compile(std::move(*document), result.diagnostics);
    if (!compiled) {
        logger_adapter::log_policy_reload(industry_name, result.version, false,
                                          result.diagnostics.size());
        return result;
    }

    if (persist && repository_) {
        auto saved = repository_->save_document(industry, result.version,
                                                std::string(document_json));
        if (saved.is_err()) {
            result.diagnostics.push_back(
                {diagnostic_code::invalid_document, saved.error().message, {industry_name}});
            logger_adapter::log_policy_reload(industry_name, result.version, false,
                                              result.diagnostics.size());
            return result;
        }
    }

    {
        std::unique_lock lock(snapshots_mutex_);
        snapshots_[industry] = std::move(compiled);
    }

    result.success = true;
    result.active_version = result.version;
    logger_adapter::log_policy_reload(industry_name, result.version, true, 0);
    return result;
}

auto policy_store::snapshot(industry_vertical industry) const
    -> std::shared_ptr<const policy_set> {
    std::shared_lock lock(snapshots_mutex_);
    auto it = snapshots_.find(industry);
    return it == snapshots_.end() ? nullptr : it->second;
}

auto policy_store::active_version(industry_vertical industry) const
    -> std::optional<std::uint64_t> {
    auto current = snapshot(industry);
    if (!current) {
        return std::nullopt;
    }
    return current->version();
}

auto policy_store::effective_permissions(industry_vertical industry,
                                         std::string_view role,
                                         std::string_view industry_role) const
    -> Result<std::vector<effective_grant>> {
    auto current = snapshot(industry);
    if (!current) {
        return tenantguard_error<std::vector<effective_grant>>(
            error_codes::policy_not_loaded, "No policy loaded for industry",
            std::string(to_string(industry)));
    }
    return current->effective_permissions(role, industry_role);
}

} // namespace tenantguard::security
