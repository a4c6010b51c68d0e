/**
 * @file main.cpp
 * @brief Policy Check - policy document validation utility
 *
 * Validates an industry policy document the way a hot reload would and
 * optionally prints the effective permissions of a role.
 *
 * Usage:
 *   policy_check <policy.json> [options]
 *
 * Example:
 *   policy_check home_services.json
 *   policy_check home_services.json --role Technician
 *   policy_check home_services.json --role Manager --format json
 */

#include <tenantguard/security/constraint.hpp>
#include <tenantguard/security/policy_loader.hpp>
#include <tenantguard/security/policy_set.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

using namespace tenantguard::security;

/**
 * @brief Output format options
 */
enum class output_format { text, json };

/**
 * @brief Command line options
 */
struct options {
    std::filesystem::path path;
    std::string role;
    std::string industry_role;
    output_format format{output_format::text};
};

void print_usage(const char* program_name) {
    std::cout << R"(
Policy Check - Policy Document Validation Utility

Usage: )" << program_name
              << R"( <policy.json> [options]

Arguments:
  policy.json             Industry policy document

Options:
  -h, --help              Show this help message
  -r, --role <name>       Print effective permissions of a base role
  -i, --industry-role <n> Industry role combined with --role
  -f, --format <f>        Output format: text (default), json

Exit Codes:
  0  Document is valid
  1  Error - Invalid arguments
  2  Error - Document rejected
)";
}

bool parse_arguments(int argc, char* argv[], options& opts) {
    if (argc < 2) {
        return false;
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            return false;
        } else if ((arg == "--role" || arg == "-r") && i + 1 < argc) {
            opts.role = argv[++i];
        } else if ((arg == "--industry-role" || arg == "-i") && i + 1 < argc) {
            opts.industry_role = argv[++i];
        } else if ((arg == "--format" || arg == "-f") && i + 1 < argc) {
            std::string fmt = argv[++i];
            if (fmt == "json") {
                opts.format = output_format::json;
            } else if (fmt == "text") {
                opts.format = output_format::text;
            } else {
                std::cerr << "Error: Unknown format '" << fmt << "'. Use: text, json\n";
                return false;
            }
        } else if (arg[0] == '-') {
            std::cerr << "Error: Unknown option '" << arg << "'\n";
            return false;
        } else if (opts.path.empty()) {
            opts.path = arg;
        } else {
            std::cerr << "Error: Only one policy document may be checked\n";
            return false;
        }
    }

    if (opts.path.empty()) {
        std::cerr << "Error: No policy document specified\n";
        return false;
    }
    if (!opts.industry_role.empty() && opts.role.empty()) {
        std::cerr << "Error: --industry-role requires --role\n";
        return false;
    }
    return true;
}

auto diagnostics_to_json(const std::vector<policy_diagnostic>& diagnostics)
    -> nlohmann::json {
    auto list = nlohmann::json::array();
    for (const auto& diag : diagnostics) {
        list.push_back({{"code", std::string(to_string(diag.code))},
                        {"message", diag.message},
                        {"subjects", diag.subjects}});
    }
    return list;
}

auto grant_to_json(const effective_grant& eg) -> nlohmann::json {
    auto constraints = nlohmann::json::array();
    for (const auto& c : eg.source.constraints) {
        constraints.push_back(std::string(to_string(category_of(c))));
    }
    return {{"rule_id", eg.source.rule_id},
            {"role", eg.source.role},
            {"resource_type", eg.source.resource_type},
            {"action", eg.source.action},
            {"distance", eg.distance},
            {"ambiguous", eg.ambiguous},
            {"include_deleted", eg.source.include_deleted},
            {"cross_tenant", eg.source.cross_tenant},
            {"constraints", constraints}};
}

void print_text(const options& opts,
                const std::shared_ptr<const policy_set>& policy,
                const std::vector<policy_diagnostic>& diagnostics,
                const std::vector<effective_grant>& grants) {
    std::cout << "Document:  " << opts.path.string() << "\n";
    if (!policy) {
        std::cout << "Status:    REJECTED (" << diagnostics.size() << " diagnostics)\n";
        for (const auto& diag : diagnostics) {
            std::cout << "  [" << to_string(diag.code) << "] " << diag.message << "\n";
        }
        return;
    }

    std::cout << "Status:    OK\n"
              << "Industry:  " << to_string(policy->industry()) << "\n"
              << "Version:   " << policy->version() << "\n"
              << "Roles:     " << policy->roles().size() << "\n"
              << "Grants:    " << policy->grant_count() << "\n";

    if (opts.role.empty()) {
        return;
    }

    std::cout << "\nEffective permissions of " << opts.role;
    if (!opts.industry_role.empty()) {
        std::cout << " + " << opts.industry_role;
    }
    std::cout << ":\n";
    for (const auto& eg : grants) {
        std::cout << "  " << eg.source.resource_type << "." << eg.source.action << "  "
                  << eg.source.rule_id << " (from " << eg.source.role << ", distance "
                  << eg.distance << ")";
        if (eg.ambiguous) {
            std::cout << " AMBIGUOUS";
        }
        for (const auto& c : eg.source.constraints) {
            std::cout << " [" << to_string(category_of(c)) << "]";
        }
        std::cout << "\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    options opts;
    if (!parse_arguments(argc, argv, opts)) {
        print_usage(argv[0]);
        return 1;
    }

    std::vector<policy_diagnostic> diagnostics;
    std::shared_ptr<const policy_set> policy;
    if (auto document = load_policy_file(opts.path, diagnostics)) {
        policy = policy_set::compile(std::move(*document), diagnostics);
    }

    std::vector<effective_grant> grants;
    if (policy && !opts.role.empty()) {
        auto effective = policy->effective_permissions(opts.role, opts.industry_role);
        if (effective.is_err()) {
            std::cerr << "Error: " << effective.error().message << "\n";
            return 2;
        }
        grants = std::move(effective.value());
    }

    if (opts.format == output_format::json) {
        nlohmann::json out;
        out["document"] = opts.path.string();
        out["valid"] = policy != nullptr;
        out["diagnostics"] = diagnostics_to_json(diagnostics);
        if (policy) {
            out["industry"] = std::string(to_string(policy->industry()));
            out["version"] = policy->version();
            out["roles"] = policy->roles().size();
            out["grants"] = policy->grant_count();
        }
        if (!opts.role.empty() && policy) {
            auto list = nlohmann::json::array();
            for (const auto& eg : grants) {
                list.push_back(grant_to_json(eg));
            }
            out["effective_permissions"] = list;
        }
        std::cout << out.dump(2) << "\n";
    } else {
        print_text(opts, policy, diagnostics, grants);
    }

    return policy ? 0 : 2;
}
