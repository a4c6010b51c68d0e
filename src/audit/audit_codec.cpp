/**
 * @file audit_codec.cpp
 * @brief JSON encoding and hashing of audit records
 *
 * @copyright Copyright (c) 2025
 */

#include <tenantguard/audit/audit_codec.hpp>

#include <tenantguard/security/crypto.hpp>

#include <nlohmann/json.hpp>

namespace tenantguard::audit {

using json = nlohmann::json;

namespace {

/// Fields covered by the hash; object keys are emitted sorted
auto hashed_fields(const audit_record& record) -> json {
    json j;
    j["tenant_id"] = record.tenant_id;
    j["sequence"] = record.sequence;
    j["timestamp_ms"] = to_millis(record.timestamp);
    j["event_type"] = to_string(record.event_type);
    j["severity"] = to_string(record.severity);
    j["principal_id"] = record.principal_id;
    j["resource"] = record.resource;
    j["action"] = record.action;
    j["decision"] = record.decision;
    j["rule_id"] = record.rule_id;
    j["reason"] = record.reason;
    j["session_id"] = record.session_id;
    j["policy_version"] = record.policy_version;
    j["metadata"] = record.metadata;
    j["prev_hash"] = record.prev_hash;
    return j;
}

} // namespace

auto to_millis(std::chrono::system_clock::time_point tp) -> std::int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch())
        .count();
}

auto from_millis(std::int64_t ms) -> std::chrono::system_clock::time_point {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

auto canonical_form(const audit_record& record) -> std::string {
    return hashed_fields(record).dump();
}

auto compute_entry_hash(const audit_record& record) -> Result<std::string> {
    return security::sha256_hex(record.prev_hash + canonical_form(record));
}

auto to_json_line(const audit_record& record) -> std::string {
    auto j = hashed_fields(record);
    j["entry_hash"] = record.entry_hash;
    return j.dump();
}

auto from_json_line(std::string_view line) -> Result<audit_record> {
    try {
        auto j = json::parse(line);

        audit_record record;
        record.tenant_id = j.at("tenant_id").get<std::string>();
        record.sequence = j.at("sequence").get<std::uint64_t>();
        record.timestamp = from_millis(j.at("timestamp_ms").get<std::int64_t>());

        auto type = parse_audit_event_type(j.at("event_type").get<std::string>());
        auto severity = parse_audit_severity(j.at("severity").get<std::string>());
        if (!type || !severity) {
            return tenantguard_error<audit_record>(error_codes::audit_buffer_error,
                                                   "Unknown audit event type or severity");
        }
        record.event_type = *type;
        record.severity = *severity;

        record.principal_id = j.at("principal_id").get<std::string>();
        record.resource = j.at("resource").get<std::string>();
        record.action = j.at("action").get<std::string>();
        record.decision = j.at("decision").get<std::string>();
        record.rule_id = j.at("rule_id").get<std::string>();
        record.reason = j.at("reason").get<std::string>();
        record.session_id = j.at("session_id").get<std::string>();
        record.policy_version = j.at("policy_version").get<std::uint64_t>();
        record.metadata = j.at("metadata").get<std::map<std::string, std::string>>();
        record.prev_hash = j.at("prev_hash").get<std::string>();
        record.entry_hash = j.at("entry_hash").get<std::string>();
        return record;
    }
    catch (const json::exception& ex) {
        return tenantguard_error<audit_record>(error_codes::audit_buffer_error,
                                               "Malformed audit line", ex.what());
    }
}

} // namespace tenantguard::audit
