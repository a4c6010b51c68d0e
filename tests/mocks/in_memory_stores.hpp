/**
 * @file in_memory_stores.hpp
 * @brief In-memory storage backends for unit tests
 */

#pragma once

#include <tenantguard/audit/audit_store_interface.hpp>
#include <tenantguard/isolation/entity_store_interface.hpp>
#include <tenantguard/security/policy_repository_interface.hpp>
#include <tenantguard/security/principal_store_interface.hpp>

#include <algorithm>
#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace tenantguard::test {

// Mock Principal Directory
class MockPrincipalStore : public security::principal_store_interface {
public:
  VoidResult create_principal(const security::principal &p) override {
    principals[p.id] = p;
    return ok();
  }

  Result<security::principal> get_principal(std::string_view id) override {
    if (fail_reads) {
      return tenantguard_error<security::principal>(
          error_codes::database_query_error, "Directory offline");
    }
    auto it = principals.find(std::string(id));
    if (it == principals.end()) {
      return tenantguard_error<security::principal>(
          error_codes::principal_not_found, "Not found");
    }
    return it->second;
  }

  VoidResult update_principal(const security::principal &p) override {
    principals[p.id] = p;
    return ok();
  }

  VoidResult delete_principal(std::string_view id) override {
    principals.erase(std::string(id));
    return ok();
  }

  Result<std::vector<security::principal>>
  get_principals_by_tenant(std::string_view tenant_id) override {
    std::vector<security::principal> res;
    for (const auto &[id, p] : principals) {
      if (p.is_bound_to(tenant_id))
        res.push_back(p);
    }
    return res;
  }

  VoidResult create_tenant(const security::tenant &t) override {
    tenants[t.id] = t;
    return ok();
  }

  Result<security::tenant> get_tenant(std::string_view id) override {
    if (fail_reads) {
      return tenantguard_error<security::tenant>(
          error_codes::database_query_error, "Directory offline");
    }
    auto it = tenants.find(std::string(id));
    if (it == tenants.end()) {
      return tenantguard_error<security::tenant>(error_codes::tenant_not_found,
                                                 "Not found");
    }
    return it->second;
  }

  VoidResult update_tenant(const security::tenant &t) override {
    tenants[t.id] = t;
    return ok();
  }

  std::map<std::string, security::principal> principals;
  std::map<std::string, security::tenant> tenants;
  bool fail_reads{false};
};

// Mock Policy Repository
class MockPolicyRepository : public security::policy_repository_interface {
public:
  VoidResult save_document(security::industry_vertical industry,
                           std::uint64_t version,
                           const std::string &body) override {
    documents[{industry, version}] = body;
    return ok();
  }

  Result<std::string> load_document(security::industry_vertical industry,
                                    std::uint64_t version) override {
    auto it = documents.find({industry, version});
    if (it == documents.end()) {
      return tenantguard_error<std::string>(error_codes::policy_not_loaded,
                                            "Not found");
    }
    return it->second;
  }

  Result<std::optional<std::uint64_t>>
  latest_version(security::industry_vertical industry) override {
    std::optional<std::uint64_t> latest;
    for (const auto &[key, body] : documents) {
      if (key.first == industry)
        latest = key.second;
    }
    return latest;
  }

  Result<std::vector<std::uint64_t>>
  list_versions(security::industry_vertical industry) override {
    std::vector<std::uint64_t> versions;
    for (const auto &[key, body] : documents) {
      if (key.first == industry)
        versions.push_back(key.second);
    }
    return versions;
  }

  std::map<std::pair<security::industry_vertical, std::uint64_t>, std::string>
      documents;
};

// Mock Audit Store
//
// Unlike the SQLite store, stored entries can be edited in place so that
// tests can simulate tampering.
class MockAuditStore : public audit::audit_store_interface {
public:
  VoidResult append(const audit::audit_record &record) override {
    std::lock_guard lock(mutex);
    ++append_calls;
    if (fail_appends) {
      return tenantguard_void_error(error_codes::store_unavailable,
                                    "Audit store offline");
    }
    auto key = std::make_pair(record.tenant_id, record.sequence);
    if (entries.contains(key)) {
      return tenantguard_void_error(error_codes::audit_sequence_conflict,
                                    "Duplicate sequence");
    }
    entries[key] = record;
    return ok();
  }

  Result<std::vector<audit::audit_record>>
  query(const audit::audit_query &q) override {
    std::lock_guard lock(mutex);
    std::vector<audit::audit_record> res;
    for (const auto &[key, r] : entries) {
      if (key.first != q.tenant_id)
        continue;
      if (q.principal_id && r.principal_id != *q.principal_id)
        continue;
      if (q.decision && r.decision != *q.decision)
        continue;
      if (q.event_type && r.event_type != *q.event_type)
        continue;
      res.push_back(r);
    }
    return res;
  }

  Result<std::optional<audit::audit_record>>
  last_entry(std::string_view tenant_id) override {
    std::lock_guard lock(mutex);
    if (fail_reads) {
      return tenantguard_error<std::optional<audit::audit_record>>(
          error_codes::store_unavailable, "Audit store offline");
    }
    std::optional<audit::audit_record> last;
    for (const auto &[key, r] : entries) {
      if (key.first == tenant_id)
        last = r;
    }
    return last;
  }

  Result<std::size_t>
  delete_before(std::string_view tenant_id,
                std::chrono::system_clock::time_point cutoff) override {
    std::lock_guard lock(mutex);
    std::size_t deleted = std::erase_if(entries, [&](const auto &item) {
      return item.first.first == tenant_id && item.second.timestamp < cutoff;
    });
    return deleted;
  }

  std::vector<audit::audit_record> tenant_entries(const std::string &tenant) {
    return query(audit::audit_query{tenant}).value();
  }

  std::recursive_mutex mutex;
  std::map<std::pair<std::string, std::uint64_t>, audit::audit_record> entries;
  bool fail_appends{false};
  bool fail_reads{false};
  int append_calls{0};
};

// Mock Entity Store
class MockEntityStore : public isolation::entity_store_interface {
public:
  Result<std::vector<isolation::entity_record>>
  find(std::string_view tenant_id, const isolation::entity_query &q) override {
    std::vector<isolation::entity_record> res;
    for (const auto &[key, r] : rows) {
      if (r.tenant_id != tenant_id || r.entity_type != q.entity_type)
        continue;
      if (q.entity_id && r.entity_id != *q.entity_id)
        continue;
      if (!q.include_deleted && !r.is_active())
        continue;
      res.push_back(r);
    }
    return res;
  }

  Result<isolation::entity_record>
  upsert(std::string_view tenant_id, const isolation::entity_mutation &m,
         std::chrono::system_clock::time_point now) override {
    auto key = std::make_pair(m.entity_type, m.entity_id);
    auto it = rows.find(key);
    if (it != rows.end()) {
      if (it->second.tenant_id != tenant_id) {
        return tenantguard_error<isolation::entity_record>(
            error_codes::tenant_immutable, "Owned by another tenant");
      }
      if (!it->second.is_active()) {
        return tenantguard_error<isolation::entity_record>(
            error_codes::entity_not_found, "Deleted");
      }
      it->second.payload = m.payload;
      it->second.updated_at = now;
      return it->second;
    }
    isolation::entity_record r;
    r.tenant_id = std::string(tenant_id);
    r.entity_type = m.entity_type;
    r.entity_id = m.entity_id;
    r.payload = m.payload;
    r.created_at = now;
    r.updated_at = now;
    rows[key] = r;
    return r;
  }

  VoidResult soft_delete(std::string_view tenant_id, std::string_view type,
                         std::string_view id,
                         std::chrono::system_clock::time_point now) override {
    auto it = rows.find({std::string(type), std::string(id)});
    if (it == rows.end() || it->second.tenant_id != tenant_id ||
        !it->second.is_active()) {
      return tenantguard_void_error(error_codes::entity_not_found, "Not found");
    }
    it->second.state = isolation::entity_state::soft_deleted;
    it->second.deleted_at = now;
    return ok();
  }

  Result<std::size_t>
  mark_purge_eligible(std::string_view tenant_id,
                      std::chrono::system_clock::time_point before) override {
    std::size_t count = 0;
    for (auto &[key, r] : rows) {
      if (r.tenant_id == tenant_id &&
          r.state == isolation::entity_state::soft_deleted && r.deleted_at &&
          *r.deleted_at < before) {
        r.state = isolation::entity_state::purge_eligible;
        ++count;
      }
    }
    return count;
  }

  std::map<std::pair<std::string, std::string>, isolation::entity_record> rows;
};

// Manually advanced clock shared by components under test
struct ManualClock {
  std::chrono::system_clock::time_point now{
      std::chrono::sys_days{std::chrono::year{2025} / 3 / 12} +
      std::chrono::hours(10)}; // Wednesday 10:00 UTC

  auto fn() {
    return [this] { return now; };
  }

  void advance(std::chrono::seconds by) { now += by; }
};

} // namespace tenantguard::test
