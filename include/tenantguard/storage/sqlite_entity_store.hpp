/**
 * @file sqlite_entity_store.hpp
 * @brief SQLite implementation of the tenant-scoped entity store
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <tenantguard/isolation/entity_store_interface.hpp>

#include <memory>
#include <mutex>
#include <string>

// Forward declaration for SQLite3
struct sqlite3;

namespace tenantguard::storage {

/**
 * @brief SQLite backend for generic entity rows
 *
 * Table: entities(entity_type, entity_id, tenant_id, payload, state,
 * created_at, updated_at, deleted_at), primary key (entity_type,
 * entity_id). A trigger rejects any update of tenant_id.
 */
class sqlite_entity_store : public isolation::entity_store_interface {
public:
    [[nodiscard]] static auto open(const std::string& db_path)
        -> Result<std::unique_ptr<sqlite_entity_store>>;

    ~sqlite_entity_store() override;

    [[nodiscard]] auto find(std::string_view tenant_id,
                            const isolation::entity_query& query)
        -> Result<std::vector<isolation::entity_record>> override;

    [[nodiscard]] auto upsert(std::string_view tenant_id,
                              const isolation::entity_mutation& mutation,
                              std::chrono::system_clock::time_point now)
        -> Result<isolation::entity_record> override;

    [[nodiscard]] auto soft_delete(std::string_view tenant_id,
                                   std::string_view entity_type,
                                   std::string_view entity_id,
                                   std::chrono::system_clock::time_point now)
        -> VoidResult override;

    [[nodiscard]] auto mark_purge_eligible(
        std::string_view tenant_id, std::chrono::system_clock::time_point deleted_before)
        -> Result<std::size_t> override;

private:
    explicit sqlite_entity_store(sqlite3* db);

    [[nodiscard]] auto initialize_tables() -> VoidResult;

    sqlite3* db_{nullptr};
    std::mutex mutex_;
};

} // namespace tenantguard::storage
