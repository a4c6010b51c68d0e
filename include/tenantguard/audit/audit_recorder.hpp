/**
 * @file audit_recorder.hpp
 * @brief Per-tenant sequenced, hash-chained audit recorder
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include "audit_buffer.hpp"
#include "audit_record.hpp"
#include "audit_store_interface.hpp"

#include <tenantguard/core/result.hpp>
#include <tenantguard/security/tenant.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <vector>

namespace tenantguard::audit {

/**
 * @brief Audit recorder settings
 */
struct audit_config {
    /// SQLite database for the audit log (":memory:" for tests)
    std::string database_path{"tenantguard_audit.db"};

    /// JSON-lines file holding entries the store could not accept
    std::filesystem::path buffer_path{"tenantguard_audit.buffer.jsonl"};

    /// Decisions on resources at or above this sensitivity are written synchronously
    int sync_sensitivity_threshold{5};

    /// Replay backoff
    std::chrono::milliseconds retry_initial_delay{500};
    double retry_multiplier{2.0};
    std::chrono::milliseconds retry_max_delay{std::chrono::seconds(60)};

    /// Budget for a synchronous write; also the store's lock wait
    std::chrono::milliseconds audit_timeout{2000};

    /// Age after which entries of a cancelled tenant may be purged
    std::chrono::hours retention{std::chrono::hours(24 * 365 * 7)};

    /// Start the background worker on construction
    bool auto_start{false};
};

/**
 * @brief How a record() call persists its entry
 */
enum class write_mode {
    /// Queue for the background worker; acknowledged as buffered
    async,
    /// Return only once the store or the local buffer holds the entry
    sync
};

/**
 * @brief Assigns sequence numbers and hashes, then persists audit entries
 *
 * Each tenant is a partition with its own mutex, sequence counter and
 * chain head. Sequence numbers are assigned before any write is attempted
 * and are never reused: an entry the store rejects goes to the durable
 * buffer, and an entry neither can take stays queued in memory until the
 * worker succeeds. Within a tenant, entries reach the store in sequence
 * order; once a tenant has buffered entries, later ones are buffered too
 * until replay drains them.
 *
 * Thread Safety: All methods are thread-safe.
 *
 * @example
 * @code
 * auto store = storage::sqlite_audit_store::open("audit.db").value();
 * audit_recorder recorder{std::move(store), config};
 * recorder.start();
 *
 * audit_record event;
 * event.tenant_id = "biz-1";
 * event.event_type = audit_event_type::data_mutation;
 * auto ack = recorder.record(std::move(event), write_mode::sync);
 * @endcode
 */
class audit_recorder {
public:
    using clock_type = std::function<std::chrono::system_clock::time_point()>;

    audit_recorder(std::shared_ptr<audit_store_interface> store,
                   const audit_config& config = {},
                   clock_type clock = {});

    /**
     * @brief Destructor - stops the worker and flushes queued entries
     */
    ~audit_recorder();

    audit_recorder(const audit_recorder&) = delete;
    audit_recorder& operator=(const audit_recorder&) = delete;
    audit_recorder(audit_recorder&&) = delete;
    audit_recorder& operator=(audit_recorder&&) = delete;

    // =========================================================================
    // Lifecycle Management
    // =========================================================================

    /**
     * @brief Start the background replay worker
     *
     * Without a running worker, async records are written inline.
     */
    void start();

    /**
     * @brief Stop the worker, then persist whatever is still queued
     */
    void stop();

    [[nodiscard]] auto is_running() const noexcept -> bool;

    // =========================================================================
    // Recording
    // =========================================================================

    /**
     * @brief Append an event to its tenant's log
     *
     * The recorder fills sequence, timestamp, prev_hash and entry_hash.
     *
     * @return Acknowledgement, or audit_write_failed when no sequence could
     *         be assigned or a synchronous write reached neither the store
     *         nor the buffer
     */
    [[nodiscard]] auto record(audit_record event, write_mode mode = write_mode::async)
        -> Result<audit_ack>;

    /**
     * @brief Persist queued entries and replay the buffer once
     * @return Number of entries still not in the store
     */
    auto flush() -> std::size_t;

    /// Entries queued in memory or held in the buffer
    [[nodiscard]] auto pending_count() const -> std::size_t;

    /// Whether a partition (sequence and chain head) exists for the tenant
    [[nodiscard]] auto has_partition(std::string_view tenant_id) const -> bool;

    // =========================================================================
    // Query and Integrity
    // =========================================================================

    /// Entries already in the store
    [[nodiscard]] auto query(const audit_query& query) -> Result<std::vector<audit_record>>;

    /**
     * @brief Check sequence continuity and the hash chain of a tenant
     *
     * A chain that does not start at 1 reports the missing prefix as a gap.
     */
    [[nodiscard]] auto verify_chain(std::string_view tenant_id) -> Result<chain_report>;

    /**
     * @brief Purge entries past retention
     *
     * Only a cancelled tenant's entries are ever deleted; for any other
     * status this is a no-op returning 0.
     */
    [[nodiscard]] auto apply_retention(std::string_view tenant_id,
                                       security::tenant_status status)
        -> Result<std::size_t>;

    [[nodiscard]] auto config() const noexcept -> const audit_config& { return config_; }

private:
    struct partition {
        std::mutex mutex;
        bool seeded{false};
        std::uint64_t next_sequence{1};
        std::string last_hash;

        /// Chain head found in the buffer at startup
        std::uint64_t buffer_head_sequence{0};
        std::string buffer_head_hash;

        /// Sequenced entries not yet in the store or the buffer
        std::deque<audit_record> pending;

        /// Entries of this tenant in the buffer file
        std::atomic<std::size_t> buffered{0};
    };

    enum class persisted { store, buffer };

    [[nodiscard]] auto get_partition(const std::string& tenant_id)
        -> std::shared_ptr<partition>;
    [[nodiscard]] auto all_partitions() const
        -> std::vector<std::pair<std::string, std::shared_ptr<partition>>>;

    [[nodiscard]] auto seed_locked(partition& p, const std::string& tenant_id)
        -> VoidResult;
    [[nodiscard]] auto persist_one(partition& p, const audit_record& record)
        -> Result<persisted>;
    [[nodiscard]] auto drain_locked(partition& p) -> VoidResult;

    void load_buffer_heads();
    void drain_all();
    auto replay_buffer() -> std::size_t;

    void run_loop();

    [[nodiscard]] auto now() const -> std::chrono::system_clock::time_point;

    std::shared_ptr<audit_store_interface> store_;
    audit_config config_;
    clock_type clock_;
    audit_buffer buffer_;

    mutable std::shared_mutex partitions_mutex_;
    std::unordered_map<std::string, std::shared_ptr<partition>> partitions_;

    /// Serializes buffer appends against replay
    std::mutex buffer_mutex_;

    // Worker state
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::thread worker_thread_;
    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> running_{false};
    bool work_ready_{false};
    std::chrono::steady_clock::time_point next_attempt_time_;
    std::chrono::milliseconds current_delay_;
};

} // namespace tenantguard::audit
