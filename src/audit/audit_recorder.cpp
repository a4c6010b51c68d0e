/**
 * @file audit_recorder.cpp
 * @brief Implementation of the audit recorder and its replay worker
 *
 * @copyright Copyright (c) 2025
 */

#include <tenantguard/audit/audit_recorder.hpp>

#include <tenantguard/audit/audit_codec.hpp>
#include <tenantguard/compat/format.hpp>
#include <tenantguard/integration/logger_adapter.hpp>

#include <algorithm>
#include <map>

namespace tenantguard::audit {

using integration::logger_adapter;
using integration::security_event_type;

// ============================================================================
// Construction
// ============================================================================

audit_recorder::audit_recorder(std::shared_ptr<audit_store_interface> store,
                               const audit_config& config,
                               clock_type clock)
    : store_(std::move(store)),
      config_(config),
      clock_(std::move(clock)),
      buffer_(config.buffer_path),
      current_delay_(config.retry_initial_delay) {
    load_buffer_heads();
    if (config_.auto_start) {
        start();
    }
}

audit_recorder::~audit_recorder() {
    stop();
}

void audit_recorder::load_buffer_heads() {
    auto loaded = buffer_.load();
    if (loaded.is_err()) {
        logger_adapter::error("Audit buffer unreadable at startup: {}",
                              loaded.error().message);
        return;
    }

    for (const auto& record : loaded.value()) {
        auto p = get_partition(record.tenant_id);
        p->buffered.fetch_add(1);
        if (record.sequence > p->buffer_head_sequence) {
            p->buffer_head_sequence = record.sequence;
            p->buffer_head_hash = record.entry_hash;
        }
    }

    if (!loaded.value().empty()) {
        logger_adapter::warn("Audit buffer holds {} entries awaiting replay",
                             loaded.value().size());
    }
}

// ============================================================================
// Lifecycle Management
// ============================================================================

void audit_recorder::start() {
    std::lock_guard lock(mutex_);

    if (running_.load()) {
        return;
    }

    stop_requested_.store(false);
    running_.store(true);
    work_ready_ = true;
    next_attempt_time_ = std::chrono::steady_clock::now();

    worker_thread_ = std::thread([this]() { run_loop(); });
}

void audit_recorder::stop() {
    {
        std::lock_guard lock(mutex_);

        if (!running_.load()) {
            return;
        }

        stop_requested_.store(true);
    }

    cv_.notify_all();

    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }

    running_.store(false);

    drain_all();
}

auto audit_recorder::is_running() const noexcept -> bool {
    return running_.load();
}

// ============================================================================
// Recording
// ============================================================================

auto audit_recorder::record(audit_record event, write_mode mode) -> Result<audit_ack> {
    if (event.tenant_id.empty()) {
        return tenantguard_error<audit_ack>(error_codes::audit_write_failed,
                                            "Audit event has no tenant");
    }

    auto p = get_partition(event.tenant_id);
    std::unique_lock lock(p->mutex);

    auto seeded = seed_locked(*p, event.tenant_id);
    if (seeded.is_err()) {
        logger_adapter::log_security_event(
            security_event_type::audit_degraded,
            compat::format("Cannot sequence audit events for tenant {}: {}",
                           event.tenant_id, seeded.error().message),
            event.principal_id);
        return tenantguard_error<audit_ack>(error_codes::audit_write_failed,
                                            "Audit sequence unavailable",
                                            seeded.error().message);
    }

    event.sequence = p->next_sequence;
    event.timestamp = from_millis(to_millis(now()));
    event.prev_hash = p->last_hash;
    auto hash = compute_entry_hash(event);
    if (hash.is_err()) {
        return tenantguard_error<audit_ack>(error_codes::audit_write_failed,
                                            "Failed to hash audit entry",
                                            hash.error().message);
    }
    event.entry_hash = hash.value();

    // The sequence is consumed from here on
    p->next_sequence = event.sequence + 1;
    p->last_hash = event.entry_hash;

    audit_ack ack{event.tenant_id, event.sequence, event.entry_hash, true};

    if (mode == write_mode::async && running_.load()) {
        p->pending.push_back(std::move(event));
        lock.unlock();
        {
            std::lock_guard worker_lock(mutex_);
            work_ready_ = true;
        }
        cv_.notify_one();
        return ack;
    }

    auto started = std::chrono::steady_clock::now();

    // Older queued entries of this tenant go first
    auto drained = drain_locked(*p);
    if (drained.is_err()) {
        p->pending.push_back(std::move(event));
        if (mode == write_mode::async) {
            return ack;
        }
        return tenantguard_error<audit_ack>(error_codes::audit_write_failed,
                                            "Audit write failed",
                                            drained.error().message);
    }

    auto written = persist_one(*p, event);
    if (written.is_err()) {
        p->pending.push_back(std::move(event));
        if (mode == write_mode::async) {
            return ack;
        }
        return tenantguard_error<audit_ack>(error_codes::audit_write_failed,
                                            "Audit write failed",
                                            written.error().message);
    }
    ack.buffered = written.value() == persisted::buffer;

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    if (mode == write_mode::sync && elapsed > config_.audit_timeout) {
        logger_adapter::warn("Synchronous audit write for tenant {} took {}ms",
                             ack.tenant_id, elapsed.count());
    }
    return ack;
}

auto audit_recorder::flush() -> std::size_t {
    drain_all();
    replay_buffer();
    return pending_count();
}

auto audit_recorder::pending_count() const -> std::size_t {
    std::size_t total = 0;
    for (auto& entry : all_partitions()) {
        auto& p = entry.second;
        std::lock_guard lock(p->mutex);
        total += p->pending.size() + p->buffered.load();
    }
    return total;
}

auto audit_recorder::has_partition(std::string_view tenant_id) const -> bool {
    std::shared_lock lock(partitions_mutex_);
    return partitions_.contains(std::string(tenant_id));
}

// ============================================================================
// Query and Integrity
// ============================================================================

auto audit_recorder::query(const audit_query& query) -> Result<std::vector<audit_record>> {
    return store_->query(query);
}

auto audit_recorder::verify_chain(std::string_view tenant_id) -> Result<chain_report> {
    audit_query q;
    q.tenant_id = std::string(tenant_id);
    auto entries = store_->query(q);
    if (entries.is_err()) {
        return entries.error();
    }

    chain_report report;
    report.tenant_id = q.tenant_id;

    std::uint64_t expected = 1;
    std::string prev_hash;
    bool linked = true;

    for (const auto& entry : entries.value()) {
        ++report.entries_checked;
        report.last_sequence = entry.sequence;

        if (entry.sequence > expected) {
            report.gaps.emplace_back(expected, entry.sequence - 1);
            linked = false;
        }

        bool intact = !linked || entry.prev_hash == prev_hash;
        if (intact) {
            auto hash = compute_entry_hash(entry);
            if (hash.is_err()) {
                return hash.error();
            }
            intact = hash.value() == entry.entry_hash;
        }
        if (!intact) {
            report.mismatches.push_back(entry.sequence);
        }

        prev_hash = entry.entry_hash;
        linked = true;
        expected = entry.sequence + 1;
    }

    if (!report.intact()) {
        logger_adapter::log_security_event(
            security_event_type::audit_degraded,
            compat::format("Audit chain of tenant {} failed verification: {} gaps, {} mismatches",
                           report.tenant_id, report.gaps.size(), report.mismatches.size()));
    }
    return report;
}

auto audit_recorder::apply_retention(std::string_view tenant_id,
                                     security::tenant_status status)
    -> Result<std::size_t> {
    if (status != security::tenant_status::cancelled) {
        return std::size_t{0};
    }

    auto cutoff = now() - config_.retention;
    auto deleted = store_->delete_before(tenant_id, cutoff);
    if (deleted.is_ok() && deleted.value() > 0) {
        logger_adapter::info("Purged {} audit entries of cancelled tenant {}",
                             deleted.value(), tenant_id);
    }
    return deleted;
}

// ============================================================================
// Internal Methods
// ============================================================================

auto audit_recorder::get_partition(const std::string& tenant_id)
    -> std::shared_ptr<partition> {
    {
        std::shared_lock lock(partitions_mutex_);
        auto it = partitions_.find(tenant_id);
        if (it != partitions_.end()) {
            return it->second;
        }
    }

    std::unique_lock lock(partitions_mutex_);
    auto& slot = partitions_[tenant_id];
    if (!slot) {
        slot = std::make_shared<partition>();
    }
    return slot;
}

auto audit_recorder::all_partitions() const
    -> std::vector<std::pair<std::string, std::shared_ptr<partition>>> {
    std::shared_lock lock(partitions_mutex_);
    return {partitions_.begin(), partitions_.end()};
}

auto audit_recorder::seed_locked(partition& p, const std::string& tenant_id)
    -> VoidResult {
    if (p.seeded) {
        return ok();
    }

    auto last = store_->last_entry(tenant_id);
    if (last.is_err()) {
        // Buffered entries always follow everything already in the store
        if (p.buffered.load() == 0) {
            return last.error();
        }
        p.next_sequence = p.buffer_head_sequence + 1;
        p.last_hash = p.buffer_head_hash;
        p.seeded = true;
        return ok();
    }

    std::uint64_t head = 0;
    std::string head_hash;
    if (last.value()) {
        head = last.value()->sequence;
        head_hash = last.value()->entry_hash;
    }
    if (p.buffer_head_sequence > head) {
        head = p.buffer_head_sequence;
        head_hash = p.buffer_head_hash;
    }

    p.next_sequence = head + 1;
    p.last_hash = std::move(head_hash);
    p.seeded = true;
    return ok();
}

auto audit_recorder::persist_one(partition& p, const audit_record& record)
    -> Result<persisted> {
    std::string store_error;
    if (p.buffered.load() == 0) {
        auto stored = store_->append(record);
        if (stored.is_ok()) {
            return persisted::store;
        }
        store_error = stored.error().message;
        logger_adapter::warn("Audit store rejected {}#{}: {}", record.tenant_id,
                             record.sequence, store_error);
    }

    std::lock_guard lock(buffer_mutex_);
    auto buffered = buffer_.append(record);
    if (buffered.is_err()) {
        logger_adapter::log_security_event(
            security_event_type::audit_degraded,
            compat::format("Audit entry {}#{} held in memory: {}", record.tenant_id,
                           record.sequence, buffered.error().message),
            record.principal_id);
        return tenantguard_error<persisted>(
            error_codes::audit_write_failed,
            "Audit store and local buffer unavailable",
            store_error.empty() ? buffered.error().message
                                : store_error + "; " + buffered.error().message);
    }
    p.buffered.fetch_add(1);
    return persisted::buffer;
}

auto audit_recorder::drain_locked(partition& p) -> VoidResult {
    while (!p.pending.empty()) {
        auto written = persist_one(p, p.pending.front());
        if (written.is_err()) {
            return written.error();
        }
        p.pending.pop_front();
    }
    return ok();
}

void audit_recorder::drain_all() {
    for (auto& [tenant_id, p] : all_partitions()) {
        std::lock_guard lock(p->mutex);
        if (p->pending.empty()) {
            continue;
        }
        auto drained = drain_locked(*p);
        if (drained.is_err()) {
            logger_adapter::error("{} audit entries of tenant {} still queued: {}",
                                  p->pending.size(), tenant_id, drained.error().message);
        }
    }
}

auto audit_recorder::replay_buffer() -> std::size_t {
    std::lock_guard lock(buffer_mutex_);

    auto loaded = buffer_.load();
    if (loaded.is_err()) {
        logger_adapter::error("Audit buffer replay failed: {}", loaded.error().message);
        return 0;
    }
    if (loaded.value().empty()) {
        return 0;
    }

    std::map<std::string, std::vector<audit_record>> by_tenant;
    for (auto& record : loaded.value()) {
        by_tenant[record.tenant_id].push_back(std::move(record));
    }

    std::vector<audit_record> remaining;
    std::size_t replayed = 0;

    for (auto& [tenant_id, records] : by_tenant) {
        std::sort(records.begin(), records.end(),
                  [](const audit_record& a, const audit_record& b) {
                      return a.sequence < b.sequence;
                  });

        std::size_t index = 0;
        for (; index < records.size(); ++index) {
            auto stored = store_->append(records[index]);
            if (stored.is_err() &&
                stored.error().code != error_codes::audit_sequence_conflict) {
                break;
            }
            ++replayed;
        }
        remaining.insert(remaining.end(),
                         std::make_move_iterator(records.begin() +
                                                 static_cast<std::ptrdiff_t>(index)),
                         std::make_move_iterator(records.end()));

        get_partition(tenant_id)->buffered.store(records.size() - index);
    }

    auto rewritten = buffer_.rewrite(remaining);
    if (rewritten.is_err()) {
        // Replayed entries stay in the file; a later replay sees them as conflicts
        logger_adapter::error("Failed to compact audit buffer: {}",
                              rewritten.error().message);
    }

    if (replayed > 0) {
        logger_adapter::info("Replayed {} buffered audit entries, {} remaining", replayed,
                             remaining.size());
    }
    return remaining.size();
}

void audit_recorder::run_loop() {
    while (!stop_requested_.load()) {
        std::unique_lock lock(mutex_);

        cv_.wait_until(lock, next_attempt_time_, [this]() {
            return stop_requested_.load() || work_ready_ ||
                   std::chrono::steady_clock::now() >= next_attempt_time_;
        });

        if (stop_requested_.load()) {
            break;
        }
        work_ready_ = false;

        // Release lock while writing
        lock.unlock();

        drain_all();
        auto left = replay_buffer();
        bool backlog = left > 0 || pending_count() > 0;

        lock.lock();
        if (backlog) {
            next_attempt_time_ = std::chrono::steady_clock::now() + current_delay_;
            auto next_delay = std::chrono::duration_cast<std::chrono::milliseconds>(
                current_delay_ * config_.retry_multiplier);
            current_delay_ = std::min(next_delay, config_.retry_max_delay);
        } else {
            current_delay_ = config_.retry_initial_delay;
            next_attempt_time_ = std::chrono::steady_clock::now() + config_.retry_max_delay;
        }
    }
}

auto audit_recorder::now() const -> std::chrono::system_clock::time_point {
    return clock_ ? clock_() : std::chrono::system_clock::now();
}

} // namespace tenantguard::audit
