/**
 * @file audit_buffer.hpp
 * @brief Durable local buffer for audit entries awaiting the store
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include "audit_record.hpp"

#include <tenantguard/core/result.hpp>

#include <filesystem>
#include <mutex>
#include <vector>

namespace tenantguard::audit {

/**
 * @brief Append-only JSON-lines file of pending audit entries
 *
 * Each append is flushed and fsync'd before returning, so an acknowledged
 * entry survives a process crash. Entries keep the sequence number and
 * hashes assigned by the recorder; replay must not renumber them.
 *
 * Thread Safety: All methods are thread-safe.
 */
class audit_buffer {
public:
    explicit audit_buffer(std::filesystem::path path);

    audit_buffer(const audit_buffer&) = delete;
    audit_buffer& operator=(const audit_buffer&) = delete;

    [[nodiscard]] auto append(const audit_record& record) -> VoidResult;

    /**
     * @brief Read every buffered entry in file order
     *
     * A missing file is an empty buffer. Malformed lines are skipped and
     * logged; a truncated final line is expected after a crash.
     */
    [[nodiscard]] auto load() const -> Result<std::vector<audit_record>>;

    /**
     * @brief Atomically replace the buffer with the given entries
     *
     * An empty list removes the file.
     */
    [[nodiscard]] auto rewrite(const std::vector<audit_record>& records) -> VoidResult;

    /// Number of entries currently buffered
    [[nodiscard]] auto size() const -> std::size_t;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

private:
    [[nodiscard]] auto load_unlocked() const -> Result<std::vector<audit_record>>;

    std::filesystem::path path_;
    mutable std::mutex mutex_;
};

} // namespace tenantguard::audit
