/**
 * @file audit_buffer.cpp
 * @brief Implementation of the durable audit buffer
 *
 * @copyright Copyright (c) 2025
 */

#include <tenantguard/audit/audit_buffer.hpp>

#include <tenantguard/audit/audit_codec.hpp>
#include <tenantguard/compat/format.hpp>
#include <tenantguard/integration/logger_adapter.hpp>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <string>

#include <fcntl.h>
#include <unistd.h>

namespace tenantguard::audit {

using integration::logger_adapter;

namespace {

auto errno_message() -> std::string {
    return std::strerror(errno);
}

/// Write the whole buffer and fsync before closing
auto write_synced(const std::filesystem::path& path, const std::string& data, int flags)
    -> VoidResult {
    int fd = ::open(path.c_str(), flags | O_WRONLY | O_CREAT | O_CLOEXEC, 0600);
    if (fd < 0) {
        return tenantguard_void_error(
            error_codes::audit_buffer_error,
            compat::format("Failed to open audit buffer: {}", errno_message()),
            path.string());
    }

    const char* cursor = data.data();
    std::size_t remaining = data.size();
    while (remaining > 0) {
        auto written = ::write(fd, cursor, remaining);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            auto message = errno_message();
            ::close(fd);
            return tenantguard_void_error(
                error_codes::audit_buffer_error,
                compat::format("Failed to write audit buffer: {}", message),
                path.string());
        }
        cursor += written;
        remaining -= static_cast<std::size_t>(written);
    }

    if (::fsync(fd) != 0) {
        auto message = errno_message();
        ::close(fd);
        return tenantguard_void_error(
            error_codes::audit_buffer_error,
            compat::format("Failed to sync audit buffer: {}", message),
            path.string());
    }

    if (::close(fd) != 0) {
        return tenantguard_void_error(
            error_codes::audit_buffer_error,
            compat::format("Failed to close audit buffer: {}", errno_message()),
            path.string());
    }
    return ok();
}

} // namespace

audit_buffer::audit_buffer(std::filesystem::path path) : path_(std::move(path)) {}

auto audit_buffer::append(const audit_record& record) -> VoidResult {
    std::lock_guard lock(mutex_);

    if (path_.empty()) {
        return tenantguard_void_error(error_codes::audit_buffer_error,
                                      "No audit buffer configured");
    }

    if (path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            return tenantguard_void_error(
                error_codes::audit_buffer_error,
                "Failed to create audit buffer directory: " + ec.message(),
                path_.string());
        }
    }

    return write_synced(path_, to_json_line(record) + "\n", O_APPEND);
}

auto audit_buffer::load() const -> Result<std::vector<audit_record>> {
    std::lock_guard lock(mutex_);
    return load_unlocked();
}

auto audit_buffer::load_unlocked() const -> Result<std::vector<audit_record>> {
    std::vector<audit_record> records;
    if (path_.empty() || !std::filesystem::exists(path_)) {
        return records;
    }

    std::ifstream in(path_);
    if (!in) {
        return tenantguard_error<std::vector<audit_record>>(
            error_codes::audit_buffer_error, "Failed to read audit buffer",
            path_.string());
    }

    std::string line;
    std::size_t line_number = 0;
    while (std::getline(in, line)) {
        ++line_number;
        if (line.empty()) {
            continue;
        }
        auto record = from_json_line(line);
        if (record.is_err()) {
            logger_adapter::warn("Skipping malformed audit buffer line {} in {}: {}",
                                 line_number, path_.string(), record.error().message);
            continue;
        }
        records.push_back(std::move(record.value()));
    }
    return records;
}

auto audit_buffer::rewrite(const std::vector<audit_record>& records) -> VoidResult {
    std::lock_guard lock(mutex_);

    if (path_.empty()) {
        return tenantguard_void_error(error_codes::audit_buffer_error,
                                      "No audit buffer configured");
    }

    std::error_code ec;
    if (records.empty()) {
        std::filesystem::remove(path_, ec);
        if (ec) {
            return tenantguard_void_error(
                error_codes::audit_buffer_error,
                "Failed to remove audit buffer: " + ec.message(), path_.string());
        }
        return ok();
    }

    std::string data;
    for (const auto& record : records) {
        data += to_json_line(record);
        data += '\n';
    }

    auto temp_path = path_;
    temp_path += ".tmp";
    auto written = write_synced(temp_path, data, O_TRUNC);
    if (written.is_err()) {
        std::filesystem::remove(temp_path, ec);
        return written;
    }

    std::filesystem::rename(temp_path, path_, ec);
    if (ec) {
        auto message = ec.message();
        std::filesystem::remove(temp_path, ec);
        return tenantguard_void_error(error_codes::audit_buffer_error,
                                      "Failed to replace audit buffer: " + message,
                                      path_.string());
    }
    return ok();
}

auto audit_buffer::size() const -> std::size_t {
    std::lock_guard lock(mutex_);
    auto records = load_unlocked();
    return records.is_ok() ? records.value().size() : 0;
}

} // namespace tenantguard::audit
