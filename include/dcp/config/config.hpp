#pragma once

#include "dcp/copy/retry.hpp"
#include "dcp/copy/types.hpp"
#include "dcp/core/result.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace dcp::config {

/**
 * @brief Everything a copy task needs besides its backends and context
 *
 * JSON LAYOUT (all keys optional):
 * {
 *   "bandwidth": "10MB",          // bytes/sec, number or size string, <= 0 unlimited
 *   "work_path": "/data/.staging",
 *   "buffer_size": "8K",
 *   "checksum": "verify",         // or "skip"
 *   "preserve": "rb",             // r = replication, b = block size
 *   "skip_read_failures": false,
 *   "log_level": "info",
 *   "retry": {
 *     "max_attempts": 3,
 *     "initial_delay_ms": 100,
 *     "backoff_multiplier": 2.0,
 *     "max_delay_ms": 10000
 *   }
 * }
 */
struct Config {
    copy::CopyOptions copy;
    copy::RetryPolicy retry;
    copy::CopyAttributes preserve;
    bool skip_read_failures = false;
    spdlog::level::level_enum log_level = spdlog::level::info;
};

/// Parses "1024", "512K", "10MB", "2 GiB" (binary units) into bytes
std::optional<std::uint64_t> parse_size(const std::string& text);

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& text);

dcp::Result<Config> parse_config(const nlohmann::json& document);

dcp::Result<Config> load_config(const std::filesystem::path& path);

} // namespace dcp::config
