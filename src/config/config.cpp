#include "dcp/config/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>
#include <unordered_map>

namespace dcp::config {
namespace {

std::string lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

// Accepts a JSON integer or a size string
dcp::Result<std::int64_t> read_size(const nlohmann::json& value, const std::string& key) {
    if (value.is_number_unsigned() &&
        value.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        return dcp::Err<std::int64_t>("Size out of range for '" + key + "'");
    }
    if (value.is_number_integer()) {
        return dcp::Ok(value.get<std::int64_t>());
    }
    if (value.is_string()) {
        const auto text = value.get<std::string>();
        if (auto parsed = parse_size(text)) {
            if (*parsed > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                return dcp::Err<std::int64_t>("Size out of range for '" + key + "': " + text);
            }
            return dcp::Ok(static_cast<std::int64_t>(*parsed));
        }
        return dcp::Err<std::int64_t>("Invalid size for '" + key + "': " + text);
    }
    return dcp::Err<std::int64_t>("Expected a number or size string for '" + key + "'");
}

} // namespace

std::optional<std::uint64_t> parse_size(const std::string& text) {
    std::size_t i = 0;
    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) {
        ++i;
    }
    const std::size_t digits_begin = i;
    std::uint64_t value = 0;
    while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
        const std::uint64_t digit = static_cast<std::uint64_t>(text[i] - '0');
        if (value > (UINT64_MAX - digit) / 10) {
            return std::nullopt;
        }
        value = value * 10 + digit;
        ++i;
    }
    if (i == digits_begin) {
        return std::nullopt;
    }
    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) {
        ++i;
    }
    std::string unit;
    while (i < text.size() && std::isalpha(static_cast<unsigned char>(text[i]))) {
        unit += static_cast<char>(std::tolower(static_cast<unsigned char>(text[i])));
        ++i;
    }
    if (i != text.size()) {
        return std::nullopt;
    }
    if (unit.empty()) {
        return value;
    }

    static const std::unordered_map<std::string, std::uint64_t> multipliers = {
        {"b", 1ULL},
        {"k", 1ULL << 10}, {"kb", 1ULL << 10}, {"kib", 1ULL << 10},
        {"m", 1ULL << 20}, {"mb", 1ULL << 20}, {"mib", 1ULL << 20},
        {"g", 1ULL << 30}, {"gb", 1ULL << 30}, {"gib", 1ULL << 30},
        {"t", 1ULL << 40}, {"tb", 1ULL << 40}, {"tib", 1ULL << 40},
    };
    const auto it = multipliers.find(unit);
    if (it == multipliers.end()) {
        return std::nullopt;
    }
    if (value > UINT64_MAX / it->second) {
        return std::nullopt;
    }
    return value * it->second;
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& text) {
    const auto name = lower(text);
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off") return spdlog::level::off;
    return std::nullopt;
}

dcp::Result<Config> parse_config(const nlohmann::json& document) {
    if (!document.is_object()) {
        return dcp::Err<Config>(std::string("Configuration must be a JSON object"));
    }

    Config config;
    try {
        if (document.contains("bandwidth")) {
            auto bandwidth = read_size(document.at("bandwidth"), "bandwidth");
            if (bandwidth.is_error()) {
                return dcp::Err<Config>(bandwidth.error());
            }
            config.copy.max_bytes_per_sec = bandwidth.value();
        }

        if (document.contains("work_path")) {
            config.copy.work_path = document.at("work_path").get<std::string>();
        }

        if (document.contains("buffer_size")) {
            auto buffer = read_size(document.at("buffer_size"), "buffer_size");
            if (buffer.is_error()) {
                return dcp::Err<Config>(buffer.error());
            }
            if (buffer.value() <= 0) {
                return dcp::Err<Config>(std::string("buffer_size must be positive"));
            }
            config.copy.buffer_size = static_cast<std::size_t>(buffer.value());
        }

        if (document.contains("checksum")) {
            const auto mode = lower(document.at("checksum").get<std::string>());
            if (mode == "verify") {
                config.copy.checksum_mode = copy::ChecksumMode::Verify;
            } else if (mode == "skip") {
                config.copy.checksum_mode = copy::ChecksumMode::Skip;
            } else {
                return dcp::Err<Config>("Unknown checksum mode: " + mode);
            }
        }

        if (document.contains("preserve")) {
            auto attributes = copy::CopyAttributes::parse(document.at("preserve").get<std::string>());
            if (attributes.is_error()) {
                return dcp::Err<Config>(attributes.error());
            }
            config.preserve = attributes.value();
        }

        if (document.contains("skip_read_failures")) {
            config.skip_read_failures = document.at("skip_read_failures").get<bool>();
        }

        if (document.contains("log_level")) {
            const auto name = document.at("log_level").get<std::string>();
            auto level = parse_log_level(name);
            if (!level) {
                return dcp::Err<Config>("Unknown log level: " + name);
            }
            config.log_level = *level;
        }

        if (document.contains("retry")) {
            const auto& retry = document.at("retry");
            if (!retry.is_object()) {
                return dcp::Err<Config>(std::string("'retry' must be an object"));
            }
            if (retry.contains("max_attempts")) {
                const auto attempts = retry.at("max_attempts").get<std::int64_t>();
                if (attempts < 1) {
                    return dcp::Err<Config>(std::string("retry.max_attempts must be at least 1"));
                }
                config.retry.max_attempts = static_cast<std::uint32_t>(attempts);
            }
            if (retry.contains("initial_delay_ms")) {
                config.retry.initial_delay = std::chrono::milliseconds{retry.at("initial_delay_ms").get<std::int64_t>()};
            }
            if (retry.contains("backoff_multiplier")) {
                config.retry.backoff_multiplier = retry.at("backoff_multiplier").get<double>();
            }
            if (retry.contains("max_delay_ms")) {
                config.retry.max_delay = std::chrono::milliseconds{retry.at("max_delay_ms").get<std::int64_t>()};
            }
            if (config.retry.initial_delay.count() < 0 || config.retry.max_delay.count() < 0 ||
                config.retry.backoff_multiplier < 1.0) {
                return dcp::Err<Config>(std::string("retry delays must be >= 0 and backoff_multiplier >= 1"));
            }
        }
    } catch (const nlohmann::json::exception& e) {
        return dcp::Err<Config>(std::string("Invalid configuration: ") + e.what());
    }

    return dcp::Ok(config);
}

dcp::Result<Config> load_config(const std::filesystem::path& path) {
    spdlog::info("Loading configuration from {}", path.string());
    std::ifstream input(path);
    if (!input) {
        return dcp::Err<Config>("Failed to open config file: " + path.string());
    }
    auto document = nlohmann::json::parse(input, nullptr, false);
    if (document.is_discarded()) {
        return dcp::Err<Config>("Malformed JSON in config file: " + path.string());
    }
    return parse_config(document);
}

} // namespace dcp::config
