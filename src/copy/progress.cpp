#include "dcp/copy/progress.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <iomanip>
#include <sstream>

namespace dcp::copy {

std::string format_bytes(std::uint64_t bytes) {
    static constexpr std::array<char, 6> kUnits{'K', 'M', 'G', 'T', 'P', 'E'};
    if (bytes < 1024) {
        return std::to_string(bytes);
    }
    double value = static_cast<double>(bytes) / 1024.0;
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < kUnits.size()) {
        value /= 1024.0;
        ++unit;
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << value << kUnits[unit];
    return oss.str();
}

std::string format_percentage(std::uint64_t done, std::uint64_t total) {
    const double percent = total == 0 ? 100.0
                                      : static_cast<double>(done) * 100.0 / static_cast<double>(total);
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << percent;
    return oss.str();
}

ProgressReporter::ProgressReporter(TaskContext& context, std::string description, std::uint64_t total_bytes)
    : context_(context), description_(std::move(description)), total_bytes_(total_bytes) {}

std::string ProgressReporter::format(std::uint64_t bytes_done) const {
    std::ostringstream oss;
    oss << format_percentage(bytes_done, total_bytes_) << "% " << description_
        << " [" << format_bytes(bytes_done) << '/' << format_bytes(total_bytes_) << ']';
    return oss.str();
}

void ProgressReporter::report(std::uint64_t bytes_done) noexcept {
    try {
        context_.set_status(format(bytes_done));
    } catch (const std::exception& e) {
        // Warn once per copy, progress keeps being attempted
        if (!sink_failed_) {
            spdlog::warn("Progress update failed for {}: {}", description_, e.what());
            sink_failed_ = true;
        }
    }
}

} // namespace dcp::copy
