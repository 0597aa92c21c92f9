#pragma once

#include "dcp/copy/task_context.hpp"

#include <cstdint>
#include <string>

namespace dcp::copy {

/// Human readable byte count: "512", "1.5K", "3.0M", "2.0G"
std::string format_bytes(std::uint64_t bytes);

/// Percentage with one decimal; an empty total counts as complete
std::string format_percentage(std::uint64_t done, std::uint64_t total);

/**
 * @brief Forwards "<pct>% <description> [<done>/<total>]" to the task status
 */
class ProgressReporter {
public:
    ProgressReporter(TaskContext& context, std::string description, std::uint64_t total_bytes);

    std::string format(std::uint64_t bytes_done) const;

    /// Never throws; a failing status sink is logged and ignored
    void report(std::uint64_t bytes_done) noexcept;

private:
    TaskContext& context_;
    std::string description_;
    std::uint64_t total_bytes_;
    bool sink_failed_ = false;
};

} // namespace dcp::copy
