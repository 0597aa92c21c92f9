#pragma once

#include <cstdint>
#include <string>

namespace dcp::copy {

/**
 * @brief Counters a copy task reports to its framework
 */
enum class Counter {
    Copy,          ///< Files copied
    Skip,          ///< Files abandoned after a read failure
    Fail,          ///< Files that failed
    BytesCopied,
    BytesExpected,
    BytesFailed,
    BytesSkipped,
    SleepTimeMs    ///< Time spent sleeping in the bandwidth throttle
};

const char* counter_name(Counter counter) noexcept;

/**
 * @brief The slice of the task framework the copy engine talks to
 *
 * attempt_id() must be unique per concurrently running task; it namespaces
 * the temp file. If set_status() or increment_counter() throws, the copy
 * engine logs the exception and carries on.
 */
class TaskContext {
public:
    virtual ~TaskContext() = default;

    virtual const std::string& attempt_id() const = 0;
    virtual void set_status(const std::string& status) = 0;
    virtual void increment_counter(Counter counter, std::uint64_t value) = 0;
};

/// Forwards to increment_counter(), logging instead of propagating exceptions
void increment_counter_safely(TaskContext& context, Counter counter, std::uint64_t value) noexcept;

} // namespace dcp::copy
