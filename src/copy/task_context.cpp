#include "dcp/copy/task_context.hpp"

#include <spdlog/spdlog.h>

#include <exception>

namespace dcp::copy {

const char* counter_name(Counter counter) noexcept {
    switch (counter) {
        case Counter::Copy: return "COPY";
        case Counter::Skip: return "SKIP";
        case Counter::Fail: return "FAIL";
        case Counter::BytesCopied: return "BYTESCOPIED";
        case Counter::BytesExpected: return "BYTESEXPECTED";
        case Counter::BytesFailed: return "BYTESFAILED";
        case Counter::BytesSkipped: return "BYTESSKIPPED";
        case Counter::SleepTimeMs: return "SLEEP_TIME_MS";
    }
    return "UNKNOWN";
}

void increment_counter_safely(TaskContext& context, Counter counter, std::uint64_t value) noexcept {
    try {
        context.increment_counter(counter, value);
    } catch (const std::exception& e) {
        spdlog::warn("Could not increment counter {} by {}: {}", counter_name(counter), value, e.what());
    }
}

} // namespace dcp::copy
