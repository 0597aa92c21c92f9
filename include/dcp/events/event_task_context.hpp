#pragma once

#include "dcp/copy/task_context.hpp"
#include "dcp/events/event_bus.hpp"

#include <cstdint>
#include <string>

namespace dcp::events {

/**
 * @brief TaskContext that publishes status and counters on an EventBus
 */
class EventTaskContext : public copy::TaskContext {
public:
    EventTaskContext(EventBus& bus, std::string attempt_id);

    const std::string& attempt_id() const override { return attempt_id_; }
    void set_status(const std::string& status) override;
    void increment_counter(copy::Counter counter, std::uint64_t value) override;

    /// Last status passed to set_status()
    const std::string& last_status() const noexcept { return last_status_; }

private:
    EventBus& bus_;
    std::string attempt_id_;
    std::string last_status_;
};

} // namespace dcp::events
