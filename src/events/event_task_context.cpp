#include "dcp/events/event_task_context.hpp"
#include "dcp/events/events.hpp"

namespace dcp::events {

EventTaskContext::EventTaskContext(EventBus& bus, std::string attempt_id)
    : bus_(bus), attempt_id_(std::move(attempt_id)) {}

void EventTaskContext::set_status(const std::string& status) {
    last_status_ = status;
    bus_.emit(CopyStatusEvent{attempt_id_, status});
}

void EventTaskContext::increment_counter(copy::Counter counter, std::uint64_t value) {
    bus_.emit(CounterIncrementedEvent{attempt_id_, counter, value});
}

} // namespace dcp::events
