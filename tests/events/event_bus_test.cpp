#include <gtest/gtest.h>
#include "dcp/events/event_bus.hpp"
#include "dcp/events/events.hpp"
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace dcp::events;
using dcp::copy::Counter;

TEST(EventBus, SubscribeAndEmit) {
    EventBus bus;

    bool handler_called = false;
    std::string received_status;

    bus.subscribe<CopyStatusEvent>([&](const CopyStatusEvent& e) {
        handler_called = true;
        received_status = e.status;
    });

    bus.emit(CopyStatusEvent{"attempt_1", "50.0% Copying /a to /b [1.0K/2.0K]"});

    EXPECT_TRUE(handler_called);
    EXPECT_EQ(received_status, "50.0% Copying /a to /b [1.0K/2.0K]");
}

TEST(EventBus, MultipleSubscribers) {
    EventBus bus;

    int count = 0;

    bus.subscribe<CopyStatusEvent>([&](const CopyStatusEvent&) { count++; });
    bus.subscribe<CopyStatusEvent>([&](const CopyStatusEvent&) { count++; });
    bus.subscribe<CopyStatusEvent>([&](const CopyStatusEvent&) { count++; });

    bus.emit(CopyStatusEvent{"attempt_1", "status"});

    EXPECT_EQ(count, 3);
}

TEST(EventBus, DifferentEventTypes) {
    EventBus bus;

    int status_count = 0;
    std::uint64_t counted = 0;

    bus.subscribe<CopyStatusEvent>([&](const CopyStatusEvent&) { status_count++; });
    bus.subscribe<CounterIncrementedEvent>([&](const CounterIncrementedEvent& e) { counted += e.value; });

    bus.emit(CopyStatusEvent{"attempt_1", "a"});
    bus.emit(CounterIncrementedEvent{"attempt_1", Counter::BytesCopied, 4096});
    bus.emit(CopyStatusEvent{"attempt_1", "b"});

    EXPECT_EQ(status_count, 2);
    EXPECT_EQ(counted, 4096u);
}

TEST(EventBus, Unsubscribe) {
    EventBus bus;

    int count = 0;
    auto id = bus.subscribe<CopyStatusEvent>([&](const CopyStatusEvent&) { count++; });

    bus.emit(CopyStatusEvent{"attempt_1", "a"});
    EXPECT_EQ(count, 1);

    bus.unsubscribe<CopyStatusEvent>(id);

    bus.emit(CopyStatusEvent{"attempt_1", "b"});
    EXPECT_EQ(count, 1);
}

TEST(EventBus, NoSubscribers) {
    EventBus bus;

    EXPECT_NO_THROW(bus.emit(CopyStatusEvent{"attempt_1", "nobody listens"}));
}

TEST(EventBus, ThrowingHandlerDoesNotReachEmitter) {
    EventBus bus;

    int later_handler_calls = 0;
    bus.subscribe<CopyStatusEvent>([](const CopyStatusEvent&) {
        throw std::runtime_error("display went away");
    });
    bus.subscribe<CopyStatusEvent>([&](const CopyStatusEvent&) { later_handler_calls++; });

    EXPECT_NO_THROW(bus.emit(CopyStatusEvent{"attempt_1", "a"}));
    EXPECT_EQ(later_handler_calls, 1);
}

TEST(EventBus, ThreadSafety) {
    EventBus bus;
    std::atomic<int> count{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 10; ++i) {
        threads.emplace_back([&bus, &count]() {
            bus.subscribe<CopyStatusEvent>([&count](const CopyStatusEvent&) {
                count++;
            });
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    bus.emit(CopyStatusEvent{"attempt_1", "a"});

    EXPECT_EQ(count, 10);
}

TEST(EventBus, ConcurrentEmit) {
    EventBus bus;
    std::atomic<std::uint64_t> total{0};

    bus.subscribe<CounterIncrementedEvent>([&total](const CounterIncrementedEvent& e) {
        total += e.value;
    });

    std::vector<std::thread> threads;
    for (int i = 0; i < 100; ++i) {
        threads.emplace_back([&bus, i]() {
            bus.emit(CounterIncrementedEvent{"attempt_" + std::to_string(i), Counter::Copy, 1});
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(total.load(), 100u);
}

TEST(EventBus, SubscriberCount) {
    EventBus bus;

    EXPECT_EQ(bus.subscriber_count<CopyStatusEvent>(), 0u);

    auto id1 = bus.subscribe<CopyStatusEvent>([](const CopyStatusEvent&) {});
    EXPECT_EQ(bus.subscriber_count<CopyStatusEvent>(), 1u);

    bus.subscribe<CopyStatusEvent>([](const CopyStatusEvent&) {});
    EXPECT_EQ(bus.subscriber_count<CopyStatusEvent>(), 2u);

    bus.unsubscribe<CopyStatusEvent>(id1);
    EXPECT_EQ(bus.subscriber_count<CopyStatusEvent>(), 1u);
}

TEST(EventBus, Clear) {
    EventBus bus;

    bus.subscribe<CopyStatusEvent>([](const CopyStatusEvent&) {});
    bus.subscribe<CounterIncrementedEvent>([](const CounterIncrementedEvent&) {});

    EXPECT_EQ(bus.subscriber_count<CopyStatusEvent>(), 1u);
    EXPECT_EQ(bus.subscriber_count<CounterIncrementedEvent>(), 1u);

    bus.clear();

    EXPECT_EQ(bus.subscriber_count<CopyStatusEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<CounterIncrementedEvent>(), 0u);
}
