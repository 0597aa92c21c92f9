#include "dcp/copy/copier.hpp"
#include "dcp/events/components.hpp"
#include "dcp/events/event_bus.hpp"
#include "dcp/events/event_task_context.hpp"
#include "dcp/events/events.hpp"
#include "dcp/storage/memory_backend.hpp"
#include "support/test_support.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using dcp::copy::Counter;
using dcp::events::CopyStatusEvent;
using dcp::events::CounterIncrementedEvent;
using dcp::events::EventBus;
using dcp::events::EventTaskContext;
using dcp::events::LoggerComponent;
using dcp::events::MetricsComponent;

TEST(MetricsComponentTest, AggregatesCountersAcrossTasks) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(CounterIncrementedEvent{"attempt_1", Counter::Copy, 1});
    bus.emit(CounterIncrementedEvent{"attempt_1", Counter::BytesCopied, 1024});
    bus.emit(CounterIncrementedEvent{"attempt_2", Counter::Copy, 1});
    bus.emit(CounterIncrementedEvent{"attempt_2", Counter::BytesCopied, 2048});
    bus.emit(CounterIncrementedEvent{"attempt_3", Counter::Skip, 1});
    bus.emit(CounterIncrementedEvent{"attempt_3", Counter::BytesSkipped, 10});
    bus.emit(CounterIncrementedEvent{"attempt_4", Counter::Fail, 1});
    bus.emit(CounterIncrementedEvent{"attempt_4", Counter::BytesFailed, 20});
    bus.emit(CounterIncrementedEvent{"attempt_4", Counter::SleepTimeMs, 300});
    bus.emit(CopyStatusEvent{"attempt_1", "100.0% done"});

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.files_copied.load(), 2u);
    EXPECT_EQ(stats.bytes_copied.load(), 3072u);
    EXPECT_EQ(stats.files_skipped.load(), 1u);
    EXPECT_EQ(stats.bytes_skipped.load(), 10u);
    EXPECT_EQ(stats.files_failed.load(), 1u);
    EXPECT_EQ(stats.bytes_failed.load(), 20u);
    EXPECT_EQ(stats.sleep_time_ms.load(), 300u);
    EXPECT_EQ(stats.status_updates.load(), 1u);
}

TEST(EventTaskContextTest, PublishesStatusAndCounters) {
    EventBus bus;
    EventTaskContext context(bus, "attempt_9");

    std::vector<std::string> statuses;
    std::vector<std::string> attempts;
    bus.subscribe<CopyStatusEvent>([&](const CopyStatusEvent& e) {
        statuses.push_back(e.status);
        attempts.push_back(e.attempt_id);
    });
    std::uint64_t bytes = 0;
    bus.subscribe<CounterIncrementedEvent>([&](const CounterIncrementedEvent& e) {
        if (e.counter == Counter::BytesCopied) {
            bytes += e.value;
        }
    });

    context.set_status("10.0% Copying");
    context.increment_counter(Counter::BytesCopied, 77);

    EXPECT_EQ(context.attempt_id(), "attempt_9");
    EXPECT_EQ(context.last_status(), "10.0% Copying");
    ASSERT_EQ(statuses.size(), 1u);
    EXPECT_EQ(statuses.front(), "10.0% Copying");
    EXPECT_EQ(attempts.front(), "attempt_9");
    EXPECT_EQ(bytes, 77u);
}

TEST(MetricsComponentTest, ObservesACopyEndToEnd) {
    dcp::storage::MemoryStorage source_store;
    dcp::storage::MemoryStorage target_store;
    ASSERT_TRUE(source_store.put("/src/f", dcp::test::make_content(9000)).is_ok());
    const auto source = source_store.status("/src/f").value();

    EventBus bus;
    LoggerComponent logger(bus);
    MetricsComponent metrics(bus);
    EventTaskContext context(bus, "attempt_e2e");

    dcp::copy::StagingCopyEngine engine(source_store, target_store);
    dcp::copy::CopyOptions options;
    options.max_bytes_per_sec = 0;
    options.buffer_size = 1000;

    auto result = dcp::copy::copy_with_retries(engine, source, "/dst/f", {}, options, context,
                                               dcp::copy::RetryPolicy{}, false);

    ASSERT_TRUE(result.is_ok()) << result.error().describe();
    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.files_copied.load(), 1u);
    EXPECT_EQ(stats.bytes_copied.load(), 9000u);
    EXPECT_EQ(stats.bytes_expected.load(), 9000u);
    EXPECT_EQ(stats.files_failed.load(), 0u);
    EXPECT_EQ(stats.status_updates.load(), 9u);
    EXPECT_EQ(context.last_status().rfind("100.0%", 0), 0u);
    EXPECT_NO_THROW(metrics.print_stats());
}
