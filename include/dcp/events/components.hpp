/**
 * @file components.hpp
 * @brief Observers that react to copy task events
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * // run copies with an EventTaskContext on the same bus
 * metrics.print_stats();
 */

#pragma once

#include "dcp/events/event_bus.hpp"
#include "dcp/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace dcp::events {

/**
 * @brief Logs status updates and counter increments at debug level
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<CopyStatusEvent>([this](const CopyStatusEvent& e) {
            on_status(e);
        });

        bus_.subscribe<CounterIncrementedEvent>([this](const CounterIncrementedEvent& e) {
            on_counter(e);
        });
    }

private:
    void on_status(const CopyStatusEvent& e) {
        spdlog::debug("[Status] attempt={} {}", e.attempt_id, e.status);
    }

    void on_counter(const CounterIncrementedEvent& e) {
        spdlog::debug("[Counter] attempt={} {}+={}", e.attempt_id, copy::counter_name(e.counter), e.value);
    }

    EventBus& bus_;
};

/**
 * @brief Aggregates task counters across every copy on the bus
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<std::uint64_t> files_copied{0};
        std::atomic<std::uint64_t> files_skipped{0};
        std::atomic<std::uint64_t> files_failed{0};
        std::atomic<std::uint64_t> bytes_copied{0};
        std::atomic<std::uint64_t> bytes_expected{0};
        std::atomic<std::uint64_t> bytes_failed{0};
        std::atomic<std::uint64_t> bytes_skipped{0};
        std::atomic<std::uint64_t> sleep_time_ms{0};
        std::atomic<std::uint64_t> status_updates{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<CounterIncrementedEvent>([this](const CounterIncrementedEvent& e) {
            on_counter(e);
        });

        bus_.subscribe<CopyStatusEvent>([this](const CopyStatusEvent&) {
            stats_.status_updates++;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Copy Statistics:");
        spdlog::info("  Files copied:    {}", stats_.files_copied.load());
        spdlog::info("  Files skipped:   {}", stats_.files_skipped.load());
        spdlog::info("  Files failed:    {}", stats_.files_failed.load());
        spdlog::info("  Bytes copied:    {}", stats_.bytes_copied.load());
        spdlog::info("  Bytes expected:  {}", stats_.bytes_expected.load());
        spdlog::info("  Bytes failed:    {}", stats_.bytes_failed.load());
        spdlog::info("  Bytes skipped:   {}", stats_.bytes_skipped.load());
        spdlog::info("  Throttle sleep:  {}ms", stats_.sleep_time_ms.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    void on_counter(const CounterIncrementedEvent& e) {
        switch (e.counter) {
            case copy::Counter::Copy: stats_.files_copied += e.value; break;
            case copy::Counter::Skip: stats_.files_skipped += e.value; break;
            case copy::Counter::Fail: stats_.files_failed += e.value; break;
            case copy::Counter::BytesCopied: stats_.bytes_copied += e.value; break;
            case copy::Counter::BytesExpected: stats_.bytes_expected += e.value; break;
            case copy::Counter::BytesFailed: stats_.bytes_failed += e.value; break;
            case copy::Counter::BytesSkipped: stats_.bytes_skipped += e.value; break;
            case copy::Counter::SleepTimeMs: stats_.sleep_time_ms += e.value; break;
        }
    }

    EventBus& bus_;
    Stats stats_;
};

} // namespace dcp::events
