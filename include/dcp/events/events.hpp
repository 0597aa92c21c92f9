/**
 * @file events.hpp
 * @brief Events published by copy tasks
 *
 * NAMING CONVENTION:
 * Events are past-tense or state snapshots, one struct per message.
 */

#pragma once

#include "dcp/copy/task_context.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace dcp::events {

/**
 * @brief Latest human-readable status of a copy task
 *
 * WHO EMITS:
 * - EventTaskContext, whenever the engine reports progress
 *
 * WHO SUBSCRIBES:
 * - LoggerComponent (debug log)
 * - Heartbeat/status displays of the surrounding job
 */
struct CopyStatusEvent {
    std::string attempt_id;
    std::string status;
    std::chrono::system_clock::time_point timestamp;

    CopyStatusEvent(std::string id, std::string text)
        : attempt_id(std::move(id)),
          status(std::move(text)),
          timestamp(std::chrono::system_clock::now()) {}
};

/**
 * @brief A task counter was incremented
 *
 * WHO EMITS:
 * - EventTaskContext, for the engine's sleep time and the retry driver's
 *   copy/skip/fail bookkeeping
 *
 * WHO SUBSCRIBES:
 * - MetricsComponent (aggregation)
 * - LoggerComponent (debug log)
 */
struct CounterIncrementedEvent {
    std::string attempt_id;
    copy::Counter counter;
    std::uint64_t value;
};

} // namespace dcp::events
