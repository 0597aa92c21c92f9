#include "dcp/config/config.hpp"
#include "dcp/copy/copier.hpp"
#include "dcp/events/components.hpp"
#include "dcp/events/event_bus.hpp"
#include "dcp/events/event_task_context.hpp"
#include "dcp/storage/local_backend.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <filesystem>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

std::string make_attempt_id() {
    const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    return "attempt_" + std::to_string(::getpid()) + "_" + std::to_string(now);
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    if (argc < 3) {
        spdlog::error("Usage: {} <source> <target> [config.json]", argv[0]);
        return 2;
    }

    const fs::path source_path = fs::absolute(argv[1]);
    const fs::path target_path = fs::absolute(argv[2]);

    dcp::config::Config config;
    if (argc > 3) {
        auto loaded = dcp::config::load_config(argv[3]);
        if (loaded.is_error()) {
            spdlog::error("{}", loaded.error());
            return 2;
        }
        config = loaded.value();
    }
    spdlog::set_level(config.log_level);

    dcp::storage::LocalStorage storage;
    auto source = storage.status(source_path);
    if (source.is_error()) {
        spdlog::error("Cannot stat source: {}", source.error());
        return 1;
    }
    if (source.value().is_directory) {
        spdlog::error("Source {} is a directory; only single files are copied", source_path.string());
        return 2;
    }

    dcp::events::EventBus bus;
    dcp::events::LoggerComponent logger(bus);
    dcp::events::MetricsComponent metrics(bus);
    dcp::events::EventTaskContext context(bus, make_attempt_id());

    dcp::copy::StagingCopyEngine engine(storage, storage);
    auto outcome = dcp::copy::copy_with_retries(engine, source.value(), target_path, config.preserve,
                                                config.copy, context, config.retry,
                                                config.skip_read_failures);
    metrics.print_stats();

    if (outcome.is_error()) {
        spdlog::error("Copy failed: {}", outcome.error().describe());
        return 1;
    }
    if (outcome.value().action == dcp::copy::CopyAction::Skipped) {
        spdlog::warn("Skipped {} after {} attempt(s)", source_path.string(), outcome.value().attempts);
        return 0;
    }
    spdlog::info("Copied {} bytes to {} in {} attempt(s)", outcome.value().bytes, target_path.string(),
                 outcome.value().attempts);
    return 0;
}
