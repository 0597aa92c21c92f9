#pragma once

#include "dcp/storage/backend.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace dcp::copy {

/**
 * @brief InputStream decorator that caps the average read rate
 *
 * After each read the reader compares the bytes delivered so far with the
 * wall-clock time since construction and sleeps exactly long enough to
 * bring the average back to the ceiling. Bursts are smoothed over the
 * whole stream rather than capped per call.
 */
class ThrottledReader : public storage::InputStream {
public:
    /// @param max_bytes_per_sec ceiling; 0 or negative disables throttling
    ThrottledReader(std::unique_ptr<storage::InputStream> raw, std::int64_t max_bytes_per_sec);

    dcp::Result<std::size_t> read(std::uint8_t* buffer, std::size_t size) override;

    [[nodiscard]] std::uint64_t total_bytes_read() const noexcept { return bytes_read_; }
    [[nodiscard]] std::chrono::milliseconds total_sleep_time() const noexcept;
    [[nodiscard]] std::int64_t max_bytes_per_sec() const noexcept { return max_bytes_per_sec_; }

    /// Average rate since construction
    [[nodiscard]] double bytes_per_second() const;

    std::string to_string() const;

private:
    void throttle();

    std::unique_ptr<storage::InputStream> raw_;
    std::int64_t max_bytes_per_sec_;
    std::chrono::steady_clock::time_point start_;
    std::uint64_t bytes_read_ = 0;
    std::chrono::steady_clock::duration total_sleep_{};
};

} // namespace dcp::copy
