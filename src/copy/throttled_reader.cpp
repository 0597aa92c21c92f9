#include "dcp/copy/throttled_reader.hpp"

#include <sstream>
#include <thread>

namespace dcp::copy {

using Clock = std::chrono::steady_clock;

ThrottledReader::ThrottledReader(std::unique_ptr<storage::InputStream> raw, std::int64_t max_bytes_per_sec)
    : raw_(std::move(raw)), max_bytes_per_sec_(max_bytes_per_sec), start_(Clock::now()) {}

dcp::Result<std::size_t> ThrottledReader::read(std::uint8_t* buffer, std::size_t size) {
    auto result = raw_->read(buffer, size);
    if (result.is_error()) {
        return result;
    }
    if (result.value() > 0) {
        bytes_read_ += result.value();
        throttle();
    }
    return result;
}

void ThrottledReader::throttle() {
    if (max_bytes_per_sec_ <= 0) {
        return;
    }
    const std::chrono::duration<double> earliest(static_cast<double>(bytes_read_) /
                                                 static_cast<double>(max_bytes_per_sec_));
    const auto elapsed = Clock::now() - start_;
    if (earliest <= elapsed) {
        return;
    }
    const auto wait = std::chrono::duration_cast<Clock::duration>(earliest - elapsed);
    const auto before = Clock::now();
    std::this_thread::sleep_for(wait);
    total_sleep_ += Clock::now() - before;
}

std::chrono::milliseconds ThrottledReader::total_sleep_time() const noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(total_sleep_);
}

double ThrottledReader::bytes_per_second() const {
    const std::chrono::duration<double> elapsed = Clock::now() - start_;
    if (elapsed.count() <= 0.0) {
        return static_cast<double>(bytes_read_);
    }
    return static_cast<double>(bytes_read_) / elapsed.count();
}

std::string ThrottledReader::to_string() const {
    std::ostringstream oss;
    oss << "ThrottledReader{bytesRead=" << bytes_read_
        << ", maxBytesPerSec=" << max_bytes_per_sec_
        << ", bytesPerSec=" << static_cast<std::uint64_t>(bytes_per_second())
        << ", totalSleepTime=" << total_sleep_time().count() << "ms}";
    return oss.str();
}

} // namespace dcp::copy
