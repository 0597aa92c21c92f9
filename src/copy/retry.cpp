#include "dcp/copy/retry.hpp"

#include <algorithm>
#include <cmath>

namespace dcp::copy {

std::chrono::milliseconds RetryPolicy::delay_for(std::uint32_t failed_attempts) const {
    if (failed_attempts == 0 || initial_delay.count() <= 0) {
        return std::chrono::milliseconds{0};
    }
    const double factor = std::pow(std::max(backoff_multiplier, 1.0),
                                   static_cast<double>(failed_attempts - 1));
    const double scaled = static_cast<double>(initial_delay.count()) * factor;
    const double capped = std::min(scaled, static_cast<double>(max_delay.count()));
    return std::chrono::milliseconds{static_cast<std::int64_t>(capped)};
}

} // namespace dcp::copy
