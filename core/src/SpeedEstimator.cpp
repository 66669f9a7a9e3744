#include "ferry/SpeedEstimator.hpp"
#include <algorithm>
#include <cmath>

namespace ferry {
namespace speed {

std::uint64_t bytesPerSecond(std::uint64_t lastBytes,
                             std::uint64_t currentBytes,
                             std::chrono::milliseconds elapsed) {
    if (elapsed < kMinSampleInterval)
        return 0;
    if (currentBytes <= lastBytes)
        return 0;
    const double seconds = double(elapsed.count()) / 1000.0;
    const double bps = double(currentBytes - lastBytes) / seconds;
    return (std::uint64_t)std::llround(bps);
}

std::uint64_t remainingSeconds(std::uint64_t transferred,
                               std::uint64_t total,
                               std::uint64_t bytesPerSec) {
    if (bytesPerSec == 0 || transferred >= total)
        return 0;
    const double secs = double(total - transferred) / double(bytesPerSec);
    return (std::uint64_t)std::max<long long>(0, std::llround(secs));
}

int percent(std::uint64_t transferred, std::uint64_t total) {
    if (total == 0)
        return 0;
    const double pct = (double(transferred) / double(total)) * 100.0;
    return std::clamp(int(std::lround(pct)), 0, 100);
}

} // namespace speed
} // namespace ferry
