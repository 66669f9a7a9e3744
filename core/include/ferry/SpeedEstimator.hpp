// Speed/ETA math for transfer progress. Pure functions, no state.
#pragma once
#include <chrono>
#include <cstdint>

namespace ferry {
namespace speed {

// Samples closer together than this report speed 0 (noise suppression).
constexpr std::chrono::milliseconds kMinSampleInterval{100};

// Bytes per second between two samples. Single-sample, no averaging.
// Returns 0 for samples under kMinSampleInterval apart or when the byte
// count went backwards.
std::uint64_t bytesPerSecond(std::uint64_t lastBytes,
                             std::uint64_t currentBytes,
                             std::chrono::milliseconds elapsed);

// Whole seconds left at the given speed; 0 when speed is 0.
std::uint64_t remainingSeconds(std::uint64_t transferred,
                               std::uint64_t total,
                               std::uint64_t bytesPerSec);

// Rounded percentage 0..100; 0 when total is unknown.
int percent(std::uint64_t transferred, std::uint64_t total);

} // namespace speed
} // namespace ferry
