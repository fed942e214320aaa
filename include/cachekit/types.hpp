#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace cachekit {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;

using Bytes = std::vector<std::uint8_t>;

} // namespace cachekit
