#pragma once

#include <chrono>

namespace batch_cache {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = Clock::duration;

template <typename V> struct Entry {
  V value;
  TimePoint inserted_at{};
};

} // namespace batch_cache
