#pragma once

#include <chrono>
#include <cstdint>

namespace logship::transport {

/*
  Attempt budget and exponential backoff for one payload.

  Attempt n (1-based, n > 1) is preceded by a sleep of
  initial_backoff * multiplier^(n-2).
*/
struct RetryPolicy {
  std::uint32_t             max_attempts{3};
  std::chrono::milliseconds initial_backoff{1000};
  double                    multiplier{2.0};

  std::chrono::milliseconds NextBackoff(std::chrono::milliseconds current) const {
    return std::chrono::milliseconds(static_cast<std::int64_t>(static_cast<double>(current.count()) * multiplier));
  }
};

} // namespace logship::transport
