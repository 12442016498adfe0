#pragma once

#include <chrono>

namespace logship::transport {

// Blocks the delivery thread between retry attempts.
class Sleeper {
 public:
  virtual ~Sleeper() = default;

  virtual void Sleep(std::chrono::milliseconds duration) = 0;
};

class ThreadSleeper final : public Sleeper {
 public:
  void Sleep(std::chrono::milliseconds duration) override;
};

} // namespace logship::transport
