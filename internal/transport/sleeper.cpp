#include "sleeper.hpp"

#include <thread>

namespace logship::transport {

void ThreadSleeper::Sleep(std::chrono::milliseconds duration) {
  if (duration.count() > 0) {
    std::this_thread::sleep_for(duration);
  }
}

} // namespace logship::transport
