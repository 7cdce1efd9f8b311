#ifndef UTIL_CLOCK_HPP
#define UTIL_CLOCK_HPP

#include <cstdint>

namespace util {

// Source of wall-clock timestamps, in milliseconds since the epoch.
class Clock {
 public:
  virtual ~Clock() = default;
  virtual int64_t NowMillis() = 0;

  // The process-wide real clock.
  static Clock* System();
};

}  // namespace util

#endif
