#ifndef __PD_CLOCK__
#define __PD_CLOCK__

#include "Headers.hpp"

namespace pd {
/**
 * @brief Source of wall-clock time in epoch milliseconds.
 *
 * Everything that ages sessions reads time through this interface so that
 * retention policies can be tested without sleeping.
 */
class Clock {
 public:
  virtual ~Clock() {}
  virtual int64_t nowMillis() = 0;
};

class SystemClock : public Clock {
 public:
  virtual int64_t nowMillis() { return EpochMillis(); }
};
}  // namespace pd

#endif  // __PD_CLOCK__
