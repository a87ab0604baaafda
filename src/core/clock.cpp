#include "flakeid/core/clock.h"

namespace flakeid::core {

Timestamp SystemClock::now() {
  return Clock::now();
}

Timestamp FixedClock::now() {
  return fixed_time_;
}

Timestamp FunctionClock::now() {
  return source_();
}

}  // namespace flakeid::core
