#ifndef _COMMON_UTILS_TIME_H_
#define _COMMON_UTILS_TIME_H_

#include "base/defines.hpp"

#include <stdint.h>

namespace jinglesdp {

static constexpr int64_t kNumMillisecsPerSec = INT64_C(1000);
static constexpr int64_t kNumMicrosecsPerSec = INT64_C(1000000);
static constexpr int64_t kNumMicrosecsPerMillisec = kNumMicrosecsPerSec / kNumMillisecsPerSec;

namespace utils {
namespace time {

// Returns the number of microseconds since January 1, 1970, UTC.
// It obeys the system's idea about what the time is, so it is not
// guaranteed to be monotonic.
int64_t TimeUTCInMicros();

// Returns the number of milliseconds since January 1, 1970, UTC.
int64_t TimeUTCInMillis();
    
} // namespace time
} // namespace utils
} // namespace jinglesdp

#endif
