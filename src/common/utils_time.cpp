#include "common/utils_time.hpp"

#include <sys/time.h>

namespace jinglesdp {
namespace utils {
namespace time {

int64_t TimeUTCInMicros() {
    struct timeval time;
    gettimeofday(&time, nullptr);
    // Convert from second (1.0) and microsecond (1e-6).
    return static_cast<int64_t>(time.tv_sec) * kNumMicrosecsPerSec + time.tv_usec;
}

int64_t TimeUTCInMillis() {
    return TimeUTCInMicros() / kNumMicrosecsPerMillisec;
}
    
} // namespace time
} // namespace utils
} // namespace jinglesdp
