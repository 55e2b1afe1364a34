#ifndef _COMMON_LOGGER_H_
#define _COMMON_LOGGER_H_

#include "base/defines.hpp"

#include <plog/Log.h>

#include <functional>
#include <string>

namespace jinglesdp {
namespace logging {

enum class Level { // Don't change, it MUST match plog severity
    NONE = 0,
    FATAL = 1,
    ERROR = 2,
    WARNING = 3,
    INFO = 4,
    DEBUG = 5,
    VERBOSE = 6
};

// Returns true if the message was consumed, false to fall back to stdout.
using LoggingCallback = std::function<bool(Level level, std::string message)>;

JINGLESDP_CPP_EXPORT void InitLogger(Level level, LoggingCallback callback = nullptr);

} // namespace logging
} // namespace jinglesdp

#endif
