#ifndef _SDP_OPTIONS_H_
#define _SDP_OPTIONS_H_

#include "base/defines.hpp"
#include "sdp/sdp_defines.hpp"

#include <string>
#include <optional>

namespace jinglesdp {
namespace sdp {

// Per-call serialization settings
struct JINGLESDP_CPP_EXPORT SerializeOptions {
    SessionRole role = SessionRole::INITIATOR;
    NegotiationDirection direction = NegotiationDirection::OUTGOING;
    // Overrides the session id of the origin line.
    std::optional<std::string> session_id = std::nullopt;
    // Overrides the session version of the origin line.
    std::optional<std::string> time = std::nullopt;
};

} // namespace sdp
} // namespace jinglesdp

#endif
