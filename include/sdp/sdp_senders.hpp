#ifndef _SDP_SENDERS_H_
#define _SDP_SENDERS_H_

#include "base/defines.hpp"
#include "sdp/sdp_defines.hpp"

namespace jinglesdp {
namespace sdp {

// Maps a declared sender mode to its counterpart for the given local role and
// negotiation direction:
// - Jingle modes (initiator, responder, both, none) map to the SDP direction
//   attribute (recvonly, sendonly, sendrecv, inactive).
// - SDP direction attributes map back to the Jingle mode.
// Throws std::logic_error if the key is missing from the table.
JINGLESDP_CPP_EXPORT Senders ResolveSenders(SessionRole role,
                                            NegotiationDirection direction,
                                            Senders declared);

} // namespace sdp
} // namespace jinglesdp

#endif
