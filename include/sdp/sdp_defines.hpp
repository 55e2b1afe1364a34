#ifndef _SDP_DEFINES_H_
#define _SDP_DEFINES_H_

#include "base/defines.hpp"

#include <iostream>
#include <string>

namespace jinglesdp {
namespace sdp {

// Type of a session description handed to the negotiation engine.
enum class Type {
    UNSPEC,
    OFFER,
    ANSWER,
    PRANSWER, // provisional answer
    ROLLBACK
};

// DTLS setup role carried by a fingerprint, See rfc4145 rfc4572
enum class SetupRole {
    ACT_PASS,
    ACTIVE,
    PASSIVE
};

// Local role in the Jingle session.
enum class SessionRole {
    INITIATOR,
    RESPONDER
};

// Whether the description is sent to or was received from the peer.
enum class NegotiationDirection {
    INCOMING,
    OUTGOING
};

// Sender modes. The first four are the Jingle 'senders' values, relative to
// the session roles; the last four are the SDP direction attributes.
enum class Senders {
    INITIATOR,
    RESPONDER,
    BOTH,
    NONE,
    RECV_ONLY,
    SEND_ONLY,
    SEND_RECV,
    INACTIVE
};

enum class ApplicationType {
    RTP,
    DATA_CHANNEL
};

// Overload operator <<
JINGLESDP_CPP_EXPORT std::ostream& operator<<(std::ostream& out, Type type);
JINGLESDP_CPP_EXPORT std::ostream& operator<<(std::ostream& out, SetupRole role);
JINGLESDP_CPP_EXPORT std::ostream& operator<<(std::ostream& out, SessionRole role);
JINGLESDP_CPP_EXPORT std::ostream& operator<<(std::ostream& out, NegotiationDirection direction);
JINGLESDP_CPP_EXPORT std::ostream& operator<<(std::ostream& out, Senders senders);
JINGLESDP_CPP_EXPORT std::ostream& operator<<(std::ostream& out, ApplicationType type);

} // namespace sdp
} // namespace jinglesdp

#endif
