#include "sdp/sdp_defines.hpp"

namespace jinglesdp {
namespace sdp {

std::ostream& operator<<(std::ostream& out, Type type) {
    switch (type) {
    case sdp::Type::UNSPEC:
        out << "unspec";
        break;
    case sdp::Type::OFFER:
        out << "offer";
        break;
    case sdp::Type::ANSWER:
        out << "answer";
        break;
    case sdp::Type::PRANSWER:
        out << "pranswer";
        break;
    case sdp::Type::ROLLBACK:
        out << "rollback";
        break;
    default:
        break;
    }
    return out;
}

std::ostream& operator<<(std::ostream& out, SetupRole role) {
    switch (role) {
    case sdp::SetupRole::ACT_PASS:
        out << "actpass";
        break;
    case sdp::SetupRole::ACTIVE:
        out << "active";
        break;
    case sdp::SetupRole::PASSIVE:
        out << "passive";
        break;
    default:
        break;
    }
    return out;
}

std::ostream& operator<<(std::ostream& out, SessionRole role) {
    switch (role) {
    case sdp::SessionRole::INITIATOR:
        out << "initiator";
        break;
    case sdp::SessionRole::RESPONDER:
        out << "responder";
        break;
    default:
        break;
    }
    return out;
}

std::ostream& operator<<(std::ostream& out, NegotiationDirection direction) {
    switch (direction) {
    case sdp::NegotiationDirection::INCOMING:
        out << "incoming";
        break;
    case sdp::NegotiationDirection::OUTGOING:
        out << "outgoing";
        break;
    default:
        break;
    }
    return out;
}

std::ostream& operator<<(std::ostream& out, Senders senders) {
    switch (senders) {
    case sdp::Senders::INITIATOR:
        out << "initiator";
        break;
    case sdp::Senders::RESPONDER:
        out << "responder";
        break;
    case sdp::Senders::BOTH:
        out << "both";
        break;
    case sdp::Senders::NONE:
        out << "none";
        break;
    case sdp::Senders::RECV_ONLY:
        out << "recvonly";
        break;
    case sdp::Senders::SEND_ONLY:
        out << "sendonly";
        break;
    case sdp::Senders::SEND_RECV:
        out << "sendrecv";
        break;
    case sdp::Senders::INACTIVE:
        out << "inactive";
        break;
    default:
        break;
    }
    return out;
}

std::ostream& operator<<(std::ostream& out, ApplicationType type) {
    switch (type) {
    case sdp::ApplicationType::RTP:
        out << "rtp";
        break;
    case sdp::ApplicationType::DATA_CHANNEL:
        out << "datachannel";
        break;
    default:
        break;
    }
    return out;
}

} // namespace sdp
} // namespace jinglesdp
