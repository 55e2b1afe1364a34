#include "sdp/sdp_utils.hpp"

#include <cctype>
#include <stdexcept>
#include <unordered_map>

namespace jinglesdp {
namespace sdp {
namespace {

template <typename T>
T LookUp(const std::unordered_map<std::string, T>& map, std::string_view key, const char* what) {
    auto it = map.find(std::string(key));
    if (it == map.end()) {
        throw std::invalid_argument("Unknown " + std::string(what) + ": " + std::string(key));
    }
    return it->second;
}

} // namespace

sdp::Type StringToType(std::string_view type_string) {
    using type_map_t = std::unordered_map<std::string, sdp::Type>;
    static const type_map_t type_map = {
        {"unspec", sdp::Type::UNSPEC},
        {"offer", sdp::Type::OFFER},
        {"answer", sdp::Type::ANSWER},
        {"pranswer", sdp::Type::PRANSWER},
        {"rollback", sdp::Type::ROLLBACK}
    };
    auto it = type_map.find(std::string(type_string));
    return it != type_map.end() ? it->second : sdp::Type::UNSPEC;
}

std::string TypeToString(sdp::Type type) {
    switch (type) {
    case sdp::Type::UNSPEC:
        return "unspec";
    case sdp::Type::OFFER:
        return "offer";
    case sdp::Type::ANSWER:
        return "answer";
    case sdp::Type::PRANSWER:
        return "pranswer";
    case sdp::Type::ROLLBACK:
        return "rollback";
    default:
        return "unknown";
    }
}

sdp::SetupRole StringToSetupRole(std::string_view role_string) {
    static const std::unordered_map<std::string, sdp::SetupRole> role_map = {
        {"actpass", sdp::SetupRole::ACT_PASS},
        {"active", sdp::SetupRole::ACTIVE},
        {"passive", sdp::SetupRole::PASSIVE}
    };
    return LookUp(role_map, role_string, "setup role");
}

sdp::SessionRole StringToSessionRole(std::string_view role_string) {
    static const std::unordered_map<std::string, sdp::SessionRole> role_map = {
        {"initiator", sdp::SessionRole::INITIATOR},
        {"responder", sdp::SessionRole::RESPONDER}
    };
    return LookUp(role_map, role_string, "session role");
}

sdp::NegotiationDirection StringToNegotiationDirection(std::string_view direction_string) {
    static const std::unordered_map<std::string, sdp::NegotiationDirection> direction_map = {
        {"incoming", sdp::NegotiationDirection::INCOMING},
        {"outgoing", sdp::NegotiationDirection::OUTGOING}
    };
    return LookUp(direction_map, direction_string, "negotiation direction");
}

sdp::Senders StringToSenders(std::string_view senders_string) {
    static const std::unordered_map<std::string, sdp::Senders> senders_map = {
        {"initiator", sdp::Senders::INITIATOR},
        {"responder", sdp::Senders::RESPONDER},
        {"both", sdp::Senders::BOTH},
        {"none", sdp::Senders::NONE},
        {"recvonly", sdp::Senders::RECV_ONLY},
        {"sendonly", sdp::Senders::SEND_ONLY},
        {"sendrecv", sdp::Senders::SEND_RECV},
        {"inactive", sdp::Senders::INACTIVE}
    };
    return LookUp(senders_map, senders_string, "senders");
}

sdp::ApplicationType StringToApplicationType(std::string_view type_string) {
    static const std::unordered_map<std::string, sdp::ApplicationType> type_map = {
        {"rtp", sdp::ApplicationType::RTP},
        {"datachannel", sdp::ApplicationType::DATA_CHANNEL}
    };
    return LookUp(type_map, type_string, "application type");
}

// a=fingerprint:sha-256 A9:CA:95:47:CB:8D:81:DE:E4:78:38:1E:70:6B:AA:14:66:6C:AF:7F:89:D7:B7:C7:1A:A9:45:09:83:CC:0D:03
// A SHA-256 digest is 32 bytes, written as hex pairs separated by ':', so the length is 32 * 2 + (32 - 1).
constexpr size_t kSHA256FixedLength = 32 * 3 - 1;
bool IsSHA256Fingerprint(std::string_view fingerprint) {
    if (fingerprint.size() != kSHA256FixedLength) {
        return false;
    }

    for (size_t i = 0; i < fingerprint.size(); ++i) {
        if (i % 3 == 2) {
            if (fingerprint[i] != ':') {
                return false;
            }
        } else {
            if (!std::isxdigit(static_cast<unsigned char>(fingerprint[i]))) {
                return false;
            }
        }
    }
    return true;
}

} // namespace sdp
} // namespace jinglesdp
