#ifndef _SDP_CANDIDATE_H_
#define _SDP_CANDIDATE_H_

#include "base/defines.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <optional>
#include <iostream>

namespace jinglesdp {
namespace sdp {

// ICE candidate as carried by a Jingle transport.
// Addresses and ports are not validated, they are rendered verbatim.
struct JINGLESDP_CPP_EXPORT Candidate {
public:
    enum class Type {
        HOST,
        SERVER_REFLEXIVE,
        PEER_REFLEXIVE,
        RELAYED
    };

    static Type ToType(std::string_view type_string);

public:
    std::string foundation;
    // 1: RTP, 2: RTCP
    uint32_t component_id = 1;
    // udp or tcp, case-insensitive
    std::string protocol = "udp";
    uint32_t priority = 0;
    std::string ip;
    std::string port;
    Type type = Type::HOST;
    // Only rendered for non-host candidates carrying both.
    std::optional<std::string> related_address = std::nullopt;
    std::optional<std::string> related_port = std::nullopt;
    // active, passive or so, only rendered for TCP candidates.
    std::optional<std::string> tcp_type = std::nullopt;
    std::optional<uint32_t> generation = std::nullopt;

    bool is_tcp() const;

    // a=candidate:...
    std::string sdp_line() const;
    // candidate:...
    operator std::string() const;
};

JINGLESDP_CPP_EXPORT std::ostream& operator<<(std::ostream& out, Candidate::Type type);
JINGLESDP_CPP_EXPORT std::ostream& operator<<(std::ostream& out, const Candidate& candidate);

} // namespace sdp
} // namespace jinglesdp

#endif
