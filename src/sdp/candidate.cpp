#include "sdp/candidate.hpp"
#include "common/utils_string.hpp"

#include <plog/Log.h>

#include <sstream>
#include <stdexcept>
#include <unordered_map>

namespace jinglesdp {
namespace sdp {

Candidate::Type Candidate::ToType(std::string_view type_string) {
    using candidate_type_map_t = std::unordered_map<std::string, Type>;
    static const candidate_type_map_t candidate_type_map = {
        {"host", Type::HOST},
        {"srflx", Type::SERVER_REFLEXIVE},
        {"prflx", Type::PEER_REFLEXIVE},
        {"relay", Type::RELAYED}
    };
    auto it = candidate_type_map.find(std::string(type_string));
    if (it == candidate_type_map.end()) {
        throw std::invalid_argument("Unknown candidate type: " + std::string(type_string));
    }
    return it->second;
}

bool Candidate::is_tcp() const {
    return utils::string::to_upper(protocol) == "TCP";
}

std::string Candidate::sdp_line() const {
    std::ostringstream line;
    line << "a=" << std::string(*this);
    return line.str();
}

// eg: a=candidate:1 1 UDP 9654321 212.223.223.223 12345 typ srflx raddr 10.216.33.9 rport 54321 generation 0
Candidate::operator std::string() const {
    const char sp{' '};
    std::ostringstream oss;
    oss << "candidate:";
    oss << foundation << sp << component_id << sp << utils::string::to_upper(protocol) << sp << priority << sp;
    oss << ip << sp << port;
    oss << sp << "typ" << sp << type;

    // Base address of a reflexive or relayed candidate
    if (type != Type::HOST && related_address && related_port) {
        oss << sp << "raddr" << sp << related_address.value() << sp << "rport" << sp << related_port.value();
    }

    // TCP ICE Candidate: https://tools.ietf.org/id/draft-ietf-mmusic-ice-tcp-16.html#rfc.section.3
    if (tcp_type) {
        if (is_tcp()) {
            oss << sp << "tcptype" << sp << tcp_type.value();
        } else {
            PLOG_WARNING << "Ignoring tcptype " << tcp_type.value() << " of " << protocol << " candidate " << foundation;
        }
    }

    // Not part of the grammar in rfc8839, but existing peers expect it here.
    oss << sp << "generation" << sp << generation.value_or(0);

    return oss.str();
}

std::ostream& operator<<(std::ostream& out, Candidate::Type type) {
    switch (type) {
    case Candidate::Type::HOST:
        return out << "host";
    case Candidate::Type::SERVER_REFLEXIVE:
        return out << "srflx";
    case Candidate::Type::PEER_REFLEXIVE:
        return out << "prflx";
    case Candidate::Type::RELAYED:
        return out << "relay";
    default:
        return out << "unknown";
    }
}

std::ostream& operator<<(std::ostream& out, const Candidate& candidate) {
    return out << std::string(candidate);
}

} // namespace sdp
} // namespace jinglesdp
