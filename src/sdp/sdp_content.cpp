#include "sdp/sdp_content.hpp"
#include "sdp/sdp_senders.hpp"

#include <plog/Log.h>

#include <sstream>
#include <stdexcept>

namespace jinglesdp {
namespace sdp {
namespace {

// WebRTC uses ICE, the port and address below are placeholders.
constexpr const char* kDiscardPort = "1";
constexpr const char* kDiscardAddress = "IN IP4 0.0.0.0";

} // namespace

Content::operator std::string() const {
    return GenerateSDP(kSdpEol);
}

std::string Content::GenerateSDP(const std::string eol, const SerializeOptions& options) const {
    if (!transport) {
        throw std::invalid_argument("Content " + name + " has no transport");
    }
    if (application.is_rtp() && !application.kind) {
        throw std::invalid_argument("RTP content " + name + " has no media kind");
    }

    PLOG_VERBOSE << "Generating media block for content " << name << " (" << application.type << ")";

    std::ostringstream oss;
    const std::string sp = " ";

    // m=<media> <port> <proto> <fmt> ...
    // See https://datatracker.ietf.org/doc/html/rfc4566#section-5.14
    oss << FormatMediaLine() << eol;
    // c=<nettype> <addrtype> <connection-address>
    oss << "c=" << kDiscardAddress << eol;

    // b=<bwtype>:<bandwidth>
    const auto& bandwidth = application.bandwidth;
    if (bandwidth && !bandwidth->type.empty() && !bandwidth->value.empty()) {
        oss << "b=" << bandwidth->type << ":" << bandwidth->value << eol;
    }

    if (application.is_rtp()) {
        // a=rtcp:<port> <nettype> <addrtype> <connection-address>
        // See https://datatracker.ietf.org/doc/html/rfc3605
        oss << "a=rtcp:" << kDiscardPort << sp << kDiscardAddress << eol;
    }

    // ICE, DTLS and SCTP lines
    oss << transport->GenerateSDPLines(eol);

    if (application.is_rtp()) {
        oss << "a=" << ResolveSenders(options.role, options.direction, senders.value_or(Senders::BOTH)) << eol;
    }

    oss << "a=mid:" << name << eol;

    // See https://datatracker.ietf.org/doc/html/draft-ietf-mmusic-msid
    if (auto stream_id = application.stream_id()) {
        oss << "a=msid:" << stream_id.value() << eol;
    }

    oss << application.GenerateSDPLines(eol, options);

    for (const auto& candidate : transport->candidates) {
        PLOG_VERBOSE << "Adding candidate " << candidate.foundation << " to content " << name;
        oss << candidate.sdp_line() << eol;
    }

    return oss.str();
}

std::string Content::FormatMediaLine() const {
    std::ostringstream oss;
    const std::string sp = " ";
    if (application.is_rtp()) {
        oss << "m=" << application.kind.value() << sp << kDiscardPort << sp << FormatProtocol();
        if (application.payloads.empty()) {
            PLOG_WARNING << "RTP content " << name << " has no payloads";
        }
        for (const auto& payload : application.payloads) {
            oss << sp << payload.id;
        }
    } else {
        oss << "m=application" << sp << kDiscardPort << sp << FormatProtocol();
        for (const auto& sctp_map : transport->sctp_maps) {
            oss << sp << sctp_map.number;
        }
    }
    return oss.str();
}

std::string Content::FormatProtocol() const {
    if (!application.is_rtp()) {
        return "DTLS/SCTP";
    } else if (transport && !transport->fingerprints.empty()) {
        return "UDP/TLS/RTP/SAVPF";
    } else if (!application.cryptos.empty()) {
        return "RTP/SAVPF";
    } else {
        return "RTP/AVPF";
    }
}

} // namespace sdp
} // namespace jinglesdp
