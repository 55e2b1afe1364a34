#ifndef _SDP_CONTENT_H_
#define _SDP_CONTENT_H_

#include "base/defines.hpp"
#include "sdp/sdp_defines.hpp"
#include "sdp/sdp_options.hpp"
#include "sdp/candidate.hpp"

#include <string>
#include <string_view>
#include <optional>
#include <vector>
#include <iostream>

namespace jinglesdp {
namespace sdp {

// Codec specific parameter, rendered as 'key=value' or 'value' in a=fmtp
struct JINGLESDP_CPP_EXPORT Parameter {
    std::optional<std::string> key = std::nullopt;
    std::string value;
};

// RTCP feedback, See https://datatracker.ietf.org/doc/html/rfc4585#section-4.2
struct JINGLESDP_CPP_EXPORT Feedback {
    std::string type;
    std::optional<std::string> subtype = std::nullopt;
    // Only used by 'trr-int'
    std::optional<std::string> value = std::nullopt;
};

struct JINGLESDP_CPP_EXPORT Payload {
    std::string id;
    std::string name;
    std::string clockrate;
    // Absent or "1" means a single channel.
    std::optional<std::string> channels = std::nullopt;
    std::vector<Parameter> parameters;
    std::vector<Feedback> feedbacks;
};

// RTP header extension, See https://datatracker.ietf.org/doc/html/rfc8285#section-8
struct JINGLESDP_CPP_EXPORT HeaderExtension {
    int id = 0;
    std::string uri;
    std::optional<Senders> senders = std::nullopt;
};

// a=ssrc:<ssrc> <key>[:<value>]
struct JINGLESDP_CPP_EXPORT SourceParameter {
    std::string key;
    std::optional<std::string> value = std::nullopt;
};

struct JINGLESDP_CPP_EXPORT Source {
    // Falls back to Application::ssrc if absent.
    std::optional<std::string> ssrc = std::nullopt;
    std::vector<SourceParameter> parameters;
};

struct JINGLESDP_CPP_EXPORT SourceGroup {
    // eg: FID, FEC, SIM
    std::string semantics;
    std::vector<std::string> sources;
};

// SDES crypto, See https://datatracker.ietf.org/doc/html/rfc4568#section-9.1
struct JINGLESDP_CPP_EXPORT Crypto {
    std::string tag;
    std::string cipher_suite;
    std::string key_params;
    std::optional<std::string> session_params = std::nullopt;
};

struct JINGLESDP_CPP_EXPORT Bandwidth {
    // eg: AS, TIAS
    std::string type;
    std::string value;
};

// Jingle 'description' element
struct JINGLESDP_CPP_EXPORT Application {
public:
    enum class Kind {
        AUDIO,
        VIDEO
    };

    static Kind ToKind(std::string_view kind_string);

public:
    ApplicationType type = ApplicationType::RTP;
    // Required by RTP application.
    std::optional<Kind> kind = std::nullopt;
    // rtcp-mux: Rtp and Rtcp share the same connection.
    bool rtcp_mux_enabled = false;
    // rtcp-rsize: RTCP Reduced-Size mode
    bool rtcp_rsize_enabled = false;
    std::optional<Bandwidth> bandwidth = std::nullopt;
    std::vector<Payload> payloads;
    // Feedback applying to every payload (a=rtcp-fb:*)
    std::vector<Feedback> feedbacks;
    std::vector<HeaderExtension> header_extensions;
    std::vector<SourceGroup> source_groups;
    std::vector<Source> sources;
    std::optional<std::string> ssrc = std::nullopt;
    std::vector<Crypto> cryptos;
    bool conference_flag = false;

    bool is_rtp() const { return type == ApplicationType::RTP; }
    bool has_sources() const { return !sources.empty(); }

    // The media stream id shared by all sources, or nullopt if there are
    // none or more than one distinct msid values.
    std::optional<std::string> stream_id() const;

    // Attribute lines following a=mid
    std::string GenerateSDPLines(const std::string eol, const SerializeOptions& options) const;

private:
    std::string GeneratePayloadSDPLines(const Payload& payload, const std::string eol) const;
    std::string GenerateSourceSDPLines(const std::string eol) const;
    static std::string GenerateFeedbackSDPLine(std::string_view payload_id, const Feedback& feedback);
};

struct JINGLESDP_CPP_EXPORT Fingerprint {
    // eg: sha-256
    std::string hash;
    std::string value;
    std::optional<SetupRole> setup = std::nullopt;
};

// a=sctpmap:<number> <protocol> <streams>
// See https://datatracker.ietf.org/doc/html/draft-ietf-mmusic-sctp-sdp-05#section-4.1
struct JINGLESDP_CPP_EXPORT SctpMap {
    std::string number;
    std::string protocol;
    std::string streams;
};

// Jingle ICE-UDP 'transport' element
struct JINGLESDP_CPP_EXPORT Transport {
    std::optional<std::string> ice_ufrag = std::nullopt;
    std::optional<std::string> ice_pwd = std::nullopt;
    std::vector<Fingerprint> fingerprints;
    std::vector<Candidate> candidates;
    std::vector<SctpMap> sctp_maps;

    // ICE, DTLS and SCTP lines
    std::string GenerateSDPLines(const std::string eol) const;
};

// One media line of the session
struct JINGLESDP_CPP_EXPORT Content {
public:
    // mid
    std::string name;
    // Treated as 'both' if absent.
    std::optional<Senders> senders = std::nullopt;
    Application application;
    std::optional<Transport> transport = std::nullopt;

    // Throws std::invalid_argument if the content misses a transport, or
    // is a RTP content without media kind.
    std::string GenerateSDP(const std::string eol, const SerializeOptions& options = SerializeOptions()) const;
    operator std::string() const;

private:
    // m=<media> <port> <proto> <fmt> ...
    std::string FormatMediaLine() const;
    std::string FormatProtocol() const;
};

JINGLESDP_CPP_EXPORT std::ostream& operator<<(std::ostream& out, Application::Kind kind);

} // namespace sdp
} // namespace jinglesdp

#endif
