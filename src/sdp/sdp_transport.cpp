#include "sdp/sdp_content.hpp"
#include "sdp/sdp_utils.hpp"
#include "common/utils_string.hpp"

#include <plog/Log.h>

#include <sstream>

namespace jinglesdp {
namespace sdp {

std::string Transport::GenerateSDPLines(const std::string eol) const {
    std::ostringstream oss;
    const std::string sp = " ";

    // ICE attributes
    // See https://tools.ietf.org/id/draft-ietf-mmusic-ice-sip-sdp-14.html#rfc.section.5.4
    if (ice_ufrag) {
        oss << "a=ice-ufrag:" << ice_ufrag.value() << eol;
    }
    if (ice_pwd) {
        oss << "a=ice-pwd:" << ice_pwd.value() << eol;
    }

    // DTLS attributes, See rfc4145 rfc4572
    // A media line has a single DTLS association, so only the first setup role is used.
    bool setup_added = false;
    for (const auto& fingerprint : fingerprints) {
        if (utils::string::to_lower(fingerprint.hash) == "sha-256" && !IsSHA256Fingerprint(fingerprint.value)) {
            PLOG_WARNING << "Malformed sha-256 fingerprint: " << fingerprint.value;
        }
        oss << "a=fingerprint:" << fingerprint.hash << sp << fingerprint.value << eol;
        if (fingerprint.setup && !setup_added) {
            oss << "a=setup:" << fingerprint.setup.value() << eol;
            setup_added = true;
        }
    }

    for (const auto& sctp_map : sctp_maps) {
        oss << "a=sctpmap:" << sctp_map.number << sp << sctp_map.protocol << sp << sctp_map.streams << eol;
    }

    return oss.str();
}
    
} // namespace sdp
} // namespace jinglesdp
