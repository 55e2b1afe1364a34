#include "sdp/sdp_session.hpp"
#include "common/utils_string.hpp"
#include "common/utils_time.hpp"

#include <plog/Log.h>

#include <sstream>
#include <stdexcept>

namespace jinglesdp {
namespace sdp {

bool Session::HasContent(std::string_view name) const {
    return content(name) != nullptr;
}

const Content* Session::content(std::string_view name) const {
    for (const auto& entry : contents) {
        if (entry.name == name) {
            return &entry;
        }
    }
    return nullptr;
}

bool Session::HasSources() const {
    for (const auto& entry : contents) {
        if (entry.application.has_sources()) {
            return true;
        }
    }
    return false;
}

Session::operator std::string() const {
    return GenerateSDP(kSdpEol);
}

std::string Session::GenerateSDP(const std::string eol, const SerializeOptions& options) const {
    for (const auto& group : groups) {
        for (const auto& name : group.contents) {
            if (!HasContent(name)) {
                throw std::invalid_argument("Group " + group.semantics + " refers to unknown content " + name);
            }
        }
    }

    // warning: Be careful, there is no space after '=' and only has one space between two parts in a line.
    std::ostringstream oss;
    const std::string sp = " ";

    const auto now = std::to_string(utils::time::TimeUTCInMillis());
    const auto session_id = options.session_id.value_or(this->session_id.value_or(now));
    const auto session_version = options.time.value_or(now);

    PLOG_VERBOSE << "Generating SDP for session " << session_id << " (role=" << options.role
                 << ", direction=" << options.direction << ", contents=" << contents.size() << ")";

    // The version of SDP, always 0, See rfc4566
    oss << "v=0" << eol;
    // o=<username> <sess-id> <sess-version> <nettype> <addrtype> <unicast-address>
    // See https://datatracker.ietf.org/doc/html/rfc4566#section-5.2
    oss << "o=-" << sp << session_id << sp << session_version << sp << "IN IP4 0.0.0.0" << eol;
    // Session name, '-' if no name
    oss << "s=-" << eol;
    // Start and stop time, 0 means unbounded
    oss << "t=0 0" << eol;

    // WMS: WebRTC Media Stream, the sources of the media lines tell which
    // stream their tracks belong to.
    // See http://tools.ietf.org/html/draft-ietf-mmusic-msid
    if (HasSources()) {
        oss << "a=msid-semantic: WMS *" << eol;
    }

    // eg: a=group:BUNDLE audio video data
    for (const auto& group : groups) {
        oss << "a=group:" << group.semantics << sp << utils::string::join(group.contents, sp) << eol;
    }

    // Media entries lines
    for (const auto& entry : contents) {
        oss << entry.GenerateSDP(eol, options);
    }

    return oss.str();
}

} // namespace sdp
} // namespace jinglesdp
