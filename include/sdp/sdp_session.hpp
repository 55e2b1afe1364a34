#ifndef _SDP_SESSION_H_
#define _SDP_SESSION_H_

#include "base/defines.hpp"
#include "sdp/sdp_defines.hpp"
#include "sdp/sdp_options.hpp"
#include "sdp/sdp_content.hpp"

#include <string>
#include <string_view>
#include <optional>
#include <vector>

namespace jinglesdp {
namespace sdp {

// a=group:<semantics> <mid> ...
// See https://tools.ietf.org/html/rfc8843
struct JINGLESDP_CPP_EXPORT Group {
    // eg: BUNDLE
    std::string semantics;
    std::vector<std::string> contents;
};

// This struct is not thread-safe, the caller MUST not modify it while
// generating SDP.
struct JINGLESDP_CPP_EXPORT Session {
public:
    std::optional<std::string> session_id = std::nullopt;
    std::vector<Group> groups;
    std::vector<Content> contents;

    bool HasContent(std::string_view name) const;
    const Content* content(std::string_view name) const;
    // True if any content declares at least one source.
    bool HasSources() const;

    // Throws std::invalid_argument if a group refers to an unknown content,
    // or a content can not be rendered.
    std::string GenerateSDP(const std::string eol, const SerializeOptions& options = SerializeOptions()) const;
    operator std::string() const;
};

} // namespace sdp
} // namespace jinglesdp

#endif
