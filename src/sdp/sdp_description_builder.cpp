#include "sdp/sdp_description.hpp"

#include <plog/Log.h>

namespace jinglesdp {
namespace sdp {

Description::Builder::Builder(Type type) 
    : type_(type) {}

Description::Builder::~Builder() = default;

Description::Builder& Description::Builder::set_role(SessionRole role) {
    options_.role = role;
    return *this;
}

Description::Builder& Description::Builder::set_direction(NegotiationDirection direction) {
    options_.direction = direction;
    return *this;
}

Description::Builder& Description::Builder::set_session_id(std::optional<std::string> session_id) {
    options_.session_id = std::move(session_id);
    return *this;
}

Description::Builder& Description::Builder::set_time(std::optional<std::string> time) {
    options_.time = std::move(time);
    return *this;
}

Description::Builder& Description::Builder::set_options(SerializeOptions options) {
    options_ = std::move(options);
    return *this;
}

Description Description::Builder::Build(const Session& session) const {
    PLOG_DEBUG << "Building " << type_ << " description";
    return Description(type_, session.GenerateSDP(kSdpEol, options_));
}

} // namespace sdp
} // namespace jinglesdp
