#ifndef _SDP_DESCRIPTION_H_
#define _SDP_DESCRIPTION_H_

#include "base/defines.hpp"
#include "sdp/sdp_defines.hpp"
#include "sdp/sdp_options.hpp"
#include "sdp/sdp_session.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <optional>

namespace jinglesdp {
namespace sdp {

// A generated SDP blob tagged with its type, ready to be handed to the
// negotiation engine as {type, sdp}.
class JINGLESDP_CPP_EXPORT Description {
public:
// Builder
class JINGLESDP_CPP_EXPORT Builder {
public:
    Builder(Type type);
    ~Builder();

    Builder& set_role(SessionRole role);
    Builder& set_direction(NegotiationDirection direction);
    Builder& set_session_id(std::optional<std::string> session_id);
    Builder& set_time(std::optional<std::string> time);
    Builder& set_options(SerializeOptions options);

    const SerializeOptions& options() const { return options_; }

    // Throws std::invalid_argument if the session can not be rendered.
    Description Build(const Session& session) const;

private:
    Type type_ = Type::UNSPEC;
    SerializeOptions options_;
};

// Description
public:
    ~Description();

    Type type() const { return type_; }
    const std::string& sdp() const { return sdp_; }

    nlohmann::json ToJson() const;
    operator std::string() const { return sdp_; }

private:
    Description(Type type, std::string sdp);

private:
    Type type_;
    std::string sdp_;
};

} // namespace sdp
} // namespace jinglesdp

#endif
