#ifndef _SDP_UTILS_H_
#define _SDP_UTILS_H_

#include "base/defines.hpp"
#include "sdp/sdp_defines.hpp"

#include <string>
#include <string_view>
#include <sstream>

namespace jinglesdp {
namespace sdp {

// Renders any value with an operator<< overload, eg: sdp::ToString(Senders::SEND_ONLY) == "sendonly"
template <typename T>
std::string ToString(const T& value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

// Unknown strings map to Type::UNSPEC.
JINGLESDP_CPP_EXPORT sdp::Type StringToType(std::string_view type_string);
JINGLESDP_CPP_EXPORT std::string TypeToString(sdp::Type type);

// The parsers below throw std::invalid_argument on unknown strings.
JINGLESDP_CPP_EXPORT sdp::SetupRole StringToSetupRole(std::string_view role_string);
JINGLESDP_CPP_EXPORT sdp::SessionRole StringToSessionRole(std::string_view role_string);
JINGLESDP_CPP_EXPORT sdp::NegotiationDirection StringToNegotiationDirection(std::string_view direction_string);
JINGLESDP_CPP_EXPORT sdp::Senders StringToSenders(std::string_view senders_string);
JINGLESDP_CPP_EXPORT sdp::ApplicationType StringToApplicationType(std::string_view type_string);

// format: 8F:B5:D9:8F:53:7D:A9:B0:CE:01:3E:CB:30:BE:40:AC:33:42:25:FC:C4:FC:55:74:B9:8D:48:B0:02:5A:A8:EB
JINGLESDP_CPP_EXPORT bool IsSHA256Fingerprint(std::string_view fingerprint);

} // namespace sdp
} // namespace jinglesdp

#endif
