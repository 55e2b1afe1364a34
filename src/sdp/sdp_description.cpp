#include "sdp/sdp_description.hpp"
#include "sdp/sdp_utils.hpp"

namespace jinglesdp {
namespace sdp {

Description::Description(Type type, std::string sdp) 
    : type_(type),
      sdp_(std::move(sdp)) {}

Description::~Description() = default;

nlohmann::json Description::ToJson() const {
    return nlohmann::json{
        {"type", TypeToString(type_)},
        {"sdp", sdp_}
    };
}

} // namespace sdp
} // namespace jinglesdp
