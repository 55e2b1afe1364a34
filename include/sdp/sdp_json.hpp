#ifndef _SDP_JSON_H_
#define _SDP_JSON_H_

#include "base/defines.hpp"
#include "sdp/sdp_options.hpp"
#include "sdp/sdp_content.hpp"
#include "sdp/sdp_session.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace jinglesdp {
namespace sdp {

// Jingle-JSON to model. Numeric fields accept JSON numbers or strings.
// The overloads below are found by nlohmann::json through ADL,
// eg: json.get<sdp::Session>().
JINGLESDP_CPP_EXPORT void from_json(const nlohmann::json& j, Group& group);
JINGLESDP_CPP_EXPORT void from_json(const nlohmann::json& j, Session& session);
JINGLESDP_CPP_EXPORT void from_json(const nlohmann::json& j, Content& content);
JINGLESDP_CPP_EXPORT void from_json(const nlohmann::json& j, Application& application);
JINGLESDP_CPP_EXPORT void from_json(const nlohmann::json& j, Bandwidth& bandwidth);
JINGLESDP_CPP_EXPORT void from_json(const nlohmann::json& j, Payload& payload);
JINGLESDP_CPP_EXPORT void from_json(const nlohmann::json& j, Parameter& parameter);
JINGLESDP_CPP_EXPORT void from_json(const nlohmann::json& j, Feedback& feedback);
JINGLESDP_CPP_EXPORT void from_json(const nlohmann::json& j, HeaderExtension& extension);
JINGLESDP_CPP_EXPORT void from_json(const nlohmann::json& j, SourceGroup& group);
JINGLESDP_CPP_EXPORT void from_json(const nlohmann::json& j, Source& source);
JINGLESDP_CPP_EXPORT void from_json(const nlohmann::json& j, SourceParameter& parameter);
JINGLESDP_CPP_EXPORT void from_json(const nlohmann::json& j, Crypto& crypto);
JINGLESDP_CPP_EXPORT void from_json(const nlohmann::json& j, Transport& transport);
JINGLESDP_CPP_EXPORT void from_json(const nlohmann::json& j, Fingerprint& fingerprint);
JINGLESDP_CPP_EXPORT void from_json(const nlohmann::json& j, SctpMap& sctp_map);
JINGLESDP_CPP_EXPORT void from_json(const nlohmann::json& j, Candidate& candidate);
JINGLESDP_CPP_EXPORT void from_json(const nlohmann::json& j, SerializeOptions& options);

// Throw std::invalid_argument on malformed input.
JINGLESDP_CPP_EXPORT Session ParseSession(const nlohmann::json& j);
JINGLESDP_CPP_EXPORT Session ParseSession(const std::string& text);
JINGLESDP_CPP_EXPORT SerializeOptions ParseOptions(const nlohmann::json& j);

} // namespace sdp
} // namespace jinglesdp

#endif
