#include "sdp/sdp_json.hpp"
#include "sdp/sdp_utils.hpp"
#include "common/utils_string.hpp"

#include <plog/Log.h>

#include <cstdint>
#include <optional>
#include <stdexcept>

using json = nlohmann::json;

namespace jinglesdp {
namespace sdp {
namespace {

bool HasValue(const json& j, const char* key) {
    return j.is_object() && j.contains(key) && !j.at(key).is_null();
}

// Renders a string or a number the way it reads in the JSON text.
std::string ToText(const json& value, const char* key) {
    if (value.is_string()) {
        return value.get<std::string>();
    } else if (value.is_number_unsigned()) {
        return std::to_string(value.get<uint64_t>());
    } else if (value.is_number_integer()) {
        return std::to_string(value.get<int64_t>());
    } else if (value.is_number_float()) {
        return value.dump();
    }
    throw std::invalid_argument(std::string("Expected a string or a number for '") + key + "', got " + value.type_name());
}

std::optional<std::string> GetOptionalString(const json& j, const char* key) {
    if (!HasValue(j, key)) {
        return std::nullopt;
    }
    return ToText(j.at(key), key);
}

std::string GetString(const json& j, const char* key) {
    if (!HasValue(j, key)) {
        throw std::invalid_argument(std::string("Missing required field '") + key + "'");
    }
    return ToText(j.at(key), key);
}

template <typename T>
std::optional<T> GetOptionalInteger(const json& j, const char* key) {
    if (auto text = GetOptionalString(j, key)) {
        return utils::string::to_integer<T>(text.value());
    }
    return std::nullopt;
}

bool GetFlag(const json& j, const char* key) {
    if (!HasValue(j, key)) {
        return false;
    }
    const auto& value = j.at(key);
    if (value.is_boolean()) {
        return value.get<bool>();
    } else if (value.is_number()) {
        return value.get<double>() != 0;
    }
    throw std::invalid_argument(std::string("Expected a boolean for '") + key + "', got " + value.type_name());
}

template <typename T>
std::vector<T> GetArray(const json& j, const char* key) {
    if (!HasValue(j, key)) {
        return {};
    }
    return j.at(key).get<std::vector<T>>();
}

std::vector<std::string> GetStringArray(const json& j, const char* key) {
    std::vector<std::string> items;
    if (HasValue(j, key)) {
        if (!j.at(key).is_array()) {
            throw std::invalid_argument(std::string("Expected an array for '") + key + "'");
        }
        for (const auto& item : j.at(key)) {
            items.emplace_back(ToText(item, key));
        }
    }
    return items;
}

} // namespace

void from_json(const json& j, Group& group) {
    group.semantics = GetString(j, "semantics");
    group.contents = GetStringArray(j, "contents");
}

void from_json(const json& j, Session& session) {
    session.session_id = GetOptionalString(j, "sid");
    session.groups = GetArray<Group>(j, "groups");
    session.contents = GetArray<Content>(j, "contents");
}

void from_json(const json& j, Content& content) {
    content.name = GetString(j, "name");
    if (auto senders = GetOptionalString(j, "senders")) {
        content.senders = StringToSenders(senders.value());
    }
    if (HasValue(j, "application")) {
        content.application = j.at("application").get<Application>();
    }
    if (HasValue(j, "transport")) {
        content.transport = j.at("transport").get<Transport>();
    }
}

void from_json(const json& j, Application& application) {
    application.type = StringToApplicationType(GetOptionalString(j, "applicationType").value_or("rtp"));
    if (auto media = GetOptionalString(j, "media")) {
        application.kind = Application::ToKind(media.value());
    }
    application.rtcp_mux_enabled = GetFlag(j, "mux");
    application.rtcp_rsize_enabled = GetFlag(j, "rsize");
    if (HasValue(j, "bandwidth")) {
        application.bandwidth = j.at("bandwidth").get<Bandwidth>();
    }
    application.payloads = GetArray<Payload>(j, "payloads");
    application.feedbacks = GetArray<Feedback>(j, "feedback");
    application.header_extensions = GetArray<HeaderExtension>(j, "headerExtensions");
    application.source_groups = GetArray<SourceGroup>(j, "sourceGroups");
    application.sources = GetArray<Source>(j, "sources");
    application.ssrc = GetOptionalString(j, "ssrc");
    application.cryptos = GetArray<Crypto>(j, "encryption");
    application.conference_flag = GetFlag(j, "googConferenceFlag");
}

void from_json(const json& j, Bandwidth& bandwidth) {
    bandwidth.type = GetOptionalString(j, "type").value_or("");
    bandwidth.value = GetOptionalString(j, "bandwidth").value_or("");
}

void from_json(const json& j, Payload& payload) {
    payload.id = GetString(j, "id");
    payload.name = GetOptionalString(j, "name").value_or("");
    payload.clockrate = GetOptionalString(j, "clockrate").value_or("");
    payload.channels = GetOptionalString(j, "channels");
    payload.parameters = GetArray<Parameter>(j, "parameters");
    payload.feedbacks = GetArray<Feedback>(j, "feedback");
}

void from_json(const json& j, Parameter& parameter) {
    parameter.key = GetOptionalString(j, "key");
    // An empty key renders as a bare value.
    if (parameter.key && parameter.key->empty()) {
        parameter.key.reset();
    }
    parameter.value = GetOptionalString(j, "value").value_or("");
}

void from_json(const json& j, Feedback& feedback) {
    feedback.type = GetString(j, "type");
    feedback.subtype = GetOptionalString(j, "subtype");
    feedback.value = GetOptionalString(j, "value");
}

void from_json(const json& j, HeaderExtension& extension) {
    extension.id = utils::string::to_integer<int>(GetString(j, "id"));
    extension.uri = GetString(j, "uri");
    if (auto senders = GetOptionalString(j, "senders")) {
        extension.senders = StringToSenders(senders.value());
    }
}

void from_json(const json& j, SourceGroup& group) {
    group.semantics = GetString(j, "semantics");
    group.sources = GetStringArray(j, "sources");
}

void from_json(const json& j, Source& source) {
    source.ssrc = GetOptionalString(j, "ssrc");
    source.parameters = GetArray<SourceParameter>(j, "parameters");
}

void from_json(const json& j, SourceParameter& parameter) {
    parameter.key = GetString(j, "key");
    parameter.value = GetOptionalString(j, "value");
    if (parameter.value && parameter.value->empty()) {
        parameter.value.reset();
    }
}

void from_json(const json& j, Crypto& crypto) {
    crypto.tag = GetString(j, "tag");
    crypto.cipher_suite = GetString(j, "cipherSuite");
    crypto.key_params = GetString(j, "keyParams");
    crypto.session_params = GetOptionalString(j, "sessionParams");
}

void from_json(const json& j, Transport& transport) {
    transport.ice_ufrag = GetOptionalString(j, "ufrag");
    if (transport.ice_ufrag && transport.ice_ufrag->empty()) {
        transport.ice_ufrag.reset();
    }
    transport.ice_pwd = GetOptionalString(j, "pwd");
    if (transport.ice_pwd && transport.ice_pwd->empty()) {
        transport.ice_pwd.reset();
    }
    transport.fingerprints = GetArray<Fingerprint>(j, "fingerprints");
    transport.candidates = GetArray<Candidate>(j, "candidates");
    transport.sctp_maps = GetArray<SctpMap>(j, "sctp");
}

void from_json(const json& j, Fingerprint& fingerprint) {
    fingerprint.hash = GetString(j, "hash");
    fingerprint.value = GetString(j, "value");
    if (auto setup = GetOptionalString(j, "setup")) {
        fingerprint.setup = StringToSetupRole(setup.value());
    }
}

void from_json(const json& j, SctpMap& sctp_map) {
    sctp_map.number = GetString(j, "number");
    sctp_map.protocol = GetOptionalString(j, "protocol").value_or("");
    sctp_map.streams = GetOptionalString(j, "streams").value_or("");
}

void from_json(const json& j, Candidate& candidate) {
    candidate.foundation = GetString(j, "foundation");
    candidate.component_id = GetOptionalInteger<uint32_t>(j, "component").value_or(1);
    candidate.protocol = GetString(j, "protocol");
    candidate.priority = GetOptionalInteger<uint32_t>(j, "priority").value_or(0);
    candidate.ip = GetString(j, "ip");
    candidate.port = GetString(j, "port");
    candidate.type = Candidate::ToType(GetString(j, "type"));
    candidate.related_address = GetOptionalString(j, "relAddr");
    candidate.related_port = GetOptionalString(j, "relPort");
    candidate.tcp_type = GetOptionalString(j, "tcpType");
    candidate.generation = GetOptionalInteger<uint32_t>(j, "generation");
}

void from_json(const json& j, SerializeOptions& options) {
    if (auto role = GetOptionalString(j, "role")) {
        options.role = StringToSessionRole(role.value());
    }
    if (auto direction = GetOptionalString(j, "direction")) {
        options.direction = StringToNegotiationDirection(direction.value());
    }
    options.session_id = GetOptionalString(j, "sid");
    options.time = GetOptionalString(j, "time");
}

Session ParseSession(const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument(std::string("Expected a session object, got ") + j.type_name());
    }
    Session session;
    try {
        session = j.get<Session>();
    } catch (const json::exception& e) {
        throw std::invalid_argument(std::string("Malformed session: ") + e.what());
    }
    PLOG_VERBOSE << "Parsed session with " << session.contents.size() << " contents and "
                 << session.groups.size() << " groups";
    return session;
}

Session ParseSession(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw std::invalid_argument(std::string("Invalid JSON: ") + e.what());
    }
    return ParseSession(j);
}

SerializeOptions ParseOptions(const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument(std::string("Expected an options object, got ") + j.type_name());
    }
    try {
        return j.get<SerializeOptions>();
    } catch (const json::exception& e) {
        throw std::invalid_argument(std::string("Malformed options: ") + e.what());
    }
}

} // namespace sdp
} // namespace jinglesdp
