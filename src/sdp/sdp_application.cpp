#include "sdp/sdp_content.hpp"
#include "sdp/sdp_senders.hpp"
#include "common/utils_string.hpp"

#include <plog/Log.h>

#include <set>
#include <sstream>
#include <stdexcept>

namespace jinglesdp {
namespace sdp {

Application::Kind Application::ToKind(std::string_view kind_string) {
    if (kind_string == "audio" || kind_string == "AUDIO") {
        return Kind::AUDIO;
    } else if (kind_string == "video" || kind_string == "VIDEO") {
        return Kind::VIDEO;
    } else {
        throw std::invalid_argument("Unknown media kind: " + std::string(kind_string));
    }
}

std::optional<std::string> Application::stream_id() const {
    std::set<std::string> stream_ids;
    for (const auto& source : sources) {
        for (const auto& parameter : source.parameters) {
            if (parameter.key == "msid" && parameter.value) {
                stream_ids.insert(parameter.value.value());
            }
        }
    }
    if (stream_ids.size() == 1) {
        return *stream_ids.begin();
    }
    if (stream_ids.size() > 1) {
        PLOG_DEBUG << "Omitting a=msid, sources carry " << stream_ids.size() << " different msid values";
    }
    return std::nullopt;
}

std::string Application::GenerateSDPLines(const std::string eol, const SerializeOptions& options) const {
    std::ostringstream oss;
    const std::string sp = " ";

    if (is_rtp()) {
        if (rtcp_mux_enabled) {
            oss << "a=rtcp-mux" << eol;
        }
        if (rtcp_rsize_enabled) {
            oss << "a=rtcp-rsize" << eol;
        }
    }

    // a=crypto:<tag> <crypto-suite> <key-params> [<session-params>]
    for (const auto& crypto : cryptos) {
        oss << "a=crypto:" << crypto.tag << sp << crypto.cipher_suite << sp << crypto.key_params;
        if (crypto.session_params) {
            oss << sp << crypto.session_params.value();
        }
        oss << eol;
    }

    if (conference_flag) {
        oss << "a=x-google-flag:conference" << eol;
    }

    if (is_rtp()) {
        for (const auto& payload : payloads) {
            oss << GeneratePayloadSDPLines(payload, eol);
        }
    }

    // Feedback applying to every payload
    for (const auto& feedback : feedbacks) {
        oss << GenerateFeedbackSDPLine("*", feedback) << eol;
    }

    // a=extmap:<id>[/<direction>] <uri>
    for (const auto& extension : header_extensions) {
        oss << "a=extmap:" << extension.id;
        if (extension.senders) {
            oss << "/" << ResolveSenders(options.role, options.direction, extension.senders.value());
        }
        oss << sp << extension.uri << eol;
    }

    oss << GenerateSourceSDPLines(eol);

    return oss.str();
}

std::string Application::GeneratePayloadSDPLines(const Payload& payload, const std::string eol) const {
    std::ostringstream oss;
    const std::string sp = " ";

    // a=rtpmap:<payload type> <encoding name>/<clock rate>[/<encoding parameters>]
    oss << "a=rtpmap:" << payload.id << sp << payload.name << "/" << payload.clockrate;
    if (payload.channels && payload.channels.value() != "1") {
        oss << "/" << payload.channels.value();
    }
    oss << eol;

    // a=fmtp:<format> <format specific parameters>
    if (!payload.parameters.empty()) {
        std::vector<std::string> parameters;
        parameters.reserve(payload.parameters.size());
        for (const auto& parameter : payload.parameters) {
            parameters.emplace_back(parameter.key ? parameter.key.value() + "=" + parameter.value : parameter.value);
        }
        oss << "a=fmtp:" << payload.id << sp << utils::string::join(parameters, ";") << eol;
    }

    for (const auto& feedback : payload.feedbacks) {
        oss << GenerateFeedbackSDPLine(payload.id, feedback) << eol;
    }

    return oss.str();
}

std::string Application::GenerateSourceSDPLines(const std::string eol) const {
    std::ostringstream oss;
    const std::string sp = " ";

    // a=ssrc-group:<semantics> <ssrc-id> ...
    for (const auto& group : source_groups) {
        oss << "a=ssrc-group:" << group.semantics << sp << utils::string::join(group.sources, sp) << eol;
    }

    // a=ssrc:<ssrc-id> <attribute>[:<value>]
    // See https://datatracker.ietf.org/doc/html/rfc5576#section-4.1
    for (const auto& source : sources) {
        const std::string source_ssrc = source.ssrc.value_or(ssrc.value_or(""));
        if (source_ssrc.empty()) {
            PLOG_WARNING << "Source without ssrc and no application ssrc to fall back to";
        }
        for (const auto& parameter : source.parameters) {
            oss << "a=ssrc:" << source_ssrc << sp << parameter.key;
            if (parameter.value) {
                oss << ":" << parameter.value.value();
            }
            oss << eol;
        }
    }

    return oss.str();
}

// a=rtcp-fb:<payload type> <type> [<subtype>]
// a=rtcp-fb:<payload type> trr-int <interval>
std::string Application::GenerateFeedbackSDPLine(std::string_view payload_id, const Feedback& feedback) {
    std::ostringstream oss;
    const std::string sp = " ";
    oss << "a=rtcp-fb:" << payload_id << sp;
    if (feedback.type == "trr-int") {
        oss << "trr-int" << sp << (feedback.value && !feedback.value->empty() ? feedback.value.value() : "0");
    } else {
        oss << feedback.type;
        if (feedback.subtype) {
            oss << sp << feedback.subtype.value();
        }
    }
    return oss.str();
}

std::ostream& operator<<(std::ostream& out, Application::Kind kind) {
    switch (kind) {
    case Application::Kind::AUDIO:
        out << "audio";
        break;
    case Application::Kind::VIDEO:
        out << "video";
        break;
    default:
        break;
    }
    return out;
}

} // namespace sdp
} // namespace jinglesdp
