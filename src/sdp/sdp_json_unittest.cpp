#include "sdp/sdp_json.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/defines.hpp"

using namespace testing;
using json = nlohmann::json;

namespace jinglesdp {
namespace test {

namespace {

const char* kSessionJson = R"({
    "sid": "7503237125123789",
    "groups": [
        { "semantics": "BUNDLE", "contents": ["audio", "data"] }
    ],
    "contents": [
        {
            "name": "audio",
            "senders": "both",
            "application": {
                "applicationType": "rtp",
                "media": "audio",
                "mux": true,
                "rsize": 1,
                "bandwidth": { "type": "AS", "bandwidth": 64 },
                "payloads": [
                    {
                        "id": 111,
                        "name": "opus",
                        "clockrate": 48000,
                        "channels": 2,
                        "parameters": [
                            { "key": "minptime", "value": 10 },
                            { "key": "", "value": "0-15" }
                        ],
                        "feedback": [
                            { "type": "transport-cc" },
                            { "type": "trr-int", "value": 100 }
                        ]
                    }
                ],
                "feedback": [ { "type": "nack", "subtype": "pli" } ],
                "headerExtensions": [
                    { "id": "1", "uri": "urn:ietf:params:rtp-hdrext:ssrc-audio-level" },
                    { "id": 3, "uri": "urn:3gpp:video-orientation", "senders": "initiator" }
                ],
                "sourceGroups": [ { "semantics": "FID", "sources": [1111, "2222"] } ],
                "sources": [
                    {
                        "ssrc": 1111,
                        "parameters": [
                            { "key": "cname", "value": "Z0b8MqDv" },
                            { "key": "label", "value": "" },
                            { "key": "msid", "value": "stream1 track1" }
                        ]
                    }
                ],
                "encryption": [
                    { "tag": 1, "cipherSuite": "AES_CM_128_HMAC_SHA1_80", "keyParams": "inline:key", "sessionParams": "KDR=1" }
                ],
                "googConferenceFlag": true
            },
            "transport": {
                "ufrag": "KTqE",
                "pwd": "u8XPW6fYzsDGjQmCYCQ+9W8S",
                "fingerprints": [
                    { "hash": "sha-256", "value": "AB:CD", "setup": "actpass" }
                ],
                "candidates": [
                    {
                        "foundation": "3",
                        "component": 1,
                        "protocol": "udp",
                        "priority": "1686052607",
                        "ip": "203.0.113.7",
                        "port": 61665,
                        "type": "srflx",
                        "relAddr": "10.0.0.2",
                        "relPort": "61665",
                        "generation": 2
                    }
                ]
            }
        },
        {
            "name": "data",
            "application": { "applicationType": "datachannel" },
            "transport": {
                "sctp": [ { "number": 5000, "protocol": "webrtc-datachannel", "streams": 1024 } ]
            }
        }
    ]
})";

} // namespace

MY_TEST(SDP_JsonTest, ParseSession) {
    auto session = sdp::ParseSession(std::string(kSessionJson));

    EXPECT_EQ(session.session_id, "7503237125123789");
    ASSERT_EQ(session.groups.size(), 1u);
    EXPECT_EQ(session.groups[0].semantics, "BUNDLE");
    EXPECT_THAT(session.groups[0].contents, ElementsAre("audio", "data"));
    ASSERT_EQ(session.contents.size(), 2u);

    const auto& audio = session.contents[0];
    EXPECT_EQ(audio.name, "audio");
    EXPECT_EQ(audio.senders, sdp::Senders::BOTH);
    EXPECT_TRUE(audio.application.is_rtp());
    EXPECT_EQ(audio.application.kind, sdp::Application::Kind::AUDIO);
    EXPECT_TRUE(audio.application.rtcp_mux_enabled);
    EXPECT_TRUE(audio.application.rtcp_rsize_enabled);
    EXPECT_TRUE(audio.application.conference_flag);
    ASSERT_TRUE(audio.application.bandwidth.has_value());
    EXPECT_EQ(audio.application.bandwidth->value, "64");

    const auto& data = session.contents[1];
    EXPECT_FALSE(data.application.is_rtp());
    EXPECT_FALSE(data.senders.has_value());
    ASSERT_TRUE(data.transport.has_value());
    ASSERT_EQ(data.transport->sctp_maps.size(), 1u);
    EXPECT_EQ(data.transport->sctp_maps[0].number, "5000");
    EXPECT_EQ(data.transport->sctp_maps[0].streams, "1024");
}

MY_TEST(SDP_JsonTest, NumbersAreReadAsText) {
    auto session = sdp::ParseSession(std::string(kSessionJson));
    const auto& application = session.contents[0].application;

    ASSERT_EQ(application.payloads.size(), 1u);
    const auto& opus = application.payloads[0];
    EXPECT_EQ(opus.id, "111");
    EXPECT_EQ(opus.clockrate, "48000");
    EXPECT_EQ(opus.channels, "2");
    ASSERT_EQ(opus.parameters.size(), 2u);
    EXPECT_EQ(opus.parameters[0].key, "minptime");
    EXPECT_EQ(opus.parameters[0].value, "10");
    EXPECT_FALSE(opus.parameters[1].key.has_value());
    EXPECT_EQ(opus.feedbacks[1].value, "100");

    EXPECT_THAT(application.source_groups[0].sources, ElementsAre("1111", "2222"));
    EXPECT_EQ(application.sources[0].ssrc, "1111");
    EXPECT_FALSE(application.sources[0].parameters[1].value.has_value());
    EXPECT_EQ(application.cryptos[0].tag, "1");
    EXPECT_EQ(application.header_extensions[0].id, 1);
    EXPECT_FALSE(application.header_extensions[0].senders.has_value());
    EXPECT_EQ(application.header_extensions[1].id, 3);
    EXPECT_EQ(application.header_extensions[1].senders, sdp::Senders::INITIATOR);
}

MY_TEST(SDP_JsonTest, ParseTransport) {
    auto session = sdp::ParseSession(std::string(kSessionJson));
    const auto& transport = session.contents[0].transport.value();

    EXPECT_EQ(transport.ice_ufrag, "KTqE");
    EXPECT_EQ(transport.ice_pwd, "u8XPW6fYzsDGjQmCYCQ+9W8S");
    ASSERT_EQ(transport.fingerprints.size(), 1u);
    EXPECT_EQ(transport.fingerprints[0].setup, sdp::SetupRole::ACT_PASS);

    ASSERT_EQ(transport.candidates.size(), 1u);
    const auto& candidate = transport.candidates[0];
    EXPECT_EQ(candidate.component_id, 1u);
    EXPECT_EQ(candidate.priority, 1686052607u);
    EXPECT_EQ(candidate.port, "61665");
    EXPECT_EQ(candidate.type, sdp::Candidate::Type::SERVER_REFLEXIVE);
    EXPECT_EQ(candidate.generation, 2u);
    EXPECT_EQ(candidate.sdp_line(), "a=candidate:3 1 UDP 1686052607 203.0.113.7 61665 typ srflx raddr 10.0.0.2 rport 61665 generation 2");
}

MY_TEST(SDP_JsonTest, CandidateNumbersMustFit) {
    auto make_session = [](json priority) {
        json candidate = {
            {"foundation", "1"},
            {"component", 1},
            {"protocol", "udp"},
            {"priority", priority},
            {"ip", "192.168.1.2"},
            {"port", 50000},
            {"type", "host"}
        };
        return json{{"contents", {{{"name", "audio"}, {"transport", {{"candidates", json::array({candidate})}}}}}}};
    };

    auto session = sdp::ParseSession(make_session(4294967295u));
    EXPECT_EQ(session.contents[0].transport->candidates[0].priority, 4294967295u);

    EXPECT_THROW(sdp::ParseSession(make_session(-1)), std::invalid_argument);
    EXPECT_THROW(sdp::ParseSession(make_session(4294967296ull)), std::invalid_argument);
    EXPECT_THROW(sdp::ParseSession(make_session("12abc")), std::invalid_argument);
    EXPECT_THROW(sdp::ParseSession(make_session(1.9)), std::invalid_argument);
}

MY_TEST(SDP_JsonTest, EmptyIceCredentialsAreOmitted) {
    json j = {
        {"contents", {{
            {"name", "audio"},
            {"application", {{"media", "audio"}}},
            {"transport", {{"ufrag", ""}, {"pwd", ""}}}
        }}}
    };

    auto session = sdp::ParseSession(j);
    const auto& transport = session.contents[0].transport.value();
    EXPECT_FALSE(transport.ice_ufrag.has_value());
    EXPECT_FALSE(transport.ice_pwd.has_value());

    auto lines = SplitLines(session.contents[0].GenerateSDP("\r\n"));
    EXPECT_EQ(CountLinesWithPrefix(lines, "a=ice-ufrag"), 0u);
    EXPECT_EQ(CountLinesWithPrefix(lines, "a=ice-pwd"), 0u);
}

MY_TEST(SDP_JsonTest, LoadedSessionMatchesBuiltSession) {
    const char* text = R"({
        "contents": [{
            "name": "audio",
            "application": {
                "media": "audio",
                "payloads": [{ "id": "111", "name": "OPUS", "clockrate": "48000", "channels": "2" }]
            },
            "transport": {}
        }]
    })";

    sdp::Session built;
    sdp::Content content;
    content.name = "audio";
    content.application.kind = sdp::Application::Kind::AUDIO;
    content.application.payloads.push_back({"111", "OPUS", "48000", std::string("2"), {}, {}});
    content.transport.emplace();
    built.contents.push_back(content);

    sdp::SerializeOptions options;
    options.session_id = "1";
    options.time = "2";

    auto loaded = sdp::ParseSession(std::string(text));

    EXPECT_EQ(loaded.GenerateSDP("\r\n", options), built.GenerateSDP("\r\n", options));
}

MY_TEST(SDP_JsonTest, MalformedInputThrows) {
    EXPECT_THROW(sdp::ParseSession(std::string("{ not json")), std::invalid_argument);
    EXPECT_THROW(sdp::ParseSession(json::array()), std::invalid_argument);
    EXPECT_THROW(sdp::ParseSession(json{{"contents", {{{"name", "audio"}, {"senders", "everyone"}}}}}), std::invalid_argument);
    EXPECT_THROW(sdp::ParseSession(json{{"contents", {{{"name", "audio"}, {"application", {{"media", "text"}}}}}}}), std::invalid_argument);
    EXPECT_THROW(sdp::ParseSession(json{{"contents", {{{"name", "data"}, {"application", {{"applicationType", "sctp"}}}}}}}), std::invalid_argument);
    EXPECT_THROW(sdp::ParseSession(json{{"contents", {{{"senders", "both"}}}}}), std::invalid_argument);
    EXPECT_THROW(sdp::ParseSession(json{{"contents", "audio"}}), std::invalid_argument);
    EXPECT_THROW(sdp::ParseSession(json{{"groups", {{{"semantics", "BUNDLE"}, {"contents", "audio"}}}}}), std::invalid_argument);
}

MY_TEST(SDP_JsonTest, BadFingerprintSetupThrows) {
    json j = {
        {"contents", {{
            {"name", "audio"},
            {"transport", {{"fingerprints", {{{"hash", "sha-256"}, {"value", "AB"}, {"setup", "holdconn"}}}}}}
        }}}
    };

    EXPECT_THROW(sdp::ParseSession(j), std::invalid_argument);
}

MY_TEST(SDP_JsonTest, ParseOptions) {
    auto options = sdp::ParseOptions(json{{"role", "responder"}, {"direction", "incoming"}, {"sid", 12345}, {"time", "67890"}});

    EXPECT_EQ(options.role, sdp::SessionRole::RESPONDER);
    EXPECT_EQ(options.direction, sdp::NegotiationDirection::INCOMING);
    EXPECT_EQ(options.session_id, "12345");
    EXPECT_EQ(options.time, "67890");

    auto defaults = sdp::ParseOptions(json::object());
    EXPECT_EQ(defaults.role, sdp::SessionRole::INITIATOR);
    EXPECT_EQ(defaults.direction, sdp::NegotiationDirection::OUTGOING);
    EXPECT_FALSE(defaults.session_id.has_value());

    EXPECT_THROW(sdp::ParseOptions(json{{"role", "observer"}}), std::invalid_argument);
    EXPECT_THROW(sdp::ParseOptions(json::array()), std::invalid_argument);
}

} // namespace test
} // namespace jinglesdp
