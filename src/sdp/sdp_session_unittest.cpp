#include "sdp/sdp_session.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/defines.hpp"

using namespace testing;

namespace jinglesdp {
namespace test {

namespace {

const std::string kFingerprint = "8F:B5:D9:8F:53:7D:A9:B0:CE:01:3E:CB:30:BE:40:AC:33:42:25:FC:C4:FC:55:74:B9:8D:48:B0:02:5A:A8:EB";

sdp::Content MakeVideoContent() {
    sdp::Content content;
    content.name = "video";
    content.senders = sdp::Senders::INITIATOR;
    content.application.type = sdp::ApplicationType::RTP;
    content.application.kind = sdp::Application::Kind::VIDEO;
    content.application.rtcp_mux_enabled = true;

    sdp::Payload h264;
    h264.id = "97";
    h264.name = "H264";
    h264.clockrate = "90000";
    h264.parameters.push_back({std::string("profile-level-id"), "42C01F"});
    h264.parameters.push_back({std::string("packetization-mode"), "1"});
    content.application.payloads.push_back(h264);

    content.transport.emplace();
    content.transport->fingerprints.push_back({"sha-256", kFingerprint, sdp::SetupRole::ACT_PASS});
    return content;
}

sdp::Content MakeDataContent() {
    sdp::Content content;
    content.name = "data";
    content.application.type = sdp::ApplicationType::DATA_CHANNEL;
    content.transport.emplace();
    content.transport->sctp_maps.push_back({"5000", "webrtc-datachannel", "1024"});
    return content;
}

sdp::Session MakeBundleSession() {
    sdp::Session session;
    session.groups.push_back({"BUNDLE", {"video"}});
    session.contents.push_back(MakeVideoContent());
    return session;
}

sdp::SerializeOptions FixedOptions() {
    sdp::SerializeOptions options;
    options.role = sdp::SessionRole::INITIATOR;
    options.direction = sdp::NegotiationDirection::OUTGOING;
    options.session_id = "1629863612";
    options.time = "1629863613";
    return options;
}

} // namespace

MY_TEST(SDP_SessionTest, BundledVideoOffer) {
    auto lines = SplitLines(MakeBundleSession().GenerateSDP("\r\n", FixedOptions()));

    EXPECT_THAT(lines, ElementsAre(
        "v=0",
        "o=- 1629863612 1629863613 IN IP4 0.0.0.0",
        "s=-",
        "t=0 0",
        "a=group:BUNDLE video",
        "m=video 1 UDP/TLS/RTP/SAVPF 97",
        "c=IN IP4 0.0.0.0",
        "a=rtcp:1 IN IP4 0.0.0.0",
        "a=fingerprint:sha-256 " + kFingerprint,
        "a=setup:actpass",
        "a=sendonly",
        "a=mid:video",
        "a=rtcp-mux",
        "a=rtpmap:97 H264/90000",
        "a=fmtp:97 profile-level-id=42C01F;packetization-mode=1"));
}

MY_TEST(SDP_SessionTest, SessionHeaderComesFirst) {
    auto session = MakeBundleSession();
    session.contents.push_back(MakeDataContent());
    session.groups[0].contents.push_back("data");

    auto lines = SplitLines(session.GenerateSDP("\r\n", FixedOptions()));

    ASSERT_GE(lines.size(), 4u);
    EXPECT_EQ(lines[0], "v=0");
    EXPECT_THAT(lines[1], StartsWith("o=- "));
    EXPECT_EQ(lines[2], "s=-");
    EXPECT_EQ(lines[3], "t=0 0");
    EXPECT_EQ(lines[4], "a=group:BUNDLE video data");
    EXPECT_LT(IndexOf(lines, "a=mid:video"), IndexOf(lines, "m=application 1 DTLS/SCTP 5000"));
    EXPECT_EQ(CountLinesWithPrefix(lines, "m="), 2u);
}

MY_TEST(SDP_SessionTest, MultipleGroupsKeepOrder) {
    auto session = MakeBundleSession();
    session.contents.push_back(MakeDataContent());
    session.groups.push_back({"LS", {"video", "data"}});

    auto lines = SplitLines(session.GenerateSDP("\r\n", FixedOptions()));

    EXPECT_EQ(IndexOf(lines, "a=group:LS video data"), IndexOf(lines, "a=group:BUNDLE video") + 1);
}

MY_TEST(SDP_SessionTest, EmptyGroupKeepsSeparator) {
    auto session = MakeBundleSession();
    session.groups.push_back({"BUNDLE", {}});

    auto lines = SplitLines(session.GenerateSDP("\r\n", FixedOptions()));

    EXPECT_TRUE(HasLine(lines, "a=group:BUNDLE "));
}

MY_TEST(SDP_SessionTest, StreamSemanticsOnlyWithSources) {
    auto session = MakeBundleSession();
    EXPECT_EQ(CountLinesWithPrefix(SplitLines(session.GenerateSDP("\r\n", FixedOptions())), "a=msid-semantic"), 0u);

    sdp::Source source;
    source.ssrc = "3735928559";
    source.parameters.push_back({"cname", std::string("Z0b8MqDv")});
    session.contents[0].application.sources.push_back(source);

    auto lines = SplitLines(session.GenerateSDP("\r\n", FixedOptions()));
    EXPECT_EQ(lines[4], "a=msid-semantic: WMS *");
    EXPECT_EQ(lines[5], "a=group:BUNDLE video");
    EXPECT_TRUE(session.HasSources());
}

MY_TEST(SDP_SessionTest, UnknownGroupMemberThrows) {
    auto session = MakeBundleSession();
    session.groups.push_back({"BUNDLE", {"video", "audio"}});

    EXPECT_THROW(session.GenerateSDP("\r\n", FixedOptions()), std::invalid_argument);
}

MY_TEST(SDP_SessionTest, ContentErrorPropagates) {
    auto session = MakeBundleSession();
    session.contents[0].transport.reset();

    EXPECT_THROW(session.GenerateSDP("\r\n", FixedOptions()), std::invalid_argument);
}

MY_TEST(SDP_SessionTest, SessionIdPrecedence) {
    auto session = MakeBundleSession();
    auto options = FixedOptions();

    session.session_id = "42";
    EXPECT_EQ(SplitLines(session.GenerateSDP("\r\n", options))[1], "o=- 1629863612 1629863613 IN IP4 0.0.0.0");

    options.session_id.reset();
    EXPECT_EQ(SplitLines(session.GenerateSDP("\r\n", options))[1], "o=- 42 1629863613 IN IP4 0.0.0.0");
}

MY_TEST(SDP_SessionTest, GeneratedSessionIdAndVersion) {
    auto session = MakeBundleSession();
    sdp::SerializeOptions options;

    auto origin = SplitLines(session.GenerateSDP("\r\n", options))[1];

    EXPECT_THAT(origin, MatchesRegex("o=- [0-9]+ [0-9]+ IN IP4 0\\.0\\.0\\.0"));
}

MY_TEST(SDP_SessionTest, ResponderIncoming) {
    auto session = MakeBundleSession();
    auto options = FixedOptions();
    options.role = sdp::SessionRole::RESPONDER;
    options.direction = sdp::NegotiationDirection::INCOMING;

    auto lines = SplitLines(session.GenerateSDP("\r\n", options));

    EXPECT_TRUE(HasLine(lines, "a=sendonly"));

    options.direction = sdp::NegotiationDirection::OUTGOING;
    lines = SplitLines(session.GenerateSDP("\r\n", options));

    EXPECT_TRUE(HasLine(lines, "a=recvonly"));
}

MY_TEST(SDP_SessionTest, EveryLineEndsWithCRLF) {
    auto session = MakeBundleSession();
    session.contents.push_back(MakeDataContent());

    std::string sdp = session;

    EXPECT_EQ(sdp.substr(sdp.size() - 2), "\r\n");
    EXPECT_THAT(sdp, Not(HasSubstr("\r\n\r\n")));
    for (size_t pos = sdp.find('\n'); pos != std::string::npos; pos = sdp.find('\n', pos + 1)) {
        EXPECT_EQ(sdp[pos - 1], '\r');
    }
}

MY_TEST(SDP_SessionTest, CustomLineTerminator) {
    auto sdp = MakeBundleSession().GenerateSDP("\n", FixedOptions());

    EXPECT_THAT(sdp, Not(HasSubstr("\r")));
    EXPECT_THAT(sdp, StartsWith("v=0\no=- 1629863612"));
}

MY_TEST(SDP_SessionTest, ContentLookup) {
    auto session = MakeBundleSession();

    EXPECT_TRUE(session.HasContent("video"));
    EXPECT_FALSE(session.HasContent("audio"));
    ASSERT_NE(session.content("video"), nullptr);
    EXPECT_EQ(session.content("video")->application.payloads.size(), 1u);
    EXPECT_EQ(session.content("audio"), nullptr);
}

} // namespace test
} // namespace jinglesdp
