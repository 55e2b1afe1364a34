#include "sdp/sdp_content.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/defines.hpp"

#include <string>
#include <vector>

using namespace testing;

namespace jinglesdp {
namespace test {

namespace {

const std::string kFingerprint = "8F:B5:D9:8F:53:7D:A9:B0:CE:01:3E:CB:30:BE:40:AC:33:42:25:FC:C4:FC:55:74:B9:8D:48:B0:02:5A:A8:EB";

sdp::Content MakeAudioContent() {
    sdp::Content content;
    content.name = "audio";
    content.application.type = sdp::ApplicationType::RTP;
    content.application.kind = sdp::Application::Kind::AUDIO;
    content.transport.emplace();
    return content;
}

sdp::Payload MakeOpus() {
    sdp::Payload opus;
    opus.id = "111";
    opus.name = "OPUS";
    opus.clockrate = "48000";
    opus.channels = "2";
    return opus;
}

sdp::Source MakeSource(std::string ssrc, std::string msid) {
    sdp::Source source;
    source.ssrc = std::move(ssrc);
    source.parameters.push_back({"cname", std::string("sTjtznXLCNH7nbRw")});
    source.parameters.push_back({"msid", std::move(msid)});
    return source;
}

std::vector<std::string> Generate(const sdp::Content& content, const sdp::SerializeOptions& options = sdp::SerializeOptions()) {
    return SplitLines(content.GenerateSDP("\r\n", options));
}

} // namespace

MY_TEST(SDP_ContentTest, MinimalRtpContent) {
    auto lines = Generate(MakeAudioContent());

    EXPECT_THAT(lines, ElementsAre("m=audio 1 RTP/AVPF",
                                   "c=IN IP4 0.0.0.0",
                                   "a=rtcp:1 IN IP4 0.0.0.0",
                                   "a=sendrecv",
                                   "a=mid:audio"));
}

MY_TEST(SDP_ContentTest, MinimalDataChannelContent) {
    sdp::Content content;
    content.name = "data";
    content.application.type = sdp::ApplicationType::DATA_CHANNEL;
    content.transport.emplace();

    EXPECT_THAT(Generate(content), ElementsAre("m=application 1 DTLS/SCTP",
                                               "c=IN IP4 0.0.0.0",
                                               "a=mid:data"));
}

MY_TEST(SDP_ContentTest, DataChannelNeverEmitsRtpLines) {
    sdp::Content content;
    content.name = "data";
    content.application.type = sdp::ApplicationType::DATA_CHANNEL;
    content.application.rtcp_mux_enabled = true;
    content.application.rtcp_rsize_enabled = true;
    content.application.payloads.push_back(MakeOpus());
    content.application.feedbacks.push_back({"nack", std::nullopt, std::nullopt});
    content.senders = sdp::Senders::INITIATOR;
    content.transport.emplace();
    content.transport->fingerprints.push_back({"sha-256", kFingerprint, sdp::SetupRole::ACTIVE});
    content.transport->sctp_maps.push_back({"5000", "webrtc-datachannel", "1024"});

    auto lines = Generate(content);

    EXPECT_EQ(lines[0], "m=application 1 DTLS/SCTP 5000");
    EXPECT_TRUE(HasLine(lines, "a=sctpmap:5000 webrtc-datachannel 1024"));
    EXPECT_TRUE(HasLine(lines, "a=setup:active"));
    EXPECT_EQ(CountLinesWithPrefix(lines, "a=rtcp:1"), 0);
    EXPECT_EQ(CountLinesWithPrefix(lines, "a=rtcp-mux"), 0);
    EXPECT_EQ(CountLinesWithPrefix(lines, "a=rtcp-rsize"), 0);
    EXPECT_EQ(CountLinesWithPrefix(lines, "a=rtpmap"), 0);
    EXPECT_EQ(CountLinesWithPrefix(lines, "a=rtcp-fb:111"), 0);
    EXPECT_TRUE(HasLine(lines, "a=rtcp-fb:* nack"));
    EXPECT_EQ(CountLinesWithPrefix(lines, "a=sendonly"), 0);
}

MY_TEST(SDP_ContentTest, DataChannelKeepsWildcardFeedback) {
    sdp::Content content;
    content.name = "data";
    content.application.type = sdp::ApplicationType::DATA_CHANNEL;
    content.application.feedbacks.push_back({"nack", std::nullopt, std::nullopt});
    content.transport.emplace();

    EXPECT_THAT(Generate(content), ElementsAre("m=application 1 DTLS/SCTP",
                                               "c=IN IP4 0.0.0.0",
                                               "a=mid:data",
                                               "a=rtcp-fb:* nack"));
}

MY_TEST(SDP_ContentTest, OpusWithoutParameters) {
    auto content = MakeAudioContent();
    content.application.payloads.push_back(MakeOpus());

    auto lines = Generate(content);

    EXPECT_EQ(lines[0], "m=audio 1 RTP/AVPF 111");
    EXPECT_TRUE(HasLine(lines, "a=rtpmap:111 OPUS/48000/2"));
    EXPECT_EQ(CountLinesWithPrefix(lines, "a=fmtp:111"), 0);
}

MY_TEST(SDP_ContentTest, ChannelsSuffix) {
    auto content = MakeAudioContent();
    sdp::Payload mono{"0", "PCMU", "8000", std::string("1"), {}, {}};
    sdp::Payload absent{"8", "PCMA", "8000", std::nullopt, {}, {}};
    sdp::Payload stereo{"111", "opus", "48000", std::string("2"), {}, {}};
    content.application.payloads = {mono, absent, stereo};

    auto lines = Generate(content);

    EXPECT_EQ(lines[0], "m=audio 1 RTP/AVPF 0 8 111");
    EXPECT_TRUE(HasLine(lines, "a=rtpmap:0 PCMU/8000"));
    EXPECT_TRUE(HasLine(lines, "a=rtpmap:8 PCMA/8000"));
    EXPECT_TRUE(HasLine(lines, "a=rtpmap:111 opus/48000/2"));
}

MY_TEST(SDP_ContentTest, FmtpKeepsParameterOrder) {
    auto content = MakeAudioContent();
    auto opus = MakeOpus();
    opus.parameters.push_back({std::string("minptime"), "10"});
    opus.parameters.push_back({std::string("useinbandfec"), "1"});
    opus.parameters.push_back({std::nullopt, "0-15"});
    content.application.payloads.push_back(opus);

    auto lines = Generate(content);

    EXPECT_TRUE(HasLine(lines, "a=fmtp:111 minptime=10;useinbandfec=1;0-15"));
    EXPECT_EQ(IndexOf(lines, "a=fmtp:111 minptime=10;useinbandfec=1;0-15"), IndexOf(lines, "a=rtpmap:111 OPUS/48000/2") + 1);
}

MY_TEST(SDP_ContentTest, PayloadFeedback) {
    auto content = MakeAudioContent();
    content.application.kind = sdp::Application::Kind::VIDEO;
    sdp::Payload vp8{"100", "VP8", "90000", std::nullopt, {}, {}};
    vp8.feedbacks.push_back({"nack", std::nullopt, std::nullopt});
    vp8.feedbacks.push_back({"nack", std::string("pli"), std::nullopt});
    vp8.feedbacks.push_back({"ccm", std::string("fir"), std::nullopt});
    vp8.feedbacks.push_back({"trr-int", std::nullopt, std::string("100")});
    vp8.feedbacks.push_back({"trr-int", std::nullopt, std::nullopt});
    content.application.payloads.push_back(vp8);

    auto lines = Generate(content);
    auto rtpmap = IndexOf(lines, "a=rtpmap:100 VP8/90000");

    ASSERT_GE(rtpmap, 0);
    EXPECT_EQ(lines[rtpmap + 1], "a=rtcp-fb:100 nack");
    EXPECT_EQ(lines[rtpmap + 2], "a=rtcp-fb:100 nack pli");
    EXPECT_EQ(lines[rtpmap + 3], "a=rtcp-fb:100 ccm fir");
    EXPECT_EQ(lines[rtpmap + 4], "a=rtcp-fb:100 trr-int 100");
    EXPECT_EQ(lines[rtpmap + 5], "a=rtcp-fb:100 trr-int 0");
}

MY_TEST(SDP_ContentTest, ApplicationFeedbackUsesWildcard) {
    auto content = MakeAudioContent();
    content.application.payloads.push_back(MakeOpus());
    content.application.feedbacks.push_back({"transport-cc", std::nullopt, std::nullopt});
    content.application.feedbacks.push_back({"trr-int", std::nullopt, std::string("5")});

    auto lines = Generate(content);

    EXPECT_EQ(IndexOf(lines, "a=rtcp-fb:* transport-cc"), IndexOf(lines, "a=rtpmap:111 OPUS/48000/2") + 1);
    EXPECT_TRUE(HasLine(lines, "a=rtcp-fb:* trr-int 5"));
}

MY_TEST(SDP_ContentTest, ProfileSelection) {
    auto content = MakeAudioContent();
    EXPECT_EQ(Generate(content)[0], "m=audio 1 RTP/AVPF");

    content.application.cryptos.push_back({"1", "AES_CM_128_HMAC_SHA1_80", "inline:WVNfX19zZW1jdGwgKCkgewkyMjA7fQp9CnVubGVz", std::nullopt});
    EXPECT_EQ(Generate(content)[0], "m=audio 1 RTP/SAVPF");

    content.transport->fingerprints.push_back({"sha-256", kFingerprint, std::nullopt});
    EXPECT_EQ(Generate(content)[0], "m=audio 1 UDP/TLS/RTP/SAVPF");
}

MY_TEST(SDP_ContentTest, Bandwidth) {
    auto content = MakeAudioContent();
    content.application.bandwidth = sdp::Bandwidth{"AS", ""};
    EXPECT_EQ(CountLinesWithPrefix(Generate(content), "b="), 0);

    content.application.bandwidth = sdp::Bandwidth{"AS", "512"};
    auto lines = Generate(content);
    EXPECT_EQ(lines[2], "b=AS:512");
}

MY_TEST(SDP_ContentTest, OnlyFirstSetupRoleIsUsed) {
    auto content = MakeAudioContent();
    content.transport->fingerprints.push_back({"sha-1", "AB:CD", std::nullopt});
    content.transport->fingerprints.push_back({"sha-256", kFingerprint, sdp::SetupRole::ACT_PASS});
    content.transport->fingerprints.push_back({"sha-512", "EF:01", sdp::SetupRole::ACTIVE});

    auto lines = Generate(content);

    EXPECT_EQ(CountLinesWithPrefix(lines, "a=fingerprint:"), 3);
    EXPECT_EQ(CountLinesWithPrefix(lines, "a=setup:"), 1);
    EXPECT_EQ(IndexOf(lines, "a=setup:actpass"), IndexOf(lines, "a=fingerprint:sha-256 " + kFingerprint) + 1);
    EXPECT_FALSE(HasLine(lines, "a=setup:active"));
}

MY_TEST(SDP_ContentTest, FingerprintValuePassesThrough) {
    auto content = MakeAudioContent();
    content.transport->fingerprints.push_back({"sha-256", "not:a:fingerprint", std::nullopt});

    EXPECT_TRUE(HasLine(Generate(content), "a=fingerprint:sha-256 not:a:fingerprint"));
}

MY_TEST(SDP_ContentTest, SendersFollowRoleAndDirection) {
    auto content = MakeAudioContent();
    content.senders = sdp::Senders::INITIATOR;

    sdp::SerializeOptions options;
    EXPECT_TRUE(HasLine(Generate(content, options), "a=sendonly"));

    options.direction = sdp::NegotiationDirection::INCOMING;
    EXPECT_TRUE(HasLine(Generate(content, options), "a=recvonly"));

    options.role = sdp::SessionRole::RESPONDER;
    EXPECT_TRUE(HasLine(Generate(content, options), "a=sendonly"));

    content.senders = sdp::Senders::NONE;
    EXPECT_TRUE(HasLine(Generate(content, options), "a=inactive"));
}

MY_TEST(SDP_ContentTest, SingleStreamId) {
    auto content = MakeAudioContent();
    sdp::Source source;
    source.ssrc = "18509423";
    source.parameters.push_back({"msid", std::string("stream1")});
    content.application.sources.push_back(source);

    auto lines = Generate(content);

    EXPECT_EQ(IndexOf(lines, "a=msid:stream1"), IndexOf(lines, "a=mid:audio") + 1);
}

MY_TEST(SDP_ContentTest, SameStreamIdAcrossSources) {
    auto content = MakeAudioContent();
    content.application.sources.push_back(MakeSource("1", "stream1"));
    content.application.sources.push_back(MakeSource("2", "stream1"));

    EXPECT_TRUE(HasLine(Generate(content), "a=msid:stream1"));
}

MY_TEST(SDP_ContentTest, AmbiguousStreamIdIsOmitted) {
    auto content = MakeAudioContent();
    content.application.sources.push_back(MakeSource("1", "stream1"));
    content.application.sources.push_back(MakeSource("2", "stream2"));

    EXPECT_EQ(CountLinesWithPrefix(Generate(content), "a=msid:"), 0);
}

MY_TEST(SDP_ContentTest, SourceLinesPerParameter) {
    auto content = MakeAudioContent();
    content.application.ssrc = "3463951252";
    sdp::Source fallback;
    fallback.parameters.push_back({"cname", std::string("sTjtznXLCNH7nbRw")});
    fallback.parameters.push_back({"label", std::nullopt});
    content.application.sources.push_back(fallback);
    content.application.sources.push_back(MakeSource("1461041037", "stream1 track1"));
    content.application.source_groups.push_back({"FID", {"3463951252", "1461041037"}});

    auto lines = Generate(content);
    auto group = IndexOf(lines, "a=ssrc-group:FID 3463951252 1461041037");

    ASSERT_GE(group, 0);
    EXPECT_EQ(lines[group + 1], "a=ssrc:3463951252 cname:sTjtznXLCNH7nbRw");
    EXPECT_EQ(lines[group + 2], "a=ssrc:3463951252 label");
    EXPECT_EQ(lines[group + 3], "a=ssrc:1461041037 cname:sTjtznXLCNH7nbRw");
    EXPECT_EQ(lines[group + 4], "a=ssrc:1461041037 msid:stream1 track1");
}

MY_TEST(SDP_ContentTest, HeaderExtensions) {
    auto content = MakeAudioContent();
    content.application.header_extensions.push_back({1, "urn:ietf:params:rtp-hdrext:ssrc-audio-level", std::nullopt});
    content.application.header_extensions.push_back({3, "http://www.webrtc.org/experiments/rtp-hdrext/abs-send-time", sdp::Senders::INITIATOR});
    content.application.header_extensions.push_back({4, "urn:3gpp:video-orientation", sdp::Senders::SEND_ONLY});

    sdp::SerializeOptions options;
    auto lines = Generate(content, options);
    EXPECT_TRUE(HasLine(lines, "a=extmap:1 urn:ietf:params:rtp-hdrext:ssrc-audio-level"));
    EXPECT_TRUE(HasLine(lines, "a=extmap:3/sendonly http://www.webrtc.org/experiments/rtp-hdrext/abs-send-time"));
    EXPECT_TRUE(HasLine(lines, "a=extmap:4/initiator urn:3gpp:video-orientation"));

    options.role = sdp::SessionRole::RESPONDER;
    lines = Generate(content, options);
    EXPECT_TRUE(HasLine(lines, "a=extmap:3/recvonly http://www.webrtc.org/experiments/rtp-hdrext/abs-send-time"));
    EXPECT_TRUE(HasLine(lines, "a=extmap:4/responder urn:3gpp:video-orientation"));
}

MY_TEST(SDP_ContentTest, Crypto) {
    auto content = MakeAudioContent();
    content.application.cryptos.push_back({"1", "AES_CM_128_HMAC_SHA1_80", "inline:PS1uQCVeeCFCanVmcjkpPywjNWhcYD0mXXtxaVBR|2^20|1:32", std::nullopt});
    content.application.cryptos.push_back({"2", "AES_CM_128_HMAC_SHA1_32", "inline:NzB4d1BINUAvLEw6UzF3WSJ+PSdFcGdUJShpX1Zj|2^20|1:32", std::string("KDR=1")});

    auto lines = Generate(content);

    EXPECT_TRUE(HasLine(lines, "a=crypto:1 AES_CM_128_HMAC_SHA1_80 inline:PS1uQCVeeCFCanVmcjkpPywjNWhcYD0mXXtxaVBR|2^20|1:32"));
    EXPECT_TRUE(HasLine(lines, "a=crypto:2 AES_CM_128_HMAC_SHA1_32 inline:NzB4d1BINUAvLEw6UzF3WSJ+PSdFcGdUJShpX1Zj|2^20|1:32 KDR=1"));
}

MY_TEST(SDP_ContentTest, FullLineOrder) {
    sdp::Content content;
    content.name = "audio";
    content.senders = sdp::Senders::BOTH;
    auto& app = content.application;
    app.type = sdp::ApplicationType::RTP;
    app.kind = sdp::Application::Kind::AUDIO;
    app.rtcp_mux_enabled = true;
    app.rtcp_rsize_enabled = true;
    app.bandwidth = sdp::Bandwidth{"AS", "64"};
    auto opus = MakeOpus();
    opus.parameters.push_back({std::string("minptime"), "10"});
    opus.feedbacks.push_back({"transport-cc", std::nullopt, std::nullopt});
    app.payloads.push_back(opus);
    app.feedbacks.push_back({"nack", std::nullopt, std::nullopt});
    app.header_extensions.push_back({1, "urn:ietf:params:rtp-hdrext:ssrc-audio-level", std::nullopt});
    app.source_groups.push_back({"FEC", {"18509423", "27389734"}});
    app.sources.push_back(MakeSource("18509423", "stream1"));
    app.cryptos.push_back({"1", "AES_CM_128_HMAC_SHA1_80", "inline:key", std::nullopt});
    app.conference_flag = true;
    content.transport.emplace();
    content.transport->ice_ufrag = "KTqE";
    content.transport->ice_pwd = "u8XPW6fYzsDGjQmCYCQ+9W8S";
    content.transport->fingerprints.push_back({"sha-256", kFingerprint, sdp::SetupRole::ACT_PASS});
    sdp::Candidate candidate;
    candidate.foundation = "1";
    candidate.priority = 2130706431;
    candidate.ip = "192.168.1.2";
    candidate.port = "50000";
    content.transport->candidates.push_back(candidate);

    EXPECT_THAT(Generate(content), ElementsAre(
        "m=audio 1 UDP/TLS/RTP/SAVPF 111",
        "c=IN IP4 0.0.0.0",
        "b=AS:64",
        "a=rtcp:1 IN IP4 0.0.0.0",
        "a=ice-ufrag:KTqE",
        "a=ice-pwd:u8XPW6fYzsDGjQmCYCQ+9W8S",
        "a=fingerprint:sha-256 " + kFingerprint,
        "a=setup:actpass",
        "a=sendrecv",
        "a=mid:audio",
        "a=msid:stream1",
        "a=rtcp-mux",
        "a=rtcp-rsize",
        "a=crypto:1 AES_CM_128_HMAC_SHA1_80 inline:key",
        "a=x-google-flag:conference",
        "a=rtpmap:111 OPUS/48000/2",
        "a=fmtp:111 minptime=10",
        "a=rtcp-fb:111 transport-cc",
        "a=rtcp-fb:* nack",
        "a=extmap:1 urn:ietf:params:rtp-hdrext:ssrc-audio-level",
        "a=ssrc-group:FEC 18509423 27389734",
        "a=ssrc:18509423 cname:sTjtznXLCNH7nbRw",
        "a=ssrc:18509423 msid:stream1",
        "a=candidate:1 1 UDP 2130706431 192.168.1.2 50000 typ host generation 0"));
}

MY_TEST(SDP_ContentTest, EveryLineIsTerminated) {
    auto content = MakeAudioContent();
    std::string sdp = content;

    ASSERT_GE(sdp.size(), 2u);
    EXPECT_EQ(sdp.substr(sdp.size() - 2), "\r\n");
    EXPECT_THAT(sdp, Not(HasSubstr("\r\n\r\n")));
}

MY_TEST(SDP_ContentTest, MissingTransportThrows) {
    auto content = MakeAudioContent();
    content.transport.reset();

    EXPECT_THROW(content.GenerateSDP("\r\n"), std::invalid_argument);
}

MY_TEST(SDP_ContentTest, RtpContentWithoutKindThrows) {
    auto content = MakeAudioContent();
    content.application.kind.reset();

    EXPECT_THROW(content.GenerateSDP("\r\n"), std::invalid_argument);
}

} // namespace test
} // namespace jinglesdp
