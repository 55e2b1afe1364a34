#include "sdp/sdp_description.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/defines.hpp"

using namespace testing;

namespace jinglesdp {
namespace test {

namespace {

sdp::Session MakeDataSession() {
    sdp::Content content;
    content.name = "data";
    content.application.type = sdp::ApplicationType::DATA_CHANNEL;
    content.transport.emplace();
    content.transport->sctp_maps.push_back({"5000", "webrtc-datachannel", "1024"});

    sdp::Session session;
    session.groups.push_back({"BUNDLE", {"data"}});
    session.contents.push_back(content);
    return session;
}

} // namespace

MY_TEST(SDP_DescriptionTest, BuildOffer) {
    auto description = sdp::Description::Builder(sdp::Type::OFFER)
                        .set_session_id("4611731400430051336")
                        .set_time("2")
                        .Build(MakeDataSession());

    EXPECT_EQ(description.type(), sdp::Type::OFFER);
    EXPECT_THAT(description.sdp(), StartsWith("v=0\r\no=- 4611731400430051336 2 IN IP4 0.0.0.0\r\n"));
    EXPECT_THAT(description.sdp(), HasSubstr("a=sctpmap:5000 webrtc-datachannel 1024\r\n"));
    EXPECT_EQ(std::string(description), description.sdp());
}

MY_TEST(SDP_DescriptionTest, BuilderCarriesOptions) {
    sdp::Description::Builder builder(sdp::Type::ANSWER);
    builder.set_role(sdp::SessionRole::RESPONDER)
           .set_direction(sdp::NegotiationDirection::INCOMING)
           .set_session_id("1");

    EXPECT_EQ(builder.options().role, sdp::SessionRole::RESPONDER);
    EXPECT_EQ(builder.options().direction, sdp::NegotiationDirection::INCOMING);
    EXPECT_EQ(builder.options().session_id, "1");
    EXPECT_FALSE(builder.options().time.has_value());

    sdp::SerializeOptions options;
    options.time = "3";
    builder.set_options(options);

    EXPECT_EQ(builder.options().role, sdp::SessionRole::INITIATOR);
    EXPECT_FALSE(builder.options().session_id.has_value());
    EXPECT_EQ(builder.options().time, "3");
}

MY_TEST(SDP_DescriptionTest, RoleAndDirectionReachMediaBlocks) {
    sdp::Content content;
    content.name = "audio";
    content.senders = sdp::Senders::RESPONDER;
    content.application.kind = sdp::Application::Kind::AUDIO;
    content.transport.emplace();
    sdp::Session session;
    session.contents.push_back(content);

    auto offer = sdp::Description::Builder(sdp::Type::OFFER).Build(session);
    auto answer = sdp::Description::Builder(sdp::Type::ANSWER)
                    .set_role(sdp::SessionRole::RESPONDER)
                    .Build(session);

    EXPECT_TRUE(HasLine(SplitLines(offer.sdp()), "a=recvonly"));
    EXPECT_TRUE(HasLine(SplitLines(answer.sdp()), "a=sendonly"));
}

MY_TEST(SDP_DescriptionTest, ToJson) {
    auto description = sdp::Description::Builder(sdp::Type::ANSWER)
                        .set_session_id("1")
                        .set_time("2")
                        .Build(MakeDataSession());

    auto j = description.ToJson();

    EXPECT_EQ(j.at("type").get<std::string>(), "answer");
    EXPECT_EQ(j.at("sdp").get<std::string>(), description.sdp());
    EXPECT_EQ(j.size(), 2u);
}

MY_TEST(SDP_DescriptionTest, BuildFailsOnInvalidSession) {
    auto session = MakeDataSession();
    session.groups[0].contents.push_back("video");

    EXPECT_THROW(sdp::Description::Builder(sdp::Type::OFFER).Build(session), std::invalid_argument);
}

} // namespace test
} // namespace jinglesdp
