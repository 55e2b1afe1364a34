#include "sdp/sdp_utils.hpp"

#include <gtest/gtest.h>

namespace jinglesdp {
namespace test {

TEST(SDP_UtilsTest, TypeRoundTrip) {
    EXPECT_EQ(sdp::StringToType("offer"), sdp::Type::OFFER);
    EXPECT_EQ(sdp::StringToType("pranswer"), sdp::Type::PRANSWER);
    EXPECT_EQ(sdp::StringToType("whatever"), sdp::Type::UNSPEC);
    EXPECT_EQ(sdp::TypeToString(sdp::Type::ANSWER), "answer");
}

TEST(SDP_UtilsTest, ParseEnumerations) {
    EXPECT_EQ(sdp::StringToSetupRole("actpass"), sdp::SetupRole::ACT_PASS);
    EXPECT_EQ(sdp::StringToSessionRole("responder"), sdp::SessionRole::RESPONDER);
    EXPECT_EQ(sdp::StringToNegotiationDirection("incoming"), sdp::NegotiationDirection::INCOMING);
    EXPECT_EQ(sdp::StringToSenders("sendrecv"), sdp::Senders::SEND_RECV);
    EXPECT_EQ(sdp::StringToApplicationType("datachannel"), sdp::ApplicationType::DATA_CHANNEL);

    EXPECT_THROW(sdp::StringToSetupRole("holdconn"), std::invalid_argument);
    EXPECT_THROW(sdp::StringToSessionRole("observer"), std::invalid_argument);
    EXPECT_THROW(sdp::StringToNegotiationDirection("sideways"), std::invalid_argument);
    EXPECT_THROW(sdp::StringToSenders("everyone"), std::invalid_argument);
    EXPECT_THROW(sdp::StringToApplicationType("file-transfer"), std::invalid_argument);
}

TEST(SDP_UtilsTest, ToString) {
    EXPECT_EQ(sdp::ToString(sdp::Senders::RECV_ONLY), "recvonly");
    EXPECT_EQ(sdp::ToString(sdp::SetupRole::PASSIVE), "passive");
    EXPECT_EQ(sdp::ToString(sdp::ApplicationType::RTP), "rtp");
}

TEST(SDP_UtilsTest, SHA256Fingerprint) {
    EXPECT_TRUE(sdp::IsSHA256Fingerprint("8F:B5:D9:8F:53:7D:A9:B0:CE:01:3E:CB:30:BE:40:AC:33:42:25:FC:C4:FC:55:74:B9:8D:48:B0:02:5A:A8:EB"));
    EXPECT_FALSE(sdp::IsSHA256Fingerprint("8F:B5:D9"));
    EXPECT_FALSE(sdp::IsSHA256Fingerprint("8F-B5-D9-8F-53-7D-A9-B0-CE-01-3E-CB-30-BE-40-AC-33-42-25-FC-C4-FC-55-74-B9-8D-48-B0-02-5A-A8-EB"));
}

} // namespace test
} // namespace jinglesdp
