#include "sdp/sdp_senders.hpp"

#include <gtest/gtest.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/defines.hpp"

#include <vector>

namespace jinglesdp {
namespace test {

using sdp::NegotiationDirection;
using sdp::Senders;
using sdp::SessionRole;

namespace {

const std::vector<SessionRole> kRoles = {SessionRole::INITIATOR, SessionRole::RESPONDER};
const std::vector<NegotiationDirection> kDirections = {NegotiationDirection::INCOMING, NegotiationDirection::OUTGOING};
const std::vector<Senders> kAllSenders = {
    Senders::INITIATOR, Senders::RESPONDER, Senders::BOTH, Senders::NONE,
    Senders::RECV_ONLY, Senders::SEND_ONLY, Senders::SEND_RECV, Senders::INACTIVE
};

SessionRole Swap(SessionRole role) {
    return role == SessionRole::INITIATOR ? SessionRole::RESPONDER : SessionRole::INITIATOR;
}

NegotiationDirection Swap(NegotiationDirection direction) {
    return direction == NegotiationDirection::INCOMING ? NegotiationDirection::OUTGOING : NegotiationDirection::INCOMING;
}

bool IsJingleMode(Senders senders) {
    return senders == Senders::INITIATOR || senders == Senders::RESPONDER ||
           senders == Senders::BOTH || senders == Senders::NONE;
}

} // namespace

MY_TEST(SDP_SendersTest, InitiatorOutgoing) {
    const auto role = SessionRole::INITIATOR;
    const auto direction = NegotiationDirection::OUTGOING;
    EXPECT_EQ(sdp::ResolveSenders(role, direction, Senders::INITIATOR), Senders::SEND_ONLY);
    EXPECT_EQ(sdp::ResolveSenders(role, direction, Senders::RESPONDER), Senders::RECV_ONLY);
    EXPECT_EQ(sdp::ResolveSenders(role, direction, Senders::BOTH), Senders::SEND_RECV);
    EXPECT_EQ(sdp::ResolveSenders(role, direction, Senders::NONE), Senders::INACTIVE);
    EXPECT_EQ(sdp::ResolveSenders(role, direction, Senders::RECV_ONLY), Senders::RESPONDER);
    EXPECT_EQ(sdp::ResolveSenders(role, direction, Senders::SEND_ONLY), Senders::INITIATOR);
    EXPECT_EQ(sdp::ResolveSenders(role, direction, Senders::SEND_RECV), Senders::BOTH);
    EXPECT_EQ(sdp::ResolveSenders(role, direction, Senders::INACTIVE), Senders::NONE);
}

MY_TEST(SDP_SendersTest, InitiatorIncoming) {
    const auto role = SessionRole::INITIATOR;
    const auto direction = NegotiationDirection::INCOMING;
    EXPECT_EQ(sdp::ResolveSenders(role, direction, Senders::INITIATOR), Senders::RECV_ONLY);
    EXPECT_EQ(sdp::ResolveSenders(role, direction, Senders::RESPONDER), Senders::SEND_ONLY);
    EXPECT_EQ(sdp::ResolveSenders(role, direction, Senders::BOTH), Senders::SEND_RECV);
    EXPECT_EQ(sdp::ResolveSenders(role, direction, Senders::NONE), Senders::INACTIVE);
    EXPECT_EQ(sdp::ResolveSenders(role, direction, Senders::RECV_ONLY), Senders::INITIATOR);
    EXPECT_EQ(sdp::ResolveSenders(role, direction, Senders::SEND_ONLY), Senders::RESPONDER);
    EXPECT_EQ(sdp::ResolveSenders(role, direction, Senders::SEND_RECV), Senders::BOTH);
    EXPECT_EQ(sdp::ResolveSenders(role, direction, Senders::INACTIVE), Senders::NONE);
}

MY_TEST(SDP_SendersTest, ResponderIncoming) {
    const auto role = SessionRole::RESPONDER;
    const auto direction = NegotiationDirection::INCOMING;
    EXPECT_EQ(sdp::ResolveSenders(role, direction, Senders::INITIATOR), Senders::SEND_ONLY);
    EXPECT_EQ(sdp::ResolveSenders(role, direction, Senders::RESPONDER), Senders::RECV_ONLY);
    EXPECT_EQ(sdp::ResolveSenders(role, direction, Senders::RECV_ONLY), Senders::RESPONDER);
    EXPECT_EQ(sdp::ResolveSenders(role, direction, Senders::SEND_ONLY), Senders::INITIATOR);
}

MY_TEST(SDP_SendersTest, ResponderOutgoing) {
    const auto role = SessionRole::RESPONDER;
    const auto direction = NegotiationDirection::OUTGOING;
    EXPECT_EQ(sdp::ResolveSenders(role, direction, Senders::INITIATOR), Senders::RECV_ONLY);
    EXPECT_EQ(sdp::ResolveSenders(role, direction, Senders::RESPONDER), Senders::SEND_ONLY);
    EXPECT_EQ(sdp::ResolveSenders(role, direction, Senders::RECV_ONLY), Senders::INITIATOR);
    EXPECT_EQ(sdp::ResolveSenders(role, direction, Senders::SEND_ONLY), Senders::RESPONDER);
}

MY_TEST(SDP_SendersTest, BothAndNoneIgnoreRoleAndDirection) {
    for (auto role : kRoles) {
        for (auto direction : kDirections) {
            EXPECT_EQ(sdp::ResolveSenders(role, direction, Senders::BOTH), Senders::SEND_RECV);
            EXPECT_EQ(sdp::ResolveSenders(role, direction, Senders::NONE), Senders::INACTIVE);
            EXPECT_EQ(sdp::ResolveSenders(role, direction, Senders::SEND_RECV), Senders::BOTH);
            EXPECT_EQ(sdp::ResolveSenders(role, direction, Senders::INACTIVE), Senders::NONE);
        }
    }
}

MY_TEST(SDP_SendersTest, SwappingRoleAndDirectionKeepsKeyword) {
    for (auto role : kRoles) {
        for (auto direction : kDirections) {
            for (auto senders : kAllSenders) {
                EXPECT_EQ(sdp::ResolveSenders(role, direction, senders),
                          sdp::ResolveSenders(Swap(role), Swap(direction), senders));
            }
        }
    }
}

MY_TEST(SDP_SendersTest, SwappingOnlyDirectionInvertsSenders) {
    for (auto role : kRoles) {
        EXPECT_EQ(sdp::ResolveSenders(role, NegotiationDirection::INCOMING, Senders::INITIATOR),
                  sdp::ResolveSenders(role, NegotiationDirection::OUTGOING, Senders::RESPONDER));
        EXPECT_EQ(sdp::ResolveSenders(role, NegotiationDirection::INCOMING, Senders::RESPONDER),
                  sdp::ResolveSenders(role, NegotiationDirection::OUTGOING, Senders::INITIATOR));
    }
}

MY_TEST(SDP_SendersTest, MappingIsAnInvolution) {
    for (auto role : kRoles) {
        for (auto direction : kDirections) {
            for (auto senders : kAllSenders) {
                auto mapped = sdp::ResolveSenders(role, direction, senders);
                EXPECT_NE(IsJingleMode(mapped), IsJingleMode(senders));
                EXPECT_EQ(sdp::ResolveSenders(role, direction, mapped), senders);
            }
        }
    }
}

} // namespace test
} // namespace jinglesdp
