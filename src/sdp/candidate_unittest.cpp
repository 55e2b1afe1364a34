#include "sdp/candidate.hpp"

#include <gtest/gtest.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/defines.hpp"

#include <string>

using namespace testing;

namespace jinglesdp {
namespace test {

namespace {

sdp::Candidate MakeCandidate(sdp::Candidate::Type type) {
    sdp::Candidate candidate;
    candidate.foundation = "2550170968";
    candidate.component_id = 1;
    candidate.protocol = "udp";
    candidate.priority = 8265471;
    candidate.ip = "45.76.53.21";
    candidate.port = "52823";
    candidate.type = type;
    return candidate;
}

} // namespace

MY_TEST(CandidateTest, BuildHostSDPLine) {
    auto candidate = MakeCandidate(sdp::Candidate::Type::HOST);

    EXPECT_EQ(candidate.sdp_line(), "a=candidate:2550170968 1 UDP 8265471 45.76.53.21 52823 typ host generation 0");
}

MY_TEST(CandidateTest, ToString) {
    auto candidate = MakeCandidate(sdp::Candidate::Type::HOST);
    candidate.generation = 2;

    EXPECT_EQ(std::string(candidate), "candidate:2550170968 1 UDP 8265471 45.76.53.21 52823 typ host generation 2");
}

MY_TEST(CandidateTest, RelayedCandidateWithRelatedAddress) {
    auto candidate = MakeCandidate(sdp::Candidate::Type::RELAYED);
    candidate.related_address = "113.246.193.40";
    candidate.related_port = "37467";

    EXPECT_EQ(candidate.sdp_line(), "a=candidate:2550170968 1 UDP 8265471 45.76.53.21 52823 typ relay raddr 113.246.193.40 rport 37467 generation 0");
}

MY_TEST(CandidateTest, RelatedAddressNeedsBothFields) {
    auto candidate = MakeCandidate(sdp::Candidate::Type::SERVER_REFLEXIVE);
    candidate.related_address = "10.216.33.9";

    EXPECT_EQ(candidate.sdp_line(), "a=candidate:2550170968 1 UDP 8265471 45.76.53.21 52823 typ srflx generation 0");
}

MY_TEST(CandidateTest, HostCandidateDropsRelatedAddress) {
    auto candidate = MakeCandidate(sdp::Candidate::Type::HOST);
    candidate.related_address = "10.216.33.9";
    candidate.related_port = "54321";

    EXPECT_EQ(std::string(candidate).find("raddr"), std::string::npos);
    EXPECT_EQ(std::string(candidate).find("rport"), std::string::npos);
}

MY_TEST(CandidateTest, RelatedAddressForEveryNonHostType) {
    for (auto type : {sdp::Candidate::Type::SERVER_REFLEXIVE, sdp::Candidate::Type::PEER_REFLEXIVE, sdp::Candidate::Type::RELAYED}) {
        auto candidate = MakeCandidate(type);
        candidate.related_address = "10.216.33.9";
        candidate.related_port = "54321";
        EXPECT_NE(std::string(candidate).find(" raddr 10.216.33.9 rport 54321 "), std::string::npos);
    }
}

MY_TEST(CandidateTest, TcpTypeOnTcpCandidate) {
    auto candidate = MakeCandidate(sdp::Candidate::Type::HOST);
    candidate.protocol = "tcp";
    candidate.port = "9";
    candidate.tcp_type = "active";

    EXPECT_EQ(candidate.sdp_line(), "a=candidate:2550170968 1 TCP 8265471 45.76.53.21 9 typ host tcptype active generation 0");
}

MY_TEST(CandidateTest, TcpTypeIgnoredOnUdpCandidate) {
    auto candidate = MakeCandidate(sdp::Candidate::Type::HOST);
    candidate.tcp_type = "passive";

    EXPECT_EQ(std::string(candidate).find("tcptype"), std::string::npos);
}

MY_TEST(CandidateTest, RelatedAddressBeforeTcpType) {
    auto candidate = MakeCandidate(sdp::Candidate::Type::SERVER_REFLEXIVE);
    candidate.protocol = "TcP";
    candidate.related_address = "10.216.33.9";
    candidate.related_port = "54321";
    candidate.tcp_type = "so";
    candidate.generation = 1;

    EXPECT_EQ(candidate.sdp_line(), "a=candidate:2550170968 1 TCP 8265471 45.76.53.21 52823 typ srflx raddr 10.216.33.9 rport 54321 tcptype so generation 1");
}

MY_TEST(CandidateTest, MalformedAddressPassesThrough) {
    auto candidate = MakeCandidate(sdp::Candidate::Type::HOST);
    candidate.ip = "not-an-ip";
    candidate.port = "99999";

    EXPECT_EQ(candidate.sdp_line(), "a=candidate:2550170968 1 UDP 8265471 not-an-ip 99999 typ host generation 0");
}

MY_TEST(CandidateTest, ParseType) {
    EXPECT_EQ(sdp::Candidate::ToType("host"), sdp::Candidate::Type::HOST);
    EXPECT_EQ(sdp::Candidate::ToType("srflx"), sdp::Candidate::Type::SERVER_REFLEXIVE);
    EXPECT_EQ(sdp::Candidate::ToType("prflx"), sdp::Candidate::Type::PEER_REFLEXIVE);
    EXPECT_EQ(sdp::Candidate::ToType("relay"), sdp::Candidate::Type::RELAYED);
    EXPECT_THROW(sdp::Candidate::ToType("bogus"), std::invalid_argument);
}

} // namespace test
} // namespace jinglesdp
