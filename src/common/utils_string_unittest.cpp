#include "common/utils_string.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>

namespace jinglesdp {
namespace test {

TEST(Common_UtilsStringTest, ChangeCase) {
    EXPECT_EQ(utils::string::to_upper("udp"), "UDP");
    EXPECT_EQ(utils::string::to_upper("Tcp"), "TCP");
    EXPECT_EQ(utils::string::to_lower("SHA-256"), "sha-256");
}

TEST(Common_UtilsStringTest, Join) {
    EXPECT_EQ(utils::string::join({"audio", "video", "data"}, " "), "audio video data");
    EXPECT_EQ(utils::string::join({"minptime=10"}, ";"), "minptime=10");
    EXPECT_EQ(utils::string::join({}, " "), "");
}

TEST(Common_UtilsStringTest, ToInteger) {
    EXPECT_EQ(utils::string::to_integer<int>("-3"), -3);
    EXPECT_EQ(utils::string::to_integer<uint32_t>("2130706431"), 2130706431u);
    EXPECT_EQ(utils::string::to_integer<uint32_t>("4294967295"), 4294967295u);
    EXPECT_THROW(utils::string::to_integer<int>("abc"), std::invalid_argument);
    EXPECT_THROW(utils::string::to_integer<uint32_t>(""), std::invalid_argument);
}

TEST(Common_UtilsStringTest, ToIntegerRejectsWhatDoesNotFit) {
    EXPECT_THROW(utils::string::to_integer<uint32_t>("-1"), std::invalid_argument);
    EXPECT_THROW(utils::string::to_integer<uint32_t>("4294967296"), std::invalid_argument);
    EXPECT_THROW(utils::string::to_integer<uint32_t>("99999999999999999999999"), std::invalid_argument);
    EXPECT_THROW(utils::string::to_integer<uint32_t>("12abc"), std::invalid_argument);
    EXPECT_THROW(utils::string::to_integer<uint32_t>("1.9"), std::invalid_argument);
    EXPECT_THROW(utils::string::to_integer<uint32_t>(" 12"), std::invalid_argument);
    EXPECT_THROW(utils::string::to_integer<uint32_t>("+12"), std::invalid_argument);
    EXPECT_THROW(utils::string::to_integer<int>("-"), std::invalid_argument);
    EXPECT_THROW(utils::string::to_integer<int>("2147483648"), std::invalid_argument);
    EXPECT_EQ(utils::string::to_integer<int>("-2147483648"), std::numeric_limits<int>::min());
}

} // namespace test
} // namespace jinglesdp
