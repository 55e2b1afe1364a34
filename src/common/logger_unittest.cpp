#include "common/logger.hpp"
#include "sdp/candidate.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace testing;

namespace jinglesdp {
namespace test {

TEST(Common_LoggerTest, CallbackReceivesWarnings) {
    std::vector<std::pair<logging::Level, std::string>> records;
    logging::InitLogger(logging::Level::WARNING, [&records](logging::Level level, std::string message) {
        records.emplace_back(level, std::move(message));
        return true;
    });

    sdp::Candidate candidate;
    candidate.foundation = "7";
    candidate.protocol = "udp";
    candidate.ip = "10.0.0.7";
    candidate.port = "9";
    candidate.tcp_type = "active";
    EXPECT_THAT(candidate.sdp_line(), Not(HasSubstr("tcptype")));

    // Detach the callback before the records go out of scope.
    logging::InitLogger(logging::Level::WARNING, [](logging::Level, std::string) { return true; });

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].first, logging::Level::WARNING);
    EXPECT_THAT(records[0].second, HasSubstr("tcptype active"));
}

TEST(Common_LoggerTest, ReplaceCallbackWhileLogging) {
    constexpr int kNumRecords = 200;
    std::atomic<int> consumed{0};
    auto counter = [&consumed](logging::Level, std::string) {
        ++consumed;
        return true;
    };
    logging::InitLogger(logging::Level::WARNING, counter);

    std::thread writer([]() {
        for (int i = 0; i < kNumRecords; ++i) {
            PLOG_WARNING << "record " << i;
        }
    });
    for (int i = 0; i < kNumRecords; ++i) {
        logging::InitLogger(logging::Level::WARNING, counter);
    }
    writer.join();

    logging::InitLogger(logging::Level::WARNING, [](logging::Level, std::string) { return true; });

    EXPECT_EQ(consumed.load(), kNumRecords);
}

} // namespace test
} // namespace jinglesdp
