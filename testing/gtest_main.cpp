#include "common/logger.hpp"

#include <gtest/gtest.h>

int main(int argc, char* argv[]) {
    testing::InitGoogleTest(&argc, argv);
    jinglesdp::logging::InitLogger(jinglesdp::logging::Level::WARNING);
    return RUN_ALL_TESTS();
}
