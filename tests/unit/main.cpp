#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "logging/logger.hpp"

int main(int argc, char **argv) {
    // Explicit init so --gtest_list_tests and filters work during CTest discovery.
    ::testing::InitGoogleTest(&argc, argv);
    ::testing::InitGoogleMock(&argc, argv);

    // Failover paths log a warning per attempt; keep test output readable
    avatarlink::logging::Logger::init(avatarlink::logging::Level::LVL_ERROR);
    return RUN_ALL_TESTS();
}
