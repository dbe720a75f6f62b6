#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "logging/logger.hpp"

int main(int argc, char **argv) {
    // Explicit init keeps --gtest_list_tests working for CTest discovery
    ::testing::InitGoogleTest(&argc, argv);
    ::testing::InitGoogleMock(&argc, argv);

    // Failure-path tests log on purpose, keep the output short
    ippusb::logging::Logger::set_level(ippusb::logging::Level::LVL_WARN);
    return RUN_ALL_TESTS();
}
