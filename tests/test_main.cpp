// tests/test_main.cpp
#include <gtest/gtest.h>
#include "logging.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    // Library code logs through the global logger; keep test output quiet
    core::logging::initializeConsoleOnly(spdlog::level::warn);
    return RUN_ALL_TESTS();
}
