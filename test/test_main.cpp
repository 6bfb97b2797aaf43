#include <gtest/gtest.h>

#include "cli/CommandFactory.hpp"

/**
 * @brief Main entry point for gitminer unit tests
 *
 * All test files are automatically registered with GoogleTest.
 * Run with: ./gitminer_tests
 *
 * Or with CMake CTest: ctest --output-on-failure
 */

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    gitminer::registerCommands();
    return RUN_ALL_TESTS();
}
