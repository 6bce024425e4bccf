/**
 * @file test_main.cpp
 * @brief GoogleTest main entry point
 *
 * This file provides the main() function for running all GoogleTest tests.
 * Each test file registers its tests automatically via the TEST() macro.
 * Library logging is lowered to warnings so test output stays readable.
 *
 * Build: cmake --build . --target stagehand_tests
 * Run:   ./stagehand_tests
 *
 * @copyright (c) 2026. MIT License.
 */

#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    spdlog::set_level(spdlog::level::warn);
    return RUN_ALL_TESTS();
}
