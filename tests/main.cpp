#include <gtest/gtest.h>
#include <formulize/log.hpp>
#include <iostream>

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    // Keep expected warnings out of the test output unless a test captures them
    formulize::log::set_min_level(formulize::log::Level::Error);

    std::cout << "=== Formulize Test Suite ===" << std::endl;
    std::cout << "Running bottom-up component tests..." << std::endl;

    return RUN_ALL_TESTS();
}
