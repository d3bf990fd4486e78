#include <gtest/gtest.h>
#include <iostream>

#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        sk::config::ConfigRegistry::init(SK_TEST_CONFIG_PATH);
        sk::log::Registry::init();
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize sessionkeeper test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}
