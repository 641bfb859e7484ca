#include <gtest/gtest.h>
#include <filesystem>
#include <iostream>

#include "crypto/util/hash.hpp"
#include "logging/LogRegistry.hpp"

namespace fs = std::filesystem;

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    const auto logDir = fs::temp_directory_path() / "orcasync_test_logs";

    try {
        osync::crypto::hash::init();
        osync::logging::LogRegistry::init(logDir);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize orcasync test environment: " << e.what() << std::endl;
        return 1;
    }

    const int rc = RUN_ALL_TESTS();
    osync::logging::LogRegistry::shutdown();
    return rc;
}
