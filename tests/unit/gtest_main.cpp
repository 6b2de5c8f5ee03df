#include <gtest/gtest.h>
#include <filesystem>
#include <iostream>

#include "config/Config.hpp"
#include "log/Registry.hpp"

namespace fs = std::filesystem;

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        mg::config::LoggingConfig logging;
        logging.log_dir = fs::temp_directory_path() / "mediagate-tests";
        logging.console_log_level = spdlog::level::off;
        logging.file_log_level = spdlog::level::debug;
        mg::log::Registry::init(logging);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize mediagate test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}
