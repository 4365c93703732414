#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>
#include "cross_stats/core/logger.hpp"

using namespace cross_stats;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::reset_for_tests();

        original_cout = std::cout.rdbuf();
        std::cout.rdbuf(cout_buffer.rdbuf());

        std::error_code ec;
        std::filesystem::remove_all(test_log_dir, ec);
    }

    void TearDown() override {
        std::cout.rdbuf(original_cout);
        Logger::reset_for_tests();

        std::error_code ec;
        std::filesystem::remove_all(test_log_dir, ec);
    }

    std::vector<std::filesystem::path> get_log_files(const std::string& dir) {
        std::vector<std::filesystem::path> files;
        if (!std::filesystem::exists(dir)) return files;
        for (const auto& entry : std::filesystem::directory_iterator(dir)) {
            if (entry.is_regular_file() && entry.path().extension() == ".log") {
                files.push_back(entry.path());
            }
        }
        std::sort(files.begin(), files.end());
        return files;
    }

    std::string read_file(const std::filesystem::path& path) {
        std::ifstream file(path);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    LoggerConfig plain_config(LogDestination destination) {
        LoggerConfig config;
        config.destination = destination;
        config.log_directory = test_log_dir;
        config.include_timestamp = false;
        config.include_level = false;
        return config;
    }

    std::streambuf* original_cout;
    std::stringstream cout_buffer;
    const std::string test_log_dir = "cross_stats_test_logs";
};

TEST_F(LoggerTest, LogsToConsoleWhenConfigured) {
    Logger::instance().initialize(plain_config(LogDestination::CONSOLE));

    Logger::instance().log(LogLevel::INFO, "Loaded data: 3 countries, 2 features");

    EXPECT_EQ(cout_buffer.str(), "Loaded data: 3 countries, 2 features\n");
    EXPECT_TRUE(get_log_files(test_log_dir).empty());
}

TEST_F(LoggerTest, LogsToBothDestinations) {
    Logger::instance().initialize(plain_config(LogDestination::BOTH));

    Logger::instance().log(LogLevel::INFO, "Both message");

    EXPECT_EQ(cout_buffer.str(), "Both message\n");
    auto files = get_log_files(test_log_dir);
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(read_file(files[0]), "Both message\n");
}

TEST_F(LoggerTest, LogLevelFiltering) {
    LoggerConfig config = plain_config(LogDestination::CONSOLE);
    config.min_level = LogLevel::WARNING;
    Logger::instance().initialize(config);

    DEBUG("Debug");
    INFO("Info");
    WARN("Warning");
    ERROR("Error");

    EXPECT_EQ(cout_buffer.str(), "Warning\nError\n");
}

TEST_F(LoggerTest, MessageFormattingIncludesLevelAndComponent) {
    LoggerConfig config = plain_config(LogDestination::CONSOLE);
    config.include_level = true;
    Logger::instance().initialize(config);
    Logger::register_component("DatasetLoader");

    WARN("Feature 'x' appears " << 2 << " times");

    EXPECT_EQ(cout_buffer.str(), "[WARNING] [DatasetLoader] Feature 'x' appears 2 times\n");
}

TEST_F(LoggerTest, FileRotationKeepsAtMostMaxFiles) {
    LoggerConfig config = plain_config(LogDestination::FILE);
    config.max_file_size = 1;  // Rotate after every message
    config.max_files = 2;
    Logger::instance().initialize(config);

    for (int i = 0; i < 4; ++i) {
        Logger::instance().log(LogLevel::INFO, std::to_string(i));
    }

    EXPECT_EQ(get_log_files(test_log_dir).size(), 2u);
}

TEST_F(LoggerTest, LogBeforeInitializationDoesNotWriteToConsole) {
    Logger::instance().log(LogLevel::INFO, "Test");

    EXPECT_TRUE(cout_buffer.str().empty());
    EXPECT_FALSE(Logger::instance().is_initialized());
}

TEST_F(LoggerTest, ConfigJsonRoundTrip) {
    LoggerConfig config;
    config.min_level = LogLevel::ERR;
    config.destination = LogDestination::BOTH;
    config.filename_prefix = "report";

    LoggerConfig restored;
    restored.from_json(config.to_json());

    EXPECT_EQ(restored.min_level, LogLevel::ERR);
    EXPECT_EQ(restored.destination, LogDestination::BOTH);
    EXPECT_EQ(restored.filename_prefix, "report");
}
