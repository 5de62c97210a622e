#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <vector>
#include "quanttrade/core/logger.hpp"
#include "test_base.hpp"

using namespace quanttrade;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::reset_for_tests();
        Logger::register_component("");

        original_cout = std::cout.rdbuf();
        std::cout.rdbuf(cout_buffer.rdbuf());

        test_log_dir = quanttrade::testing::scratch_directory("quanttrade_logs").string();
        std::error_code ec;
        std::filesystem::remove_all(test_log_dir, ec);
        std::filesystem::create_directories(test_log_dir);
    }

    void TearDown() override {
        std::cout.rdbuf(original_cout);
        Logger::reset_for_tests();
        Logger::register_component("");

        std::error_code ec;
        std::filesystem::remove_all(test_log_dir, ec);
    }

    LoggerConfig file_config() const {
        LoggerConfig config;
        config.destination = LogDestination::FILE;
        config.log_directory = test_log_dir;
        config.include_timestamp = false;
        config.include_level = false;
        return config;
    }

    std::vector<std::filesystem::path> get_log_files(const std::string& dir) {
        std::vector<std::filesystem::path> files;
        for (const auto& entry : std::filesystem::directory_iterator(dir)) {
            if (entry.is_regular_file() && entry.path().extension() == ".log") {
                files.push_back(entry.path());
            }
        }
        std::sort(files.begin(), files.end(), [](const auto& a, const auto& b) {
            return std::filesystem::last_write_time(a) < std::filesystem::last_write_time(b);
        });
        return files;
    }

    std::string read_file(const std::filesystem::path& path) {
        std::ifstream file(path);
        if (!file.is_open())
            return "";
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    std::streambuf* original_cout;
    std::stringstream cout_buffer;
    std::string test_log_dir;
};

TEST_F(LoggerTest, InitializationCreatesLogDirectory) {
    LoggerConfig config = file_config();
    config.log_directory = test_log_dir + "/subdir";
    ASSERT_NO_THROW(Logger::instance().initialize(config));
    EXPECT_TRUE(std::filesystem::exists(config.log_directory));
}

TEST_F(LoggerTest, LogsToConsoleWhenConfigured) {
    LoggerConfig config;
    config.destination = LogDestination::CONSOLE;
    config.include_timestamp = false;
    config.include_level = false;
    Logger::instance().initialize(config);

    Logger::instance().log(LogLevel::INFO, "Console message");

    EXPECT_EQ(cout_buffer.str(), "Console message\n");
}

TEST_F(LoggerTest, LogsToFileWithPrefix) {
    LoggerConfig config = file_config();
    config.filename_prefix = "bt_test";
    Logger::instance().initialize(config);

    Logger::instance().log(LogLevel::INFO, "File message");

    auto files = get_log_files(test_log_dir);
    ASSERT_EQ(files.size(), 1);
    EXPECT_EQ(files[0].filename().string().rfind("bt_test_", 0), 0u);
    EXPECT_EQ(read_file(files[0]), "File message\n");
}

TEST_F(LoggerTest, LogLevelFiltering) {
    LoggerConfig config = file_config();
    config.min_level = LogLevel::WARNING;
    Logger::instance().initialize(config);

    DEBUG("Debug");
    INFO("Info");
    WARN("Warning");
    ERROR("Error");

    auto content = read_file(get_log_files(test_log_dir)[0]);
    EXPECT_EQ(content.find("Debug"), std::string::npos);
    EXPECT_EQ(content.find("Info"), std::string::npos);
    EXPECT_NE(content.find("Warning\nError\n"), std::string::npos);
}

TEST_F(LoggerTest, ComponentAndLevelTags) {
    LoggerConfig config = file_config();
    config.include_level = true;
    Logger::instance().initialize(config);

    Logger::register_component("MonteCarlo");
    INFO("Completed " << 100 << "/" << 1000 << " Monte Carlo simulations");

    auto content = read_file(get_log_files(test_log_dir)[0]);
    EXPECT_EQ(content, "[INFO] [MonteCarlo] Completed 100/1000 Monte Carlo simulations\n");
}

TEST_F(LoggerTest, FileRotationRespectsMaxFiles) {
    LoggerConfig config = file_config();
    config.max_file_size = 1;  // Rotate after every message
    config.max_files = 2;
    Logger::instance().initialize(config);

    for (int i = 0; i < 4; ++i) {
        Logger::instance().log(LogLevel::INFO, std::to_string(i));
    }

    EXPECT_EQ(get_log_files(test_log_dir).size(), 2);
}

TEST_F(LoggerTest, RetentionIgnoresOtherPrefixes) {
    {
        std::ofstream other(std::filesystem::path(test_log_dir) / "unrelated.log");
        other << "keep me\n";
    }

    LoggerConfig config = file_config();
    config.max_files = 1;
    Logger::instance().initialize(config);
    Logger::instance().log(LogLevel::INFO, "x");

    EXPECT_TRUE(std::filesystem::exists(std::filesystem::path(test_log_dir) / "unrelated.log"));
}

TEST_F(LoggerTest, LogBeforeInitializationSilent) {
    Logger::instance().log(LogLevel::INFO, "Test");

    EXPECT_TRUE(cout_buffer.str().empty());
    EXPECT_TRUE(get_log_files(test_log_dir).empty());
}

TEST_F(LoggerTest, ConfigJsonRoundTrip) {
    LoggerConfig config;
    config.min_level = LogLevel::DEBUG;
    config.destination = LogDestination::BOTH;
    config.filename_prefix = "runner";

    LoggerConfig loaded;
    loaded.from_json(config.to_json());

    EXPECT_EQ(loaded.min_level, LogLevel::DEBUG);
    EXPECT_EQ(loaded.destination, LogDestination::BOTH);
    EXPECT_EQ(loaded.filename_prefix, "runner");
}

TEST_F(LoggerTest, ParseLevelNames) {
    EXPECT_EQ(parse_log_level("warn"), LogLevel::WARNING);
    EXPECT_EQ(parse_log_level("WARNING"), LogLevel::WARNING);
    EXPECT_EQ(parse_log_level("Error"), LogLevel::ERR);
    EXPECT_EQ(parse_log_level("trace"), LogLevel::TRACE);
    EXPECT_FALSE(parse_log_level("verbose").has_value());

    EXPECT_EQ(parse_log_destination("both"), LogDestination::BOTH);
    EXPECT_FALSE(parse_log_destination("syslog").has_value());
}

TEST_F(LoggerTest, ConfigRejectsUnknownLevel) {
    LoggerConfig config;
    EXPECT_THROW(config.from_json({{"min_level", "verbose"}}), std::invalid_argument);
    EXPECT_THROW(config.from_json({{"destination", "syslog"}}), std::invalid_argument);

    config.from_json({{"min_level", "debug"}});
    EXPECT_EQ(config.min_level, LogLevel::DEBUG);
}

TEST_F(LoggerTest, ScopedComponentRestoresPrevious) {
    LoggerConfig config = file_config();
    Logger::instance().initialize(config);

    Logger::register_component("BacktestEngine");
    {
        ScopedLogComponent tag("MonteCarlo");
        INFO("inside");
    }
    INFO("outside");

    auto content = read_file(get_log_files(test_log_dir)[0]);
    EXPECT_EQ(content, "[MonteCarlo] inside\n[BacktestEngine] outside\n");
}

TEST_F(LoggerTest, WorkerThreadsStartUntagged) {
    LoggerConfig config = file_config();
    Logger::instance().initialize(config);
    Logger::register_component("MonteCarlo");

    std::thread worker([]() { INFO("from worker"); });
    worker.join();

    auto content = read_file(get_log_files(test_log_dir)[0]);
    EXPECT_EQ(content, "from worker\n");
}
