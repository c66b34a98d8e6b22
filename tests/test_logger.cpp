/// @file test_logger.cpp
/// Tests for the per-session log file.

#include "logger.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace {

class LoggerTest : public ::testing::Test {
   protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("engine_bridge_logger_" +
                std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);
        LoggerConfig::set_directory(dir_.string());
    }

    void TearDown() override {
        LoggerConfig::set_directory(".");
        LoggerConfig::set_enabled(false);
        std::filesystem::remove_all(dir_);
    }

    static std::string read_file(const std::string &path) {
        std::ifstream in(path);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    std::filesystem::path dir_;
};

TEST_F(LoggerTest, WritesTrafficAndEvents) {
    LoggerConfig::set_enabled(true);
    std::string path = Logger::file_name("Alpha", 3);
    {
        Logger logger("Alpha", 3);
        EXPECT_TRUE(logger.is_open());
        logger.log_to_engine("go depth 1");
        logger.log_from_engine("bestmove e2e4");
        logger.log_event("child status was: exited with code 0");
    }

    std::string content = read_file(path);
    EXPECT_NE(content.find("[Alpha] Engine debug log started"), std::string::npos);
    EXPECT_NE(content.find("[TO Alpha]: go depth 1"), std::string::npos);
    EXPECT_NE(content.find("[FROM Alpha]: bestmove e2e4"), std::string::npos);
    EXPECT_NE(content.find("[Alpha] child status was: exited with code 0"), std::string::npos);
}

TEST_F(LoggerTest, FileNameUsesDirectoryAndSession) {
    std::filesystem::path expected = dir_ / "engine_debug_Beta_session7.log";
    EXPECT_EQ(Logger::file_name("Beta", 7), expected.string());
}

TEST_F(LoggerTest, DisabledLoggerCreatesNoFile) {
    LoggerConfig::set_enabled(false);
    {
        Logger logger("Gamma", 1);
        EXPECT_FALSE(logger.is_open());
        logger.log_to_engine("uci");
    }
    EXPECT_FALSE(std::filesystem::exists(Logger::file_name("Gamma", 1)));
}

TEST_F(LoggerTest, ToggleWhileOtherThreadsWrite) {
    LoggerConfig::set_enabled(true);
    Logger logger("Delta", 2);
    ASSERT_TRUE(logger.is_open());

    std::vector<std::thread> writers;
    for (int t = 0; t < 3; ++t) {
        writers.emplace_back([&logger, t] {
            for (int i = 0; i < 200; ++i) {
                logger.log_from_engine(std::format("info depth {} thread {}", i, t));
            }
        });
    }
    for (int i = 0; i < 200; ++i) {
        LoggerConfig::set_enabled(i % 2 == 0);
    }
    for (auto &writer : writers) {
        writer.join();
    }

    LoggerConfig::set_enabled(true);
    logger.log_event("done");
    EXPECT_NE(read_file(Logger::file_name("Delta", 2)).find("[Delta] done"), std::string::npos);
}

}  // namespace
