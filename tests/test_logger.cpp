/* SPDX-FileCopyrightText: 2025 Marionette Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/logger.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <thread>
#include <vector>

using namespace mrn::core;

class LoggerTest : public ::testing::Test {
protected:
    void TearDown() override {
        Logger::get().init(LogLevel::Info);
    }
};

TEST_F(LoggerTest, LevelFiltering) {
    Logger& logger = Logger::get();
    logger.setLevel(LogLevel::Warn);

    EXPECT_EQ(logger.level(), LogLevel::Warn);
    EXPECT_FALSE(logger.shouldLog(LogLevel::Debug));
    EXPECT_TRUE(logger.shouldLog(LogLevel::Warn));
    EXPECT_TRUE(logger.shouldLog(LogLevel::Critical));
}

TEST_F(LoggerTest, OffSilencesEverything) {
    Logger& logger = Logger::get();
    logger.setLevel(LogLevel::Off);
    EXPECT_FALSE(logger.shouldLog(LogLevel::Critical));
}

TEST_F(LoggerTest, LevelChangesWhileOtherThreadsLog) {
    Logger& logger = Logger::get();
    logger.setLevel(LogLevel::Off);

    std::vector<std::thread> readers;
    for (int t = 0; t < 4; ++t) {
        readers.emplace_back([&logger] {
            for (int i = 0; i < 1000; ++i) {
                LOG_TRACE("trace message {}", i);
                static_cast<void>(logger.shouldLog(LogLevel::Warn));
            }
        });
    }
    for (int i = 0; i < 1000; ++i) {
        logger.setLevel(i % 2 == 0 ? LogLevel::Off : LogLevel::Critical);
    }
    for (auto& reader : readers) {
        reader.join();
    }

    logger.setLevel(LogLevel::Error);
    EXPECT_EQ(logger.level(), LogLevel::Error);
    EXPECT_TRUE(logger.shouldLog(LogLevel::Critical));
}

TEST_F(LoggerTest, WritesToFileSink) {
    const auto path = std::filesystem::temp_directory_path() / "mrn_logger_test.log";
    std::filesystem::remove(path);

    Logger::get().init(LogLevel::Debug, path.string());
    LOG_INFO("curve {} bound", "ParamAngleX");
    {
        LOG_TIMER("scoped");
    }
    Logger::get().flush();

    std::ifstream in(path);
    const std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_NE(contents.find("curve ParamAngleX bound"), std::string::npos);
    EXPECT_NE(contents.find("scoped took"), std::string::npos);

    Logger::get().init(LogLevel::Info);
    std::filesystem::remove(path);
}
