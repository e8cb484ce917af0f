/* SPDX-FileCopyrightText: 2025 SR Losses Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/logger.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace srl::core;

namespace {

    class LoggerTest : public ::testing::Test {
    protected:
        void SetUp() override {
            log_path = std::filesystem::temp_directory_path() / "srl_logger_test.log";
            std::filesystem::remove(log_path);
            Logger::get().init(LogLevel::Info, log_path.string());
        }

        void TearDown() override {
            for (size_t i = 0; i < static_cast<size_t>(LogModule::Count); ++i) {
                Logger::get().enable_module(static_cast<LogModule>(i), true);
            }
            Logger::get().init(LogLevel::Warn);
            std::error_code ec;
            std::filesystem::remove(log_path, ec);
        }

        std::string read_log() const {
            Logger::get().flush();
            std::ifstream file(log_path);
            std::stringstream ss;
            ss << file.rdbuf();
            return ss.str();
        }

        std::filesystem::path log_path;
    };

} // namespace

TEST_F(LoggerTest, ModuleFollowsSourceDirectory) {
    EXPECT_EQ(module_of("/work/srl/src/losses/contextual/distance.cpp"), LogModule::Losses);
    EXPECT_EQ(module_of("/work/srl/src/losses/pixel_loss.cpp"), LogModule::Losses);
    EXPECT_EQ(module_of("/work/srl/src/features/torchscript_extractor.cpp"), LogModule::Features);
    EXPECT_EQ(module_of("/work/srl/src/core/parameters.cpp"), LogModule::Config);
    EXPECT_EQ(module_of("/work/srl/src/core/logger.cpp"), LogModule::Core);
    EXPECT_EQ(module_of("/work/srl/tests/test_pixel_losses.cpp"), LogModule::Other);
}

TEST_F(LoggerTest, WritesFormattedMessagesToFile) {
    LOG_INFO("pooled {} positions", 42);
    LOG_ERROR("band width {}", -0.5);

    const auto content = read_log();
    EXPECT_NE(content.find("[info] test_logger.cpp"), std::string::npos);
    EXPECT_NE(content.find("pooled 42 positions"), std::string::npos);
    EXPECT_NE(content.find("[error]"), std::string::npos);
    EXPECT_NE(content.find("band width -0.5"), std::string::npos);
}

TEST_F(LoggerTest, FiltersBelowLevel) {
    LOG_DEBUG("hidden debug message");
    Logger::get().set_level(LogLevel::Debug);
    EXPECT_EQ(Logger::get().level(), LogLevel::Debug);
    LOG_DEBUG("visible debug message");

    const auto content = read_log();
    EXPECT_EQ(content.find("hidden debug message"), std::string::npos);
    EXPECT_NE(content.find("visible debug message"), std::string::npos);
}

TEST_F(LoggerTest, PerformanceRanksBetweenInfoAndWarn) {
    LOG_PERF("timing at info");
    Logger::get().set_level(LogLevel::Warn);
    LOG_PERF("timing at warn");

    const auto content = read_log();
    EXPECT_NE(content.find("[perf] test_logger.cpp"), std::string::npos);
    EXPECT_NE(content.find("timing at info"), std::string::npos);
    EXPECT_EQ(content.find("timing at warn"), std::string::npos);
}

TEST_F(LoggerTest, MutedModuleIsSilent) {
    // Test sources belong to no library module
    Logger::get().enable_module(LogModule::Other, false);
    LOG_ERROR("silenced message");
    Logger::get().enable_module(LogModule::Other, true);
    LOG_ERROR("audible message");

    const auto content = read_log();
    EXPECT_EQ(content.find("silenced message"), std::string::npos);
    EXPECT_NE(content.find("audible message"), std::string::npos);
}

TEST_F(LoggerTest, ScopedTimerReportsDuration) {
    {
        LOG_TIMER("pooling");
        LOG_TIMER_TRACE("sampling");
    }

    const auto content = read_log();
    EXPECT_NE(content.find("pooling took"), std::string::npos);
    // Trace timers stay quiet at Info
    EXPECT_EQ(content.find("sampling took"), std::string::npos);
}
