#include <gtest/gtest.h>
#include <fstream>
#include <filesystem>
#include <sstream>
#include "output_manager.hpp"

class OutputConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        config = OutputConfig{};
    }

    OutputConfig config;
};

TEST_F(OutputConfigTest, DefaultValues) {
    EXPECT_EQ(config.log_level, "info");
    EXPECT_EQ(config.performance_summary_interval, 30);
    EXPECT_FALSE(config.enable_csv_logging);
    EXPECT_EQ(config.csv_output_path, "output/frame_log.csv");
}

TEST(LogLevelTest, KnownLevelsApply) {
    EXPECT_TRUE(applyLogLevel("debug"));
    EXPECT_EQ(spdlog::get_level(), spdlog::level::debug);
    EXPECT_TRUE(applyLogLevel("error"));
    EXPECT_EQ(spdlog::get_level(), spdlog::level::err);
    EXPECT_TRUE(applyLogLevel("info"));
    EXPECT_EQ(spdlog::get_level(), spdlog::level::info);
}

TEST(LogLevelTest, UnknownLevelLeavesLevelAlone) {
    applyLogLevel("warn");
    EXPECT_FALSE(applyLogLevel("verbose"));
    EXPECT_EQ(spdlog::get_level(), spdlog::level::warn);
    applyLogLevel("info");
}

class OutputManagerCSVTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() / "framepace_output_tests";
        std::filesystem::remove_all(test_dir);

        config.enable_csv_logging = true;
        config.csv_output_path = (test_dir / "nested" / "ticks.csv").string();
        config.performance_summary_interval = 3600;
    }

    void TearDown() override {
        if (std::filesystem::exists(test_dir)) {
            std::filesystem::remove_all(test_dir);
        }
    }

    std::vector<std::string> readLines() {
        std::ifstream in(config.csv_output_path);
        std::vector<std::string> lines;
        std::string line;
        while (std::getline(in, line)) lines.push_back(line);
        return lines;
    }

    std::filesystem::path test_dir;
    OutputConfig config;
};

TEST_F(OutputManagerCSVTest, CreatesDirectoryAndHeader) {
    OutputManager manager(config);
    EXPECT_TRUE(manager.csvOpen());
    EXPECT_TRUE(std::filesystem::exists(test_dir / "nested"));

    manager.closeCSV();
    auto lines = readLines();
    ASSERT_EQ(lines.size(), 1);
    EXPECT_EQ(lines[0],
              "frame_id,tick_ms,average_fps,mode,mode_forced,executed_callbacks,"
              "failed_callbacks,active_callbacks,total_callbacks");
}

TEST_F(OutputManagerCSVTest, WritesOneRowPerTick) {
    {
        OutputManager manager(config);

        SchedulerStats s;
        s.average_fps = 58.25;
        s.mode = PerformanceMode::HIGH;
        s.executed_last_tick = 5;
        s.active_callbacks = 5;
        s.total_callbacks = 6;

        FrameContext ctx;
        ctx.frame_id = 1;
        manager.recordTick(ctx, s, 1.5);

        s.mode = PerformanceMode::LOW;
        s.mode_forced = true;
        s.executed_last_tick = 1;
        s.failed_last_tick = 1;
        ctx.frame_id = 2;
        manager.recordTick(ctx, s, 0.25);

        auto totals = manager.totals();
        EXPECT_EQ(totals.total_ticks, 2);
        EXPECT_EQ(totals.callbacks_executed, 6);
        EXPECT_EQ(totals.callback_failures, 1);
        EXPECT_EQ(totals.low_mode_ticks, 1);
        EXPECT_DOUBLE_EQ(totals.getAvgTickTime(), 0.875);
        EXPECT_DOUBLE_EQ(totals.getLowModeRate(), 50.0);
    }

    auto lines = readLines();
    ASSERT_EQ(lines.size(), 3);
    EXPECT_EQ(lines[1], "1,1.500,58.25,high,0,5,0,5,6");
    EXPECT_EQ(lines[2], "2,0.250,58.25,low,1,1,1,5,6");
}

TEST_F(OutputManagerCSVTest, DisabledLoggingWritesNothing) {
    config.enable_csv_logging = false;
    {
        OutputManager manager(config);
        EXPECT_FALSE(manager.csvOpen());
        manager.recordTick(FrameContext{}, SchedulerStats{}, 1.0);
    }
    EXPECT_FALSE(std::filesystem::exists(config.csv_output_path));
}

TEST(OutputManagerTrendTest, TrendFromComputeSamples) {
    OutputManager manager(OutputConfig{});
    EXPECT_FALSE(manager.computeTrend().has_value());

    for (int i = 0; i < 20; ++i) {
        ComputeStats c;
        c.operations_per_second = i < 10 ? 100.0 : 50.0;
        manager.recordCompute(c);
    }

    auto trend = manager.computeTrend();
    ASSERT_TRUE(trend.has_value());
    EXPECT_EQ(trend->direction, "declining");
    EXPECT_DOUBLE_EQ(trend->change_pct, -50.0);
}

TEST(OutputManagerTrendTest, CleanupIsIdempotent) {
    OutputManager manager(OutputConfig{});
    EXPECT_NO_THROW(manager.cleanup());
    EXPECT_NO_THROW(manager.cleanup());
}
