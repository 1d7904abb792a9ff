#pragma once

#include <spdlog/spdlog.h>

#include <chrono>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>

#include "metrics.hpp"
#include "types.hpp"

struct OutputConfig {
  std::string log_level = "info";
  int performance_summary_interval = 30;  // seconds

  bool enable_csv_logging = false;
  std::string csv_output_path = "output/frame_log.csv";
};

struct RunTotals {
  uint64_t total_ticks = 0;
  double total_tick_ms = 0.0;
  uint64_t callbacks_executed = 0;
  uint64_t callback_failures = 0;
  uint64_t low_mode_ticks = 0;

  std::chrono::steady_clock::time_point start_time;
  std::chrono::steady_clock::time_point last_summary;

  void reset() {
    total_ticks = 0;
    total_tick_ms = 0.0;
    callbacks_executed = 0;
    callback_failures = 0;
    low_mode_ticks = 0;
    start_time = std::chrono::steady_clock::now();
    last_summary = start_time;
  }

  double getAvgTickTime() const {
    return total_ticks > 0 ? total_tick_ms / static_cast<double>(total_ticks) : 0.0;
  }

  double getLowModeRate() const {
    return total_ticks > 0
               ? static_cast<double>(low_mode_ticks) / static_cast<double>(total_ticks) * 100.0
               : 0.0;
  }
};

// Applies the configured log level, writes one CSV row per tick, and logs
// periodic summaries of scheduler and compute behaviour.
class OutputManager {
public:
  explicit OutputManager(const OutputConfig& config);
  ~OutputManager();

  void recordTick(const FrameContext& ctx, const SchedulerStats& stats, double tick_ms);
  // Called about once per second with fresh compute stats.
  void recordCompute(const ComputeStats& stats);

  void logPerformanceSummary(bool force = false);
  void cleanup();

  std::optional<PerformanceTrend> computeTrend() const;
  RunTotals totals() const;

  void initializeCSV();
  void writeCSVHeader();
  void closeCSV();
  bool csvOpen() const { return csv_file_.is_open(); }

private:
  void writeCSVRow(const FrameContext& ctx, const SchedulerStats& stats, double tick_ms);

  OutputConfig config_;
  mutable std::mutex mu_;
  RunTotals totals_;
  SchedulerStats last_scheduler_;
  ComputeStats last_compute_;
  PerformanceHistory history_;

  std::ofstream csv_file_;
  bool cleaned_up_ = false;
};

// Maps "debug" | "info" | "warn" | "error" onto spdlog's global level.
// Unknown names leave the level unchanged and return false.
bool applyLogLevel(const std::string& level);
