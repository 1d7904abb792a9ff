#include "output_manager.hpp"

#include <filesystem>
#include <iomanip>

bool applyLogLevel(const std::string& level) {
  if (level == "debug") {
    spdlog::set_level(spdlog::level::debug);
  } else if (level == "info") {
    spdlog::set_level(spdlog::level::info);
  } else if (level == "warn") {
    spdlog::set_level(spdlog::level::warn);
  } else if (level == "error") {
    spdlog::set_level(spdlog::level::err);
  } else {
    return false;
  }
  return true;
}

OutputManager::OutputManager(const OutputConfig& config) : config_(config) {
  if (!applyLogLevel(config_.log_level)) {
    spdlog::warn("Unknown log level '{}', keeping current level", config_.log_level);
  }

  totals_.reset();

  if (config_.enable_csv_logging) {
    initializeCSV();
  }
}

OutputManager::~OutputManager() { cleanup(); }

void OutputManager::cleanup() {
  {
    std::lock_guard<std::mutex> g(mu_);
    if (cleaned_up_) return;
    cleaned_up_ = true;
  }
  closeCSV();
  logPerformanceSummary(true);
}

void OutputManager::recordTick(const FrameContext& ctx, const SchedulerStats& stats,
                               double tick_ms) {
  {
    std::lock_guard<std::mutex> g(mu_);
    totals_.total_ticks++;
    totals_.total_tick_ms += tick_ms;
    totals_.callbacks_executed += stats.executed_last_tick;
    totals_.callback_failures += stats.failed_last_tick;
    if (stats.mode == PerformanceMode::LOW) totals_.low_mode_ticks++;
    last_scheduler_ = stats;

    if (config_.enable_csv_logging) {
      writeCSVRow(ctx, stats, tick_ms);
    }
  }

  if (stats.failed_last_tick > 0) {
    spdlog::debug("Frame {}: {} callback(s) failed", ctx.frame_id, stats.failed_last_tick);
  }

  logPerformanceSummary();
}

void OutputManager::recordCompute(const ComputeStats& stats) {
  std::lock_guard<std::mutex> g(mu_);
  last_compute_ = stats;
  history_.add(stats);
}

std::optional<PerformanceTrend> OutputManager::computeTrend() const {
  std::lock_guard<std::mutex> g(mu_);
  return history_.trend();
}

RunTotals OutputManager::totals() const {
  std::lock_guard<std::mutex> g(mu_);
  return totals_;
}

void OutputManager::logPerformanceSummary(bool force) {
  std::lock_guard<std::mutex> g(mu_);
  auto now = std::chrono::steady_clock::now();
  auto duration = std::chrono::duration_cast<std::chrono::seconds>(now - totals_.last_summary);

  if (!force && duration.count() < config_.performance_summary_interval) {
    return;
  }

  spdlog::info("=== PERFORMANCE SUMMARY ===");
  spdlog::info("Ticks: {}", totals_.total_ticks);
  spdlog::info("Average FPS: {:.1f} (mode: {}{})", last_scheduler_.average_fps,
               mode_name(last_scheduler_.mode), last_scheduler_.mode_forced ? ", forced" : "");
  spdlog::info("Average tick time: {:.3f}ms (p95 {:.3f}ms)", totals_.getAvgTickTime(),
               last_scheduler_.tick_p95_ms);
  spdlog::info("Callbacks: {}/{} active, {} executed, {} failed", last_scheduler_.active_callbacks,
               last_scheduler_.total_callbacks, totals_.callbacks_executed,
               totals_.callback_failures);
  spdlog::info("Low mode: {:.2f}% of ticks", totals_.getLowModeRate());
  spdlog::info("Compute: {} backend, {:.1f} ops/s, {:.3f}ms avg, {} fallbacks, {} failures",
               last_compute_.backend, last_compute_.operations_per_second,
               last_compute_.average_operation_ms, last_compute_.fallbacks,
               last_compute_.failures);

  if (auto trend = history_.trend()) {
    spdlog::info("Compute throughput {} ({:+.1f}%)", trend->direction, trend->change_pct);
  }

  totals_.last_summary = now;
}

void OutputManager::initializeCSV() {
  if (!config_.enable_csv_logging) return;

  std::filesystem::path csv_path(config_.csv_output_path);
  std::filesystem::path directory = csv_path.parent_path();

  if (!directory.empty() && !std::filesystem::exists(directory)) {
    std::filesystem::create_directories(directory);
    spdlog::info("Created CSV output directory: {}", directory.string());
  }

  csv_file_.open(config_.csv_output_path, std::ios::out | std::ios::trunc);
  if (!csv_file_.is_open()) {
    spdlog::error("Failed to open CSV file for writing: {}", config_.csv_output_path);
    return;
  }

  writeCSVHeader();
  spdlog::info("CSV logging initialized: {}", config_.csv_output_path);
}

void OutputManager::writeCSVHeader() {
  if (!csv_file_.is_open()) return;
  csv_file_ << "frame_id,tick_ms,average_fps,mode,mode_forced,executed_callbacks,"
            << "failed_callbacks,active_callbacks,total_callbacks\n";
  csv_file_.flush();
}

void OutputManager::writeCSVRow(const FrameContext& ctx, const SchedulerStats& stats,
                                double tick_ms) {
  if (!csv_file_.is_open()) return;

  csv_file_ << ctx.frame_id << "," << std::fixed << std::setprecision(3) << tick_ms << ","
            << std::setprecision(2) << stats.average_fps << "," << mode_name(stats.mode) << ","
            << (stats.mode_forced ? 1 : 0) << "," << stats.executed_last_tick << ","
            << stats.failed_last_tick << "," << stats.active_callbacks << ","
            << stats.total_callbacks << "\n";
  csv_file_.flush();
}

void OutputManager::closeCSV() {
  std::lock_guard<std::mutex> g(mu_);
  if (csv_file_.is_open()) {
    csv_file_.close();
    spdlog::info("CSV logging completed: {}", config_.csv_output_path);
  }
}
