#pragma once
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

class RollingHist {
public:
  explicit RollingHist(size_t cap = 512) : cap_(cap) {}
  void add(double x) {
    std::lock_guard<std::mutex> g(mu_);
    if (vals_.size() == cap_) vals_.pop_front();
    vals_.push_back(x);
  }
  // Percentile p in [0,100]
  double perc(double p) const {
    std::lock_guard<std::mutex> g(mu_);
    if (vals_.empty()) return 0.0;
    std::vector<double> v(vals_.begin(), vals_.end());
    std::sort(v.begin(), v.end());
    double rank = (p / 100.0) * static_cast<double>(v.size() - 1);
    size_t lo = static_cast<size_t>(rank);
    size_t hi = std::min(v.size() - 1, lo + 1);
    double frac = rank - static_cast<double>(lo);
    return v[lo] + (v[hi] - v[lo]) * frac;
  }
  // Oldest first.
  std::vector<double> values() const {
    std::lock_guard<std::mutex> g(mu_);
    return std::vector<double>(vals_.begin(), vals_.end());
  }
  size_t size() const {
    std::lock_guard<std::mutex> g(mu_);
    return vals_.size();
  }
  void clear() {
    std::lock_guard<std::mutex> g(mu_);
    vals_.clear();
  }

private:
  size_t cap_;
  mutable std::mutex mu_;
  std::deque<double> vals_;
};

// Frames-per-second over fixed measurement windows. Between window
// boundaries the previous window's value is reported unchanged.
class FrameRateTracker {
public:
  explicit FrameRateTracker(std::chrono::milliseconds window = std::chrono::milliseconds(1000),
                            double initial_fps = 60.0);

  void record_frame(TimePoint now);
  double current_fps() const { return average_fps_; }
  uint64_t frames_in_window() const { return frame_count_; }
  void reset();

private:
  std::chrono::milliseconds window_;
  double initial_fps_;
  double average_fps_;
  uint64_t frame_count_{0};
  bool started_{false};
  TimePoint window_start_{};
};

enum class ComputeOp { PACK_MEMORY_LAYOUT, OPTIMIZE_GEOMETRY, COMPOSE_TRANSFORMS, INTERPOLATE_PATHS };
enum class ServedBy { ACCELERATED, REFERENCE };

const char* op_name(ComputeOp op);

struct OperationRecord {
  ComputeOp kind{ComputeOp::PACK_MEMORY_LAYOUT};
  ServedBy served_by{ServedBy::REFERENCE};
  TimePoint timestamp{};
  double duration_ms{0};
};

// Recent compute invocations, kept only long enough to derive rates.
class OperationLog {
public:
  OperationLog(std::chrono::milliseconds rate_window, std::chrono::milliseconds retention);

  void record(const OperationRecord& r);
  double operations_per_second(TimePoint now);
  double average_duration_ms(TimePoint now);
  size_t size() const;
  void clear();

private:
  void purge_locked(TimePoint now);

  std::chrono::milliseconds rate_window_;
  std::chrono::milliseconds retention_;
  mutable std::mutex mu_;
  std::deque<OperationRecord> ops_;
};

struct SchedulerStats {
  double average_fps{0};
  PerformanceMode mode{PerformanceMode::HIGH};
  bool mode_forced{false};
  size_t active_callbacks{0};
  size_t total_callbacks{0};
  size_t executed_last_tick{0};
  size_t failed_last_tick{0};
  uint64_t ticks_total{0};
  uint64_t callback_failures_total{0};
  double tick_p50_ms{0}, tick_p95_ms{0}, tick_p99_ms{0};
};

struct ComputeStats {
  bool ready{false};
  bool accelerated_available{false};
  std::string backend{"none"};
  double operations_per_second{0};
  double average_operation_ms{0};
  size_t recorded_operations{0};
  uint64_t accelerated_calls{0};
  uint64_t reference_calls{0};
  uint64_t fallbacks{0};
  uint64_t failures{0};
  uint64_t not_ready_calls{0};
};

struct PerformanceTrend {
  std::string direction;  // "improving" | "declining" | "stable"
  double change_pct{0};
};

// Once-per-second samples of compute throughput.
class PerformanceHistory {
public:
  explicit PerformanceHistory(size_t cap = 60) : samples_(cap) {}
  void add(const ComputeStats& s) { samples_.add(s.operations_per_second); }
  size_t size() const { return samples_.size(); }
  std::optional<PerformanceTrend> trend() const;

private:
  RollingHist samples_;
};

std::string prometheus_text(const SchedulerStats& s, const ComputeStats& c);
