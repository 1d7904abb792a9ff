#include "metrics.hpp"

#include <numeric>
#include <sstream>
#include <stdexcept>

FrameRateTracker::FrameRateTracker(std::chrono::milliseconds window, double initial_fps)
    : window_(window), initial_fps_(initial_fps), average_fps_(initial_fps) {
  if (window_.count() <= 0) {
    throw std::invalid_argument("frame rate window must be positive");
  }
}

void FrameRateTracker::record_frame(TimePoint now) {
  frame_count_++;
  if (!started_) {
    started_ = true;
    window_start_ = now;
    return;
  }

  if (now - window_start_ >= window_) {
    const double elapsed_ms =
        std::chrono::duration<double, std::milli>(now - window_start_).count();
    average_fps_ = static_cast<double>(frame_count_) * 1000.0 / elapsed_ms;
    frame_count_ = 0;
    window_start_ = now;
  }
}

void FrameRateTracker::reset() {
  average_fps_ = initial_fps_;
  frame_count_ = 0;
  started_ = false;
  window_start_ = TimePoint{};
}

const char* op_name(ComputeOp op) {
  switch (op) {
    case ComputeOp::PACK_MEMORY_LAYOUT:
      return "pack_memory_layout";
    case ComputeOp::OPTIMIZE_GEOMETRY:
      return "optimize_geometry";
    case ComputeOp::COMPOSE_TRANSFORMS:
      return "batch_compose_transforms";
    case ComputeOp::INTERPOLATE_PATHS:
      return "interpolate_paths";
  }
  return "unknown";
}

OperationLog::OperationLog(std::chrono::milliseconds rate_window,
                           std::chrono::milliseconds retention)
    : rate_window_(rate_window), retention_(std::max(rate_window, retention)) {
  if (rate_window_.count() <= 0) {
    throw std::invalid_argument("operation rate window must be positive");
  }
}

void OperationLog::record(const OperationRecord& r) {
  std::lock_guard<std::mutex> g(mu_);
  ops_.push_back(r);
  purge_locked(r.timestamp);
}

double OperationLog::operations_per_second(TimePoint now) {
  std::lock_guard<std::mutex> g(mu_);
  purge_locked(now);
  const auto recent = std::count_if(ops_.begin(), ops_.end(), [&](const OperationRecord& op) {
    return now - op.timestamp < rate_window_;
  });
  const double window_secs = std::chrono::duration<double>(rate_window_).count();
  return static_cast<double>(recent) / window_secs;
}

double OperationLog::average_duration_ms(TimePoint now) {
  std::lock_guard<std::mutex> g(mu_);
  purge_locked(now);
  if (ops_.empty()) return 0.0;
  const double total = std::accumulate(
      ops_.begin(), ops_.end(), 0.0,
      [](double sum, const OperationRecord& op) { return sum + op.duration_ms; });
  return total / static_cast<double>(ops_.size());
}

size_t OperationLog::size() const {
  std::lock_guard<std::mutex> g(mu_);
  return ops_.size();
}

void OperationLog::clear() {
  std::lock_guard<std::mutex> g(mu_);
  ops_.clear();
}

void OperationLog::purge_locked(TimePoint now) {
  while (!ops_.empty() && now - ops_.front().timestamp >= retention_) {
    ops_.pop_front();
  }
}

std::optional<PerformanceTrend> PerformanceHistory::trend() const {
  const std::vector<double> v = samples_.values();
  if (v.size() < 2) return std::nullopt;

  const size_t recent_n = std::min<size_t>(10, v.size());
  const size_t older_end = v.size() - recent_n;
  const size_t older_begin = older_end > 10 ? older_end - 10 : 0;
  if (older_end == older_begin) return std::nullopt;

  const double recent_avg =
      std::accumulate(v.begin() + older_end, v.end(), 0.0) / static_cast<double>(recent_n);
  const double older_avg = std::accumulate(v.begin() + older_begin, v.begin() + older_end, 0.0) /
                           static_cast<double>(older_end - older_begin);

  PerformanceTrend t;
  if (recent_avg > older_avg) {
    t.direction = "improving";
  } else if (recent_avg < older_avg) {
    t.direction = "declining";
  } else {
    t.direction = "stable";
  }
  t.change_pct = older_avg > 0 ? (recent_avg - older_avg) / older_avg * 100.0 : 0.0;
  return t;
}

std::string prometheus_text(const SchedulerStats& s, const ComputeStats& c) {
  std::ostringstream os;
  os << "framepace_average_fps " << s.average_fps << "\n";
  os << "framepace_performance_mode{mode=\"" << mode_name(s.mode) << "\"} 1\n";
  os << "framepace_callbacks_active " << s.active_callbacks << "\n";
  os << "framepace_callbacks_total " << s.total_callbacks << "\n";
  os << "framepace_callbacks_executed_last_tick " << s.executed_last_tick << "\n";
  os << "framepace_ticks_total " << s.ticks_total << "\n";
  os << "framepace_callback_failures_total " << s.callback_failures_total << "\n";

  os << "framepace_tick_ms{quantile=\"0.5\"} " << s.tick_p50_ms << "\n";
  os << "framepace_tick_ms{quantile=\"0.95\"} " << s.tick_p95_ms << "\n";
  os << "framepace_tick_ms{quantile=\"0.99\"} " << s.tick_p99_ms << "\n";

  os << "framepace_compute_operations_per_second " << c.operations_per_second << "\n";
  os << "framepace_compute_accelerated_available " << (c.accelerated_available ? 1 : 0) << "\n";
  os << "framepace_compute_calls_total{backend=\"accelerated\"} " << c.accelerated_calls << "\n";
  os << "framepace_compute_calls_total{backend=\"reference\"} " << c.reference_calls << "\n";
  os << "framepace_compute_fallbacks_total " << c.fallbacks << "\n";
  os << "framepace_compute_failures_total " << c.failures << "\n";
  return os.str();
}
