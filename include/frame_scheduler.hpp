#pragma once
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "callback_registry.hpp"
#include "controller.hpp"
#include "metrics.hpp"
#include "types.hpp"

struct SchedulerConfig {
  int window_ms{1000};
  double initial_fps{60.0};
  ModeThresholds mode;
};

struct CallbackInfo {
  std::string id;
  int priority{0};
  bool enabled{true};
  uint64_t failures{0};
};

struct SchedulerDebugInfo {
  SchedulerStats stats;
  std::vector<CallbackInfo> callbacks;
};

// Runs the registered per-frame callbacks once per rendered frame, dropping
// low-priority work while the measured frame rate is poor. Safe to call from
// several threads; callbacks run without the lock held, so they may register
// or unregister callbacks themselves. unregister_callback() and clear() from
// any other thread block until the affected callbacks are no longer running.
class FrameScheduler {
public:
  explicit FrameScheduler(SchedulerConfig cfg = SchedulerConfig{}, ClockFn clock = Clock::now);

  void register_callback(const std::string& id, FrameCallbackFn fn, int priority = 0);
  void unregister_callback(const std::string& id);
  void set_enabled(const std::string& id, bool enabled);
  void set_priority(const std::string& id, int priority);

  void tick(const FrameContext& ctx, Seconds dt);

  // Pins the mode regardless of the measured frame rate.
  void force_mode(PerformanceMode mode);
  void clear_forced_mode();
  std::optional<PerformanceMode> forced_mode() const;

  SchedulerStats stats() const;
  SchedulerDebugInfo debug_info() const;
  void clear();

  // Admissible subset of an already ordered, enabled-only snapshot.
  static std::vector<FrameCallback> select_for_mode(std::vector<FrameCallback> entries,
                                                    PerformanceMode mode);

private:
  SchedulerStats stats_locked() const;
  bool running_elsewhere(const std::string* id) const;
  void wait_until_idle(std::unique_lock<std::mutex>& lk, const std::string* id);

  SchedulerConfig cfg_;
  ClockFn clock_;

  mutable std::mutex mu_;
  std::condition_variable idle_cv_;
  std::vector<std::pair<std::thread::id, std::string>> in_flight_;
  CallbackRegistry registry_;
  FrameRateTracker tracker_;
  ModeController controller_;
  std::optional<PerformanceMode> forced_;
  PerformanceMode mode_{PerformanceMode::HIGH};

  uint64_t ticks_total_{0};
  uint64_t failures_total_{0};
  size_t executed_last_{0};
  size_t failed_last_{0};
  RollingHist tick_ms_{512};
};
