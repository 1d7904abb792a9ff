#include "frame_scheduler.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>

namespace {

bool run_guarded(const FrameCallback& cb, const FrameContext& ctx, Seconds dt) {
  try {
    CallbackResult r = (*cb.fn)(ctx, dt);
    if (!r.ok) {
      spdlog::warn("Frame callback '{}' failed: {}", cb.id, r.error);
      return false;
    }
    return true;
  } catch (const std::exception& e) {
    spdlog::warn("Frame callback '{}' threw: {}", cb.id, e.what());
    return false;
  } catch (...) {
    spdlog::warn("Frame callback '{}' threw a non-standard exception", cb.id);
    return false;
  }
}

}  // namespace

FrameScheduler::FrameScheduler(SchedulerConfig cfg, ClockFn clock)
    : cfg_(cfg),
      clock_(clock ? std::move(clock) : ClockFn(Clock::now)),
      tracker_(std::chrono::milliseconds(cfg.window_ms), cfg.initial_fps),
      controller_(cfg.mode) {}

void FrameScheduler::register_callback(const std::string& id, FrameCallbackFn fn,
                                       int priority) {
  std::lock_guard<std::mutex> g(mu_);
  registry_.register_callback(id, std::move(fn), priority);
  spdlog::debug("Registered frame callback '{}' (priority {})", id, priority);
}

void FrameScheduler::unregister_callback(const std::string& id) {
  std::unique_lock<std::mutex> lk(mu_);
  registry_.unregister_callback(id);
  wait_until_idle(lk, &id);
}

void FrameScheduler::set_enabled(const std::string& id, bool enabled) {
  std::lock_guard<std::mutex> g(mu_);
  registry_.set_enabled(id, enabled);
}

void FrameScheduler::set_priority(const std::string& id, int priority) {
  std::lock_guard<std::mutex> g(mu_);
  registry_.set_priority(id, priority);
}

void FrameScheduler::tick(const FrameContext& ctx, Seconds dt) {
  std::vector<FrameCallback> selected;
  {
    std::lock_guard<std::mutex> g(mu_);
    tracker_.record_frame(clock_());
    const PerformanceMode measured = controller_.update(tracker_.current_fps());
    const PerformanceMode mode = forced_ ? *forced_ : measured;
    if (mode != mode_) {
      spdlog::info("Performance mode {} -> {} (fps {:.1f})", mode_name(mode_), mode_name(mode),
                   tracker_.current_fps());
      mode_ = mode;
    }
    selected = select_for_mode(registry_.snapshot(), mode_);
  }

  const auto self = std::this_thread::get_id();
  const auto t0 = Clock::now();
  std::vector<std::string> failed;
  size_t executed = 0;
  for (const auto& cb : selected) {
    {
      std::lock_guard<std::mutex> g(mu_);
      // Unregistered since the snapshot was taken.
      if (!registry_.contains(cb.id)) continue;
      in_flight_.emplace_back(self, cb.id);
    }
    executed++;
    const bool ok = run_guarded(cb, ctx, dt);
    {
      std::lock_guard<std::mutex> g(mu_);
      auto it = std::find(in_flight_.begin(), in_flight_.end(), std::make_pair(self, cb.id));
      if (it != in_flight_.end()) in_flight_.erase(it);
    }
    idle_cv_.notify_all();
    if (!ok) failed.push_back(cb.id);
  }
  const double tick_ms = std::chrono::duration<double, std::milli>(Clock::now() - t0).count();

  std::lock_guard<std::mutex> g(mu_);
  tick_ms_.add(tick_ms);
  ticks_total_++;
  executed_last_ = executed;
  failed_last_ = failed.size();
  failures_total_ += failed.size();
  for (const auto& id : failed) registry_.note_failure(id);
}

std::vector<FrameCallback> FrameScheduler::select_for_mode(std::vector<FrameCallback> entries,
                                                           PerformanceMode mode) {
  switch (mode) {
    case PerformanceMode::HIGH:
      break;
    case PerformanceMode::MEDIUM:
      entries.erase(std::remove_if(entries.begin(), entries.end(),
                                   [](const FrameCallback& cb) { return cb.priority < 0; }),
                    entries.end());
      break;
    case PerformanceMode::LOW: {
      entries.erase(std::remove_if(entries.begin(), entries.end(),
                                   [](const FrameCallback& cb) { return cb.priority <= 0; }),
                    entries.end());
      // Top half of what is left, never fewer than one.
      const size_t keep = std::max<size_t>(1, entries.size() / 2);
      if (entries.size() > keep) entries.erase(entries.begin() + keep, entries.end());
      break;
    }
  }
  return entries;
}

void FrameScheduler::force_mode(PerformanceMode mode) {
  std::lock_guard<std::mutex> g(mu_);
  forced_ = mode;
  mode_ = mode;
  spdlog::info("Performance mode forced to {}", mode_name(mode));
}

void FrameScheduler::clear_forced_mode() {
  std::lock_guard<std::mutex> g(mu_);
  if (!forced_) return;
  forced_.reset();
  mode_ = controller_.current();
  spdlog::info("Performance mode override cleared ({})", mode_name(mode_));
}

std::optional<PerformanceMode> FrameScheduler::forced_mode() const {
  std::lock_guard<std::mutex> g(mu_);
  return forced_;
}

SchedulerStats FrameScheduler::stats() const {
  std::lock_guard<std::mutex> g(mu_);
  return stats_locked();
}

SchedulerDebugInfo FrameScheduler::debug_info() const {
  std::lock_guard<std::mutex> g(mu_);
  SchedulerDebugInfo info;
  info.stats = stats_locked();
  for (const auto& cb : registry_.entries()) {
    info.callbacks.push_back({cb.id, cb.priority, cb.enabled, cb.failures});
  }
  return info;
}

void FrameScheduler::clear() {
  std::unique_lock<std::mutex> lk(mu_);
  registry_.clear();
  wait_until_idle(lk, nullptr);
  tracker_.reset();
  controller_.reset();
  mode_ = forced_ ? *forced_ : PerformanceMode::HIGH;
  ticks_total_ = 0;
  failures_total_ = 0;
  executed_last_ = 0;
  failed_last_ = 0;
  tick_ms_.clear();
}

SchedulerStats FrameScheduler::stats_locked() const {
  SchedulerStats s;
  s.average_fps = tracker_.current_fps();
  s.mode = mode_;
  s.mode_forced = forced_.has_value();
  s.active_callbacks = registry_.enabled_count();
  s.total_callbacks = registry_.size();
  s.executed_last_tick = executed_last_;
  s.failed_last_tick = failed_last_;
  s.ticks_total = ticks_total_;
  s.callback_failures_total = failures_total_;
  s.tick_p50_ms = tick_ms_.perc(50);
  s.tick_p95_ms = tick_ms_.perc(95);
  s.tick_p99_ms = tick_ms_.perc(99);
  return s;
}

// True when `id` (or, with nullptr, any callback) is running on a thread
// other than the caller's.
bool FrameScheduler::running_elsewhere(const std::string* id) const {
  const auto self = std::this_thread::get_id();
  return std::any_of(in_flight_.begin(), in_flight_.end(), [&](const auto& f) {
    return f.first != self && (id == nullptr || f.second == *id);
  });
}

void FrameScheduler::wait_until_idle(std::unique_lock<std::mutex>& lk, const std::string* id) {
  idle_cv_.wait(lk, [&] { return !running_elsewhere(id); });
}
