#include "render_loop.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>

using namespace std::chrono;

RenderLoop::RenderLoop(LoopConfig cfg, FrameScheduler& scheduler, ComputeFacade& compute,
                       OutputManager* output)
    : cfg_(cfg), scheduler_(scheduler), compute_(compute), output_(output) {}

RenderLoop::~RenderLoop() { stop(); }

void RenderLoop::start() {
  std::lock_guard<std::mutex> g(thread_mu_);
  if (running_.exchange(true)) return;
  loop_thread_ = std::thread([this] {
    spdlog::info("Render loop started (target {} fps, synthetic load {:.1f}ms)", cfg_.target_fps,
                 cfg_.synthetic_load_ms);
    while (running_) {
      const auto t0 = Clock::now();
      step();
      pace(t0);
    }
    spdlog::info("Render loop stopped after {} frames", frame_id_.load());
  });
}

void RenderLoop::stop() {
  std::lock_guard<std::mutex> g(thread_mu_);
  if (!running_.exchange(false)) return;
  if (loop_thread_.joinable()) loop_thread_.join();
}

void RenderLoop::run_frames(uint64_t frames) {
  for (uint64_t i = 0; i < frames; ++i) {
    const auto t0 = Clock::now();
    step();
    pace(t0);
  }
}

void RenderLoop::step() {
  const auto now = Clock::now();
  const Seconds dt = has_last_frame_ ? Seconds(now - last_frame_)
                                     : Seconds(1.0 / std::max(1, cfg_.target_fps));
  if (!has_last_frame_) last_sample_ = now;
  last_frame_ = now;
  has_last_frame_ = true;

  // Busy wait so the measured frame rate reflects the load.
  if (cfg_.synthetic_load_ms > 0) {
    const auto until = now + duration_cast<Clock::duration>(
                                 duration<double, std::milli>(cfg_.synthetic_load_ms));
    while (Clock::now() < until) {
    }
  }

  FrameContext ctx;
  ctx.frame_id = frame_id_.load() + 1;
  ctx.frame_time = now;

  const auto t0 = Clock::now();
  scheduler_.tick(ctx, dt);
  const double tick_ms = duration<double, std::milli>(Clock::now() - t0).count();
  frame_id_.store(ctx.frame_id);

  if (output_) {
    output_->recordTick(ctx, scheduler_.stats(), tick_ms);
    if (Clock::now() - last_sample_ >= seconds(1)) {
      output_->recordCompute(compute_.stats());
      last_sample_ = Clock::now();
    }
  }
}

void RenderLoop::pace(TimePoint frame_start) const {
  if (cfg_.target_fps <= 0) return;
  const auto period = duration_cast<Clock::duration>(duration<double>(1.0 / cfg_.target_fps));
  const auto next = frame_start + period;
  if (Clock::now() < next) std::this_thread::sleep_until(next);
}
