#pragma once
#include <atomic>
#include <cstdint>
#include <mutex>
#include <thread>

#include "compute_facade.hpp"
#include "frame_scheduler.hpp"
#include "output_manager.hpp"
#include "types.hpp"

struct LoopConfig {
  int target_fps{60};  // 0 runs unpaced
  double synthetic_load_ms{0.0};
  int pointer_count{8};
  int block_count{64};
};

// Stands in for the host render loop: ticks the scheduler once per frame,
// burns `synthetic_load_ms` of CPU to mimic render cost, and samples compute
// stats into the output manager once per second.
class RenderLoop {
public:
  RenderLoop(LoopConfig cfg, FrameScheduler& scheduler, ComputeFacade& compute,
             OutputManager* output = nullptr);
  ~RenderLoop();

  // Start ticking in a background thread. start() and stop() may be called
  // concurrently from several threads.
  void start();
  void stop();  // Stop and join thread
  bool running() const { return running_.load(); }

  // Runs `frames` frames on the calling thread. Must not be mixed with start().
  void run_frames(uint64_t frames);
  uint64_t frames_rendered() const { return frame_id_.load(); }

private:
  void step();
  void pace(TimePoint frame_start) const;

  LoopConfig cfg_;
  FrameScheduler& scheduler_;
  ComputeFacade& compute_;
  OutputManager* output_;

  std::atomic<uint64_t> frame_id_{0};
  TimePoint last_frame_{};
  TimePoint last_sample_{};
  bool has_last_frame_{false};

  std::mutex thread_mu_;  // guards loop_thread_
  std::atomic<bool> running_{false};
  std::thread loop_thread_;
};
