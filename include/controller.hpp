#pragma once
#include "types.hpp"

struct ModeThresholds {
  double high_fps{55.0};
  double medium_fps{40.0};
  // Consecutive ticks a new classification must persist before it is
  // reported. 0 switches immediately.
  int hysteresis_ticks{0};
};

class ModeController {
public:
  explicit ModeController(ModeThresholds t = ModeThresholds{}) : t_(t) {}

  PerformanceMode classify(double fps) const;
  PerformanceMode update(double fps);
  PerformanceMode current() const { return current_; }
  const ModeThresholds& thresholds() const { return t_; }
  void reset();

private:
  ModeThresholds t_;
  PerformanceMode current_{PerformanceMode::HIGH};
  PerformanceMode pending_{PerformanceMode::HIGH};
  int pending_count_{0};
};
