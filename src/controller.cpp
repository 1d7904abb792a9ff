#include "controller.hpp"

PerformanceMode ModeController::classify(double fps) const {
  if (fps >= t_.high_fps) return PerformanceMode::HIGH;
  if (fps >= t_.medium_fps) return PerformanceMode::MEDIUM;
  return PerformanceMode::LOW;
}

PerformanceMode ModeController::update(double fps) {
  const PerformanceMode observed = classify(fps);
  if (t_.hysteresis_ticks <= 0) {
    current_ = observed;
    return current_;
  }

  if (observed == current_) {
    pending_count_ = 0;
    return current_;
  }

  if (observed != pending_) {
    pending_ = observed;
    pending_count_ = 0;
  }

  if (++pending_count_ >= t_.hysteresis_ticks) {
    current_ = observed;
    pending_count_ = 0;
  }
  return current_;
}

void ModeController::reset() {
  current_ = PerformanceMode::HIGH;
  pending_ = PerformanceMode::HIGH;
  pending_count_ = 0;
}
