#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

using Clock = std::chrono::steady_clock;
using TimePoint = std::chrono::time_point<Clock>;
using Seconds = std::chrono::duration<double>;
using ClockFn = std::function<TimePoint()>;

// Forwarded untouched to every frame callback.
struct FrameContext {
  uint64_t frame_id{};
  TimePoint frame_time{};
  void* user_data{nullptr};
};

enum class PerformanceMode { HIGH, MEDIUM, LOW };

inline const char* mode_name(PerformanceMode m) {
  switch (m) {
    case PerformanceMode::HIGH:
      return "high";
    case PerformanceMode::MEDIUM:
      return "medium";
    case PerformanceMode::LOW:
      return "low";
  }
  return "unknown";
}

inline bool parse_mode(const std::string& s, PerformanceMode& out) {
  if (s == "high") {
    out = PerformanceMode::HIGH;
  } else if (s == "medium") {
    out = PerformanceMode::MEDIUM;
  } else if (s == "low") {
    out = PerformanceMode::LOW;
  } else {
    return false;
  }
  return true;
}
