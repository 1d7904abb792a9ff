#pragma once
#include <string>

#include "compute_facade.hpp"
#include "frame_scheduler.hpp"
#include "output_manager.hpp"
#include "render_loop.hpp"

struct AppConfig {
  SchedulerConfig scheduler;
  ComputeConfig compute;
  LoopConfig loop;
  OutputConfig output_config;
  int metrics_port{9090};
};

// Throws YAML::Exception for unreadable or malformed files and
// std::invalid_argument for out-of-range values.
AppConfig load_config(const std::string& path);

void validate_config(const AppConfig& c);
