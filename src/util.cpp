#include "util.hpp"

#include <yaml-cpp/yaml.h>

#include <stdexcept>

AppConfig load_config(const std::string& path) {
  YAML::Node y = YAML::LoadFile(path);
  AppConfig c{};

  if (y["scheduler"]) {
    auto n = y["scheduler"];
    if (n["window_ms"]) c.scheduler.window_ms = n["window_ms"].as<int>();
    if (n["initial_fps"]) c.scheduler.initial_fps = n["initial_fps"].as<double>();
    if (n["high_fps"]) c.scheduler.mode.high_fps = n["high_fps"].as<double>();
    if (n["medium_fps"]) c.scheduler.mode.medium_fps = n["medium_fps"].as<double>();
    if (n["hysteresis_ticks"]) c.scheduler.mode.hysteresis_ticks = n["hysteresis_ticks"].as<int>();
  }
  if (y["compute"]) {
    auto n = y["compute"];
    if (n["enable_accelerated"]) c.compute.enable_accelerated = n["enable_accelerated"].as<bool>();
    if (n["device_index"]) c.compute.device_index = n["device_index"].as<int>();
    if (n["rate_window_ms"]) c.compute.rate_window_ms = n["rate_window_ms"].as<int>();
    if (n["retention_ms"]) c.compute.retention_ms = n["retention_ms"].as<int>();
  }
  if (y["loop"]) {
    auto n = y["loop"];
    if (n["target_fps"]) c.loop.target_fps = n["target_fps"].as<int>();
    if (n["synthetic_load_ms"]) c.loop.synthetic_load_ms = n["synthetic_load_ms"].as<double>();
    if (n["pointer_count"]) c.loop.pointer_count = n["pointer_count"].as<int>();
    if (n["block_count"]) c.loop.block_count = n["block_count"].as<int>();
  }
  if (y["output"]) {
    auto output = y["output"];
    if (output["log_level"]) c.output_config.log_level = output["log_level"].as<std::string>();
    if (output["performance_summary_interval"])
      c.output_config.performance_summary_interval =
          output["performance_summary_interval"].as<int>();
    if (output["enable_csv_logging"])
      c.output_config.enable_csv_logging = output["enable_csv_logging"].as<bool>();
    if (output["csv_output_path"])
      c.output_config.csv_output_path = output["csv_output_path"].as<std::string>();
  }
  if (y["telemetry"] && y["telemetry"]["metrics_port"])
    c.metrics_port = y["telemetry"]["metrics_port"].as<int>();

  validate_config(c);
  return c;
}

void validate_config(const AppConfig& c) {
  if (c.scheduler.window_ms <= 0) throw std::invalid_argument("scheduler.window_ms must be > 0");
  if (c.scheduler.mode.medium_fps > c.scheduler.mode.high_fps)
    throw std::invalid_argument("scheduler.medium_fps must not exceed scheduler.high_fps");
  if (c.scheduler.mode.hysteresis_ticks < 0)
    throw std::invalid_argument("scheduler.hysteresis_ticks must be >= 0");
  if (c.compute.rate_window_ms <= 0)
    throw std::invalid_argument("compute.rate_window_ms must be > 0");
  if (c.compute.retention_ms < c.compute.rate_window_ms)
    throw std::invalid_argument("compute.retention_ms must be >= compute.rate_window_ms");
  if (c.loop.target_fps < 0) throw std::invalid_argument("loop.target_fps must be >= 0");
  if (c.loop.synthetic_load_ms < 0)
    throw std::invalid_argument("loop.synthetic_load_ms must be >= 0");
  if (c.loop.pointer_count < 0 || c.loop.block_count < 0)
    throw std::invalid_argument("loop.pointer_count and loop.block_count must be >= 0");
  if (c.metrics_port <= 0 || c.metrics_port > 65535)
    throw std::invalid_argument("telemetry.metrics_port out of range");
}
