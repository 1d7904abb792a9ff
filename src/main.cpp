#include <httplib.h>
#include <spdlog/spdlog.h>

#include <CLI/CLI.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>

#include "compute_facade.hpp"
#include "demo_scene.hpp"
#include "frame_scheduler.hpp"
#include "metrics.hpp"
#include "output_manager.hpp"
#include "render_loop.hpp"
#include "util.hpp"

namespace {

std::atomic<bool> g_interrupted{false};

void on_signal(int) { g_interrupted = true; }

nlohmann::json to_json(const SchedulerStats& s) {
  return nlohmann::json{{"average_fps", s.average_fps},
                        {"mode", mode_name(s.mode)},
                        {"mode_forced", s.mode_forced},
                        {"active_callbacks", s.active_callbacks},
                        {"total_callbacks", s.total_callbacks},
                        {"executed_last_tick", s.executed_last_tick},
                        {"failed_last_tick", s.failed_last_tick},
                        {"ticks_total", s.ticks_total},
                        {"callback_failures_total", s.callback_failures_total},
                        {"tick_p50_ms", s.tick_p50_ms},
                        {"tick_p95_ms", s.tick_p95_ms},
                        {"tick_p99_ms", s.tick_p99_ms}};
}

nlohmann::json to_json(const ComputeStats& c) {
  return nlohmann::json{{"ready", c.ready},
                        {"accelerated_available", c.accelerated_available},
                        {"backend", c.backend},
                        {"operations_per_second", c.operations_per_second},
                        {"average_operation_ms", c.average_operation_ms},
                        {"recorded_operations", c.recorded_operations},
                        {"accelerated_calls", c.accelerated_calls},
                        {"reference_calls", c.reference_calls},
                        {"fallbacks", c.fallbacks},
                        {"failures", c.failures},
                        {"not_ready_calls", c.not_ready_calls}};
}

}  // namespace

int main(int argc, char** argv) {
  CLI::App cli_app{"FramePace-RT: adaptive frame-work scheduler with compute offload"};

  std::string cfg_path = "configs/framepace.yaml";
  cli_app.add_option("-c,--config", cfg_path, "Configuration file path")->check(CLI::ExistingFile);

  bool show_version = false;
  cli_app.add_flag("-v,--version", show_version, "Show version information");

  uint64_t frames = 0;
  cli_app.add_option("--frames", frames, "Render this many frames headless, then exit");

  bool no_server = false;
  cli_app.add_flag("--no-server", no_server, "Do not start the HTTP diagnostics server");

  try {
    cli_app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return cli_app.exit(e);
  }

  if (show_version) {
    std::cout << "FramePace-RT v1.0.0" << std::endl;
    std::cout << "Frame callback scheduling with CUDA compute offload" << std::endl;
    return 0;
  }

  spdlog::set_pattern("[%H:%M:%S.%e] %^[%l]%$ %v");
  spdlog::info("FramePace-RT starting (config: {})", cfg_path);

  AppConfig app;
  try {
    app = load_config(cfg_path);
  } catch (const std::exception& e) {
    spdlog::error("Failed to load config '{}': {}", cfg_path, e.what());
    return 1;
  }

  OutputManager output(app.output_config);
  FrameScheduler scheduler(app.scheduler);
  ComputeFacade compute(app.compute);
  compute.initialize();

  DemoScene scene(scheduler, compute, app.loop.pointer_count, app.loop.block_count);
  scene.mount();
  RenderLoop loop(app.loop, scheduler, compute, &output);

  if (frames > 0) {
    compute.initialize().wait();
    loop.run_frames(frames);
    auto s = scheduler.stats();
    spdlog::info("Rendered {} frames: {:.1f} fps, mode {}, {} callback failures",
                 loop.frames_rendered(), s.average_fps, mode_name(s.mode),
                 s.callback_failures_total);
    return 0;
  }

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  if (no_server) {
    loop.start();
    while (!g_interrupted) std::this_thread::sleep_for(std::chrono::milliseconds(100));
    loop.stop();
    spdlog::info("Shutdown complete.");
    return 0;
  }

  httplib::Server svr;

  svr.Get("/healthz", [&](const httplib::Request&, httplib::Response& res) {
    res.set_content("{\"status\":\"ok\"}", "application/json");
  });

  svr.Get("/readyz", [&](const httplib::Request&, httplib::Response& res) {
    const bool ready = loop.running() && compute.ready();
    res.status = ready ? 200 : 503;
    res.set_content(std::string("{\"ready\":") + (ready ? "true" : "false") + "}",
                    "application/json");
  });

  svr.Post("/loop/start", [&](const httplib::Request&, httplib::Response& res) {
    loop.start();
    res.set_content("{\"started\":true}", "application/json");
  });

  svr.Post("/loop/stop", [&](const httplib::Request&, httplib::Response& res) {
    loop.stop();
    res.set_content("{\"stopped\":true}", "application/json");
  });

  svr.Get("/scheduler/stats", [&](const httplib::Request&, httplib::Response& res) {
    res.set_content(to_json(scheduler.stats()).dump(2), "application/json");
  });

  svr.Get("/scheduler/debug", [&](const httplib::Request&, httplib::Response& res) {
    auto info = scheduler.debug_info();
    nlohmann::json callbacks = nlohmann::json::array();
    for (const auto& cb : info.callbacks) {
      callbacks.push_back({{"id", cb.id},
                           {"priority", cb.priority},
                           {"enabled", cb.enabled},
                           {"failures", cb.failures}});
    }
    nlohmann::json j{{"stats", to_json(info.stats)}, {"callbacks", callbacks}};
    res.set_content(j.dump(2), "application/json");
  });

  svr.Post("/scheduler/mode", [&](const httplib::Request& req, httplib::Response& res) {
    if (req.body == "auto") {
      scheduler.clear_forced_mode();
    } else {
      PerformanceMode mode;
      if (!parse_mode(req.body, mode)) {
        res.status = 400;
        res.set_content("{\"error\":\"expected high|medium|low|auto\"}", "application/json");
        return;
      }
      scheduler.force_mode(mode);
    }
    res.set_content(to_json(scheduler.stats()).dump(2), "application/json");
  });

  svr.Post("/callbacks/enable", [&](const httplib::Request& req, httplib::Response& res) {
    if (!req.has_param("id") || !req.has_param("enabled")) {
      res.status = 400;
      res.set_content("{\"error\":\"id and enabled are required\"}", "application/json");
      return;
    }
    const std::string id = req.get_param_value("id");
    const bool enabled = req.get_param_value("enabled") == "true";
    scheduler.set_enabled(id, enabled);
    res.set_content(nlohmann::json{{"id", id}, {"enabled", enabled}}.dump(),
                    "application/json");
  });

  svr.Get("/compute/stats", [&](const httplib::Request&, httplib::Response& res) {
    nlohmann::json j = to_json(compute.stats());
    if (auto trend = output.computeTrend()) {
      j["trend"] = {{"direction", trend->direction}, {"change_pct", trend->change_pct}};
    }
    res.set_content(j.dump(2), "application/json");
  });

  svr.Get("/metrics", [&](const httplib::Request&, httplib::Response& res) {
    res.set_content(prometheus_text(scheduler.stats(), compute.stats()),
                    "text/plain; version=0.0.4");
  });

  std::thread watcher([&] {
    while (!g_interrupted) std::this_thread::sleep_for(std::chrono::milliseconds(100));
    svr.stop();
  });

  loop.start();

  spdlog::info("HTTP server listening on 0.0.0.0:{}", app.metrics_port);
  if (!svr.listen("0.0.0.0", app.metrics_port)) {
    spdlog::error("Failed to bind HTTP server on port {}", app.metrics_port);
  }

  g_interrupted = true;
  watcher.join();
  loop.stop();
  spdlog::info("Shutdown complete.");
  return 0;
}
