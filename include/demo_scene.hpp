#pragma once
#include <mutex>
#include <string>
#include <vector>

#include "compute_facade.hpp"
#include "frame_scheduler.hpp"

// The visual components of the pointer/memory visualizer, reduced to the
// per-frame work they hand to the scheduler and the compute facade.
class DemoScene {
public:
  static constexpr const char* kPointerPulse = "pointer_pulse";
  static constexpr const char* kMemoryBlocks = "memory_blocks";
  static constexpr const char* kPointerPaths = "pointer_paths";
  static constexpr const char* kMemoryLayout = "memory_layout";
  static constexpr const char* kBackgroundParticles = "background_particles";

  static constexpr uint64_t kLayoutRefreshFrames = 60;

  DemoScene(FrameScheduler& scheduler, ComputeFacade& compute, int pointer_count,
            int block_count);
  ~DemoScene();

  DemoScene(const DemoScene&) = delete;
  DemoScene& operator=(const DemoScene&) = delete;

  void mount();
  void unmount();

  float pointer_thickness() const;
  size_t block_matrix_count() const;
  size_t path_count() const;
  size_t layout_slot_count() const;
  bool geometry_optimized() const;
  size_t cube_vertex_count() const;
  float particle_phase() const;

private:
  CallbackResult pulse(Seconds dt);
  CallbackResult blocks(Seconds dt);
  CallbackResult paths();
  CallbackResult layout(const FrameContext& ctx);
  CallbackResult particles(Seconds dt);

  FrameScheduler& scheduler_;
  ComputeFacade& compute_;
  int pointer_count_;
  int block_count_;
  bool mounted_{false};

  mutable std::mutex mu_;
  double elapsed_{0.0};
  float thickness_{3.0f};
  std::vector<float> block_matrices_;
  std::vector<Polyline> paths_;
  std::vector<LayoutSlot> layout_;
  GeometryBuffers cube_;
  bool cube_optimized_{false};
  float particle_phase_{0.0f};
};

// 12 triangles, 36 unindexed vertices.
GeometryBuffers make_unit_cube();
