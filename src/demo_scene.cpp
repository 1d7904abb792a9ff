#include "demo_scene.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

GeometryBuffers make_unit_cube() {
  static const float corners[8][3] = {{-0.5f, -0.5f, -0.5f}, {0.5f, -0.5f, -0.5f},
                                      {0.5f, 0.5f, -0.5f},   {-0.5f, 0.5f, -0.5f},
                                      {-0.5f, -0.5f, 0.5f},  {0.5f, -0.5f, 0.5f},
                                      {0.5f, 0.5f, 0.5f},    {-0.5f, 0.5f, 0.5f}};
  static const int faces[12][3] = {{0, 2, 1}, {0, 3, 2}, {4, 5, 6}, {4, 6, 7},
                                   {0, 1, 5}, {0, 5, 4}, {3, 7, 6}, {3, 6, 2},
                                   {0, 4, 7}, {0, 7, 3}, {1, 2, 6}, {1, 6, 5}};
  GeometryBuffers g;
  g.positions.reserve(36 * 3);
  for (const auto& face : faces) {
    for (int corner : face) {
      g.positions.insert(g.positions.end(), corners[corner], corners[corner] + 3);
    }
  }
  return g;
}

DemoScene::DemoScene(FrameScheduler& scheduler, ComputeFacade& compute, int pointer_count,
                     int block_count)
    : scheduler_(scheduler),
      compute_(compute),
      pointer_count_(std::max(0, pointer_count)),
      block_count_(std::max(0, block_count)),
      cube_(make_unit_cube()) {}

DemoScene::~DemoScene() { unmount(); }

void DemoScene::mount() {
  if (mounted_) return;
  scheduler_.register_callback(
      kPointerPulse, [this](const FrameContext&, Seconds dt) { return pulse(dt); }, 2);
  scheduler_.register_callback(
      kMemoryBlocks, [this](const FrameContext&, Seconds dt) { return blocks(dt); }, 1);
  scheduler_.register_callback(
      kPointerPaths, [this](const FrameContext&, Seconds) { return paths(); }, 0);
  scheduler_.register_callback(
      kMemoryLayout, [this](const FrameContext& ctx, Seconds) { return layout(ctx); }, 0);
  scheduler_.register_callback(
      kBackgroundParticles, [this](const FrameContext&, Seconds dt) { return particles(dt); },
      -1);
  mounted_ = true;
  spdlog::info("Demo scene mounted ({} pointers, {} memory blocks)", pointer_count_,
               block_count_);
}

void DemoScene::unmount() {
  if (!mounted_) return;
  for (const char* id :
       {kPointerPulse, kMemoryBlocks, kPointerPaths, kMemoryLayout, kBackgroundParticles}) {
    scheduler_.unregister_callback(id);
  }
  mounted_ = false;
}

CallbackResult DemoScene::pulse(Seconds dt) {
  std::lock_guard<std::mutex> g(mu_);
  elapsed_ += dt.count();
  thickness_ = 3.0f + static_cast<float>(std::sin(elapsed_ * 2.0)) * 2.0f;
  return CallbackResult::success();
}

CallbackResult DemoScene::blocks(Seconds) {
  double t = 0.0;
  bool optimize = false;
  GeometryBuffers cube;
  {
    std::lock_guard<std::mutex> g(mu_);
    t = elapsed_;
    optimize = !cube_optimized_ && compute_.ready();
    if (optimize) cube = cube_;
  }

  std::vector<Transform> transforms(static_cast<size_t>(block_count_));
  for (int i = 0; i < block_count_; ++i) {
    Transform& tr = transforms[static_cast<size_t>(i)];
    tr.position = {static_cast<float>(i % 8) * 1.5f, 0.0f, static_cast<float>(i / 8) * 1.5f};
    tr.rotation = {0.0f, static_cast<float>(t * 0.5 + i * 0.1), 0.0f};
  }

  try {
    std::vector<float> matrices = compute_.batch_compose_transforms(transforms);
    if (optimize) cube = compute_.optimize_geometry(cube);

    std::lock_guard<std::mutex> g(mu_);
    if (!matrices.empty()) block_matrices_ = std::move(matrices);
    if (optimize) {
      cube_ = std::move(cube);
      cube_optimized_ = true;
      spdlog::debug("Memory block geometry optimized to {} vertices", cube_.vertex_count());
    }
  } catch (const ComputeError& e) {
    return CallbackResult::failure(e.what());
  }
  return CallbackResult::success();
}

CallbackResult DemoScene::paths() {
  float t = 0.0f;
  {
    std::lock_guard<std::mutex> g(mu_);
    t = static_cast<float>(elapsed_);
  }

  std::vector<PathSegment> segments;
  for (int i = 0; i + 1 < pointer_count_; ++i) {
    PathSegment s;
    s.start = {static_cast<float>(i), 0.0f, 0.0f};
    s.end = {static_cast<float>(i + 1), 0.0f, 2.0f};
    s.weight = 1.0f + 0.5f * std::sin(t + static_cast<float>(i));
    segments.push_back(s);
  }

  try {
    std::vector<Polyline> result = compute_.interpolate_paths(segments);
    std::lock_guard<std::mutex> g(mu_);
    if (!result.empty()) paths_ = std::move(result);
  } catch (const ComputeError& e) {
    return CallbackResult::failure(e.what());
  }
  return CallbackResult::success();
}

CallbackResult DemoScene::layout(const FrameContext& ctx) {
  if (ctx.frame_id % kLayoutRefreshFrames != 1) return CallbackResult::success();

  std::vector<LayoutRequest> objects;
  for (int i = 0; i < pointer_count_; ++i) {
    LayoutRequest r;
    r.id = "ptr" + std::to_string(i);
    r.size = 8u * static_cast<uint64_t>(i + 1);
    r.alignment = (i % 2 == 0) ? 8u : 16u;
    r.priority = pointer_count_ - i;
    objects.push_back(std::move(r));
  }

  try {
    std::vector<LayoutSlot> slots = compute_.pack_memory_layout(objects);
    std::lock_guard<std::mutex> g(mu_);
    if (!slots.empty()) layout_ = std::move(slots);
  } catch (const ComputeError& e) {
    return CallbackResult::failure(e.what());
  }
  return CallbackResult::success();
}

CallbackResult DemoScene::particles(Seconds dt) {
  std::lock_guard<std::mutex> g(mu_);
  particle_phase_ = std::fmod(particle_phase_ + static_cast<float>(dt.count()) * 0.25f, 1.0f);
  return CallbackResult::success();
}

float DemoScene::pointer_thickness() const {
  std::lock_guard<std::mutex> g(mu_);
  return thickness_;
}

size_t DemoScene::block_matrix_count() const {
  std::lock_guard<std::mutex> g(mu_);
  return block_matrices_.size() / 16;
}

size_t DemoScene::path_count() const {
  std::lock_guard<std::mutex> g(mu_);
  return paths_.size();
}

size_t DemoScene::layout_slot_count() const {
  std::lock_guard<std::mutex> g(mu_);
  return layout_.size();
}

bool DemoScene::geometry_optimized() const {
  std::lock_guard<std::mutex> g(mu_);
  return cube_optimized_;
}

size_t DemoScene::cube_vertex_count() const {
  std::lock_guard<std::mutex> g(mu_);
  return cube_.vertex_count();
}

float DemoScene::particle_phase() const {
  std::lock_guard<std::mutex> g(mu_);
  return particle_phase_;
}
