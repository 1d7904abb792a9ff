#include "cuda_backend.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

#if defined(HAVE_CUDA)

#include <mutex>

#include "cuda_kernels.hpp"
#include "gpu.hpp"
#include "host_kernels.hpp"

namespace {

// Transforms and paths run on the GPU. Welding and packing are sequential
// and stay on the host. One stream, serialized by mu_.
class CudaBackend : public ComputeBackend {
public:
  explicit CudaBackend(int device) {
    try {
      gpu_init(ctx_, device);
    } catch (...) {
      gpu_destroy(ctx_);
      throw;
    }
  }

  ~CudaBackend() override {
    std::lock_guard<std::mutex> g(mu_);
    if (ctx_.stream) cudaStreamSynchronize(ctx_.stream);
    gpu_destroy(ctx_);
  }

  std::string name() const override { return "cuda:" + ctx_.device_name; }

  std::vector<LayoutSlot> pack_memory_layout(const std::vector<LayoutRequest>& objects) override {
    return pack_aligned(objects);
  }

  GeometryBuffers optimize_geometry(const GeometryBuffers& geometry) override {
    return weld_geometry(geometry);
  }

  std::vector<float> batch_compose_transforms(const std::vector<Transform>& transforms) override {
    if (transforms.empty()) return {};
    std::lock_guard<std::mutex> g(mu_);
    const size_t n = transforms.size();

    std::vector<Vec3> positions(n), scales(n);
    const std::vector<Quat> rotations = to_quaternions(transforms);
    for (size_t i = 0; i < n; ++i) {
      positions[i] = transforms[i].position;
      scales[i] = transforms[i].scale;
    }

    d_positions_.reserve(n);
    d_rotations_.reserve(n);
    d_scales_.reserve(n);
    d_matrices_.reserve(n * 16);

    cuda_check(cudaMemcpyAsync(d_positions_.get(), positions.data(), n * sizeof(Vec3),
                               cudaMemcpyHostToDevice, ctx_.stream),
               "Memcpy positions");
    cuda_check(cudaMemcpyAsync(d_rotations_.get(), rotations.data(), n * sizeof(Quat),
                               cudaMemcpyHostToDevice, ctx_.stream),
               "Memcpy rotations");
    cuda_check(cudaMemcpyAsync(d_scales_.get(), scales.data(), n * sizeof(Vec3),
                               cudaMemcpyHostToDevice, ctx_.stream),
               "Memcpy scales");

    cuda_check(cudaEventRecord(ctx_.start, ctx_.stream), "EventRecord start");
    launch_compose_trs(d_positions_.get(), d_rotations_.get(), d_scales_.get(),
                       d_matrices_.get(), static_cast<int>(n), ctx_.stream);
    cuda_check(cudaGetLastError(), "Launch compose_trs");
    cuda_check(cudaEventRecord(ctx_.end, ctx_.stream), "EventRecord end");

    std::vector<float> matrices(n * 16);
    cuda_check(cudaMemcpyAsync(matrices.data(), d_matrices_.get(), n * 16 * sizeof(float),
                               cudaMemcpyDeviceToHost, ctx_.stream),
               "Memcpy matrices");
    cuda_check(cudaStreamSynchronize(ctx_.stream), "StreamSynchronize");

    spdlog::debug("compose_trs: {} transforms in {:.3f}ms", n,
                  gpu_elapsed_ms(ctx_.start, ctx_.end));
    return matrices;
  }

  std::vector<Polyline> interpolate_paths(const std::vector<PathSegment>& segments) override {
    if (segments.empty()) return {};
    std::lock_guard<std::mutex> g(mu_);
    const size_t n = segments.size();

    d_segments_.reserve(n);
    d_points_.reserve(n * 3);
    cuda_check(cudaMemcpyAsync(d_segments_.get(), segments.data(), n * sizeof(PathSegment),
                               cudaMemcpyHostToDevice, ctx_.stream),
               "Memcpy segments");

    cuda_check(cudaEventRecord(ctx_.start, ctx_.stream), "EventRecord start");
    launch_arc_paths(d_segments_.get(), d_points_.get(), static_cast<int>(n), ctx_.stream);
    cuda_check(cudaGetLastError(), "Launch arc_paths");
    cuda_check(cudaEventRecord(ctx_.end, ctx_.stream), "EventRecord end");

    std::vector<Vec3> points(n * 3);
    cuda_check(cudaMemcpyAsync(points.data(), d_points_.get(), n * 3 * sizeof(Vec3),
                               cudaMemcpyDeviceToHost, ctx_.stream),
               "Memcpy points");
    cuda_check(cudaStreamSynchronize(ctx_.stream), "StreamSynchronize");

    spdlog::debug("arc_paths: {} segments in {:.3f}ms", n, gpu_elapsed_ms(ctx_.start, ctx_.end));

    std::vector<Polyline> paths;
    paths.reserve(n);
    for (size_t i = 0; i < n; ++i) {
      paths.emplace_back(points.begin() + static_cast<std::ptrdiff_t>(i * 3),
                         points.begin() + static_cast<std::ptrdiff_t>(i * 3 + 3));
    }
    return paths;
  }

private:
  GpuContext ctx_;
  std::mutex mu_;
  DeviceBuffer<Vec3> d_positions_;
  DeviceBuffer<Quat> d_rotations_;
  DeviceBuffer<Vec3> d_scales_;
  DeviceBuffer<float> d_matrices_;
  DeviceBuffer<PathSegment> d_segments_;
  DeviceBuffer<Vec3> d_points_;
};

}  // namespace

std::unique_ptr<ComputeBackend> load_cuda_backend(int device_index) {
  auto backend = std::make_unique<CudaBackend>(device_index);
  spdlog::info("CUDA compute backend ready ({})", backend->name());
  return backend;
}

#else

std::unique_ptr<ComputeBackend> load_cuda_backend(int device_index) {
  throw std::runtime_error("built without CUDA support; device " + std::to_string(device_index) +
                           " unavailable");
}

#endif
