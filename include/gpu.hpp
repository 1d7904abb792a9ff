#pragma once
#include <cuda_runtime.h>

#include <cstddef>
#include <stdexcept>
#include <string>

inline void cuda_check(cudaError_t e, const char* what) {
  if (e != cudaSuccess) {
    throw std::runtime_error(std::string("[CUDA] ") + what + " failed: " + cudaGetErrorString(e));
  }
}

// Grow-only device allocation; contents are not preserved across growth.
template <typename T>
class DeviceBuffer {
public:
  DeviceBuffer() = default;
  ~DeviceBuffer() { release(); }
  DeviceBuffer(const DeviceBuffer&) = delete;
  DeviceBuffer& operator=(const DeviceBuffer&) = delete;

  void reserve(size_t count) {
    if (count <= capacity_) return;
    release();
    cuda_check(cudaMalloc(&ptr_, count * sizeof(T)), "Malloc device buffer");
    capacity_ = count;
  }

  T* get() const { return ptr_; }
  size_t capacity() const { return capacity_; }

private:
  void release() {
    if (ptr_) cudaFree(ptr_);
    ptr_ = nullptr;
    capacity_ = 0;
  }

  T* ptr_{nullptr};
  size_t capacity_{0};
};

struct GpuContext {
  int device{0};
  std::string device_name;
  cudaStream_t stream{nullptr};
  cudaEvent_t start{nullptr}, end{nullptr};
};

inline void gpu_init(GpuContext& ctx, int device) {
  int count = 0;
  cuda_check(cudaGetDeviceCount(&count), "GetDeviceCount");
  if (device < 0 || device >= count) {
    throw std::runtime_error("CUDA device " + std::to_string(device) + " not present (" +
                             std::to_string(count) + " visible)");
  }
  ctx.device = device;
  cuda_check(cudaSetDevice(device), "SetDevice");

  cudaDeviceProp prop{};
  cuda_check(cudaGetDeviceProperties(&prop, device), "GetDeviceProperties");
  ctx.device_name = prop.name;

  cuda_check(cudaStreamCreateWithFlags(&ctx.stream, cudaStreamNonBlocking), "Create stream");
  cuda_check(cudaEventCreateWithFlags(&ctx.start, cudaEventDefault), "Event start");
  cuda_check(cudaEventCreateWithFlags(&ctx.end, cudaEventDefault), "Event end");
}

inline void gpu_destroy(GpuContext& ctx) {
  if (ctx.start) cudaEventDestroy(ctx.start);
  if (ctx.end) cudaEventDestroy(ctx.end);
  if (ctx.stream) cudaStreamDestroy(ctx.stream);
  ctx.start = ctx.end = nullptr;
  ctx.stream = nullptr;
}

inline float gpu_elapsed_ms(cudaEvent_t a, cudaEvent_t b) {
  float ms = 0.f;
  cuda_check(cudaEventElapsedTime(&ms, a, b), "EventElapsedTime");
  return ms;
}
