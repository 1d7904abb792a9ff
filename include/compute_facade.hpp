#pragma once
#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "compute_backend.hpp"
#include "metrics.hpp"
#include "types.hpp"

struct ComputeConfig {
  bool enable_accelerated{true};
  int device_index{0};
  int rate_window_ms{1000};
  int retention_ms{10000};
};

// Raised when neither backend could serve a call.
class ComputeError : public std::runtime_error {
public:
  ComputeError(const std::string& op, std::string accelerated_error, std::string reference_error);

  const std::string& accelerated_error() const { return accelerated_error_; }
  const std::string& reference_error() const { return reference_error_; }

private:
  std::string accelerated_error_;
  std::string reference_error_;
};

using BackendLoader = std::function<std::unique_ptr<ComputeBackend>()>;

// Owns both backends. The accelerated one is loaded at most once, in the
// background; until that attempt settles every call returns an empty result
// instead of blocking. Afterwards each call tries the accelerated backend
// first and retries on the reference backend if it throws.
class ComputeFacade {
public:
  explicit ComputeFacade(ComputeConfig cfg = ComputeConfig{});
  ComputeFacade(ComputeConfig cfg, BackendLoader loader,
                std::unique_ptr<ComputeBackend> reference = nullptr, ClockFn clock = nullptr);
  ~ComputeFacade();

  ComputeFacade(const ComputeFacade&) = delete;
  ComputeFacade& operator=(const ComputeFacade&) = delete;

  // Idempotent; concurrent callers share one load attempt. The future
  // completes normally whether or not the accelerated backend loaded.
  std::shared_future<void> initialize();
  bool ready() const;
  bool accelerated_available() const;
  std::string active_backend() const;

  std::vector<LayoutSlot> pack_memory_layout(const std::vector<LayoutRequest>& objects);
  GeometryBuffers optimize_geometry(const GeometryBuffers& geometry);
  std::vector<float> batch_compose_transforms(const std::vector<Transform>& transforms);
  std::vector<Polyline> interpolate_paths(const std::vector<PathSegment>& segments);

  double operations_per_second();
  ComputeStats stats();

private:
  enum class InitState { UNINITIALIZED, IN_PROGRESS, DONE };

  void load_backend();

  template <typename Result, typename Call>
  Result run(ComputeOp op, Result not_ready, Call call);

  ComputeConfig cfg_;
  BackendLoader loader_;
  std::unique_ptr<ComputeBackend> reference_;
  ClockFn clock_;

  mutable std::mutex mu_;
  InitState state_{InitState::UNINITIALIZED};
  std::shared_future<void> init_future_;
  std::unique_ptr<ComputeBackend> accelerated_;

  OperationLog op_log_;
  std::atomic<uint64_t> accelerated_calls_{0};
  std::atomic<uint64_t> reference_calls_{0};
  std::atomic<uint64_t> fallbacks_{0};
  std::atomic<uint64_t> failures_{0};
  std::atomic<uint64_t> not_ready_calls_{0};
};
