#include "compute_facade.hpp"

#include <spdlog/spdlog.h>

#include <chrono>

#include "cuda_backend.hpp"
#include "reference_backend.hpp"

namespace {

constexpr const char* kUnknownError = "unknown exception";

std::string compute_error_message(const std::string& op, const std::string& accelerated,
                                  const std::string& reference) {
  if (accelerated.empty()) return op + " failed: reference: " + reference;
  return op + " failed on both backends: accelerated: " + accelerated +
         "; reference: " + reference;
}

}  // namespace

ComputeError::ComputeError(const std::string& op, std::string accelerated_error,
                           std::string reference_error)
    : std::runtime_error(compute_error_message(op, accelerated_error, reference_error)),
      accelerated_error_(std::move(accelerated_error)),
      reference_error_(std::move(reference_error)) {}

ComputeFacade::ComputeFacade(ComputeConfig cfg)
    : ComputeFacade(cfg, [device = cfg.device_index] { return load_cuda_backend(device); }) {}

ComputeFacade::ComputeFacade(ComputeConfig cfg, BackendLoader loader,
                             std::unique_ptr<ComputeBackend> reference, ClockFn clock)
    : cfg_(cfg),
      loader_(std::move(loader)),
      reference_(reference ? std::move(reference) : std::make_unique<ReferenceBackend>()),
      clock_(clock ? std::move(clock) : ClockFn(Clock::now)),
      op_log_(std::chrono::milliseconds(cfg.rate_window_ms),
              std::chrono::milliseconds(cfg.retention_ms)) {}

ComputeFacade::~ComputeFacade() {
  std::shared_future<void> pending;
  {
    std::lock_guard<std::mutex> g(mu_);
    pending = init_future_;
  }
  if (pending.valid()) pending.wait();
}

std::shared_future<void> ComputeFacade::initialize() {
  std::lock_guard<std::mutex> g(mu_);
  if (state_ == InitState::UNINITIALIZED) {
    state_ = InitState::IN_PROGRESS;
    init_future_ = std::async(std::launch::async, [this] { load_backend(); }).share();
  }
  return init_future_;
}

void ComputeFacade::load_backend() {
  std::unique_ptr<ComputeBackend> loaded;
  if (!cfg_.enable_accelerated) {
    spdlog::info("Accelerated compute disabled; using {} backend", reference_->name());
  } else if (!loader_) {
    spdlog::info("No accelerated backend loader; using {} backend", reference_->name());
  } else {
    try {
      loaded = loader_();
    } catch (const std::exception& e) {
      spdlog::error("Accelerated backend failed to load, using {} for this process: {}",
                    reference_->name(), e.what());
    } catch (...) {
      spdlog::error("Accelerated backend failed to load, using {} for this process: {}",
                    reference_->name(), kUnknownError);
    }
  }

  std::lock_guard<std::mutex> g(mu_);
  accelerated_ = std::move(loaded);
  state_ = InitState::DONE;
}

bool ComputeFacade::ready() const {
  std::lock_guard<std::mutex> g(mu_);
  return state_ == InitState::DONE;
}

bool ComputeFacade::accelerated_available() const {
  std::lock_guard<std::mutex> g(mu_);
  return state_ == InitState::DONE && accelerated_ != nullptr;
}

std::string ComputeFacade::active_backend() const {
  std::lock_guard<std::mutex> g(mu_);
  if (state_ != InitState::DONE) return "none";
  return accelerated_ ? accelerated_->name() : reference_->name();
}

template <typename Result, typename Call>
Result ComputeFacade::run(ComputeOp op, Result not_ready, Call call) {
  ComputeBackend* accelerated = nullptr;
  bool is_ready = false;
  {
    std::lock_guard<std::mutex> g(mu_);
    is_ready = state_ == InitState::DONE;
    accelerated = accelerated_.get();
  }
  if (!is_ready) {
    not_ready_calls_++;
    initialize();
    return not_ready;
  }

  const TimePoint t0 = clock_();
  auto record = [&](ServedBy by) {
    const TimePoint t1 = clock_();
    op_log_.record(OperationRecord{op, by, t1,
                                   std::chrono::duration<double, std::milli>(t1 - t0).count()});
  };

  std::string accelerated_error;
  if (accelerated) {
    try {
      Result out = call(*accelerated);
      accelerated_calls_++;
      record(ServedBy::ACCELERATED);
      return out;
    } catch (const std::exception& e) {
      accelerated_error = e.what();
    } catch (...) {
      accelerated_error = kUnknownError;
    }
    fallbacks_++;
    spdlog::warn("{} failed on {}, retrying on {}: {}", op_name(op), accelerated->name(),
                 reference_->name(), accelerated_error);
  }

  try {
    Result out = call(*reference_);
    reference_calls_++;
    record(ServedBy::REFERENCE);
    return out;
  } catch (const std::exception& e) {
    failures_++;
    throw ComputeError(op_name(op), accelerated_error, e.what());
  } catch (...) {
    failures_++;
    throw ComputeError(op_name(op), accelerated_error, kUnknownError);
  }
}

std::vector<LayoutSlot> ComputeFacade::pack_memory_layout(
    const std::vector<LayoutRequest>& objects) {
  return run(ComputeOp::PACK_MEMORY_LAYOUT, std::vector<LayoutSlot>{},
             [&](ComputeBackend& b) { return b.pack_memory_layout(objects); });
}

GeometryBuffers ComputeFacade::optimize_geometry(const GeometryBuffers& geometry) {
  return run(ComputeOp::OPTIMIZE_GEOMETRY, geometry,
             [&](ComputeBackend& b) { return b.optimize_geometry(geometry); });
}

std::vector<float> ComputeFacade::batch_compose_transforms(
    const std::vector<Transform>& transforms) {
  return run(ComputeOp::COMPOSE_TRANSFORMS, std::vector<float>{},
             [&](ComputeBackend& b) { return b.batch_compose_transforms(transforms); });
}

std::vector<Polyline> ComputeFacade::interpolate_paths(const std::vector<PathSegment>& segments) {
  return run(ComputeOp::INTERPOLATE_PATHS, std::vector<Polyline>{},
             [&](ComputeBackend& b) { return b.interpolate_paths(segments); });
}

double ComputeFacade::operations_per_second() { return op_log_.operations_per_second(clock_()); }

ComputeStats ComputeFacade::stats() {
  ComputeStats s;
  {
    std::lock_guard<std::mutex> g(mu_);
    s.ready = state_ == InitState::DONE;
    s.accelerated_available = s.ready && accelerated_ != nullptr;
    if (s.ready) s.backend = accelerated_ ? accelerated_->name() : reference_->name();
  }
  const TimePoint now = clock_();
  s.operations_per_second = op_log_.operations_per_second(now);
  s.average_operation_ms = op_log_.average_duration_ms(now);
  s.recorded_operations = op_log_.size();
  s.accelerated_calls = accelerated_calls_.load();
  s.reference_calls = reference_calls_.load();
  s.fallbacks = fallbacks_.load();
  s.failures = failures_.load();
  s.not_ready_calls = not_ready_calls_.load();
  return s;
}
