#pragma once
#include <memory>

#include "compute_backend.hpp"

// Creates the CUDA-accelerated backend on `device_index`. Throws
// std::runtime_error when the build has no CUDA support or no usable device
// is present.
std::unique_ptr<ComputeBackend> load_cuda_backend(int device_index);
