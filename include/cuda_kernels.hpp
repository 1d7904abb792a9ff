#pragma once
#include <cuda_runtime.h>

#include "transform_math.hpp"

// Host-side launchers for the kernels in cuda_kernels.cu. Arguments are
// device pointers; launches are asynchronous on `stream`.
void launch_compose_trs(const Vec3* positions, const Quat* rotations, const Vec3* scales,
                        float* matrices, int count, cudaStream_t stream);

void launch_arc_paths(const PathSegment* segments, Vec3* points, int count, cudaStream_t stream);
