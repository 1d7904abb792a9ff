#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "transform_math.hpp"

constexpr uint64_t kLayoutBaseAddress = 0x1000;

struct LayoutRequest {
  std::string id;
  uint64_t size{0};
  uint32_t alignment{1};
  int priority{0};
};

struct LayoutSlot {
  std::string id;
  uint64_t offset{0};
  uint64_t address{0};
};

// Flat xyz positions plus an optional triangle index list.
struct GeometryBuffers {
  std::vector<float> positions;
  std::vector<uint32_t> indices;

  size_t vertex_count() const { return positions.size() / 3; }
};

using Polyline = std::vector<Vec3>;

// The menu of numeric operations offloaded by visual components. Failures
// are reported by throwing a std::exception subclass.
class ComputeBackend {
public:
  virtual ~ComputeBackend() = default;

  virtual std::string name() const = 0;

  // Each object gets a distinct, non-overlapping span of at least `size`
  // bytes. Results are in input order.
  virtual std::vector<LayoutSlot> pack_memory_layout(
      const std::vector<LayoutRequest>& objects) = 0;

  virtual GeometryBuffers optimize_geometry(const GeometryBuffers& geometry) = 0;

  // 16 floats per transform, column-major, input order.
  virtual std::vector<float> batch_compose_transforms(
      const std::vector<Transform>& transforms) = 0;

  // Three points per segment: start, raised midpoint, end.
  virtual std::vector<Polyline> interpolate_paths(const std::vector<PathSegment>& segments) = 0;
};
