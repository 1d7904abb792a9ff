#pragma once
#include "compute_backend.hpp"

// Always available, single-threaded CPU implementation. Geometry passes
// through unchanged and layout is a running sum in input order.
class ReferenceBackend : public ComputeBackend {
public:
  std::string name() const override { return "reference"; }

  std::vector<LayoutSlot> pack_memory_layout(const std::vector<LayoutRequest>& objects) override;
  GeometryBuffers optimize_geometry(const GeometryBuffers& geometry) override;
  std::vector<float> batch_compose_transforms(const std::vector<Transform>& transforms) override;
  std::vector<Polyline> interpolate_paths(const std::vector<PathSegment>& segments) override;
};
