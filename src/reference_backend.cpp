#include "reference_backend.hpp"

#include "host_kernels.hpp"

std::vector<LayoutSlot> ReferenceBackend::pack_memory_layout(
    const std::vector<LayoutRequest>& objects) {
  std::vector<LayoutSlot> slots;
  slots.reserve(objects.size());
  uint64_t offset = 0;
  for (const auto& obj : objects) {
    slots.push_back(LayoutSlot{obj.id, offset, kLayoutBaseAddress + offset});
    offset += obj.size;
  }
  return slots;
}

GeometryBuffers ReferenceBackend::optimize_geometry(const GeometryBuffers& geometry) {
  validate_geometry(geometry);
  return geometry;
}

std::vector<float> ReferenceBackend::batch_compose_transforms(
    const std::vector<Transform>& transforms) {
  std::vector<float> matrices(transforms.size() * 16);
  for (size_t i = 0; i < transforms.size(); ++i) {
    const Transform& t = transforms[i];
    compose_trs(t.position, quat_from_euler_xyz(t.rotation), t.scale, &matrices[i * 16]);
  }
  return matrices;
}

std::vector<Polyline> ReferenceBackend::interpolate_paths(
    const std::vector<PathSegment>& segments) {
  std::vector<Polyline> paths;
  paths.reserve(segments.size());
  for (const auto& seg : segments) {
    Polyline line(3);
    arc_polyline(seg, line.data());
    paths.push_back(std::move(line));
  }
  return paths;
}
