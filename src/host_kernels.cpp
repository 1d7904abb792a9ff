#include "host_kernels.hpp"

#include <algorithm>
#include <cstring>
#include <numeric>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace {

struct VertexKey {
  uint32_t x, y, z;
  bool operator==(const VertexKey& o) const { return x == o.x && y == o.y && z == o.z; }
};

struct VertexKeyHash {
  size_t operator()(const VertexKey& k) const {
    size_t h = k.x;
    h = h * 1000003u ^ k.y;
    h = h * 1000003u ^ k.z;
    return h;
  }
};

uint32_t float_bits(float f) {
  uint32_t u;
  std::memcpy(&u, &f, sizeof(u));
  return u;
}

uint64_t align_up(uint64_t value, uint32_t alignment) {
  if (alignment <= 1) return value;
  const uint64_t a = alignment;
  return (value + a - 1) / a * a;
}

}  // namespace

void validate_geometry(const GeometryBuffers& geometry) {
  if (geometry.positions.size() % 3 != 0) {
    throw std::invalid_argument("position buffer size " +
                                std::to_string(geometry.positions.size()) +
                                " is not a multiple of 3");
  }
  const size_t vertices = geometry.vertex_count();
  for (uint32_t idx : geometry.indices) {
    if (idx >= vertices) {
      throw std::invalid_argument("index " + std::to_string(idx) + " out of range for " +
                                  std::to_string(vertices) + " vertices");
    }
  }
}

GeometryBuffers weld_geometry(const GeometryBuffers& geometry) {
  validate_geometry(geometry);

  std::vector<uint32_t> source = geometry.indices;
  if (source.empty()) {
    source.resize(geometry.vertex_count());
    std::iota(source.begin(), source.end(), 0u);
  }

  GeometryBuffers out;
  out.positions.reserve(geometry.positions.size());
  std::unordered_map<VertexKey, uint32_t, VertexKeyHash> seen;
  std::vector<uint32_t> remap(geometry.vertex_count(), UINT32_MAX);

  auto welded_index = [&](uint32_t v) {
    if (remap[v] != UINT32_MAX) return remap[v];
    const float* p = &geometry.positions[static_cast<size_t>(v) * 3];
    VertexKey key{float_bits(p[0]), float_bits(p[1]), float_bits(p[2])};
    auto it = seen.find(key);
    if (it == seen.end()) {
      const auto next = static_cast<uint32_t>(out.vertex_count());
      out.positions.insert(out.positions.end(), p, p + 3);
      it = seen.emplace(key, next).first;
    }
    remap[v] = it->second;
    return it->second;
  };

  const size_t triangles = source.size() / 3;
  out.indices.reserve(triangles * 3);
  for (size_t t = 0; t < triangles; ++t) {
    const uint32_t a = welded_index(source[t * 3]);
    const uint32_t b = welded_index(source[t * 3 + 1]);
    const uint32_t c = welded_index(source[t * 3 + 2]);
    if (a == b || b == c || a == c) continue;
    out.indices.push_back(a);
    out.indices.push_back(b);
    out.indices.push_back(c);
  }
  return out;
}

std::vector<LayoutSlot> pack_aligned(const std::vector<LayoutRequest>& objects,
                                     uint64_t base_address) {
  std::vector<size_t> order(objects.size());
  std::iota(order.begin(), order.end(), size_t{0});
  std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
    const LayoutRequest& l = objects[a];
    const LayoutRequest& r = objects[b];
    if (l.alignment != r.alignment) return l.alignment > r.alignment;
    return l.priority > r.priority;
  });

  std::vector<LayoutSlot> slots(objects.size());
  uint64_t cursor = 0;
  for (size_t i : order) {
    const LayoutRequest& obj = objects[i];
    cursor = align_up(cursor, obj.alignment);
    slots[i] = LayoutSlot{obj.id, cursor, base_address + cursor};
    // Zero-sized objects still get a distinct address.
    cursor += std::max<uint64_t>(obj.size, 1);
  }
  return slots;
}

std::vector<Quat> to_quaternions(const std::vector<Transform>& transforms) {
  std::vector<Quat> out;
  out.reserve(transforms.size());
  for (const auto& t : transforms) out.push_back(quat_from_euler_xyz(t.rotation));
  return out;
}
