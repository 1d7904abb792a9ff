#pragma once
#include <vector>

#include "compute_backend.hpp"

// Throws std::invalid_argument when positions are not xyz triples or an
// index points past the vertex buffer.
void validate_geometry(const GeometryBuffers& geometry);

// Merges bit-identical vertices, remaps indices and drops triangles that
// collapse to a line or point. Non-indexed input is read as a triangle list.
GeometryBuffers weld_geometry(const GeometryBuffers& geometry);

// Places larger alignments first (then higher priority, then input order),
// rounding every offset up to its alignment. Results are in input order.
std::vector<LayoutSlot> pack_aligned(const std::vector<LayoutRequest>& objects,
                                     uint64_t base_address = kLayoutBaseAddress);

std::vector<Quat> to_quaternions(const std::vector<Transform>& transforms);
