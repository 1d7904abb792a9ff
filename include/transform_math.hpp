#pragma once
#include <cmath>

// Shared by the host and the CUDA kernels. Only multiplies and adds appear in
// the device-callable functions so both sides round identically when FMA
// contraction is disabled.
#if defined(__CUDACC__)
#define FRAMEPACE_HD __host__ __device__
#else
#define FRAMEPACE_HD
#endif

constexpr float kPathArcHeight = 1.0f;

struct Vec3 {
  float x{0.0f}, y{0.0f}, z{0.0f};
};

struct Quat {
  float x{0.0f}, y{0.0f}, z{0.0f}, w{1.0f};
};

struct Transform {
  Vec3 position;
  Vec3 rotation;  // Euler angles in radians, XYZ order
  Vec3 scale{1.0f, 1.0f, 1.0f};
};

struct PathSegment {
  Vec3 start;
  Vec3 end;
  float weight{1.0f};
};

// Host only: the device sin/cos do not round like the host libm.
inline Quat quat_from_euler_xyz(const Vec3& e) {
  const float c1 = std::cos(e.x * 0.5f);
  const float c2 = std::cos(e.y * 0.5f);
  const float c3 = std::cos(e.z * 0.5f);
  const float s1 = std::sin(e.x * 0.5f);
  const float s2 = std::sin(e.y * 0.5f);
  const float s3 = std::sin(e.z * 0.5f);

  Quat q;
  q.x = s1 * c2 * c3 + c1 * s2 * s3;
  q.y = c1 * s2 * c3 - s1 * c2 * s3;
  q.z = c1 * c2 * s3 + s1 * s2 * c3;
  q.w = c1 * c2 * c3 - s1 * s2 * s3;
  return q;
}

// Writes translation * rotation * scale as a column-major 4x4 block.
FRAMEPACE_HD inline void compose_trs(const Vec3& p, const Quat& q, const Vec3& s, float* out) {
  const float x2 = q.x + q.x, y2 = q.y + q.y, z2 = q.z + q.z;
  const float xx = q.x * x2, xy = q.x * y2, xz = q.x * z2;
  const float yy = q.y * y2, yz = q.y * z2, zz = q.z * z2;
  const float wx = q.w * x2, wy = q.w * y2, wz = q.w * z2;

  out[0] = (1.0f - (yy + zz)) * s.x;
  out[1] = (xy + wz) * s.x;
  out[2] = (xz - wy) * s.x;
  out[3] = 0.0f;

  out[4] = (xy - wz) * s.y;
  out[5] = (1.0f - (xx + zz)) * s.y;
  out[6] = (yz + wx) * s.y;
  out[7] = 0.0f;

  out[8] = (xz + wy) * s.z;
  out[9] = (yz - wx) * s.z;
  out[10] = (1.0f - (xx + yy)) * s.z;
  out[11] = 0.0f;

  out[12] = p.x;
  out[13] = p.y;
  out[14] = p.z;
  out[15] = 1.0f;
}

// Writes start, raised midpoint, end.
FRAMEPACE_HD inline void arc_polyline(const PathSegment& seg, Vec3* out) {
  out[0] = seg.start;
  out[1].x = (seg.start.x + seg.end.x) * 0.5f;
  out[1].y = (seg.start.y + seg.end.y) * 0.5f + seg.weight * kPathArcHeight;
  out[1].z = (seg.start.z + seg.end.z) * 0.5f;
  out[2] = seg.end;
}
