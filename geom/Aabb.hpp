// Axis-aligned bounding box with slab ray test
#pragma once

#include <algorithm>
#include <utility>
#include <vector>
#include "core/consts.hpp"
#include "core/types.hpp"
#include "geom/Ray.hpp"

namespace rtc::geom {

struct Aabb {
  // Default state is the empty sentinel: any expand() overwrites both corners.
  rtc::Vec3 lo{ rtc::consts::inf,  rtc::consts::inf,  rtc::consts::inf};
  rtc::Vec3 hi{-rtc::consts::inf, -rtc::consts::inf, -rtc::consts::inf};

  static Aabb of(const std::vector<rtc::Vec3>& points) {
    Aabb b; for (const auto& p : points) b.expand(p); return b;
  }

  void expand(const rtc::Vec3& p) {
    lo.x = std::min(lo.x, p.x); lo.y = std::min(lo.y, p.y); lo.z = std::min(lo.z, p.z);
    hi.x = std::max(hi.x, p.x); hi.y = std::max(hi.y, p.y); hi.z = std::max(hi.z, p.z);
  }
  // An empty box contributes nothing; its inf corners would otherwise span all space
  void expand(const Aabb& b) { if (b.empty()) return; expand(b.lo); expand(b.hi); }

  bool empty() const { return lo.x > hi.x && lo.y > hi.y && lo.z > hi.z; }
  rtc::Vec3 extent() const { return {hi.x - lo.x, hi.y - lo.y, hi.z - lo.z}; }

  bool contains(const rtc::Vec3& p) const {
    return p.x >= lo.x && p.x <= hi.x &&
           p.y >= lo.y && p.y <= hi.y &&
           p.z >= lo.z && p.z <= hi.z;
  }

  // Slab test. Only answers "possibly hit"; zero direction components give
  // infinite reciprocals and NaN slab bounds are ignored.
  bool intersect(const Ray& r) const {
    double t0 = -rtc::consts::inf, t1 = rtc::consts::inf;
    for (int i = 0; i < 3; ++i) {
      double invd = 1.0 / r.d[i];
      double tNear = (lo[i] - r.o[i]) * invd;
      double tFar  = (hi[i] - r.o[i]) * invd;
      if (invd < 0.0) std::swap(tNear, tFar);
      t0 = tNear > t0 ? tNear : t0;
      t1 = tFar  < t1 ? tFar  : t1;
      if (t1 < t0) return false;
    }
    return t1 >= 0.0;
  }
};

} // namespace rtc::geom
