// Ray and per-query hit accumulator
#pragma once

#include <cstddef>
#include "core/consts.hpp"
#include "core/types.hpp"

namespace rtc::geom {

struct Ray {
  rtc::Vec3 o, d; // origin, direction (normalized by the caller)

  rtc::Vec3 at(double t) const { return o + d * t; }
};

// Nearest hit found so far. A default-constructed Hit is the "no hit yet"
// state; distance only ever decreases while a query runs.
struct Hit {
  bool hit{false};
  rtc::Vec3 position{0,0,0};
  double distance{rtc::consts::inf};
  rtc::Vec3 normal{0,0,0};
  rtc::Vec2 uv{0,0};
  // Filled by the scene layer after geometric resolution; opaque to the core
  std::size_t material_id{0};
};

} // namespace rtc::geom
