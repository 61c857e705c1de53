// Scalar helpers on top of Vec3
#pragma once

#include <cmath>
#include "core/types.hpp"

namespace rtc {

// Determinant of the 3x3 matrix with columns a, b, c (scalar triple product)
inline constexpr double det(const Vec3& a, const Vec3& b, const Vec3& c) {
  return Vec3::dot(a, Vec3::cross(b, c));
}

// Floored modulo: result has the sign of m, so modulo(-0.25, 1) == 0.75
inline double modulo(double x, double m) {
  double r = std::fmod(x, m);
  if (r >= 0.0) return r;
  r += m;
  return (r < m) ? r : 0.0; // tiny negative inputs round up to m
}

} // namespace rtc
