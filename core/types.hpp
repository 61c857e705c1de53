// Minimal vector types for rtcore
#pragma once

#include <cmath>
#include <cstddef>

namespace rtc {

struct Vec3 {
  double x{0}, y{0}, z{0};

  Vec3() = default;
  constexpr Vec3(double x_, double y_, double z_) : x(x_), y(y_), z(z_) {}

  constexpr Vec3 operator+(const Vec3& o) const { return {x + o.x, y + o.y, z + o.z}; }
  constexpr Vec3 operator-(const Vec3& o) const { return {x - o.x, y - o.y, z - o.z}; }
  // Elementwise
  constexpr Vec3 operator*(const Vec3& o) const { return {x * o.x, y * o.y, z * o.z}; }
  constexpr Vec3 operator/(const Vec3& o) const { return {x / o.x, y / o.y, z / o.z}; }
  constexpr Vec3 operator*(double s) const { return {x * s, y * s, z * s}; }
  constexpr Vec3 operator/(double s) const { return {x / s, y / s, z / s}; }
  constexpr Vec3 operator-() const { return {-x, -y, -z}; }
  Vec3& operator+=(const Vec3& o) { x += o.x; y += o.y; z += o.z; return *this; }
  Vec3& operator-=(const Vec3& o) { x -= o.x; y -= o.y; z -= o.z; return *this; }
  Vec3& operator*=(double s) { x *= s; y *= s; z *= s; return *this; }
  Vec3& operator/=(double s) { x /= s; y /= s; z /= s; return *this; }

  friend constexpr Vec3 operator*(double s, const Vec3& v) { return v * s; }

  static constexpr double dot(const Vec3& a, const Vec3& b) {
    return a.x*b.x + a.y*b.y + a.z*b.z;
  }

  static constexpr Vec3 cross(const Vec3& a, const Vec3& b) {
    return {
      a.y*b.z - a.z*b.y,
      a.z*b.x - a.x*b.z,
      a.x*b.y - a.y*b.x
    };
  }

  // Mirror v about unit normal n
  static constexpr Vec3 reflect(const Vec3& v, const Vec3& n) {
    return v - n * (2.0 * dot(v, n));
  }

  double norm() const { return std::sqrt(x*x + y*y + z*z); }

  // No zero-length guard: a zero vector yields NaN components.
  Vec3 normalized() const { return *this * (1.0 / norm()); }

  double operator[](int axis) const { return axis == 0 ? x : (axis == 1 ? y : z); }
};

struct Vec2 {
  double x{0}, y{0};

  Vec2() = default;
  constexpr Vec2(double x_, double y_) : x(x_), y(y_) {}

  constexpr Vec2 operator+(const Vec2& o) const { return {x + o.x, y + o.y}; }
  constexpr Vec2 operator-(const Vec2& o) const { return {x - o.x, y - o.y}; }
  constexpr Vec2 operator*(const Vec2& o) const { return {x * o.x, y * o.y}; }
  constexpr Vec2 operator/(const Vec2& o) const { return {x / o.x, y / o.y}; }
  constexpr Vec2 operator*(double s) const { return {x * s, y * s}; }
  constexpr Vec2 operator/(double s) const { return {x / s, y / s}; }
  constexpr Vec2 operator-() const { return {-x, -y}; }

  friend constexpr Vec2 operator*(double s, const Vec2& v) { return v * s; }

  static constexpr double dot(const Vec2& a, const Vec2& b) { return a.x*b.x + a.y*b.y; }
  // z component of the 3D cross product
  static constexpr double cross(const Vec2& a, const Vec2& b) { return a.x*b.y - b.x*a.y; }

  double norm() const { return std::sqrt(x*x + y*y); }
  Vec2 normalized() const { return *this * (1.0 / norm()); }
};

} // namespace rtc
