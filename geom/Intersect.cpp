#include "geom/Intersect.hpp"
#include "core/math.hpp"
#include <cmath>

namespace rtc::geom {

using rtc::Vec3;

bool intersect_triangle(const Vec3& v0, const Vec3& v1, const Vec3& v2,
                        const Ray& r, Hit& hit) {
  const Vec3 nd = -r.d;
  const Vec3 e1 = v1 - v0;
  const Vec3 e2 = v2 - v0;
  const double denom = rtc::det(e1, e2, nd);
  if (denom == 0.0) return false;
  const double inv = 1.0 / denom;
  const Vec3 s = r.o - v0;

  const double u = rtc::det(s, e2, nd) * inv;
  if (u < 0.0 || u > 1.0) return false;
  const double v = rtc::det(e1, s, nd) * inv;
  if (v < 0.0 || u + v > 1.0) return false;
  const double t = rtc::det(e1, e2, s) * inv;
  if (!(t > 0.0 && t < hit.distance)) return false;

  hit.hit = true;
  hit.position = r.at(t);
  hit.normal = Vec3::cross(e1, e2).normalized();
  hit.distance = t;
  hit.uv = {u, v};
  return true;
}

bool intersect_sphere(const Vec3& center, double radius, const Ray& r, Hit& hit) {
  const Vec3 a = r.o - center;
  const double b = Vec3::dot(a, r.d);
  const double c = Vec3::dot(a, a) - radius * radius;
  const double disc = b * b - c;
  if (!(disc > 0.0)) return false;
  const double t = -b - std::sqrt(disc);
  if (!(t > 0.0 && t < hit.distance)) return false;

  hit.hit = true;
  hit.position = r.at(t);
  hit.distance = t;
  hit.normal = (hit.position - center).normalized();
  return true;
}

bool intersect_plane(const Vec3& center, const Vec3& normal, const Ray& r, Hit& hit) {
  const double d = -Vec3::dot(center, normal);
  const double v = Vec3::dot(r.d, normal);
  // v == 0 gives +-inf or NaN, both rejected below
  const double t = -(Vec3::dot(r.o, normal) + d) / v;
  if (!(t > 0.0 && t < hit.distance)) return false;

  hit.hit = true;
  hit.position = r.at(t);
  hit.normal = normal;
  hit.distance = t;
  hit.uv = {rtc::modulo(hit.position.x, 1.0), rtc::modulo(hit.position.z, 1.0)};
  return true;
}

} // namespace rtc::geom
