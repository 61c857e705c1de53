#include <cmath>
#include <iostream>
#include <random>
#include "core/types.hpp"
#include "geom/Intersect.hpp"
#include "geom/Ray.hpp"

using rtc::Vec3;
using rtc::geom::Hit;
using rtc::geom::Ray;
using rtc::geom::intersect_triangle;

int main() {
  // Ray along the normal toward the centroid of random triangles
  {
    std::mt19937_64 rng(42);
    std::uniform_real_distribution<double> u(-5.0, 5.0);
    for (int i = 0; i < 1000; ++i) {
      Vec3 v0{u(rng), u(rng), u(rng)}, v1{u(rng), u(rng), u(rng)}, v2{u(rng), u(rng), u(rng)};
      Vec3 n = Vec3::cross(v1 - v0, v2 - v0);
      if (n.norm() < 1e-3) continue; // skip slivers
      n = n.normalized();
      Vec3 c = (v0 + v1 + v2) / 3.0;
      Ray r{c + n * 10.0, -n};
      Hit hit;
      if (!intersect_triangle(v0, v1, v2, r, hit) || !hit.hit) {
        std::cerr << "Centroid ray missed triangle " << i << "\n";
        return 1;
      }
      if (!(hit.uv.x >= 0.0 && hit.uv.y >= 0.0 && hit.uv.x + hit.uv.y <= 1.0)) {
        std::cerr << "Barycentrics out of range: u=" << hit.uv.x << " v=" << hit.uv.y << "\n";
        return 1;
      }
      if ((hit.position - c).norm() > 1e-9 || std::abs(hit.distance - 10.0) > 1e-9) {
        std::cerr << "Hit position/distance off: d=" << hit.distance << "\n";
        return 1;
      }
      // Flat face normal, oriented as e1 x e2
      if ((hit.normal - n).norm() > 1e-9) {
        std::cerr << "Normal is not the face normal\n";
        return 1;
      }
    }
  }

  const Vec3 v0{0,0,0}, v1{1,0,0}, v2{0,1,0};

  // Barycentrics at a known point: u weights v1, v weights v2
  {
    Hit hit;
    intersect_triangle(v0, v1, v2, Ray{{0.25, 0.5, 3}, {0,0,-1}}, hit);
    if (!hit.hit || std::abs(hit.uv.x - 0.25) > 1e-12 || std::abs(hit.uv.y - 0.5) > 1e-12) {
      std::cerr << "Barycentrics wrong: u=" << hit.uv.x << " v=" << hit.uv.y << "\n";
      return 1;
    }
  }

  // Outside the triangle (u+v > 1) and behind the origin (t <= 0)
  {
    Hit hit;
    if (intersect_triangle(v0, v1, v2, Ray{{0.75, 0.75, 3}, {0,0,-1}}, hit) || hit.hit) {
      std::cerr << "Point outside triangle reported as hit\n";
      return 1;
    }
    if (intersect_triangle(v0, v1, v2, Ray{{0.2, 0.2, 3}, {0,0,1}}, hit) || hit.hit) {
      std::cerr << "Triangle behind ray reported as hit\n";
      return 1;
    }
  }

  // Ray parallel to the triangle plane: determinant exactly zero
  {
    Hit hit;
    if (intersect_triangle(v0, v1, v2, Ray{{-1, 0.2, 0}, {1,0,0}}, hit) || hit.hit) {
      std::cerr << "Parallel ray reported as hit\n";
      return 1;
    }
  }

  // Only strictly nearer hits update: equal distance keeps the first record,
  // a farther triangle is ignored, a nearer one replaces it
  {
    Hit hit;
    Ray r{{0.2, 0.2, 3}, {0,0,-1}};
    if (!intersect_triangle(v0, v1, v2, r, hit)) { std::cerr << "First hit missed\n"; return 1; }
    const Vec3 w0{0,0,0}, w1{0,1,0}, w2{1,0,0}; // same plane, opposite winding
    if (intersect_triangle(w0, w1, w2, r, hit)) {
      std::cerr << "Tie replaced earlier hit\n";
      return 1;
    }
    if (hit.normal.z != 1.0) { std::cerr << "Tie changed the normal\n"; return 1; }
    const Vec3 off{0, 0, -1};
    if (intersect_triangle(v0 + off, v1 + off, v2 + off, r, hit)) {
      std::cerr << "Farther triangle replaced nearer hit\n";
      return 1;
    }
    const Vec3 up{0, 0, 1};
    if (!intersect_triangle(v0 + up, v1 + up, v2 + up, r, hit) || std::abs(hit.distance - 2.0) > 1e-12) {
      std::cerr << "Nearer triangle did not replace hit: d=" << hit.distance << "\n";
      return 1;
    }
  }

  // Direction need not be unit length: t is parametric
  {
    Hit hit;
    intersect_triangle(v0, v1, v2, Ray{{0.2, 0.2, 3}, {0,0,-2}}, hit);
    if (!hit.hit || std::abs(hit.distance - 1.5) > 1e-12 || std::abs(hit.position.z) > 1e-12) {
      std::cerr << "Non-unit direction gave wrong hit: t=" << hit.distance << "\n";
      return 1;
    }
  }

  return 0;
}
