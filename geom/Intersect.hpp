// Exact ray/primitive tests updating a nearest-hit accumulator
#pragma once

#include "core/types.hpp"
#include "geom/Ray.hpp"

namespace rtc::geom {

// Cramer's rule on [e1 e2 -d]. A ray parallel to the triangle plane
// (determinant exactly zero) misses; there is no epsilon band. Only strictly
// nearer hits (0 < t < hit.distance) replace the record. Normal is the flat
// face normal normalize(e1 x e2); uv are the barycentric weights of v1, v2.
bool intersect_triangle(const rtc::Vec3& v0, const rtc::Vec3& v1, const rtc::Vec3& v2,
                        const Ray& r, Hit& hit);

// Near root only: rays starting inside the sphere miss it. Assumes |r.d| == 1.
bool intersect_sphere(const rtc::Vec3& center, double radius, const Ray& r, Hit& hit);

// Infinite plane through `center` with unit `normal`. uv tiles x and z modulo 1,
// which is only meaningful for a plane whose normal is the y axis.
bool intersect_plane(const rtc::Vec3& center, const rtc::Vec3& normal, const Ray& r, Hit& hit);

} // namespace rtc::geom
