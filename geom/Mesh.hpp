// Indexed triangle mesh shared read-only by all ray queries
#pragma once

#include <cstddef>
#include <vector>
#include "core/types.hpp"
#include "geom/Aabb.hpp"

namespace rtc::geom {

struct Face { std::size_t v0, v1, v2; }; // vertex indices

struct Triangle { rtc::Vec3 v0, v1, v2; };

struct Mesh {
  std::vector<rtc::Vec3> vertices;
  std::vector<Face> faces;

  // Weld a triangle soup into an indexed mesh (exactly equal positions share a vertex)
  static Mesh from_triangles(const std::vector<Triangle>& tris);

  // False if any face references a vertex that does not exist
  bool valid() const;

  // Box over the vertices referenced by the given faces
  Aabb bounds(const std::size_t* face_indices, std::size_t count) const;
  Aabb bounds() const;
};

} // namespace rtc::geom
