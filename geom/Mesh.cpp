#include "geom/Mesh.hpp"

#include <map>
#include <tuple>

namespace rtc::geom {

using rtc::Vec3;

Mesh Mesh::from_triangles(const std::vector<Triangle>& tris) {
  Mesh m;
  m.faces.reserve(tris.size());
  std::map<std::tuple<double,double,double>, std::size_t> index;
  auto vertex_id = [&](const Vec3& p) -> std::size_t {
    auto key = std::make_tuple(p.x, p.y, p.z);
    auto it = index.find(key);
    if (it != index.end()) return it->second;
    std::size_t id = m.vertices.size();
    m.vertices.push_back(p);
    index.emplace(key, id);
    return id;
  };
  for (const auto& t : tris) {
    std::size_t a = vertex_id(t.v0);
    std::size_t b = vertex_id(t.v1);
    std::size_t c = vertex_id(t.v2);
    m.faces.push_back({a, b, c});
  }
  return m;
}

bool Mesh::valid() const {
  const std::size_t n = vertices.size();
  for (const auto& f : faces) {
    if (f.v0 >= n || f.v1 >= n || f.v2 >= n) return false;
  }
  return true;
}

Aabb Mesh::bounds(const std::size_t* face_indices, std::size_t count) const {
  Aabb b;
  for (std::size_t i = 0; i < count; ++i) {
    const Face& f = faces[face_indices[i]];
    b.expand(vertices[f.v0]); b.expand(vertices[f.v1]); b.expand(vertices[f.v2]);
  }
  return b;
}

Aabb Mesh::bounds() const {
  Aabb b;
  for (const auto& f : faces) {
    b.expand(vertices[f.v0]); b.expand(vertices[f.v1]); b.expand(vertices[f.v2]);
  }
  return b;
}

} // namespace rtc::geom
