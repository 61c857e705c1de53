#include "geom/BVH.hpp"
#include "geom/Intersect.hpp"
#include <algorithm>

namespace rtc::geom {

// Sum (not mean) of the three vertex coordinates on one axis; same order.
static inline double coord_sum(const Mesh& mesh, std::size_t face, int axis) {
  const Face& f = mesh.faces[face];
  return mesh.vertices[f.v0][axis] + mesh.vertices[f.v1][axis] + mesh.vertices[f.v2][axis];
}

Bvh::Bvh(const Mesh& mesh) {
  m_indices.resize(mesh.faces.size());
  for (std::size_t i = 0; i < m_indices.size(); ++i) m_indices[i] = i;
  m_nodes.reserve(2 * m_indices.size() + 1);
  build_node(mesh, 0, m_indices.size());
}

int Bvh::build_node(const Mesh& mesh, std::size_t start, std::size_t count) {
  BvhNode node; node.start = start; node.count = count;
  node.box = mesh.bounds(m_indices.data() + start, count);
  std::size_t mid = count / 2;
  node.leaf = (mid <= 2);
  int idx = static_cast<int>(m_nodes.size());
  m_nodes.push_back(node);
  if (node.leaf) return idx;

  // Axis whose extent strictly exceeds both others; z when none does
  rtc::Vec3 e = node.box.extent(); int axis = 2;
  if (e.x > e.y && e.x > e.z) axis = 0; else if (e.y > e.x && e.y > e.z) axis = 1;

  std::stable_sort(m_indices.begin()+start, m_indices.begin()+start+count,
    [&](std::size_t a, std::size_t b){
      return coord_sum(mesh, a, axis) < coord_sum(mesh, b, axis);
    });

  int left = build_node(mesh, start, mid);
  int right = build_node(mesh, start + mid, count - mid);
  m_nodes[idx].left = left;
  m_nodes[idx].right = right;
  m_nodes[idx].count = 0;
  return idx;
}

bool Bvh::intersect_node(int ni, const Mesh& mesh, const Ray& r, Hit& hit) const {
  const BvhNode& n = m_nodes[ni];
  if (!n.box.intersect(r)) return false;
  bool improved = false;
  if (n.leaf) {
    for (std::size_t i = 0; i < n.count; ++i) {
      const Face& f = mesh.faces[m_indices[n.start + i]];
      if (intersect_triangle(mesh.vertices[f.v0], mesh.vertices[f.v1], mesh.vertices[f.v2], r, hit))
        improved = true;
    }
  } else {
    // No near/far ordering and no early exit
    if (intersect_node(n.left, mesh, r, hit)) improved = true;
    if (intersect_node(n.right, mesh, r, hit)) improved = true;
  }
  return improved;
}

bool Bvh::intersect(const Mesh& mesh, const Ray& r, Hit& hit) const {
  return intersect_node(0, mesh, r, hit);
}

std::size_t Bvh::leaf_count() const {
  return static_cast<std::size_t>(std::count_if(m_nodes.begin(), m_nodes.end(),
    [](const BvhNode& n){ return n.leaf; }));
}

int Bvh::depth_of(int ni) const {
  const BvhNode& n = m_nodes[ni];
  if (n.leaf) return 1;
  return 1 + std::max(depth_of(n.left), depth_of(n.right));
}

} // namespace rtc::geom
