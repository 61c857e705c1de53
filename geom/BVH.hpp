// Median-split BVH over a mesh with recursive nearest-hit traversal
#pragma once

#include <cstddef>
#include <vector>
#include "geom/Aabb.hpp"
#include "geom/Mesh.hpp"
#include "geom/Ray.hpp"

namespace rtc::geom {

// Leaf: [start, start+count) in Bvh::indices(), no children.
// Internal: exactly two children, count == 0.
struct BvhNode {
  Aabb box;
  int left{-1}, right{-1};
  std::size_t start{0}, count{0};
  bool leaf{false};
};

// Built once from a mesh and immutable afterwards. The tree does not keep a
// reference to the mesh; queries take the mesh it was built from.
class Bvh {
public:
  // An empty mesh yields a single leaf with an empty box that no ray hits.
  // Callers are expected not to build from empty meshes.
  explicit Bvh(const Mesh& mesh);

  // Tests every face of every leaf whose box (and ancestors' boxes) the ray
  // passes; both children of an internal node are always visited. Returns
  // true if this call improved `hit`.
  bool intersect(const Mesh& mesh, const Ray& r, Hit& hit) const;

  const std::vector<BvhNode>& nodes() const { return m_nodes; }
  const std::vector<std::size_t>& indices() const { return m_indices; }
  const Aabb& bounds() const { return m_nodes.front().box; }
  std::size_t leaf_count() const;
  int depth() const { return depth_of(0); }

private:
  std::vector<std::size_t> m_indices;
  std::vector<BvhNode> m_nodes;

  int build_node(const Mesh& mesh, std::size_t start, std::size_t count);
  bool intersect_node(int ni, const Mesh& mesh, const Ray& r, Hit& hit) const;
  int depth_of(int ni) const;
};

} // namespace rtc::geom
