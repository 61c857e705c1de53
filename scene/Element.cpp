#include "scene/Element.hpp"
#include "geom/Intersect.hpp"
#include <utility>

namespace rtc::scene {

bool Sphere::intersect(const geom::Ray& r, geom::Hit& hit) const {
  return geom::intersect_sphere(m_center, m_radius, r, hit);
}

bool Plane::intersect(const geom::Ray& r, geom::Hit& hit) const {
  return geom::intersect_plane(m_center, m_normal, r, hit);
}

// m_mesh is declared before m_bvh, so it is moved in before the tree is built
MeshElement::MeshElement(geom::Mesh mesh, std::size_t material_id)
  : Element(material_id), m_mesh(std::move(mesh)), m_bvh(m_mesh) {}

bool MeshElement::intersect(const geom::Ray& r, geom::Hit& hit) const {
  return m_bvh.intersect(m_mesh, r, hit);
}

} // namespace rtc::scene
