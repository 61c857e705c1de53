// Intersectable scene elements (analytic primitives and BVH-backed meshes)
#pragma once

#include <cstddef>
#include "core/types.hpp"
#include "geom/BVH.hpp"
#include "geom/Mesh.hpp"
#include "geom/Ray.hpp"

namespace rtc::scene {

class Element {
public:
  explicit Element(std::size_t material_id) : m_material_id(material_id) {}
  virtual ~Element() = default;

  // Tighten `hit` if this element has a strictly nearer hit; true if it did.
  virtual bool intersect(const geom::Ray& r, geom::Hit& hit) const = 0;
  std::size_t material_id() const { return m_material_id; }

private:
  std::size_t m_material_id;
};

class Sphere : public Element {
public:
  Sphere(const rtc::Vec3& center, double radius, std::size_t material_id)
    : Element(material_id), m_center(center), m_radius(radius) {}
  bool intersect(const geom::Ray& r, geom::Hit& hit) const override;

private:
  rtc::Vec3 m_center;
  double m_radius;
};

// uv tiling assumes normal == (0,1,0)
class Plane : public Element {
public:
  Plane(const rtc::Vec3& center, const rtc::Vec3& normal, std::size_t material_id)
    : Element(material_id), m_center(center), m_normal(normal) {}
  bool intersect(const geom::Ray& r, geom::Hit& hit) const override;

private:
  rtc::Vec3 m_center;
  rtc::Vec3 m_normal;
};

// Owns its mesh and the tree built over it; both are fixed after construction.
class MeshElement : public Element {
public:
  MeshElement(geom::Mesh mesh, std::size_t material_id);
  bool intersect(const geom::Ray& r, geom::Hit& hit) const override;

  const geom::Mesh& mesh() const { return m_mesh; }
  const geom::Bvh& bvh() const { return m_bvh; }

private:
  geom::Mesh m_mesh;
  geom::Bvh m_bvh;
};

} // namespace rtc::scene
