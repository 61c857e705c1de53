#include "scene/Scene.hpp"

namespace rtc::scene {

bool Scene::intersect(const geom::Ray& r, geom::Hit& hit) const {
  bool improved = false;
  for (const auto& e : m_elements) {
    if (e->intersect(r, hit)) {
      hit.material_id = e->material_id();
      improved = true;
    }
  }
  return improved;
}

geom::Hit Scene::intersect(const geom::Ray& r) const {
  geom::Hit hit;
  intersect(r, hit);
  return hit;
}

} // namespace rtc::scene
