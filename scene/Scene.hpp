// Read-only list of scene elements answering nearest-hit queries
#pragma once

#include <cstddef>
#include <memory>
#include <utility>
#include <vector>
#include "geom/Ray.hpp"
#include "scene/Element.hpp"

namespace rtc::scene {

class Scene {
public:
  Scene() = default;

  // Non-copyable
  Scene(const Scene&) = delete;
  Scene& operator=(const Scene&) = delete;
  Scene(Scene&&) = default;
  Scene& operator=(Scene&&) = default;

  // Populate before the first query; there is no removal.
  void add(std::unique_ptr<Element> e) { m_elements.push_back(std::move(e)); }

  // Nearest hit over all elements. hit.material_id is the id of the element
  // that produced the final hit; it is left at 0 on a miss.
  geom::Hit intersect(const geom::Ray& r) const;

  // Same query against a caller-owned accumulator (only tightens it).
  bool intersect(const geom::Ray& r, geom::Hit& hit) const;

  std::size_t size() const { return m_elements.size(); }
  const Element& element(std::size_t i) const { return *m_elements[i]; }

private:
  std::vector<std::unique_ptr<Element>> m_elements;
};

} // namespace rtc::scene
