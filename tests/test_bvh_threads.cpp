#include <cstddef>
#include <iostream>
#include <random>
#include <thread>
#include <vector>
#include "core/types.hpp"
#include "geom/BVH.hpp"
#include "geom/Mesh.hpp"

using rtc::Vec3;
using rtc::geom::Bvh;
using rtc::geom::Hit;
using rtc::geom::Mesh;
using rtc::geom::Ray;

int main() {
  std::mt19937_64 rng(99);
  std::uniform_real_distribution<double> u(-1.0, 1.0);

  Mesh m;
  for (int i = 0; i < 4000; ++i) {
    Vec3 c{u(rng), u(rng), u(rng)};
    std::size_t base = m.vertices.size();
    for (int k = 0; k < 3; ++k) m.vertices.push_back(c + Vec3{0.1*u(rng), 0.1*u(rng), 0.1*u(rng)});
    m.faces.push_back({base, base + 1, base + 2});
  }
  const Bvh bvh(m);

  std::vector<Ray> rays;
  for (int i = 0; i < 20000; ++i) {
    Vec3 o{4.0*u(rng), 4.0*u(rng), 4.0*u(rng)};
    rays.push_back({o, (Vec3{u(rng), u(rng), u(rng)} * 0.5 - o).normalized()});
  }

  // Serial reference
  std::vector<Hit> serial(rays.size());
  for (std::size_t i = 0; i < rays.size(); ++i) bvh.intersect(m, rays[i], serial[i]);

  // Shared read-only tree and mesh, one Hit per ray, no locking
  const unsigned nthreads = 8;
  std::vector<Hit> parallel(rays.size());
  std::vector<std::thread> workers;
  for (unsigned w = 0; w < nthreads; ++w) {
    workers.emplace_back([&, w]{
      for (std::size_t i = w; i < rays.size(); i += nthreads) bvh.intersect(m, rays[i], parallel[i]);
    });
  }
  for (auto& t : workers) t.join();

  std::size_t hits = 0;
  for (std::size_t i = 0; i < rays.size(); ++i) {
    if (serial[i].hit != parallel[i].hit || serial[i].distance != parallel[i].distance ||
        serial[i].uv.x != parallel[i].uv.x || serial[i].uv.y != parallel[i].uv.y) {
      std::cerr << "Concurrent query " << i << " differs from serial: "
                << parallel[i].distance << " vs " << serial[i].distance << "\n";
      return 1;
    }
    if (serial[i].hit) hits++;
  }
  if (hits == 0) { std::cerr << "No ray hit the mesh\n"; return 1; }
  return 0;
}
