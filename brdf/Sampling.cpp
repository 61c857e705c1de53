#include "brdf/Sampling.hpp"
#include "core/consts.hpp"
#include <algorithm>
#include <cmath>

namespace rtc::brdf {

using rtc::Vec3;

Basis make_basis(const Vec3& n) {
  const Vec3 up = (std::abs(n.x) > rtc::consts::eps) ? Vec3{0, 1, 0} : Vec3{1, 0, 0};
  Basis b;
  b.normal = n;
  b.tangent = Vec3::cross(up, n).normalized();
  b.binormal = Vec3::cross(n, b.tangent); // already unit length
  return b;
}

Vec3 sample_cosine_hemisphere(double u1, double u2, const Vec3& n) {
  // Inverse CDF of cos(theta)/pi: sin(theta) = sqrt(u2), phi = 2 pi u1
  const Basis b = make_basis(n);
  const double phi = rtc::consts::two_pi * u1;
  const double sr = std::sqrt(u2);
  return b.tangent * (std::cos(phi) * sr) + b.binormal * (std::sin(phi) * sr) + n * std::sqrt(1.0 - u2);
}

double cosine_hemisphere_pdf(double cos_theta) {
  return std::max(0.0, cos_theta) * rtc::consts::inv_pi;
}

Vec3 sample_ggx_half_vector(double u1, double u2, const Vec3& n, double alpha) {
  const double a2 = alpha * alpha;
  const double phi = rtc::consts::two_pi * u1;
  const double cos_theta = std::sqrt((1.0 - u2) / (1.0 + (a2 - 1.0) * u2));
  const double sin_theta = std::sqrt(std::max(0.0, 1.0 - cos_theta * cos_theta));
  const Vec3 h{sin_theta * std::cos(phi), sin_theta * std::sin(phi), cos_theta};
  return make_basis(n).to_world(h);
}

} // namespace rtc::brdf
