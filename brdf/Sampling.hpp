// Importance sampling of BRDF lobes from caller-supplied uniform pairs
#pragma once

#include "core/types.hpp"

namespace rtc::brdf {

// Orthonormal frame around a unit normal. Both samplers build it through
// make_basis so they pick the same helper axis for the same normal.
struct Basis {
  rtc::Vec3 tangent, binormal, normal;

  rtc::Vec3 to_world(const rtc::Vec3& local) const {
    return tangent * local.x + binormal * local.y + normal * local.z;
  }
};

// Helper axis is (0,1,0) when |n.x| > consts::eps, otherwise (1,0,0).
Basis make_basis(const rtc::Vec3& n);

// Cosine-weighted hemisphere direction around n for u1, u2 in [0,1).
// Density is cos(theta)/pi; see cosine_hemisphere_pdf.
rtc::Vec3 sample_cosine_hemisphere(double u1, double u2, const rtc::Vec3& n);

double cosine_hemisphere_pdf(double cos_theta);

// GGX (Trowbridge-Reitz) microfacet half vector around n.
// alpha in [0,1]; alpha == 0 returns n exactly (mirror limit).
rtc::Vec3 sample_ggx_half_vector(double u1, double u2, const rtc::Vec3& n, double alpha);

} // namespace rtc::brdf
