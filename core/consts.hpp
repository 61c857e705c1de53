// Numeric constants shared by geometry and sampling code
#pragma once

#include <limits>

namespace rtc::consts {

// Mathematical constants
inline constexpr double pi = 3.141592653589793238462643383279502884;
inline constexpr double two_pi = 2.0 * pi;
inline constexpr double inv_pi = 1.0 / pi;

// "No hit yet" distance and empty-box corners
inline constexpr double inf = std::numeric_limits<double>::infinity();

// Threshold on |n.x| used when picking the helper axis of a shading basis
inline constexpr double eps = 1e-6;

} // namespace rtc::consts
