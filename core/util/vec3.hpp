#pragma once

#include <array>
#include <cmath>

namespace phenom {

using Vec3 = std::array<double, 3>;

inline double distance(const Vec3& a, const Vec3& b) {
    double dx = a[0] - b[0];
    double dy = a[1] - b[1];
    double dz = a[2] - b[2];
    return std::sqrt(dx * dx + dy * dy + dz * dz);
}

inline bool isFinite(const Vec3& v) {
    return std::isfinite(v[0]) && std::isfinite(v[1]) && std::isfinite(v[2]);
}

} // namespace phenom
