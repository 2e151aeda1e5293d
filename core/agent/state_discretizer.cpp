#include "agent/state_discretizer.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace phenom {

StateDiscretizer::StateDiscretizer(double scale) : scale_(scale) {
    if (!(scale_ > 0.0) || !std::isfinite(scale_)) {
        throw std::invalid_argument("StateDiscretizer: scale must be positive and finite");
    }
}

int64_t StateDiscretizer::bucket(double v) const {
    if (std::isnan(v)) return 0;
    double magnitude = std::min(std::abs(v), kMaxMagnitude);
    double binned = std::log1p(magnitude) * scale_;
    int64_t index = static_cast<int64_t>(std::llround(binned));
    return v < 0.0 ? -index : index;
}

StateKey StateDiscretizer::key(const Vec3& state) const {
    std::ostringstream oss;
    oss << bucket(state[0]) << ":" << bucket(state[1]) << ":" << bucket(state[2]);
    return oss.str();
}

Vec3 StateDiscretizer::sanitize(const Vec3& state) {
    Vec3 out = state;
    for (double& v : out) {
        if (std::isnan(v)) {
            v = 0.0;
        } else {
            v = std::clamp(v, -kMaxMagnitude, kMaxMagnitude);
        }
    }
    return out;
}

} // namespace phenom
