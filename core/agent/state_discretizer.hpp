#pragma once

#include "util/vec3.hpp"
#include <cstdint>
#include <string>

namespace phenom {

/// Canonical identifier of a discretized continuous state, e.g. "3:-2:7".
using StateKey = std::string;

// ─── State Discretizer ────────────────────────────────────────
// Foveated (logarithmic) binning of a continuous 3-vector into a
// StateKey. Resolution is fine near the origin and coarse far away:
//
//   bucket(v) = round(sign(v) * ln(1 + |v|) * scale)
//
// Pure and deterministic: equal inputs always give equal keys.

class StateDiscretizer {
public:
    /// Largest magnitude a component may take; infinities clamp to it.
    static constexpr double kMaxMagnitude = 1e6;

    explicit StateDiscretizer(double scale = 2.0);

    /// Bucket index for one axis. NaN maps to bucket 0.
    int64_t bucket(double v) const;

    /// Join the three per-axis buckets into a key.
    StateKey key(const Vec3& state) const;

    /// Replace NaN with 0 and clamp infinities to ±kMaxMagnitude.
    static Vec3 sanitize(const Vec3& state);

    double scale() const { return scale_; }

private:
    double scale_;
};

} // namespace phenom
