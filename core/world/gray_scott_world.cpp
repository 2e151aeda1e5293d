#include "world/gray_scott_world.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace phenom {

namespace {

struct StencilTap {
    int dx;
    int dy;
    double weight;
};

// Isotropic 3x3 Laplacian; weights sum to zero.
constexpr StencilTap kLaplacian[9] = {
    {-1, -1, 0.05}, {0, -1, 0.2}, {1, -1, 0.05},
    {-1,  0, 0.2},  {0,  0, -1.0}, {1,  0, 0.2},
    {-1,  1, 0.05}, {0,  1, 0.2}, {1,  1, 0.05},
};

constexpr int kInjectRadius = 4;

// Cell index for a fraction in [0, 1), clamped to [0, extent).
int64_t cellAt(double fraction, uint32_t extent) {
    double cell = std::clamp(fraction * extent, 0.0, static_cast<double>(extent - 1));
    return static_cast<int64_t>(cell);
}

} // namespace

GrayScottWorld::GrayScottWorld(const GrayScottConfig& config) : config_(config) {
    if (config_.width == 0 || config_.height == 0) {
        throw std::invalid_argument("GrayScottWorld: grid must be non-empty");
    }
    size_t size = static_cast<size_t>(config_.width) * config_.height;
    u_.assign(size, 1.0);
    v_.assign(size, 0.0);
    next_u_ = u_;
    next_v_ = v_;
    seedCenter();
}

void GrayScottWorld::step() {
    const int64_t w = config_.width;
    const int64_t h = config_.height;
    for (int64_t y = 0; y < h; y++) {
        for (int64_t x = 0; x < w; x++) {
            size_t i = static_cast<size_t>(y * w + x);
            double u = u_[i];
            double v = v_[i];

            double lap_u = 0.0;
            double lap_v = 0.0;
            for (const StencilTap& tap : kLaplacian) {
                size_t ni = index(x + tap.dx, y + tap.dy);
                lap_u += u_[ni] * tap.weight;
                lap_v += v_[ni] * tap.weight;
            }

            double uvv = u * v * v;
            double du = (config_.diffusion_u * lap_u - uvv + config_.feed * (1.0 - u)) * config_.dt;
            double dv = (config_.diffusion_v * lap_v + uvv - (config_.feed + config_.kill) * v) * config_.dt;

            next_u_[i] = std::clamp(u + du, 0.0, 1.0);
            next_v_[i] = std::clamp(v + dv, 0.0, 1.0);
        }
    }
    u_.swap(next_u_);
    v_.swap(next_v_);
}

SimState GrayScottWorld::getState() const {
    FloatGridState grid;
    grid.width = config_.width;
    grid.height = config_.height;
    grid.values = v_;
    return grid;
}

void GrayScottWorld::setParam(const std::string& key, const ParamValue& value) {
    if (const double* v = std::get_if<double>(&value)) {
        if (key == "f") { config_.feed = *v; return; }
        if (key == "k") { config_.kill = *v; return; }
    }
    logger()->debug("gray_scott: ignoring parameter '{}'", key);
}

void GrayScottWorld::applyAction(const Action& action) {
    if (const Perturb* kick = std::get_if<Perturb>(&action)) {
        if (kick->axis == 0 && std::isfinite(kick->delta)) {
            inject(kick->delta);
        }
    } else if (const SetParam* set = std::get_if<SetParam>(&action)) {
        setParam(set->name, ParamValue(set->value));
    }
}

Observation GrayScottWorld::observe() const {
    return StateVec{{totalV(), config_.feed, config_.kill}};
}

double GrayScottWorld::reward() const {
    double off = coverage() - 0.2;
    return std::exp(-(off * off) * 100.0) * 10.0;
}

double GrayScottWorld::totalV() const {
    return std::accumulate(v_.begin(), v_.end(), 0.0);
}

double GrayScottWorld::coverage() const {
    return totalV() / static_cast<double>(v_.size());
}

size_t GrayScottWorld::index(int64_t x, int64_t y) const {
    const int64_t w = config_.width;
    const int64_t h = config_.height;
    int64_t wx = ((x % w) + w) % w;
    int64_t wy = ((y % h) + h) % h;
    return static_cast<size_t>(wy * w + wx);
}

void GrayScottWorld::seedCenter() {
    const int64_t cx = config_.width / 2;
    const int64_t cy = config_.height / 2;
    const int64_t r = config_.seed_radius;
    for (int64_t y = cy - r; y < cy + r; y++) {
        for (int64_t x = cx - r; x < cx + r; x++) {
            v_[index(x, y)] = 1.0;
        }
    }
}

void GrayScottWorld::inject(double delta) {
    // The kick position is a deterministic function of delta.
    const double fx = std::fmod(std::abs(delta), 1.0);
    const double fy = std::fmod(std::abs(delta * 10.0), 1.0);
    if (!std::isfinite(fx) || !std::isfinite(fy)) {
        logger()->debug("gray_scott: ignoring out-of-range kick {}", delta);
        return;
    }
    const int64_t cx = cellAt(fx, config_.width);
    const int64_t cy = cellAt(fy, config_.height);
    for (int64_t dy = -kInjectRadius; dy <= kInjectRadius; dy++) {
        for (int64_t dx = -kInjectRadius; dx <= kInjectRadius; dx++) {
            if (dx * dx + dy * dy >= kInjectRadius * kInjectRadius) continue;
            size_t i = index(cx + dx, cy + dy);
            v_[i] = std::min(v_[i] + 0.5, 1.0);
        }
    }
}

} // namespace phenom
