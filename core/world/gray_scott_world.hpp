#pragma once

#include "world/world.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace phenom {

/// Defaults are the "coral" preset.
struct GrayScottConfig {
    uint32_t width = 128;
    uint32_t height = 128;
    double feed = 0.055;        // f
    double kill = 0.062;        // k
    double diffusion_u = 1.0;   // Da
    double diffusion_v = 0.5;   // Db
    double dt = 1.0;
    uint32_t seed_radius = 10;  // half-width of the initial V square
};

// ─── Gray-Scott World ─────────────────────────────────────────
// Two-species reaction-diffusion on a toroidal grid, double
// buffered. The agent sees (total V, f, k), may inject V, and is
// rewarded for keeping coverage near 20%.

class GrayScottWorld : public World, public Experimentable {
public:
    explicit GrayScottWorld(const GrayScottConfig& config = {});

    std::string name() const override { return "gray_scott"; }
    void step() override;
    SimState getState() const override;

    /// Keys: "f", "k" (float).
    void setParam(const std::string& key, const ParamValue& value) override;
    Experimentable* asExperimentable() override { return this; }

    void applyAction(const Action& action) override;
    Observation observe() const override;
    double reward() const override;

    double totalV() const;
    double coverage() const;
    double feed() const { return config_.feed; }
    double kill() const { return config_.kill; }

private:
    GrayScottConfig config_;
    std::vector<double> u_;
    std::vector<double> v_;
    std::vector<double> next_u_;
    std::vector<double> next_v_;

    size_t index(int64_t x, int64_t y) const;
    void seedCenter();
    void inject(double delta);
};

} // namespace phenom
