#pragma once

#include "world/world.hpp"
#include <deque>
#include <string>

namespace phenom {

enum class OdeSystem { Lorenz, Rossler };

/// Coefficients for both supported attractors.
struct OdeParams {
    // Lorenz
    double sigma = 10.0;
    double rho = 28.0;
    double beta = 8.0 / 3.0;
    // Rössler
    double a = 0.2;
    double b = 0.2;
    double c = 5.7;
};

struct OdeConfig {
    OdeSystem system = OdeSystem::Lorenz;
    OdeParams params;
    double dt = 0.01;
    size_t max_history = 800;   // points kept for rendering the tail
    Vec3 initial_state{1.0, 1.0, 1.0};
};

// ─── ODE World ────────────────────────────────────────────────
// Continuous chaotic attractor integrated with fixed-step RK4.
// The agent sees the raw 3-vector and may kick one axis at a time.

class OdeWorld : public World, public Experimentable {
public:
    explicit OdeWorld(const OdeConfig& config = {});

    std::string name() const override;
    void step() override;
    SimState getState() const override;
    void setParam(const std::string& key, const ParamValue& value) override;
    Experimentable* asExperimentable() override { return this; }

    void applyAction(const Action& action) override;
    Observation observe() const override;

    /// Stability measure: 1 / (1 + |state| / 100), in (0, 1].
    double reward() const override;

    const Vec3& state() const { return state_; }
    OdeSystem system() const { return config_.system; }
    const OdeParams& params() const { return config_.params; }
    size_t tailSize() const { return tail_.size(); }

private:
    OdeConfig config_;
    Vec3 state_;
    std::deque<Vec3> tail_;

    void resetState();
    Vec3 derivative(const Vec3& s) const;
};

} // namespace phenom
