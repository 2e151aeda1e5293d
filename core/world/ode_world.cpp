#include "world/ode_world.hpp"
#include "util/logging.hpp"
#include <cmath>
#include <stdexcept>

namespace phenom {

namespace {

Vec3 axpy(const Vec3& x, const Vec3& k, double h) {
    return {x[0] + k[0] * h, x[1] + k[1] * h, x[2] + k[2] * h};
}

} // namespace

OdeWorld::OdeWorld(const OdeConfig& config)
    : config_(config), state_(config.initial_state) {
    if (!(config_.dt > 0.0) || config_.max_history == 0) {
        throw std::invalid_argument("OdeWorld: dt and max_history must be positive");
    }
}

std::string OdeWorld::name() const {
    return config_.system == OdeSystem::Lorenz ? "lorenz" : "rossler";
}

void OdeWorld::step() {
    const double dt = config_.dt;
    Vec3 k1 = derivative(state_);
    Vec3 k2 = derivative(axpy(state_, k1, dt * 0.5));
    Vec3 k3 = derivative(axpy(state_, k2, dt * 0.5));
    Vec3 k4 = derivative(axpy(state_, k3, dt));

    for (size_t i = 0; i < 3; i++) {
        state_[i] += (k1[i] + 2.0 * k2[i] + 2.0 * k3[i] + k4[i]) * dt / 6.0;
    }

    tail_.push_back(state_);
    while (tail_.size() > config_.max_history) {
        tail_.pop_front();
    }
}

SimState OdeWorld::getState() const {
    PointsState points;
    points.points.assign(tail_.begin(), tail_.end());
    return points;
}

void OdeWorld::setParam(const std::string& key, const ParamValue& value) {
    if (const double* v = std::get_if<double>(&value)) {
        OdeParams& p = config_.params;
        if (key == "sigma") { p.sigma = *v; return; }
        if (key == "rho")   { p.rho = *v;   return; }
        if (key == "beta")  { p.beta = *v;  return; }
        if (key == "a")     { p.a = *v;     return; }
        if (key == "b")     { p.b = *v;     return; }
        if (key == "c")     { p.c = *v;     return; }
    }
    if (key == "system") {
        if (const std::string* s = std::get_if<std::string>(&value)) {
            if (*s == "lorenz") {
                config_.system = OdeSystem::Lorenz;
            } else if (*s == "rossler") {
                config_.system = OdeSystem::Rossler;
            }
            resetState();
            return;
        }
    }
    if (key == "reset") {
        const bool* flag = std::get_if<bool>(&value);
        if (flag && *flag) resetState();
        return;
    }
    logger()->debug("ode: ignoring parameter '{}'", key);
}

void OdeWorld::applyAction(const Action& action) {
    if (const Perturb* kick = std::get_if<Perturb>(&action)) {
        if (kick->axis < 3 && std::isfinite(kick->delta)) {
            state_[kick->axis] += kick->delta;
        }
    } else if (const SetParam* set = std::get_if<SetParam>(&action)) {
        setParam(set->name, ParamValue(set->value));
    }
}

Observation OdeWorld::observe() const {
    return StateVec{state_};
}

double OdeWorld::reward() const {
    double norm = std::sqrt(state_[0] * state_[0] +
                            state_[1] * state_[1] +
                            state_[2] * state_[2]);
    return 1.0 / (1.0 + norm / 100.0);
}

void OdeWorld::resetState() {
    state_ = config_.initial_state;
    tail_.clear();
}

Vec3 OdeWorld::derivative(const Vec3& s) const {
    const OdeParams& p = config_.params;
    const double x = s[0], y = s[1], z = s[2];
    if (config_.system == OdeSystem::Lorenz) {
        return {p.sigma * (y - x), x * (p.rho - z) - y, x * y - p.beta * z};
    }
    return {-y - z, x + p.a * y, p.b + z * (x - p.c)};
}

} // namespace phenom
