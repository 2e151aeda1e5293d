#include "agent/world_model.hpp"
#include <stdexcept>

namespace phenom {

WorldModel::WorldModel(double blend) : blend_(blend) {
    if (!(blend_ > 0.0 && blend_ <= 1.0)) {
        throw std::invalid_argument("WorldModel: blend must be in (0, 1]");
    }
}

std::optional<Vec3> WorldModel::predict(const StateKey& state, ActionId action) const {
    auto it = predictions_.find(entryKey(state, action));
    if (it == predictions_.end()) return std::nullopt;
    return it->second;
}

void WorldModel::observe(const StateKey& state, ActionId action, const Vec3& outcome) {
    if (!isFinite(outcome)) return;

    std::string key = entryKey(state, action);
    auto it = predictions_.find(key);
    if (it == predictions_.end()) {
        predictions_.emplace(std::move(key), outcome);
        return;
    }
    Vec3& predicted = it->second;
    for (size_t i = 0; i < 3; i++) {
        predicted[i] = (1.0 - blend_) * predicted[i] + blend_ * outcome[i];
    }
}

std::string WorldModel::entryKey(const StateKey& state, ActionId action) {
    return state + "#" + std::to_string(action);
}

} // namespace phenom
