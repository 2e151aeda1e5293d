#include "session/bridge.hpp"

namespace phenom {

AgentObservation toAgentObservation(const Observation& observation) {
    if (const auto* grid = std::get_if<GridSummary>(&observation)) {
        return agent::GridView{grid->width, grid->height};
    }
    if (const auto* vec = std::get_if<StateVec>(&observation)) {
        return agent::StateVector{vec->values};
    }
    return agent::Blind{};
}

Action toWorldAction(const AgentAction& action) {
    if (const auto* flip = std::get_if<agent::FlipCell>(&action)) {
        return FlipCell{flip->row, flip->col};
    }
    if (const auto* kick = std::get_if<agent::Perturb>(&action)) {
        return Perturb{kick->axis, kick->delta};
    }
    if (const auto* set = std::get_if<agent::SetParam>(&action)) {
        return SetParam{set->name, set->value};
    }
    return Noop{};
}

} // namespace phenom
