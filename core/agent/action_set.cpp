#include "agent/action_set.hpp"

namespace phenom {

AgentAction perturbationAction(ActionId id, double magnitude) {
    if (id <= 0 || id >= kPerturbationActionCount) return agent::Noop{};
    uint8_t axis = static_cast<uint8_t>((id - 1) / 2);
    double sign = (id % 2 == 1) ? 1.0 : -1.0;
    return agent::Perturb{axis, sign * magnitude};
}

std::string perturbationLabel(ActionId id) {
    if (id <= 0 || id >= kPerturbationActionCount) return "noop";
    static const char axes[] = {'x', 'y', 'z'};
    std::string label(1, (id % 2 == 1) ? '+' : '-');
    label.push_back(axes[(id - 1) / 2]);
    return label;
}

} // namespace phenom
