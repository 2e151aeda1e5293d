#pragma once

#include "util/vec3.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>

namespace phenom {

// ─── Agent Vocabulary ─────────────────────────────────────────
// The small observation/action language every experimenter speaks.
// Independent of the world-side types; the session
// bridge translates between the two.

namespace agent {

struct GridView {
    size_t width = 0;
    size_t height = 0;
};

struct StateVector {
    Vec3 values{};
};

struct Blind {};

struct FlipCell {
    size_t row = 0;
    size_t col = 0;
};

struct Perturb {
    uint8_t axis = 0;
    double delta = 0.0;
};

struct SetParam {
    std::string name;
    double value = 0.0;
};

struct Noop {};

} // namespace agent

using AgentObservation = std::variant<agent::Blind, agent::GridView, agent::StateVector>;
using AgentAction = std::variant<agent::Noop, agent::FlipCell, agent::Perturb, agent::SetParam>;

} // namespace phenom
