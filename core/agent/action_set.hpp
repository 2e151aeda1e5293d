#pragma once

#include "agent/agent_types.hpp"
#include "agent/q_table.hpp"
#include <string>

namespace phenom {

// ─── Perturbation Action Set ──────────────────────────────────
// The curious agent's discrete actions:
//   0 = noop, 1/2 = ±x, 3/4 = ±y, 5/6 = ±z
// Each non-noop action kicks one axis by a fixed magnitude.

constexpr int kPerturbationActionCount = 7;

/// Continuous action for a discrete id. Unknown ids map to Noop.
AgentAction perturbationAction(ActionId id, double magnitude);

/// Short label such as "+x" or "noop".
std::string perturbationLabel(ActionId id);

} // namespace phenom
