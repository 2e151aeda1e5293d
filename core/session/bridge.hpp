#pragma once

#include "agent/agent_types.hpp"
#include "world/world.hpp"

namespace phenom {

// ─── Observation/Action Bridge ────────────────────────────────
// Pure, total translation between the world vocabulary and the
// agent vocabulary. Anything without a counterpart maps to the
// "nothing" variant of the other side.

/// GridSummary → GridView (population dropped), StateVec → StateVector,
/// everything else → Blind.
AgentObservation toAgentObservation(const Observation& observation);

/// Variant-for-variant translation; unmatched actions → Noop.
Action toWorldAction(const AgentAction& action);

} // namespace phenom
