#pragma once

#include "agent/discovery.hpp"
#include "agent/q_table.hpp"
#include "agent/state_discretizer.hpp"
#include "util/vec3.hpp"
#include <cstdint>
#include <string>

namespace phenom {

// ─── Surprise Reading ─────────────────────────────────────────
// What the agent measured when its world model met reality.

struct SurpriseReading {
    double surprise = 0.0;      // gain-scaled and capped signal
    double raw_error = 0.0;     // ‖predicted - actual‖, 0 when first_time
    Vec3 axis_error{};          // |predicted - actual| per axis
    bool first_time = false;    // no prediction existed for the pair
    StateKey state;             // where the agent ended up
    ActionId action = -1;       // the action that led there, -1 if none
};

// ─── Insight Reporter ─────────────────────────────────────────
// Turns surprise readings into human-readable discoveries.
//
// Topics (ordered by specificity):
//   first-time pair                     → "Novel region"
//   one axis dominates the error        → "Anomaly on the <axis> axis"
//   error spread over several axes      → "Anomaly across coupled axes"

class InsightReporter {
public:
    /// Build an Insight naming the phenomenon and quantifying it.
    Insight compose(const SurpriseReading& reading) const;

    /// Periodic status line.
    TextDiscovery statusSummary(uint64_t step, size_t distinct_states,
                                size_t model_entries, double novelty,
                                double exploration_rate) const;

    /// Name the phenomenon behind a reading.
    std::string inferTopic(const SurpriseReading& reading) const;
};

} // namespace phenom
