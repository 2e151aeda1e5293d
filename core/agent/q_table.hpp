#pragma once

#include "agent/state_discretizer.hpp"
#include <cstddef>
#include <unordered_map>
#include <vector>

namespace phenom {

/// Index into an experimenter's fixed discrete action set.
using ActionId = int;

// ─── Q-Table ──────────────────────────────────────────────────
// StateKey → dense row of action-value estimates. Rows are created
// zero-filled the first time a state is touched and are never
// removed; values are updated in place by the one-step rule
//
//   Q[s][a] += alpha * (r + gamma * max_a' Q[s'][a'] - Q[s][a])

class QTable {
public:
    explicit QTable(size_t action_count);

    /// Value estimate; 0 for states or actions never touched.
    double value(const StateKey& state, ActionId action) const;

    /// Highest value over all actions of a state (0 for unknown states).
    double maxValue(const StateKey& state) const;

    /// Action with the highest value. Ties go to the lowest action id.
    ActionId bestAction(const StateKey& state) const;

    /// Make sure a row exists for the state.
    void touch(const StateKey& state);

    /// Apply one temporal-difference update. Returns the new value.
    double update(const StateKey& state, ActionId action, double reward,
                  const StateKey& next_state, double alpha, double gamma);

    size_t stateCount() const { return rows_.size(); }
    size_t actionCount() const { return action_count_; }

private:
    size_t action_count_;
    std::unordered_map<StateKey, std::vector<double>> rows_;

    std::vector<double>& row(const StateKey& state);
    bool validAction(ActionId action) const {
        return action >= 0 && static_cast<size_t>(action) < action_count_;
    }
};

} // namespace phenom
