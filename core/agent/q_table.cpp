#include "agent/q_table.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace phenom {

QTable::QTable(size_t action_count) : action_count_(action_count) {
    if (action_count_ == 0) {
        throw std::invalid_argument("QTable: action set must not be empty");
    }
}

double QTable::value(const StateKey& state, ActionId action) const {
    if (!validAction(action)) return 0.0;
    auto it = rows_.find(state);
    if (it == rows_.end()) return 0.0;
    return it->second[static_cast<size_t>(action)];
}

double QTable::maxValue(const StateKey& state) const {
    auto it = rows_.find(state);
    if (it == rows_.end()) return 0.0;
    return *std::max_element(it->second.begin(), it->second.end());
}

ActionId QTable::bestAction(const StateKey& state) const {
    auto it = rows_.find(state);
    if (it == rows_.end()) return 0;
    // max_element returns the first of equal maxima.
    const auto& values = it->second;
    return static_cast<ActionId>(std::max_element(values.begin(), values.end()) - values.begin());
}

void QTable::touch(const StateKey& state) {
    row(state);
}

double QTable::update(const StateKey& state, ActionId action, double reward,
                      const StateKey& next_state, double alpha, double gamma) {
    if (!validAction(action)) return 0.0;
    double target = reward + gamma * maxValue(next_state);
    double& q = row(state)[static_cast<size_t>(action)];
    double updated = q + alpha * (target - q);
    if (std::isfinite(updated)) {
        q = updated;
    }
    return q;
}

std::vector<double>& QTable::row(const StateKey& state) {
    auto it = rows_.find(state);
    if (it == rows_.end()) {
        it = rows_.emplace(state, std::vector<double>(action_count_, 0.0)).first;
    }
    return it->second;
}

} // namespace phenom
