#pragma once

#include "agent/q_table.hpp"
#include "agent/state_discretizer.hpp"
#include "util/vec3.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace phenom {

// ─── World Model ──────────────────────────────────────────────
// Learned one-step forward model: (state, action) → expected next
// continuous state. Each observation is blended into the stored
// prediction by an exponential moving average:
//
//   predicted ← (1 - blend) * predicted + blend * observed
//
// Entries are created on first observation and never removed.

class WorldModel {
public:
    explicit WorldModel(double blend = 0.3);

    /// Stored prediction, if this pair was ever observed.
    std::optional<Vec3> predict(const StateKey& state, ActionId action) const;

    /// Blend an observed outcome into the prediction for (state, action).
    /// Non-finite observations are ignored.
    void observe(const StateKey& state, ActionId action, const Vec3& outcome);

    size_t entryCount() const { return predictions_.size(); }
    double blend() const { return blend_; }

private:
    double blend_;
    std::unordered_map<std::string, Vec3> predictions_;

    static std::string entryKey(const StateKey& state, ActionId action);
};

// ─── Visit Counter ────────────────────────────────────────────
// StateKey → number of times the state was observed.

class VisitCounter {
public:
    /// Record one visit; returns the new count.
    uint64_t visit(const StateKey& state) { return ++counts_[state]; }

    uint64_t count(const StateKey& state) const {
        auto it = counts_.find(state);
        return it != counts_.end() ? it->second : 0;
    }

    /// 1 / max(count, 1): 1 for fresh states, shrinking with familiarity.
    double novelty(const StateKey& state) const {
        uint64_t n = count(state);
        return 1.0 / static_cast<double>(n > 0 ? n : 1);
    }

    size_t distinctStates() const { return counts_.size(); }

private:
    std::unordered_map<StateKey, uint64_t> counts_;
};

} // namespace phenom
