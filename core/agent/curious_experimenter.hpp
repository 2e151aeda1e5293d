#pragma once

#include "agent/experimenter.hpp"
#include "agent/insight_reporter.hpp"
#include "agent/q_table.hpp"
#include "agent/state_discretizer.hpp"
#include "agent/world_model.hpp"
#include <cstdint>
#include <random>
#include <string>

namespace phenom {

/// Hyperparameters of the curious agent. Everything except the
/// exploration rate stays fixed for the agent's lifetime.
struct CuriosityConfig {
    // Exploration (epsilon-greedy, annealed)
    double exploration_rate = 0.3;
    double exploration_decay = 0.999;   // multiplied in every tick
    double min_exploration = 0.05;      // floor, never fully greedy

    // Q-learning
    double learning_rate = 0.1;         // alpha
    double discount = 0.9;              // gamma

    // State abstraction
    double fovea_scale = 2.0;

    // Curiosity
    double surprise_gain = 0.5;         // prediction error → bonus
    double surprise_cap = 5.0;
    double first_time_bonus = 1.0;      // bonus for never-tried (state, action)
    double model_blend = 0.3;           // world-model EMA weight

    // Actuation
    double perturb_magnitude = 1.0;

    // Reporting
    double insight_threshold = 2.0;
    uint64_t report_interval = 50;      // insights only on multiples of this step
    uint64_t status_interval = 500;     // periodic status summary

    /// Throws std::invalid_argument describing the first bad field.
    void validate() const;
};

// ─── Curious Experimenter ─────────────────────────────────────
// Curiosity-driven tabular Q-learner. Each tick:
//   1. Discretize the observed 3-vector into a StateKey
//   2. Compare the world model's prediction for the previous
//      (state, action) against what actually happened → surprise
//   3. Blend the observation into the world model
//   4. Effective reward = base reward + surprise
//   5. One-step Q update for the previous (state, action)
//   6. Epsilon-greedy action choice, then decay epsilon
//   7. Map the discrete choice to an axis perturbation
//   8. Remember state/action for the next tick
//   9. Report an insight or a periodic status line
// Observations other than a state vector get Noop and no learning.

class CuriousExperimenter final : public Experimenter {
public:
    explicit CuriousExperimenter(const CuriosityConfig& config = {}, uint32_t seed = 42);

    std::string name() const override { return "curious"; }
    ActResult act(const AgentObservation& observation, double reward, uint64_t step) override;

    // --- Diagnostics (read-only) ---
    double explorationRate() const { return exploration_rate_; }
    double lastSurprise() const { return last_reading_.surprise; }
    const SurpriseReading& lastReading() const { return last_reading_; }
    const QTable& qTable() const { return q_table_; }
    const WorldModel& worldModel() const { return world_model_; }
    const VisitCounter& visits() const { return visits_; }
    const StateDiscretizer& discretizer() const { return discretizer_; }
    const CuriosityConfig& config() const { return config_; }
    ActionId lastAction() const { return prev_action_; }
    const StateKey& lastStateKey() const { return prev_key_; }
    const Vec3& lastState() const { return prev_state_; }

private:
    CuriosityConfig config_;
    StateDiscretizer discretizer_;
    QTable q_table_;
    WorldModel world_model_;
    VisitCounter visits_;
    InsightReporter reporter_;
    std::mt19937 rng_;

    double exploration_rate_;

    // Memory: written once per tick, read by the next tick.
    StateKey prev_key_;           // "" until the first state vector
    ActionId prev_action_ = -1;   // -1 until the first decision
    Vec3 prev_state_{};

    SurpriseReading last_reading_;

    SurpriseReading measureSurprise(const Vec3& state, const StateKey& key) const;
    ActionId chooseAction(const StateKey& key);
    std::optional<DiscoveryEvent> report(const SurpriseReading& reading, uint64_t step) const;
};

} // namespace phenom
