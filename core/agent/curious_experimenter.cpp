#include "agent/curious_experimenter.hpp"
#include "agent/action_set.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace phenom {

namespace {

const CuriosityConfig& validated(const CuriosityConfig& config) {
    config.validate();
    return config;
}

} // namespace

void CuriosityConfig::validate() const {
    auto require = [](bool ok, const char* what) {
        if (!ok) throw std::invalid_argument(std::string("CuriosityConfig: ") + what);
    };
    require(exploration_rate >= 0.0 && exploration_rate <= 1.0, "exploration_rate must be in [0, 1]");
    require(min_exploration >= 0.0 && min_exploration <= exploration_rate,
            "min_exploration must be in [0, exploration_rate]");
    require(exploration_decay > 0.0 && exploration_decay <= 1.0, "exploration_decay must be in (0, 1]");
    require(learning_rate > 0.0 && learning_rate <= 1.0, "learning_rate must be in (0, 1]");
    require(discount >= 0.0 && discount < 1.0, "discount must be in [0, 1)");
    require(fovea_scale > 0.0 && std::isfinite(fovea_scale), "fovea_scale must be positive");
    require(surprise_gain >= 0.0 && std::isfinite(surprise_gain), "surprise_gain must be non-negative");
    require(surprise_cap >= 0.0 && std::isfinite(surprise_cap), "surprise_cap must be non-negative");
    require(first_time_bonus >= 0.0 && std::isfinite(first_time_bonus), "first_time_bonus must be non-negative");
    require(model_blend > 0.0 && model_blend <= 1.0, "model_blend must be in (0, 1]");
    require(std::isfinite(perturb_magnitude), "perturb_magnitude must be finite");
    require(std::isfinite(insight_threshold), "insight_threshold must be finite");
    require(report_interval > 0, "report_interval must be positive");
    require(status_interval > 0, "status_interval must be positive");
}

CuriousExperimenter::CuriousExperimenter(const CuriosityConfig& config, uint32_t seed)
    : config_(validated(config)),
      discretizer_(config.fovea_scale),
      q_table_(kPerturbationActionCount),
      world_model_(config.model_blend),
      rng_(seed),
      exploration_rate_(config.exploration_rate) {}

ActResult CuriousExperimenter::act(const AgentObservation& observation, double reward, uint64_t step) {
    const auto* vec = std::get_if<agent::StateVector>(&observation);
    if (!vec) return {};

    // 1. Discretize
    Vec3 state = StateDiscretizer::sanitize(vec->values);
    StateKey key = discretizer_.key(state);
    double base_reward = std::isfinite(reward) ? reward : 0.0;
    bool has_previous = prev_action_ >= 0;

    // 2. Surprise against the previous prediction
    SurpriseReading reading = measureSurprise(state, key);

    // 3. World model
    if (has_previous) {
        world_model_.observe(prev_key_, prev_action_, state);
    }

    // 4-5. Shaped reward and Q update
    double effective_reward = base_reward + reading.surprise;
    q_table_.touch(key);
    if (has_previous) {
        q_table_.update(prev_key_, prev_action_, effective_reward, key,
                        config_.learning_rate, config_.discount);
    }

    // 6. Decide
    ActionId chosen = chooseAction(key);
    exploration_rate_ = std::max(exploration_rate_ * config_.exploration_decay,
                                 config_.min_exploration);

    // 8. Memory
    prev_key_ = key;
    prev_action_ = chosen;
    prev_state_ = state;
    visits_.visit(key);
    last_reading_ = reading;

    // 7, 9. Act and report
    ActResult result;
    result.action = perturbationAction(chosen, config_.perturb_magnitude);
    result.discovery = report(reading, step);
    return result;
}

SurpriseReading CuriousExperimenter::measureSurprise(const Vec3& state, const StateKey& key) const {
    SurpriseReading reading;
    reading.state = key;
    reading.action = prev_action_;

    // The first-tick sentinel ("", -1) is never stored, so it misses here.
    std::optional<Vec3> predicted = world_model_.predict(prev_key_, prev_action_);
    if (!predicted) {
        reading.first_time = true;
        reading.surprise = config_.first_time_bonus;
        return reading;
    }

    for (size_t i = 0; i < 3; i++) {
        reading.axis_error[i] = std::abs((*predicted)[i] - state[i]);
    }
    reading.raw_error = distance(*predicted, state);
    double scaled = config_.surprise_gain * reading.raw_error;
    reading.surprise = std::isfinite(scaled) ? std::min(scaled, config_.surprise_cap)
                                             : config_.surprise_cap;
    return reading;
}

ActionId CuriousExperimenter::chooseAction(const StateKey& key) {
    std::uniform_real_distribution<double> coin(0.0, 1.0);
    if (coin(rng_) < exploration_rate_) {
        std::uniform_int_distribution<int> pick(0, kPerturbationActionCount - 1);
        return pick(rng_);
    }
    return q_table_.bestAction(key);
}

std::optional<DiscoveryEvent> CuriousExperimenter::report(const SurpriseReading& reading,
                                                          uint64_t step) const {
    if (reading.surprise > config_.insight_threshold && step % config_.report_interval == 0) {
        Insight insight = reporter_.compose(reading);
        logger()->debug("curious: step {} insight '{}': {}", step, insight.topic, insight.content);
        return insight;
    }
    if (step > 0 && step % config_.status_interval == 0) {
        TextDiscovery status = reporter_.statusSummary(step, visits_.distinctStates(),
                                                       world_model_.entryCount(),
                                                       visits_.novelty(reading.state),
                                                       exploration_rate_);
        logger()->info("{}", status.message);
        return status;
    }
    return std::nullopt;
}

} // namespace phenom
