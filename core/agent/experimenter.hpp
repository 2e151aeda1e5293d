#pragma once

#include "agent/agent_types.hpp"
#include "agent/discovery.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace phenom {

/// What an experimenter decided this tick.
struct ActResult {
    AgentAction action = agent::Noop{};
    std::optional<DiscoveryEvent> discovery;
};

/// Base class for all experimenters (policies).
/// Stateful across calls; the session calls act() exactly once per tick
/// for worlds that support experimentation.
class Experimenter {
public:
    virtual ~Experimenter() = default;

    /// Short tag identifying the implementation, e.g. "curious".
    virtual std::string name() const = 0;

    /// Observe the world, receive the reward for the current state, and
    /// choose an action. May publish a discovery.
    virtual ActResult act(const AgentObservation& observation, double reward, uint64_t step) = 0;
};

// ─── Baselines ────────────────────────────────────────────────

/// Control policy: never acts, never reports.
class NoopExperimenter final : public Experimenter {
public:
    std::string name() const override { return "noop"; }
    ActResult act(const AgentObservation&, double, uint64_t) override { return {}; }
};

/// Fixed-schedule scientist: pokes the world on a timer and reports a
/// status line every few ticks, regardless of what it sees.
class ScriptedExperimenter final : public Experimenter {
public:
    static constexpr uint64_t kFlipInterval = 60;
    static constexpr uint64_t kPerturbInterval = 30;
    static constexpr uint64_t kReportInterval = 120;
    static constexpr double kPerturbDelta = 2.0;

    std::string name() const override { return "scripted"; }
    ActResult act(const AgentObservation& observation, double reward, uint64_t step) override;
};

} // namespace phenom
