#pragma once

#include "agent/discovery.hpp"
#include "agent/experimenter.hpp"
#include "world/world.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace phenom {

// ─── Session ──────────────────────────────────────────────────
// Owns one world and one experimenter and drives them one tick at
// a time:
//
//   observe → reward → act → apply → step
//
// Worlds without the experimentable extension are only stepped.
// Not reentrant: exactly one tick() may be in flight.

class Session {
public:
    /// Throws std::invalid_argument if either pointer is null.
    Session(std::unique_ptr<World> world, std::unique_ptr<Experimenter> agent);

    // Pinned in place: the world and agent are always present. Hold a
    // std::unique_ptr<Session> to hand a session around.
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;
    Session(Session&&) = delete;
    Session& operator=(Session&&) = delete;

    /// Run one tick. Returns the experimenter's discovery, if any.
    std::optional<DiscoveryEvent> tick();

    /// Run n ticks and collect every discovery in order.
    std::vector<DiscoveryEvent> run(uint64_t n);

    /// Current render snapshot, straight from the world.
    SimState getState() const { return world_->getState(); }

    /// Ticks completed so far.
    uint64_t stepCount() const { return step_count_; }

    const World& world() const { return *world_; }
    const Experimenter& agent() const { return *agent_; }

private:
    std::unique_ptr<World> world_;
    std::unique_ptr<Experimenter> agent_;
    uint64_t step_count_ = 0;
    bool warned_passive_ = false;
};

} // namespace phenom
