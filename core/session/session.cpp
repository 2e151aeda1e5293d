#include "session/session.hpp"
#include "session/bridge.hpp"
#include "util/logging.hpp"
#include <stdexcept>

namespace phenom {

Session::Session(std::unique_ptr<World> world, std::unique_ptr<Experimenter> agent)
    : world_(std::move(world)), agent_(std::move(agent)) {
    if (!world_ || !agent_) {
        throw std::invalid_argument("Session: world and agent are required");
    }
}

std::optional<DiscoveryEvent> Session::tick() {
    std::optional<DiscoveryEvent> discovery;

    if (Experimentable* lab = world_->asExperimentable()) {
        AgentObservation observation = toAgentObservation(lab->observe());
        double reward = lab->reward();

        ActResult decision = agent_->act(observation, reward, step_count_);
        discovery = std::move(decision.discovery);

        lab->applyAction(toWorldAction(decision.action));
    } else if (!warned_passive_) {
        logger()->debug("session: world '{}' is not experimentable, stepping only",
                        world_->name());
        warned_passive_ = true;
    }

    world_->step();
    step_count_++;

    if (discovery) {
        logger()->info("[{} @ {}] {}", agent_->name(), step_count_, describe(*discovery));
    }
    return discovery;
}

std::vector<DiscoveryEvent> Session::run(uint64_t n) {
    std::vector<DiscoveryEvent> discoveries;
    for (uint64_t i = 0; i < n; i++) {
        if (auto event = tick()) {
            discoveries.push_back(std::move(*event));
        }
    }
    return discoveries;
}

} // namespace phenom
