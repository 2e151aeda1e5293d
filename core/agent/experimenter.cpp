#include "agent/experimenter.hpp"
#include <sstream>

namespace phenom {

ActResult ScriptedExperimenter::act(const AgentObservation& observation, double, uint64_t step) {
    ActResult result;

    if (const auto* grid = std::get_if<agent::GridView>(&observation)) {
        if (step % kFlipInterval == 0) {
            result.action = agent::FlipCell{grid->height / 2, grid->width / 2};
        }
    } else if (std::holds_alternative<agent::StateVector>(observation)) {
        if (step % kPerturbInterval == 0) {
            result.action = agent::Perturb{0, kPerturbDelta};
        }
    }

    if (step > 0 && step % kReportInterval == 0) {
        std::ostringstream oss;
        oss << "Scientist: Tick " << step << " shows interesting stability.";
        result.discovery = TextDiscovery{oss.str()};
    }
    return result;
}

} // namespace phenom
