#include "agent/experimenter_factory.hpp"

namespace phenom {

std::unique_ptr<Experimenter> makeExperimenter(const std::string& tag,
                                               const CuriosityConfig& config,
                                               uint32_t seed) {
    if (tag == "noop") return std::make_unique<NoopExperimenter>();
    if (tag == "scripted") return std::make_unique<ScriptedExperimenter>();
    if (tag == "curious") return std::make_unique<CuriousExperimenter>(config, seed);
    return nullptr;
}

std::vector<std::string> experimenterTags() {
    return {"noop", "scripted", "curious"};
}

} // namespace phenom
