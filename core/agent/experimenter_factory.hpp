#pragma once

#include "agent/curious_experimenter.hpp"
#include "agent/experimenter.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace phenom {

/// Build an experimenter by tag: "noop", "scripted" or "curious".
/// The config and seed only apply to "curious". Unknown tags give nullptr.
std::unique_ptr<Experimenter> makeExperimenter(const std::string& tag,
                                               const CuriosityConfig& config = {},
                                               uint32_t seed = 42);

/// All tags makeExperimenter accepts.
std::vector<std::string> experimenterTags();

} // namespace phenom
