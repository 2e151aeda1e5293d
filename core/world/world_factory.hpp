#pragma once

#include "world/world.hpp"
#include <memory>
#include <string>
#include <vector>

namespace phenom {

/// Build a reference world with default settings by tag:
/// "lorenz", "rossler", "life" or "gray_scott". Unknown tags give nullptr.
std::unique_ptr<World> makeWorld(const std::string& tag);

/// All tags makeWorld accepts.
std::vector<std::string> worldTags();

} // namespace phenom
