#include "world/world_factory.hpp"
#include "world/gray_scott_world.hpp"
#include "world/life_world.hpp"
#include "world/ode_world.hpp"

namespace phenom {

std::unique_ptr<World> makeWorld(const std::string& tag) {
    if (tag == "lorenz") return std::make_unique<OdeWorld>();
    if (tag == "rossler") {
        OdeConfig config;
        config.system = OdeSystem::Rossler;
        return std::make_unique<OdeWorld>(config);
    }
    if (tag == "life") return std::make_unique<LifeWorld>();
    if (tag == "gray_scott") return std::make_unique<GrayScottWorld>();
    return nullptr;
}

std::vector<std::string> worldTags() {
    return {"lorenz", "rossler", "life", "gray_scott"};
}

} // namespace phenom
