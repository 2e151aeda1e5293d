// PyBind11 bindings for the phenom C++ core.
// Exposes worlds, experimenters, sessions and the discovery feed to Python.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DPHENOM_BUILD_PYTHON=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "agent/curious_experimenter.hpp"
#include "agent/discovery.hpp"
#include "agent/experimenter_factory.hpp"
#include "session/discovery_feed.hpp"
#include "session/session.hpp"
#include "session/tick_pacer.hpp"
#include "util/logging.hpp"
#include "world/world_factory.hpp"

#include <stdexcept>

namespace py = pybind11;

namespace {

std::unique_ptr<phenom::Session> makeSession(const std::string& world_tag,
                                             const std::string& agent_tag,
                                             const phenom::CuriosityConfig& config,
                                             uint32_t seed) {
    auto world = phenom::makeWorld(world_tag);
    if (!world) throw std::invalid_argument("unknown world: " + world_tag);
    auto agent = phenom::makeExperimenter(agent_tag, config, seed);
    if (!agent) throw std::invalid_argument("unknown experimenter: " + agent_tag);
    return std::make_unique<phenom::Session>(std::move(world), std::move(agent));
}

} // namespace

PYBIND11_MODULE(phenom_bindings, m) {
    m.doc() = "Phenom C++ Core Bindings";

    // ── Discovery events ──
    py::class_<phenom::TextDiscovery>(m, "TextDiscovery")
        .def(py::init<>())
        .def_readwrite("message", &phenom::TextDiscovery::message);

    py::class_<phenom::Insight>(m, "Insight")
        .def(py::init<>())
        .def_readwrite("topic", &phenom::Insight::topic)
        .def_readwrite("content", &phenom::Insight::content);

    py::class_<phenom::Detection>(m, "Detection")
        .def(py::init<>())
        .def_readwrite("label", &phenom::Detection::label)
        .def_readwrite("confidence", &phenom::Detection::confidence);

    m.def("describe", &phenom::describe);
    m.def("encode_discovery", &phenom::encodeDiscovery);
    m.def("decode_discovery", &phenom::decodeDiscovery);

    // ── CuriosityConfig ──
    py::class_<phenom::CuriosityConfig>(m, "CuriosityConfig")
        .def(py::init<>())
        .def_readwrite("exploration_rate", &phenom::CuriosityConfig::exploration_rate)
        .def_readwrite("exploration_decay", &phenom::CuriosityConfig::exploration_decay)
        .def_readwrite("min_exploration", &phenom::CuriosityConfig::min_exploration)
        .def_readwrite("learning_rate", &phenom::CuriosityConfig::learning_rate)
        .def_readwrite("discount", &phenom::CuriosityConfig::discount)
        .def_readwrite("fovea_scale", &phenom::CuriosityConfig::fovea_scale)
        .def_readwrite("surprise_gain", &phenom::CuriosityConfig::surprise_gain)
        .def_readwrite("surprise_cap", &phenom::CuriosityConfig::surprise_cap)
        .def_readwrite("first_time_bonus", &phenom::CuriosityConfig::first_time_bonus)
        .def_readwrite("model_blend", &phenom::CuriosityConfig::model_blend)
        .def_readwrite("perturb_magnitude", &phenom::CuriosityConfig::perturb_magnitude)
        .def_readwrite("insight_threshold", &phenom::CuriosityConfig::insight_threshold)
        .def_readwrite("report_interval", &phenom::CuriosityConfig::report_interval)
        .def_readwrite("status_interval", &phenom::CuriosityConfig::status_interval)
        .def("validate", &phenom::CuriosityConfig::validate);

    // ── Render snapshots ──
    py::class_<phenom::GridState>(m, "GridState")
        .def_readonly("offset_x", &phenom::GridState::offset_x)
        .def_readonly("offset_y", &phenom::GridState::offset_y)
        .def_readonly("width", &phenom::GridState::width)
        .def_readonly("height", &phenom::GridState::height)
        .def_readonly("cells", &phenom::GridState::cells);

    py::class_<phenom::PointsState>(m, "PointsState")
        .def_readonly("points", &phenom::PointsState::points);

    py::class_<phenom::FloatGridState>(m, "FloatGridState")
        .def_readonly("width", &phenom::FloatGridState::width)
        .def_readonly("height", &phenom::FloatGridState::height)
        .def_readonly("values", &phenom::FloatGridState::values);

    // ── Session ──
    py::class_<phenom::Session>(m, "Session")
        .def(py::init(&makeSession),
             py::arg("world"), py::arg("agent"),
             py::arg("config") = phenom::CuriosityConfig{},
             py::arg("seed") = 42u)
        .def("tick", &phenom::Session::tick)
        .def("run", &phenom::Session::run, py::arg("n"))
        .def("get_state", &phenom::Session::getState)
        .def_property_readonly("step_count", &phenom::Session::stepCount)
        .def_property_readonly("world_name",
                               [](const phenom::Session& s) { return s.world().name(); })
        .def_property_readonly("agent_name",
                               [](const phenom::Session& s) { return s.agent().name(); });

    // ── DiscoveryFeed ──
    py::class_<phenom::DiscoveryFeed>(m, "DiscoveryFeed")
        .def(py::init<size_t>(), py::arg("capacity") = phenom::DiscoveryFeed::kDefaultCapacity)
        .def("push", &phenom::DiscoveryFeed::push)
        .def("events", &phenom::DiscoveryFeed::events)
        .def("recent", &phenom::DiscoveryFeed::recent)
        .def("count", &phenom::DiscoveryFeed::count)
        .def("capacity", &phenom::DiscoveryFeed::capacity)
        .def("export_to_file", &phenom::DiscoveryFeed::exportToFile)
        .def("import_from_file", &phenom::DiscoveryFeed::importFromFile)
        .def("clear", &phenom::DiscoveryFeed::clear);

    // ── TickPacer ──
    py::class_<phenom::TickPacer>(m, "TickPacer")
        .def(py::init<double, uint32_t>(),
             py::arg("ticks_per_second"), py::arg("max_ticks_per_frame") = 5u)
        .def("advance", &phenom::TickPacer::advance)
        .def("set_speed", &phenom::TickPacer::setSpeed)
        .def("pause", &phenom::TickPacer::pause)
        .def("resume", &phenom::TickPacer::resume)
        .def_property_readonly("paused", &phenom::TickPacer::paused)
        .def_property_readonly("speed", &phenom::TickPacer::speed)
        .def_property_readonly("total_ticks", &phenom::TickPacer::totalTicks);

    m.def("world_tags", &phenom::worldTags);
    m.def("experimenter_tags", &phenom::experimenterTags);

    m.def("set_log_level", [](const std::string& level) {
        phenom::setLogLevel(spdlog::level::from_str(level));
    }, py::arg("level"));
}
