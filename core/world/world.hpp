#pragma once

#include "util/vec3.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <tuple>
#include <variant>
#include <vector>

namespace phenom {

// ─── Render Snapshot ──────────────────────────────────────────
// What a world hands to the presentation layer. Side-effect free
// to produce; never read by the agent.

struct GridState {
    int64_t offset_x = 0;
    int64_t offset_y = 0;
    uint32_t width = 0;
    uint32_t height = 0;
    std::vector<bool> cells;  // row-major, width * height

    bool operator==(const GridState& o) const {
        return std::tie(offset_x, offset_y, width, height, cells) ==
               std::tie(o.offset_x, o.offset_y, o.width, o.height, o.cells);
    }
};

struct PointsState {
    std::vector<Vec3> points;  // oldest first

    bool operator==(const PointsState& o) const { return points == o.points; }
};

struct FloatGridState {
    uint32_t width = 0;
    uint32_t height = 0;
    std::vector<double> values;  // row-major intensities in [0, 1]

    bool operator==(const FloatGridState& o) const {
        return width == o.width && height == o.height && values == o.values;
    }
};

using SimState = std::variant<GridState, PointsState, FloatGridState>;

// ─── Parameters ───────────────────────────────────────────────

using ParamValue = std::variant<bool, int64_t, double, std::string>;

// ─── Experiment Vocabulary (world side) ───────────────────────

struct GridSummary {
    size_t alive = 0;
    size_t width = 0;
    size_t height = 0;
};

struct StateVec {
    Vec3 values{};
};

struct TextObservation {
    std::string text;
};

struct NoObservation {};

using Observation = std::variant<NoObservation, GridSummary, StateVec, TextObservation>;

struct FlipCell {
    size_t row = 0;
    size_t col = 0;
};

struct Perturb {
    uint8_t axis = 0;
    double delta = 0.0;
};

struct SetParam {
    std::string name;
    double value = 0.0;
};

struct Noop {};

using Action = std::variant<Noop, FlipCell, Perturb, SetParam>;

// ─── Experimentable ───────────────────────────────────────────
// Optional extension of a World that lets an agent observe it,
// act on it and be rewarded by it.

class Experimentable {
public:
    virtual ~Experimentable() = default;

    /// Apply an agent action. Actions the world does not understand are ignored.
    virtual void applyAction(const Action& action) = 0;

    /// Snapshot of what the agent may see.
    virtual Observation observe() const = 0;

    /// World-defined scalar reward for the current state.
    virtual double reward() const = 0;
};

// ─── World ────────────────────────────────────────────────────
// A dynamical system advanced one step at a time. Implementations
// are black boxes to the rest of the library.

class World {
public:
    virtual ~World() = default;

    /// Human-readable name, e.g. "lorenz".
    virtual std::string name() const = 0;

    /// Advance one step.
    virtual void step() = 0;

    /// Render snapshot of the current state.
    virtual SimState getState() const = 0;

    /// Best-effort parameter update. Unknown keys and value kinds are ignored.
    virtual void setParam(const std::string& key, const ParamValue& value) = 0;

    /// Capability query: non-null when the world supports experimentation.
    virtual Experimentable* asExperimentable() { return nullptr; }
};

} // namespace phenom
