#pragma once

#include "world/world.hpp"
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace phenom {

struct LifeConfig {
    uint32_t width = 64;
    uint32_t height = 64;
};

// ─── Life World ───────────────────────────────────────────────
// Conway's Game of Life (B3/S23) on a toroidal grid. The agent sees
// population and size, and may birth single cells.

class LifeWorld : public World, public Experimentable {
public:
    explicit LifeWorld(const LifeConfig& config = {});

    std::string name() const override { return "life"; }
    void step() override;
    SimState getState() const override;

    /// Keys: "inject_pattern" (string: glider, r_pentomino, blinker), "clear" (bool).
    void setParam(const std::string& key, const ParamValue& value) override;
    Experimentable* asExperimentable() override { return this; }

    /// FlipCell births the cell at (row, col); out-of-range cells are ignored.
    void applyAction(const Action& action) override;
    Observation observe() const override;

    /// Survival measure: number of generations stepped so far.
    double reward() const override;

    bool alive(size_t row, size_t col) const;
    size_t population() const;
    uint64_t generation() const { return generation_; }

private:
    using Pattern = std::vector<std::pair<int, int>>;  // (row, col) offsets

    uint32_t width_;
    uint32_t height_;
    std::vector<uint8_t> cells_;
    std::vector<uint8_t> next_;
    uint64_t generation_ = 0;

    size_t index(int64_t row, int64_t col) const;
    void stamp(const Pattern& pattern);
    static const Pattern* lookupPattern(const std::string& name);
};

} // namespace phenom
