#include "world/life_world.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <map>
#include <stdexcept>

namespace phenom {

LifeWorld::LifeWorld(const LifeConfig& config)
    : width_(config.width), height_(config.height) {
    if (width_ < 3 || height_ < 3) {
        throw std::invalid_argument("LifeWorld: grid must be at least 3x3");
    }
    cells_.assign(static_cast<size_t>(width_) * height_, 0);
    next_ = cells_;
    stamp(*lookupPattern("r_pentomino"));
}

void LifeWorld::step() {
    const int64_t h = height_;
    const int64_t w = width_;
    for (int64_t r = 0; r < h; r++) {
        for (int64_t c = 0; c < w; c++) {
            int neighbours = 0;
            for (int64_t dr = -1; dr <= 1; dr++) {
                for (int64_t dc = -1; dc <= 1; dc++) {
                    if (dr == 0 && dc == 0) continue;
                    neighbours += cells_[index(r + dr, c + dc)];
                }
            }
            uint8_t self = cells_[index(r, c)];
            next_[index(r, c)] =
                (neighbours == 3 || (self && neighbours == 2)) ? 1 : 0;
        }
    }
    cells_.swap(next_);
    generation_++;
}

SimState LifeWorld::getState() const {
    GridState grid;
    grid.offset_x = -static_cast<int64_t>(width_ / 2);
    grid.offset_y = -static_cast<int64_t>(height_ / 2);
    grid.width = width_;
    grid.height = height_;
    grid.cells.reserve(cells_.size());
    for (uint8_t c : cells_) grid.cells.push_back(c != 0);
    return grid;
}

void LifeWorld::setParam(const std::string& key, const ParamValue& value) {
    if (key == "inject_pattern") {
        if (const std::string* s = std::get_if<std::string>(&value)) {
            if (const Pattern* p = lookupPattern(*s)) {
                stamp(*p);
                return;
            }
        }
    } else if (key == "clear") {
        const bool* flag = std::get_if<bool>(&value);
        if (flag && *flag) {
            std::fill(cells_.begin(), cells_.end(), 0);
            return;
        }
    }
    logger()->debug("life: ignoring parameter '{}'", key);
}

void LifeWorld::applyAction(const Action& action) {
    const FlipCell* flip = std::get_if<FlipCell>(&action);
    if (!flip || flip->row >= height_ || flip->col >= width_) return;
    cells_[flip->row * width_ + flip->col] = 1;
}

Observation LifeWorld::observe() const {
    return GridSummary{population(), width_, height_};
}

double LifeWorld::reward() const {
    return static_cast<double>(generation_);
}

bool LifeWorld::alive(size_t row, size_t col) const {
    if (row >= height_ || col >= width_) return false;
    return cells_[row * width_ + col] != 0;
}

size_t LifeWorld::population() const {
    return static_cast<size_t>(std::count(cells_.begin(), cells_.end(), uint8_t{1}));
}

size_t LifeWorld::index(int64_t row, int64_t col) const {
    const int64_t h = height_;
    const int64_t w = width_;
    int64_t r = ((row % h) + h) % h;
    int64_t c = ((col % w) + w) % w;
    return static_cast<size_t>(r * w + c);
}

void LifeWorld::stamp(const Pattern& pattern) {
    const int64_t cr = height_ / 2;
    const int64_t cc = width_ / 2;
    for (const auto& [dr, dc] : pattern) {
        cells_[index(cr + dr, cc + dc)] = 1;
    }
}

const LifeWorld::Pattern* LifeWorld::lookupPattern(const std::string& name) {
    static const std::map<std::string, Pattern> library = {
        {"glider",      {{-1, 0}, {0, 1}, {1, -1}, {1, 0}, {1, 1}}},
        {"r_pentomino", {{-1, 0}, {-1, 1}, {0, -1}, {0, 0}, {1, 0}}},
        {"blinker",     {{0, -1}, {0, 0}, {0, 1}}},
    };
    auto it = library.find(name);
    return it != library.end() ? &it->second : nullptr;
}

} // namespace phenom
