#include "session/tick_pacer.hpp"
#include <cmath>
#include <stdexcept>

namespace phenom {

TickPacer::TickPacer(double ticks_per_second, uint32_t max_ticks_per_frame)
    : ticks_per_second_(ticks_per_second), max_ticks_per_frame_(max_ticks_per_frame) {
    if (!(ticks_per_second_ > 0.0) || !std::isfinite(ticks_per_second_)) {
        throw std::invalid_argument("TickPacer: ticks_per_second must be positive");
    }
    if (max_ticks_per_frame_ == 0) {
        throw std::invalid_argument("TickPacer: max_ticks_per_frame must be positive");
    }
}

uint32_t TickPacer::advance(double elapsed_seconds) {
    if (paused_ || !(elapsed_seconds > 0.0) || !std::isfinite(elapsed_seconds)) {
        return 0;
    }

    accumulator_ += elapsed_seconds;
    const double period = 1.0 / ticks_per_second_;

    uint32_t ticks = 0;
    while (accumulator_ >= period && ticks < max_ticks_per_frame_) {
        accumulator_ -= period;
        ticks++;
    }
    if (ticks == max_ticks_per_frame_ && accumulator_ >= period) {
        accumulator_ = 0.0;
    }

    total_ticks_ += ticks;
    return ticks;
}

void TickPacer::setSpeed(double ticks_per_second) {
    if (ticks_per_second > 0.0 && std::isfinite(ticks_per_second)) {
        ticks_per_second_ = ticks_per_second;
    }
}

} // namespace phenom
