#pragma once

#include <cstdint>

namespace phenom {

// ─── Tick Pacer ───────────────────────────────────────────────
// Accumulator for fixed-rate auto-play driven by an irregular host
// callback (e.g. a frame loop). Each call to advance() adds the
// elapsed time and returns how many ticks to run now, never more
// than max_ticks_per_frame. Backlog beyond the cap is dropped so a
// slow host cannot fall further and further behind.

class TickPacer {
public:
    /// Throws std::invalid_argument unless ticks_per_second > 0 and the cap > 0.
    TickPacer(double ticks_per_second, uint32_t max_ticks_per_frame = 5);

    /// Add elapsed wall time; returns the number of ticks due now.
    uint32_t advance(double elapsed_seconds);

    /// Change the speed. Non-positive speeds are ignored.
    void setSpeed(double ticks_per_second);
    double speed() const { return ticks_per_second_; }

    void pause() { paused_ = true; accumulator_ = 0.0; }
    void resume() { paused_ = false; }
    bool paused() const { return paused_; }

    void reset() { accumulator_ = 0.0; total_ticks_ = 0; }

    /// Ticks handed out since construction or reset().
    uint64_t totalTicks() const { return total_ticks_; }

    /// Seconds accumulated but not yet converted into ticks.
    double backlogSeconds() const { return accumulator_; }

private:
    double ticks_per_second_;
    uint32_t max_ticks_per_frame_;
    double accumulator_ = 0.0;
    uint64_t total_ticks_ = 0;
    bool paused_ = false;
};

} // namespace phenom
