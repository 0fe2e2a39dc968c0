#pragma once

#include <cmath>
#include <cstdint>
#include <stdexcept>

namespace asteroids {

// Countdown that restarts itself every period. tick() consumes elapsed time and reports,
// for that tick only, whether and how many times the period boundary was crossed.
class RepeatingTimer {
public:
    explicit RepeatingTimer(float period) { set_period(period); }

    void set_period(float period) {
        if (!(period > 0.0F)) throw std::invalid_argument("timer period must be positive");
        period_ = period;
        if (elapsed_ >= period_) elapsed_ = std::fmod(elapsed_, period_);
    }

    // Returns the number of periods that completed during this tick.
    std::uint32_t tick(float dt) {
        if (dt < 0.0F) throw std::invalid_argument("timer dt must not be negative");
        elapsed_ += dt;
        times_finished_ = 0;
        if (elapsed_ >= period_) {
            times_finished_ = static_cast<std::uint32_t>(elapsed_ / period_);
            elapsed_ -= static_cast<float>(times_finished_) * period_;
        }
        return times_finished_;
    }

    void reset() {
        elapsed_ = 0.0F;
        times_finished_ = 0;
    }

    [[nodiscard]] bool just_finished() const { return times_finished_ > 0; }
    [[nodiscard]] std::uint32_t times_finished() const { return times_finished_; }
    [[nodiscard]] float elapsed() const { return elapsed_; }
    [[nodiscard]] float period() const { return period_; }

private:
    float period_ = 1.0F;
    float elapsed_ = 0.0F;
    std::uint32_t times_finished_ = 0;
};

class Stopwatch {
public:
    void tick(float dt) {
        if (dt < 0.0F) throw std::invalid_argument("stopwatch dt must not be negative");
        elapsed_ += static_cast<double>(dt);
    }
    void reset() { elapsed_ = 0.0; }
    [[nodiscard]] double elapsed() const { return elapsed_; }

private:
    double elapsed_ = 0.0;
};

}  // namespace asteroids
