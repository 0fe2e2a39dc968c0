#pragma once

#include <cstdint>

#include "Config.hpp"
#include "Random.hpp"
#include "Timer.hpp"

namespace asteroids {

// Mutable per-run game state. Created once when the world is set up and stored as a flecs singleton;
// the rule engine and the asteroid field receive it by reference.
struct GameState {
    std::uint32_t score = 0;
    Stopwatch play_time;
    RepeatingTimer asteroid_timer{constants::default_asteroid_period};
    Rng rng{constants::default_seed};
    std::uint64_t ticks = 0;

    GameState() = default;
    explicit GameState(const Config& cfg) : asteroid_timer(cfg.asteroid_period), rng(cfg.seed) {}
};

}  // namespace asteroids
