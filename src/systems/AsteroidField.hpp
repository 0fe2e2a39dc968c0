#pragma once

#include <cstdint>
#include <flecs.h>

#include "../core/Config.hpp"
#include "../core/GameState.hpp"
#include "../core/Random.hpp"
#include "Spawner.hpp"

namespace asteroids::systems {

// Periodic asteroid spawning. Each time the spawn timer fires, roll [0, 100); below the configured
// chance spawns one asteroid with random position, heading, speed and spin.
class AsteroidField {
public:
    // Returns the number of asteroids spawned this tick.
    static int tick(const Config& cfg, GameState& state, SpawnService& spawner, const float dt) {
        if (state.asteroid_timer.period() != cfg.asteroid_period) state.asteroid_timer.set_period(cfg.asteroid_period);
        state.play_time.tick(dt);

        const std::uint32_t fired = state.asteroid_timer.tick(dt);
        int spawned = 0;
        for (std::uint32_t i = 0; i < fired; ++i) {
            if (random_int(state.rng, 0, constants::chance_roll_max) >= cfg.asteroid_chance) continue;

            const DVec2 pos{random_real(state.rng, cfg.spawn_min.x, cfg.spawn_max.x),
                            random_real(state.rng, cfg.spawn_min.y, cfg.spawn_max.y)};
            const double heading = random_real(state.rng, constants::heading_min, constants::heading_max);
            const double speed = random_real(state.rng, cfg.asteroid_speed_min, cfg.asteroid_speed_max);
            const double spin = random_real(state.rng, constants::asteroid_spin_min, constants::asteroid_spin_max);

            // Negative speeds are kept: the asteroid drifts backwards along its heading.
            spawner.spawn(SpawnKind::asteroid, pos, heading, forward_from_heading(heading) * speed, spin);
            ++spawned;
        }
        return spawned;
    }

    static void run(const flecs::world& w, const float dt) {
        const Config* cfg = w.get<Config>();
        auto* state = w.get_mut<GameState>();
        if (!cfg || !state) return;
        WorldSpawner spawner(w);
        tick(*cfg, *state, spawner, dt);
    }
};

}  // namespace asteroids::systems
