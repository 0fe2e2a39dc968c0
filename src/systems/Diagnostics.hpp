#pragma once

#include <cstdint>
#include <flecs.h>

#include "../components/Components.hpp"
#include "../core/GameState.hpp"
#include "Collision.hpp"

namespace asteroids {

struct Diagnostics {
    int ships = 0;
    int asteroids = 0;
    int projectiles = 0;
    int colliders = 0;
    int pairs_last_tick = 0;
    std::uint32_t score = 0;
    double play_time = 0.0;
    std::uint64_t ticks = 0;
};

inline Diagnostics compute_diagnostics(const flecs::world& w) {
    Diagnostics d{};
    w.each([&](const Role& r) {
        switch (r.tag) {
            case RoleTag::ship: ++d.ships; break;
            case RoleTag::asteroid: ++d.asteroids; break;
            case RoleTag::projectile: ++d.projectiles; break;
            case RoleTag::untagged: break;
        }
    });
    w.each([&](const CircleCollider&) { ++d.colliders; });
    if (const auto* stats = w.get<systems::TickStats>()) d.pairs_last_tick = stats->pairs;
    if (const auto* state = w.get<GameState>()) {
        d.score = state->score;
        d.play_time = state->play_time.elapsed();
        d.ticks = state->ticks;
    }
    return d;
}

}  // namespace asteroids
