#pragma once

#include <flecs.h>
#include <raylib.h>
#include <vector>

#include "../components/Components.hpp"
#include "../core/Config.hpp"
#include "Input.hpp"
#include "Spawner.hpp"

namespace asteroids::systems {

// Player ship steering and firing. Thrust and turning accumulate into the ship's velocity; there
// is no speed cap. Fire spawns one projectile per press.
class Control {
public:
    // Returns the number of projectiles fired this tick.
    static int process_input(const flecs::world& w, const InputSource& input, SpawnService& spawner, const float dt) {
        const Config* cfg = w.get<Config>();
        const double muzzle = cfg ? cfg->muzzle_speed : constants::muzzle_speed;
        const auto step = static_cast<double>(dt);

        struct Shot {
            DVec2 pos;
            double heading;
            DVec2 vel;
        };
        std::vector<Shot> shots;

        w.each([&](const Position& p, const Orientation& o, Velocity& v, const ShipControl& ship) {
            if (input.is_held(Action::forward)) {
                v.linear += forward_from_heading(o.radians) * (static_cast<double>(ship.linear_accel) * step);
            }
            if (input.is_held(Action::turn_right)) v.angular -= step * static_cast<double>(ship.angular_accel);
            if (input.is_held(Action::turn_left)) v.angular += step * static_cast<double>(ship.angular_accel);

            if (input.was_just_pressed(Action::fire)) shots.push_back(Shot{p.value, o.radians, v.linear});
        });

        for (const Shot& s : shots) fire(spawner, s.pos, s.heading, s.vel, muzzle);
        return static_cast<int>(shots.size());
    }

    // Projectile leaves along the heading at muzzle speed plus the ship's own velocity.
    static flecs::entity_t fire(SpawnService& spawner, const DVec2 position, const double heading,
                                const DVec2 ship_velocity, const double muzzle_speed) {
        TraceLog(LOG_INFO, "Shooting");
        const DVec2 velocity = forward_from_heading(heading) * muzzle_speed + ship_velocity;
        return spawner.spawn(SpawnKind::projectile, position, heading, velocity, 0.0);
    }
};

}  // namespace asteroids::systems
