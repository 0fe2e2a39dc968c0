// src/core/Config.hpp
#pragma once

#include <cstdint>
#include <raylib.h>
#include <stdexcept>

#include "Constants.hpp"
#include "Math.hpp"

namespace asteroids {

// How the collision pass decides that two colliders overlap.
//   reference:    ordered test, only the first entity's radius is the threshold, and a pair already
//                 recorded from the other side suppresses this one. Matches the shipped game exactly.
//   summed_radii: each unordered pair tested once against rA + rB.
enum class CollisionMode : std::uint8_t { reference, summed_radii };

}  // namespace asteroids

// Global/singleton game configuration stored in flecs as a singleton component.
struct Config {
    // Asteroid field
    float asteroid_period = asteroids::constants::default_asteroid_period;  // seconds per spawn roll
    int asteroid_chance = asteroids::constants::default_asteroid_chance;  // percent, 0..100
    DVec2 spawn_min{asteroids::constants::spawn_box_min, asteroids::constants::spawn_box_min};
    DVec2 spawn_max{asteroids::constants::spawn_box_max, asteroids::constants::spawn_box_max};
    double asteroid_speed_min = asteroids::constants::asteroid_speed_min;
    double asteroid_speed_max = asteroids::constants::asteroid_speed_max;
    int asteroid_variants = asteroids::constants::asteroid_variant_count;

    // Ship
    float ship_linear_accel = static_cast<float>(asteroids::constants::ship_linear_accel);
    float ship_angular_accel = static_cast<float>(asteroids::constants::ship_angular_accel);
    double muzzle_speed = asteroids::constants::muzzle_speed;

    // Collision
    asteroids::CollisionMode collision_mode = asteroids::CollisionMode::reference;

    // Time
    bool paused = false;
    bool use_fixed_dt = false;
    float fixed_dt = asteroids::constants::default_fixed_dt;
    float time_scale = asteroids::constants::default_time_scale;
    unsigned int seed = asteroids::constants::default_seed;

    // Key bindings (raylib KeyboardKey values)
    int key_forward = KEY_W;
    int key_turn_left = KEY_A;
    int key_turn_right = KEY_D;
    int key_fire = KEY_SPACE;

    // Visuals
    bool draw_colliders = false;

    // UI/runtime
    double last_step_ms = 0.0;
};

namespace asteroids {

// Rejects configurations the simulation cannot run with.
inline void validate(const Config& cfg) {
    if (!(cfg.asteroid_period > 0.0F)) throw std::invalid_argument("asteroid_period must be positive");
    if (cfg.asteroid_chance < 0 || cfg.asteroid_chance > constants::chance_roll_max)
        throw std::invalid_argument("asteroid_chance must be within [0, 100]");
    if (cfg.spawn_min.x >= cfg.spawn_max.x || cfg.spawn_min.y >= cfg.spawn_max.y)
        throw std::invalid_argument("asteroid spawn box is empty");
    if (cfg.asteroid_speed_min >= cfg.asteroid_speed_max)
        throw std::invalid_argument("asteroid speed range is empty");
    if (cfg.asteroid_variants < 1) throw std::invalid_argument("at least one asteroid variant is required");
    if (cfg.fixed_dt < 0.0F || cfg.time_scale < 0.0F)
        throw std::invalid_argument("time step and time scale must not be negative");
}

}  // namespace asteroids
