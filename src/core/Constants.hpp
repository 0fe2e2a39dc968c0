#pragma once

#include <numbers>
#include <raylib.h>

namespace asteroids::constants {
inline constexpr int window_width = 1280;
inline constexpr int window_height = 720;
inline constexpr int target_fps = 120;

inline constexpr ::Color background{10, 10, 14, 255};

// Gameplay
inline constexpr int score_per_asteroid = 10;
inline constexpr double muzzle_speed = 400.0;  // units/s along heading, added to ship velocity
inline constexpr float default_asteroid_period = 0.5F;  // seconds between spawn rolls
inline constexpr int default_asteroid_chance = 10;  // percent per roll
inline constexpr int chance_roll_max = 100;  // rolls are uniform in [0, chance_roll_max)
inline constexpr double spawn_box_min = -550.0;
inline constexpr double spawn_box_max = 55.0;
inline constexpr double asteroid_speed_min = -200.0;
inline constexpr double asteroid_speed_max = 200.0;
inline constexpr double heading_min = -std::numbers::pi;
inline constexpr double heading_max = std::numbers::pi;
inline constexpr double asteroid_spin_min = -std::numbers::pi;
inline constexpr double asteroid_spin_max = std::numbers::pi;
inline constexpr int asteroid_variant_count = 4;

// Bodies
inline constexpr double ship_radius = 50.0;
inline constexpr double asteroid_radius = 50.0;
inline constexpr double projectile_radius = 15.0;
inline constexpr double default_linear_drag = 0.5;
inline constexpr double default_angular_drag = 0.5;
inline constexpr double ship_linear_accel = 50.0;  // units/s^2
inline constexpr double ship_angular_accel = 2.0 * std::numbers::pi;  // rad/s^2

// Time
inline constexpr float default_fixed_dt = 1.0F / target_fps;
inline constexpr float default_time_scale = 1.0F;
inline constexpr float fixed_dt_min = 1e-4F;
inline constexpr float fixed_dt_max = 0.1F;
inline constexpr float time_scale_min = 0.0F;
inline constexpr float time_scale_max = 4.0F;
inline constexpr unsigned int default_seed = 0x5EEDu;

// Tuning panel ranges
inline constexpr float period_min = 0.05F;
inline constexpr float period_max = 5.0F;
inline constexpr float accel_max = 500.0F;
inline constexpr float angular_accel_max = 8.0F * static_cast<float>(std::numbers::pi);

// Rendering
inline constexpr float ship_nose_scale = 1.0F;
inline constexpr float ship_tail_scale = 0.7F;
inline constexpr float collider_line_alpha = 0.35F;
inline constexpr int asteroid_min_sides = 5;
inline constexpr float hud_x = 10.0F;
inline constexpr float hud_y = 10.0F;
inline constexpr int hud_font = 20;
inline constexpr float zoom_wheel_scale = 0.1F;
inline constexpr float min_zoom = 0.1F;
inline constexpr float max_zoom = 4.0F;

inline constexpr int random_color_min = 96;
inline constexpr int random_color_max = 255;
inline constexpr unsigned char alpha_opaque = 255;
}  // namespace asteroids::constants
