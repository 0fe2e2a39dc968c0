#pragma once

#include <cstdint>
#include <raylib-cpp.hpp>

#include "../core/Constants.hpp"
#include "../core/Math.hpp"

// Kinematic body: Position + Orientation + Velocity.
struct Position {
    DVec2 value;
};

// Heading in radians. Not wrapped; readers go through sin/cos.
struct Orientation {
    double radians = 0.0;
};

// Linear and angular velocity with their per-tick multiplicative drag coefficients.
struct Velocity {
    DVec2 linear{0.0, 0.0};
    DVec2 linear_drag{asteroids::constants::default_linear_drag, asteroids::constants::default_linear_drag};
    double angular = 0.0;
    double angular_drag = asteroids::constants::default_angular_drag;
};

// Circular collision extent. A body without one never takes part in collision detection.
struct CircleCollider {
    double radius = 1.0;
};

enum class RoleTag : std::uint8_t { untagged, ship, asteroid, projectile };

struct Role {
    RoleTag tag = RoleTag::untagged;
};

// Marks an entity for removal when the scene is reset.
struct Cleanup {};

struct ShipControl {
    float linear_accel = static_cast<float>(asteroids::constants::ship_linear_accel);
    float angular_accel = static_cast<float>(asteroids::constants::ship_angular_accel);
};

// Which asteroid look to draw; has no effect on physics or rules.
struct AsteroidVariant {
    int index = 0;
};

struct Tint {
    raylib::Color value;
};
