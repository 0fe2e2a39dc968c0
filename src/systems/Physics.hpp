#pragma once

#include <flecs.h>
#include <stdexcept>

#include "../components/Components.hpp"

namespace asteroids {

// Velocity integration with per-tick multiplicative drag.
//
// Drag is applied as v *= (1 - drag * dt) each tick, not as a closed-form exponential decay, so
// results depend on the tick rate. Large drag * dt (> 1) flips the sign of the velocity; this is
// not clamped. Drag coefficients are checked when a body is spawned.
class Physics {
public:
    static void integrate_body(Position& p, Orientation& o, Velocity& v, const double dt) {
        v.linear.x *= 1.0 - v.linear_drag.x * dt;
        v.linear.y *= 1.0 - v.linear_drag.y * dt;
        v.angular *= 1.0 - v.angular_drag * dt;

        p.value += v.linear * dt;
        o.radians += v.angular * dt;
    }

    static void integrate(const flecs::world& w, const float dt) {
        if (dt < 0.0F) throw std::invalid_argument("integrate: dt must not be negative");
        const auto step = static_cast<double>(dt);
        w.each([&](Position& p, Orientation& o, Velocity& v) { integrate_body(p, o, v, step); });
    }
};

}  // namespace asteroids
