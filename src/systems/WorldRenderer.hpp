#pragma once

#include <algorithm>
#include <cmath>
#include <flecs.h>
#include <raylib-cpp.hpp>
#include <raymath.h>

#include "../components/Components.hpp"
#include "../core/Config.hpp"
#include "../core/Constants.hpp"
#include "../core/GameState.hpp"

namespace asteroids::systems {

// Draws the play field with plain shapes. World space is y-up, so every point is flipped into
// raylib's y-down screen space through to_screen().
class WorldRenderer {
public:
    static raylib::Vector2 to_screen(const DVec2& p) {
        return raylib::Vector2{static_cast<float>(p.x), static_cast<float>(-p.y)};
    }

    static void render_scene(const flecs::world& w, const Config& cfg, raylib::Camera2D& cam) {
        cam.BeginMode();

        w.each([&](const Position& p, const Orientation& o, const Role& r, const CircleCollider& c, const Tint& t) {
            switch (r.tag) {
                case RoleTag::ship: draw_ship(p.value, o.radians, c.radius, t.value); break;
                case RoleTag::projectile: DrawCircleV(to_screen(p.value), static_cast<float>(c.radius), t.value); break;
                case RoleTag::asteroid: break;
                case RoleTag::untagged: DrawCircleLinesV(to_screen(p.value), static_cast<float>(c.radius), t.value); break;
            }
        });

        w.each([&](const Position& p, const Orientation& o, const CircleCollider& c, const AsteroidVariant& v,
                   const Tint& t) {
            const int sides = constants::asteroid_min_sides + std::max(0, v.index);
            // raylib rotates clockwise in degrees on screen; negate for the y-flip.
            const float rot = -static_cast<float>(o.radians) * RAD2DEG;
            DrawPoly(to_screen(p.value), sides, static_cast<float>(c.radius), rot, t.value);
        });

        if (cfg.draw_colliders) {
            w.each([&](const Position& p, const CircleCollider& c) {
                DrawCircleLinesV(to_screen(p.value), static_cast<float>(c.radius),
                                 ColorAlpha(GREEN, constants::collider_line_alpha));
            });
        }

        EndMode2D();
    }

    static void render_hud(const flecs::world& w) {
        const auto* state = w.get<GameState>();
        if (!state) return;
        DrawText(TextFormat("Score: %u", state->score), static_cast<int>(constants::hud_x),
                 static_cast<int>(constants::hud_y), constants::hud_font, RAYWHITE);
    }

private:
    static void draw_ship(const DVec2& pos, const double heading, const double radius, const raylib::Color& tint) {
        const DVec2 fwd = forward_from_heading(heading);
        const DVec2 side{fwd.y, -fwd.x};
        const DVec2 nose = pos + fwd * (radius * constants::ship_nose_scale);
        const DVec2 tail = pos - fwd * (radius * constants::ship_tail_scale);
        const DVec2 left = tail - side * (radius * constants::ship_tail_scale);
        const DVec2 right = tail + side * (radius * constants::ship_tail_scale);
        // Counter-clockwise as seen on screen.
        DrawTriangle(to_screen(nose), to_screen(left), to_screen(right), tint);
    }
};

}  // namespace asteroids::systems
