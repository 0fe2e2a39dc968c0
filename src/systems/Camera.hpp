#pragma once

#include <algorithm>
#include <flecs.h>
#include <raylib-cpp.hpp>
#include <raymath.h>

#include "../core/Constants.hpp"

namespace asteroids {

// Wraps the play-field camera as a singleton component and provides helpers.
// Camera space is raylib screen space: world y is flipped when drawing (see WorldRenderer).
class Camera {
public:
    static void init(raylib::Camera2D& cam) {
        constexpr float kHalf = 0.5F;
        cam.zoom = 1.0F;
        cam.rotation = 0.0F;
        cam.offset = {static_cast<float>(GetScreenWidth()) * kHalf, static_cast<float>(GetScreenHeight()) * kHalf};
        cam.target = {0.0F, 0.0F};
    }

    static void zoom_at_mouse(raylib::Camera2D& cam, const float wheel) {
        if (wheel == 0.0F) return;
        const raylib::Vector2 mouse = GetMousePosition();
        const raylib::Vector2 worldBefore = GetScreenToWorld2D(mouse, cam);
        cam.zoom = std::clamp(cam.zoom * (1.0F + wheel * constants::zoom_wheel_scale), constants::min_zoom,
                              constants::max_zoom);
        const raylib::Vector2 worldAfter = GetScreenToWorld2D(mouse, cam);
        cam.target = Vector2Add(cam.target, Vector2Subtract(worldBefore, worldAfter));
    }

    struct CameraComponent {
        raylib::Camera2D camera;
        CameraComponent() { init(camera); }
    };

    static void register_systems(const flecs::world& world) { world.set<CameraComponent>({}); }

    // Back to the default framing centred on the origin.
    static void reset_view(const flecs::world& world) {
        if (auto* cam = get(world)) init(*cam);
    }

    static raylib::Camera2D* get(const flecs::world& world) {
        if (auto* cam = world.get_mut<CameraComponent>()) return &cam->camera;
        return nullptr;
    }
};

}  // namespace asteroids
