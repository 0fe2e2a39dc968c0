#pragma once

#include <stdexcept>
#include <flecs.h>
#include <imgui.h>
#include <raylib-cpp.hpp>
#include <rlImGui.h>

#include "../components/Components.hpp"
#include "../core/Config.hpp"
#include "../core/Constants.hpp"
#include "../core/GameState.hpp"
#include "Diagnostics.hpp"
#include "Scene.hpp"
#include "Spawner.hpp"

namespace asteroids {

class UI {
public:
    static void begin() { rlImGuiBegin(); }
    static void end() { rlImGuiEnd(); }

    static void draw(const flecs::world& w) {
        auto* cfg = w.get_mut<Config>();
        if (!cfg) return;
        bool requestStep = false;

        draw_time_panel(*cfg, requestStep);
        draw_tuning_panel(w, *cfg);
        draw_diagnostics_panel(w, *cfg);

        if (requestStep) {
            const bool old = cfg->paused;
            cfg->paused = false;
            w.progress(cfg->fixed_dt);
            cfg->paused = old;
        }
    }

private:
    static void draw_time_panel(Config& cfg, bool& requestStep) {
        ImGui::SetNextWindowPos(ImVec2(12, 48), ImGuiCond_FirstUseEver);
        ImGui::SetNextWindowSize(ImVec2(320, 0), ImGuiCond_FirstUseEver);
        ImGui::Begin("Time");
        ImGui::Checkbox("Paused", &cfg.paused);
        ImGui::SameLine();
        if (ImGui::Button("Step")) requestStep = true;
        ImGui::Checkbox("Use Fixed dt", &cfg.use_fixed_dt);
        ImGui::SliderFloat("Fixed dt", &cfg.fixed_dt, constants::fixed_dt_min, constants::fixed_dt_max, "%.4f");
        ImGui::SliderFloat("Time Scale", &cfg.time_scale, constants::time_scale_min, constants::time_scale_max,
                           "%.2f");
        ImGui::Text("Last step: %.3f ms", cfg.last_step_ms);
        ImGui::End();
    }

    // Edits go to a copy and are only committed when the result still validates.
    static void draw_tuning_panel(const flecs::world& w, Config& cfg) {
        ImGui::SetNextWindowPos(ImVec2(12, 200), ImGuiCond_FirstUseEver);
        ImGui::SetNextWindowSize(ImVec2(320, 0), ImGuiCond_FirstUseEver);
        ImGui::Begin("Tuning");
        Config edit = cfg;
        ImGui::SliderFloat("Spawn Period", &edit.asteroid_period, constants::period_min, constants::period_max, "%.2f s");
        ImGui::SliderInt("Spawn Chance", &edit.asteroid_chance, 0, constants::chance_roll_max, "%d %%");
        ImGui::SliderFloat("Thrust", &edit.ship_linear_accel, 0.0F, constants::accel_max, "%.1f");
        ImGui::SliderFloat("Turn Rate", &edit.ship_angular_accel, 0.0F, constants::angular_accel_max, "%.2f");
        int mode = static_cast<int>(edit.collision_mode);
        ImGui::RadioButton("Reference collisions", &mode, static_cast<int>(CollisionMode::reference));
        ImGui::SameLine();
        ImGui::RadioButton("Summed radii", &mode, static_cast<int>(CollisionMode::summed_radii));
        edit.collision_mode = static_cast<CollisionMode>(mode);
        ImGui::Checkbox("Draw Colliders", &edit.draw_colliders);

        try {
            validate(edit);
            apply_ship_tuning(w, cfg, edit);
            cfg = edit;
        } catch (const std::invalid_argument& e) {
            TraceLog(LOG_WARNING, "Rejected tuning change: %s", e.what());
        }

        if (ImGui::Button("Reset Scene")) {
            systems::WorldSpawner spawner(w);
            systems::Scene::reset(w, spawner, systems::Scene::cleanup_entities(w));
        }
        ImGui::End();
    }

    static void draw_diagnostics_panel(const flecs::world& w, const Config& cfg) {
        const Diagnostics d = compute_diagnostics(w);
        ImGui::SetNextWindowPos(ImVec2(12, 400), ImGuiCond_FirstUseEver);
        ImGui::SetNextWindowSize(ImVec2(320, 0), ImGuiCond_FirstUseEver);
        ImGui::Begin("Diagnostics");
        ImGui::Text("Score: %u", d.score);
        ImGui::Text("Play time: %.1f s  Ticks: %llu", d.play_time, static_cast<unsigned long long>(d.ticks));
        ImGui::Text("Ships: %d  Asteroids: %d  Projectiles: %d", d.ships, d.asteroids, d.projectiles);
        ImGui::Text("Colliders: %d  Pairs last tick: %d", d.colliders, d.pairs_last_tick);
        ImGui::Text("Collision mode: %s",
                    cfg.collision_mode == CollisionMode::reference ? "reference" : "summed radii");
        ImGui::End();
    }

    // Thrust and turn rate live on the ship; push changes onto the live ship too.
    static void apply_ship_tuning(const flecs::world& w, const Config& before, const Config& after) {
        if (before.ship_linear_accel == after.ship_linear_accel && before.ship_angular_accel == after.ship_angular_accel)
            return;
        w.each([&](ShipControl& ship) {
            ship.linear_accel = after.ship_linear_accel;
            ship.angular_accel = after.ship_angular_accel;
        });
    }
};

}  // namespace asteroids
