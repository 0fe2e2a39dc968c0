#pragma once

#include <algorithm>
#include <flecs.h>
#include <stdexcept>

#include "../components/Components.hpp"
#include "../core/Config.hpp"
#include "../core/GameState.hpp"
#include "AsteroidField.hpp"
#include "Camera.hpp"
#include "Collision.hpp"
#include "Control.hpp"
#include "Input.hpp"
#include "Physics.hpp"
#include "Rules.hpp"
#include "Scene.hpp"
#include "Spawner.hpp"

namespace asteroids {

// Per-tick pipeline. Phases run strictly in this order:
//   asteroid timer -> integrate -> detect collisions -> evaluate and apply rules.
// Ship input is read by the host before the pipeline runs (see Simulation::step and main).
class Simulation {
public:
    // Sets up singletons, validates the config and builds the initial scene.
    static void init(const flecs::world& w, const Config& cfg = Config{}) {
        validate(cfg);
        w.set<Config>(cfg);
        w.set<GameState>(GameState{cfg});
        w.set<systems::CollisionEvents>({});
        w.set<systems::TickStats>({});
        Camera::register_systems(w);

        systems::WorldSpawner spawner(w);
        systems::Scene::setup(w, spawner);
    }

    static void register_systems(const flecs::world& w) {
        // Asteroid spawn timer
        w.system<>().kind(flecs::OnUpdate).iter([&](const flecs::iter& it) {
            if (const Config& cfg = *w.get<Config>(); cfg.paused) return;
            systems::AsteroidField::run(w, effective_dt(*w.get<Config>(), it.delta_time()));
        });

        // Integration
        w.system<>().kind(flecs::OnUpdate).iter([&](const flecs::iter& it) {
            if (const Config& cfg = *w.get<Config>(); cfg.paused) return;
            Physics::integrate(w, effective_dt(*w.get<Config>(), it.delta_time()));
        });

        // Collision detection on post-integration positions
        w.system<>().kind(flecs::PostUpdate).iter([&](flecs::iter&) {
            if (const Config& cfg = *w.get<Config>(); cfg.paused) return;
            systems::Collision::run(w);
        });

        // Rules consume the pairs detected this tick
        w.system<>().kind(flecs::PostUpdate).iter([&](flecs::iter&) {
            if (const Config& cfg = *w.get<Config>(); cfg.paused) return;
            systems::Rules::run(w);
            if (auto* state = w.get_mut<GameState>()) ++state->ticks;
        });
    }

    // One full tick without going through the flecs pipeline. Used by headless hosts and tests.
    static void step(const flecs::world& w, const InputSource& input, const float dt) {
        if (dt < 0.0F) throw std::invalid_argument("step: dt must not be negative");
        const Config* cfg = w.get<Config>();
        auto* state = w.get_mut<GameState>();
        if (!cfg || !state) throw std::logic_error("step: Simulation::init has not been called");
        if (cfg->paused) return;

        const float scaled = effective_dt(*cfg, dt);
        systems::WorldSpawner spawner(w);
        systems::Control::process_input(w, input, spawner, scaled);
        systems::AsteroidField::tick(*cfg, *state, spawner, scaled);
        Physics::integrate(w, scaled);
        systems::Collision::run(w);
        systems::Rules::run(w);
        ++state->ticks;
    }

    static float effective_dt(const Config& cfg, const float frame_dt) {
        const float base = cfg.use_fixed_dt ? cfg.fixed_dt : frame_dt;
        return std::max(0.0F, base) * std::max(0.0F, cfg.time_scale);
    }
};

}  // namespace asteroids
