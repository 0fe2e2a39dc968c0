#pragma once

#include <flecs.h>
#include <raylib.h>
#include <vector>

#include "../components/Components.hpp"
#include "Camera.hpp"
#include "Spawner.hpp"

namespace asteroids::systems {

class Scene {
public:
    // Spawns the player ship at the origin and points the camera at it.
    static flecs::entity_t setup(const flecs::world& w, SpawnService& spawner) {
        Camera::reset_view(w);
        return spawner.spawn(SpawnKind::ship, DVec2{0.0, 0.0}, 0.0, DVec2{0.0, 0.0}, 0.0);
    }

    static std::vector<flecs::entity_t> cleanup_entities(const flecs::world& w) {
        std::vector<flecs::entity_t> ids;
        const auto tagged = w.query_builder<>().with<Cleanup>().build();
        tagged.each([&](const flecs::entity e) { ids.push_back(e.id()); });
        return ids;
    }

    // Removes the given cleanup-tagged entities and builds the scene again.
    static flecs::entity_t reset(const flecs::world& w, SpawnService& spawner,
                                 const std::vector<flecs::entity_t>& cleanup) {
        for (const flecs::entity_t id : cleanup) spawner.despawn(id);
        TraceLog(LOG_INFO, "Scene reset: removed %d entities", static_cast<int>(cleanup.size()));
        return setup(w, spawner);
    }
};

}  // namespace asteroids::systems
