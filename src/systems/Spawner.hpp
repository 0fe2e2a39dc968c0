#pragma once

#include <cstdint>
#include <flecs.h>
#include <raylib.h>
#include <stdexcept>

#include "../components/Components.hpp"
#include "../core/Colors.hpp"
#include "../core/Config.hpp"
#include "../core/GameState.hpp"
#include "../core/Random.hpp"

namespace asteroids::systems {

enum class SpawnKind : std::uint8_t { ship, asteroid, projectile };

inline const char* to_string(const SpawnKind kind) {
    switch (kind) {
        case SpawnKind::ship: return "ship";
        case SpawnKind::asteroid: return "asteroid";
        case SpawnKind::projectile: return "projectile";
    }
    return "unknown";
}

// Entity creation/removal as seen by the game rules. The rules never touch component data directly.
class SpawnService {
public:
    virtual ~SpawnService() = default;

    virtual flecs::entity_t spawn(SpawnKind kind, DVec2 position, double heading, DVec2 velocity,
                                  double angular_velocity) = 0;

    // Removing an entity that no longer exists is a no-op.
    virtual void despawn(flecs::entity_t entity) = 0;
};

// Spawns into a flecs world. Kind decides role, collider size, drag and look.
class WorldSpawner final : public SpawnService {
public:
    explicit WorldSpawner(const flecs::world& w) : world_(w) {}

    flecs::entity_t spawn(const SpawnKind kind, const DVec2 position, const double heading, const DVec2 velocity,
                          const double angular_velocity) override {
        Velocity v{};
        v.linear = velocity;
        v.angular = angular_velocity;
        double radius = constants::ship_radius;
        RoleTag tag = RoleTag::ship;
        raylib::Color tint{ship_color};

        if (kind != SpawnKind::ship) {
            v.linear_drag = DVec2{0.0, 0.0};
            v.angular_drag = 0.0;
        }
        if (kind == SpawnKind::asteroid) {
            radius = constants::asteroid_radius;
            tag = RoleTag::asteroid;
        } else if (kind == SpawnKind::projectile) {
            radius = constants::projectile_radius;
            tag = RoleTag::projectile;
            tint = projectile_color;
        }
        if (v.linear_drag.x < 0.0 || v.linear_drag.y < 0.0 || v.angular_drag < 0.0)
            throw std::invalid_argument("spawn: drag coefficients must not be negative");
        if (!(radius > 0.0)) throw std::invalid_argument("spawn: collider radius must be positive");

        flecs::entity e = world_.entity()
                              .set<Position>({position})
                              .set<Orientation>({heading})
                              .set<Velocity>(v)
                              .set<CircleCollider>({radius})
                              .set<Role>({tag})
                              .add<Cleanup>();

        if (kind == SpawnKind::ship) {
            ShipControl control{};
            if (const auto* cfg = world_.get<Config>()) {
                control.linear_accel = cfg->ship_linear_accel;
                control.angular_accel = cfg->ship_angular_accel;
            }
            e.set<ShipControl>(control);
        } else if (kind == SpawnKind::asteroid) {
            const int variant = pick_variant();
            e.set<AsteroidVariant>({variant});
            tint = asteroid_color(variant);
        }
        e.set<Tint>({tint});

        TraceLog(LOG_DEBUG, "Spawned %s #%llu at (%.1f, %.1f)", to_string(kind),
                 static_cast<unsigned long long>(e.id()), position.x, position.y);
        return e.id();
    }

    void despawn(const flecs::entity_t entity) override {
        if (entity == 0) return;
        flecs::entity e = world_.entity(entity);
        if (e.is_alive()) e.destruct();
    }

private:
    int pick_variant() const {
        const Config* cfg = world_.get<Config>();
        const int variants = cfg ? cfg->asteroid_variants : constants::asteroid_variant_count;
        if (auto* state = world_.get_mut<GameState>()) return random_int(state->rng, 0, variants);
        return 0;
    }

    const flecs::world& world_;
};

}  // namespace asteroids::systems
