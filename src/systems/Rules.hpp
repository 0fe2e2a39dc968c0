#pragma once

#include <cstdint>
#include <flecs.h>
#include <raylib.h>
#include <unordered_map>
#include <vector>

#include "../components/Components.hpp"
#include "../core/Constants.hpp"
#include "../core/GameState.hpp"
#include "Collision.hpp"
#include "Scene.hpp"
#include "Spawner.hpp"

namespace asteroids::systems {

using RoleTable = std::unordered_map<flecs::entity_t, RoleTag>;

// What the rules may look at for one tick: role of every tagged entity and the cleanup set.
struct RuleContext {
    RoleTable roles;
    std::vector<flecs::entity_t> cleanup;
};

// Mutations decided while evaluating a tick's collision pairs. Nothing is changed until apply().
struct TickCommands {
    std::vector<flecs::entity_t> despawns;
    std::uint32_t score_delta = 0;
    bool reset_scene = false;
    std::vector<flecs::entity_t> reset_cleanup;

    [[nodiscard]] bool empty() const { return despawns.empty() && score_delta == 0 && !reset_scene; }
};

// Collision response:
//   1. projectile + asteroid (either order): both removed, score += 10, next pair.
//   2. ship + asteroid (either order): every cleanup-tagged entity removed, scene set up again.
//   3. anything else: ignored.
class Rules {
public:
    static RoleTag role_of(const RoleTable& roles, const flecs::entity_t e) {
        const auto it = roles.find(e);
        return it == roles.end() ? RoleTag::untagged : it->second;
    }

    static RuleContext context(const flecs::world& w) {
        RuleContext ctx;
        w.each([&](const flecs::entity e, const Role& r) { ctx.roles.emplace(e.id(), r.tag); });
        ctx.cleanup = Scene::cleanup_entities(w);
        return ctx;
    }

    static TickCommands evaluate(const std::vector<CollisionPair>& pairs, const RuleContext& ctx) {
        TickCommands out;
        for (const CollisionPair& pair : pairs) {
            const RoleTag a = role_of(ctx.roles, pair.first);
            const RoleTag b = role_of(ctx.roles, pair.second);

            if (is(a, b, RoleTag::projectile, RoleTag::asteroid)) {
                out.despawns.push_back(pair.first);
                out.despawns.push_back(pair.second);
                out.score_delta += static_cast<std::uint32_t>(constants::score_per_asteroid);
                continue;
            }

            if (is(a, b, RoleTag::ship, RoleTag::asteroid) && !out.reset_scene) {
                out.reset_scene = true;
                out.reset_cleanup = ctx.cleanup;
            }
        }
        return out;
    }

    static void apply(const TickCommands& cmds, SpawnService& spawner, GameState& state, const flecs::world& w) {
        for (const flecs::entity_t id : cmds.despawns) spawner.despawn(id);

        if (cmds.score_delta > 0) {
            state.score += cmds.score_delta;
            TraceLog(LOG_INFO, "Score: %u", state.score);
        }

        if (cmds.reset_scene) Scene::reset(w, spawner, cmds.reset_cleanup);
    }

    static TickCommands apply_rules(const std::vector<CollisionPair>& pairs, const RuleContext& ctx,
                                    SpawnService& spawner, GameState& state, const flecs::world& w) {
        TickCommands cmds = evaluate(pairs, ctx);
        apply(cmds, spawner, state, w);
        return cmds;
    }

    // Consumes this tick's CollisionEvents.
    static void run(const flecs::world& w) {
        auto* events = w.get_mut<CollisionEvents>();
        auto* state = w.get_mut<GameState>();
        if (!events || !state) return;
        WorldSpawner spawner(w);
        apply_rules(events->pairs, context(w), spawner, *state, w);
        events->pairs.clear();
    }

private:
    static bool is(const RoleTag a, const RoleTag b, const RoleTag x, const RoleTag y) {
        return (a == x && b == y) || (a == y && b == x);
    }
};

}  // namespace asteroids::systems
