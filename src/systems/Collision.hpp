#pragma once

#include <algorithm>
#include <cstddef>
#include <flecs.h>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <vector>

#include "../components/Components.hpp"
#include "../core/Config.hpp"

namespace asteroids::systems {

// Two distinct entities whose colliders overlapped this tick. Reported once per tick.
struct CollisionPair {
    flecs::entity_t first = 0;
    flecs::entity_t second = 0;

    [[nodiscard]] bool involves(flecs::entity_t e) const { return first == e || second == e; }
};

// Pairs produced by the detector for the current tick. Overwritten every tick and consumed by the
// rule engine before the next integration step.
struct CollisionEvents {
    std::vector<CollisionPair> pairs;
};

struct TickStats {
    int pairs = 0;
};

// Pairwise circle overlap test over every collidable entity. O(n^2), no broad phase.
struct Collision {
    struct Body {
        flecs::entity_t id;
        DVec2 p;
        double r;
    };

    static std::vector<Body> snapshot(const flecs::world& w) {
        std::vector<Body> bodies;
        bodies.reserve(256);
        w.each([&](const flecs::entity e, const Position& p, const CircleCollider& c) {
            bodies.push_back(Body{e.id(), p.value, c.radius});
        });
        return bodies;
    }

    static std::vector<CollisionPair> detect(const std::vector<Body>& bodies, const CollisionMode mode) {
        for (const Body& b : bodies) {
            if (!(b.r > 0.0)) throw std::invalid_argument("collider radius must be positive");
        }
        return mode == CollisionMode::summed_radii ? detect_summed(bodies) : detect_reference(bodies);
    }

    static std::vector<CollisionPair> detect_collisions(const flecs::world& w, const CollisionMode mode) {
        return detect(snapshot(w), mode);
    }

    // Runs detection and stores the result in the CollisionEvents singleton.
    static void run(const flecs::world& w) {
        const Config* cfg = w.get<Config>();
        const CollisionMode mode = cfg ? cfg->collision_mode : CollisionMode::reference;
        auto* events = w.get_mut<CollisionEvents>();
        if (!events) return;
        events->pairs = detect_collisions(w, mode);
        if (auto* stats = w.get_mut<TickStats>()) stats->pairs = static_cast<int>(events->pairs.size());
    }

private:
    // Every ordered (A, B) is tested against A's radius only. Before recording (A, B) the hits already
    // recorded for B are checked, and (A, B) is dropped if B already listed A. Hits for B only exist
    // once B has been visited as the outer entity, so the result depends on traversal order.
    static std::vector<CollisionPair> detect_reference(const std::vector<Body>& bodies) {
        std::vector<std::pair<flecs::entity_t, std::vector<flecs::entity_t>>> hits;
        std::unordered_map<flecs::entity_t, size_t> slot;
        hits.reserve(bodies.size());
        slot.reserve(bodies.size());

        for (const Body& a : bodies) {
            const auto [it, inserted] = slot.try_emplace(a.id, hits.size());
            if (inserted) hits.emplace_back(a.id, std::vector<flecs::entity_t>{});
            const size_t own = it->second;

            for (const Body& b : bodies) {
                if (a.id == b.id) continue;
                if (distance(a.p, b.p) >= a.r) continue;

                if (const auto other = slot.find(b.id); other != slot.end()) {
                    const auto& seen = hits[other->second].second;
                    if (std::find(seen.begin(), seen.end(), a.id) != seen.end()) continue;
                }
                hits[own].second.push_back(b.id);
            }
        }

        std::vector<CollisionPair> pairs;
        for (const auto& [a, list] : hits) {
            for (const flecs::entity_t b : list) pairs.push_back(CollisionPair{a, b});
        }
        return pairs;
    }

    static std::vector<CollisionPair> detect_summed(const std::vector<Body>& bodies) {
        std::vector<CollisionPair> pairs;
        const size_t n = bodies.size();
        for (size_t i = 0; i < n; ++i) {
            for (size_t j = i + 1; j < n; ++j) {
                const Body &A = bodies[i], &B = bodies[j];
                const double rsum = A.r + B.r;
                if (length2(B.p - A.p) < rsum * rsum) pairs.push_back(CollisionPair{A.id, B.id});
            }
        }
        return pairs;
    }
};

}  // namespace asteroids::systems
