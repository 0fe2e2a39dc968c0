#include <cassert>
#include <flecs.h>
#include <raylib.h>
#include <stdexcept>
#include <vector>

#include "../src/components/Components.hpp"
#include "../src/systems/Collision.hpp"
#include "TestSupport.hpp"

using asteroids::CollisionMode;
using asteroids::systems::Collision;
using asteroids::systems::CollisionPair;
using Body = Collision::Body;

static bool has_pair(const std::vector<CollisionPair>& pairs, flecs::entity_t a, flecs::entity_t b) {
    for (const CollisionPair& p : pairs)
        if (p.first == a && p.second == b) return true;
    return false;
}

static void never_pairs_entity_with_itself() {
    const std::vector<Body> bodies{{1, {0.0, 0.0}, 50.0}, {2, {5.0, 0.0}, 50.0}, {3, {0.0, 5.0}, 50.0}};
    for (const CollisionMode mode : {CollisionMode::reference, CollisionMode::summed_radii}) {
        for (const CollisionPair& p : Collision::detect(bodies, mode)) assert(p.first != p.second);
    }
}

static void mutual_overlap_reports_one_ordering() {
    const std::vector<Body> bodies{{1, {0.0, 0.0}, 50.0}, {2, {10.0, 0.0}, 50.0}};
    const auto pairs = Collision::detect(bodies, CollisionMode::reference);
    assert(pairs.size() == 1);
    assert(has_pair(pairs, 1, 2));
    assert(!has_pair(pairs, 2, 1));
}

static void separation_then_overlap() {
    std::vector<Body> bodies{{1, {0.0, 0.0}, 20.0}, {2, {100.0, 0.0}, 20.0}};
    assert(Collision::detect(bodies, CollisionMode::reference).empty());
    bodies[1].p = DVec2{10.0, 0.0};
    assert(Collision::detect(bodies, CollisionMode::reference).size() == 1);
}

static void threshold_is_the_first_radius_only() {
    // 50 apart: inside the big radius, outside the small one, outside neither sum.
    const Body small{1, {0.0, 0.0}, 10.0};
    const Body big{2, {50.0, 0.0}, 100.0};

    const auto forward = Collision::detect({small, big}, CollisionMode::reference);
    assert(forward.size() == 1);
    assert(has_pair(forward, 2, 1));

    const auto backward = Collision::detect({big, small}, CollisionMode::reference);
    assert(backward.size() == 1);
    assert(has_pair(backward, 2, 1));

    // Two radius-10 bodies 15 apart only touch when radii are summed.
    const std::vector<Body> close{{1, {0.0, 0.0}, 10.0}, {2, {15.0, 0.0}, 10.0}};
    assert(Collision::detect(close, CollisionMode::reference).empty());
    const auto summed = Collision::detect(close, CollisionMode::summed_radii);
    assert(summed.size() == 1);
    assert(has_pair(summed, 1, 2));
}

static void distance_equal_to_radius_is_not_a_hit() {
    const std::vector<Body> bodies{{1, {0.0, 0.0}, 10.0}, {2, {10.0, 0.0}, 10.0}};
    assert(Collision::detect(bodies, CollisionMode::reference).empty());
}

static void one_entity_in_several_pairs() {
    const std::vector<Body> bodies{{1, {0.0, 0.0}, 50.0}, {2, {20.0, 0.0}, 5.0}, {3, {-20.0, 0.0}, 5.0}};
    const auto pairs = Collision::detect(bodies, CollisionMode::reference);
    assert(pairs.size() == 2);
    assert(has_pair(pairs, 1, 2));
    assert(has_pair(pairs, 1, 3));
}

static void no_pair_reported_twice_in_a_crowd() {
    std::vector<Body> bodies;
    for (flecs::entity_t i = 1; i <= 12; ++i)
        bodies.push_back(Body{i, {static_cast<double>(i % 4) * 7.0, static_cast<double>(i / 4) * 9.0}, 30.0});
    for (const CollisionMode mode : {CollisionMode::reference, CollisionMode::summed_radii}) {
        const auto pairs = Collision::detect(bodies, mode);
        for (size_t i = 0; i < pairs.size(); ++i) {
            for (size_t j = i + 1; j < pairs.size(); ++j) {
                const bool same = pairs[i].first == pairs[j].first && pairs[i].second == pairs[j].second;
                const bool mirrored = pairs[i].first == pairs[j].second && pairs[i].second == pairs[j].first;
                assert(!same && !mirrored);
            }
        }
    }
}

static void non_positive_radius_is_rejected() {
    const std::vector<Body> bodies{{1, {0.0, 0.0}, 0.0}, {2, {1.0, 0.0}, 10.0}};
    bool threw = false;
    try {
        (void)Collision::detect(bodies, CollisionMode::reference);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

static void world_detection_skips_bodies_without_collider() {
    flecs::world w;
    const flecs::entity a = w.entity().set<Position>({DVec2{0.0, 0.0}}).set<CircleCollider>({40.0});
    const flecs::entity b = w.entity().set<Position>({DVec2{10.0, 0.0}}).set<CircleCollider>({40.0});
    w.entity().set<Position>({DVec2{5.0, 0.0}});  // no collider

    const auto pairs = Collision::detect_collisions(w, CollisionMode::reference);
    assert(pairs.size() == 1);
    assert(pairs[0].involves(a.id()) && pairs[0].involves(b.id()));
}

static void run_fills_the_tick_event_list() {
    flecs::world w;
    w.set<Config>({});
    w.set<asteroids::systems::CollisionEvents>({});
    w.set<asteroids::systems::TickStats>({});
    w.entity().set<Position>({DVec2{0.0, 0.0}}).set<CircleCollider>({40.0});
    w.entity().set<Position>({DVec2{10.0, 0.0}}).set<CircleCollider>({40.0});

    Collision::run(w);
    assert(w.get<asteroids::systems::CollisionEvents>()->pairs.size() == 1);
    assert(w.get<asteroids::systems::TickStats>()->pairs == 1);
}

int main() {
    SetTraceLogLevel(LOG_WARNING);
    never_pairs_entity_with_itself();
    mutual_overlap_reports_one_ordering();
    separation_then_overlap();
    threshold_is_the_first_radius_only();
    distance_equal_to_radius_is_not_a_hit();
    one_entity_in_several_pairs();
    no_pair_reported_twice_in_a_crowd();
    non_positive_radius_is_rejected();
    world_detection_skips_bodies_without_collider();
    run_fills_the_tick_event_list();
    return 0;
}
