#include <cassert>
#include <cmath>
#include <flecs.h>
#include <raylib.h>
#include <stdexcept>

#include "../src/components/Components.hpp"
#include "../src/systems/Physics.hpp"
#include "TestSupport.hpp"

using asteroids::Physics;

static flecs::entity make_body(const flecs::world& w, DVec2 pos, double heading, const Velocity& v) {
    return w.entity().set<Position>({pos}).set<Orientation>({heading}).set<Velocity>(v);
}

static void zero_velocity_is_a_no_op() {
    flecs::world w;
    Velocity v{};  // default drag 0.5, zero velocity
    const flecs::entity e = make_body(w, DVec2{3.0, -4.0}, 1.25, v);
    for (const float dt : {0.0F, 0.125F, 1.0F, 7.5F}) Physics::integrate(w, dt);
    assert(e.get<Position>()->value == (DVec2{3.0, -4.0}));
    assert(e.get<Orientation>()->radians == 1.25);
}

static void zero_drag_advances_linearly() {
    flecs::world w;
    Velocity v{};
    v.linear = DVec2{10.0, -4.0};
    v.linear_drag = DVec2{0.0, 0.0};
    v.angular_drag = 0.0;
    const flecs::entity e = make_body(w, DVec2{0.0, 0.0}, 0.0, v);

    for (int i = 0; i < 4; ++i) Physics::integrate(w, 0.25F);  // t1 = 1.0
    const DVec2 p1 = e.get<Position>()->value;
    for (int i = 0; i < 8; ++i) Physics::integrate(w, 0.5F);  // t2 = 5.0
    const DVec2 p2 = e.get<Position>()->value;

    assert(test::near(p2.x - p1.x, 10.0 * 4.0));
    assert(test::near(p2.y - p1.y, -4.0 * 4.0));
    assert(e.get<Velocity>()->linear == (DVec2{10.0, -4.0}));
}

static void drag_is_applied_per_tick_before_moving() {
    flecs::world w;
    Velocity v{};
    v.linear = DVec2{100.0, -40.0};
    v.angular = 2.0;
    const flecs::entity e = make_body(w, DVec2{0.0, 0.0}, 0.0, v);

    Physics::integrate(w, 0.125F);
    // v *= 1 - 0.5 * 0.125, then p += v * dt
    const Velocity& after = *e.get<Velocity>();
    assert(after.linear.x == 93.75);
    assert(after.linear.y == -37.5);
    assert(after.angular == 1.875);
    assert(e.get<Position>()->value.x == 93.75 * 0.125);
    assert(e.get<Position>()->value.y == -37.5 * 0.125);
    assert(e.get<Orientation>()->radians == 1.875 * 0.125);
}

static void drag_shrinks_speed_monotonically() {
    flecs::world w;
    Velocity v{};
    v.linear = DVec2{30.0, 40.0};
    v.linear_drag = DVec2{0.8, 0.8};
    v.angular = -3.0;
    v.angular_drag = 0.8;
    const flecs::entity e = make_body(w, DVec2{0.0, 0.0}, 0.0, v);

    double speed = length(v.linear);
    double spin = std::abs(v.angular);
    for (int i = 0; i < 50; ++i) {
        Physics::integrate(w, 0.125F);  // drag * dt = 0.1
        const Velocity& now = *e.get<Velocity>();
        assert(length(now.linear) < speed);
        assert(length(now.linear) > 0.0);
        assert(std::abs(now.angular) < spin);
        speed = length(now.linear);
        spin = std::abs(now.angular);
    }
}

static void oversized_drag_flips_velocity() {
    flecs::world w;
    Velocity v{};
    v.linear = DVec2{100.0, 0.0};
    v.linear_drag = DVec2{24.0, 0.0};
    v.angular_drag = 0.0;
    const flecs::entity e = make_body(w, DVec2{0.0, 0.0}, 0.0, v);

    Physics::integrate(w, 0.125F);  // factor 1 - 3 = -2
    assert(e.get<Velocity>()->linear.x == -200.0);
    assert(e.get<Position>()->value.x == -25.0);
}

static void orientation_is_not_wrapped() {
    flecs::world w;
    Velocity v{};
    v.angular = 10.0;
    v.angular_drag = 0.0;
    const flecs::entity e = make_body(w, DVec2{0.0, 0.0}, 0.0, v);
    for (int i = 0; i < 100; ++i) Physics::integrate(w, 0.125F);
    assert(test::near(e.get<Orientation>()->radians, 125.0));
}

static void negative_dt_is_rejected() {
    flecs::world w;
    make_body(w, DVec2{0.0, 0.0}, 0.0, Velocity{});
    bool threw = false;
    try {
        Physics::integrate(w, -0.01F);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

static void body_without_velocity_is_untouched() {
    flecs::world w;
    const flecs::entity e = w.entity().set<Position>({DVec2{1.0, 1.0}}).set<Orientation>({0.5});
    Physics::integrate(w, 1.0F);
    assert(e.get<Position>()->value == (DVec2{1.0, 1.0}));
}

int main() {
    SetTraceLogLevel(LOG_WARNING);
    zero_velocity_is_a_no_op();
    zero_drag_advances_linearly();
    drag_is_applied_per_tick_before_moving();
    drag_shrinks_speed_monotonically();
    oversized_drag_flips_velocity();
    orientation_is_not_wrapped();
    negative_dt_is_rejected();
    body_without_velocity_is_untouched();
    return 0;
}
