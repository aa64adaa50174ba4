#include "physics/integrator.hpp"

#include <gtest/gtest.h>

namespace {

Particle make_particle(Vec2d pos, Vec2d prev, bool pinned = false)
{
    Particle p;
    p.pos = pos;
    p.prev_pos = prev;
    p.pinned = pinned;
    return p;
}

IntegratorParams default_params()
{
    IntegratorParams ip;
    ip.dt = 0.016;
    ip.gravity = 980.0;
    ip.damping = 0.99;
    return ip;
}

} // namespace

TEST(IntegratorTest, GravityFromRest)
{
    std::vector<Particle> ps{ make_particle({100.0, 50.0}, {100.0, 50.0}) };

    integrate_verlet(ps, default_params());

    // g * dt^2 = 980 * 0.000256
    EXPECT_NEAR(ps[0].pos.x, 100.0, 1e-12);
    EXPECT_NEAR(ps[0].pos.y, 50.25088, 1e-9);
    EXPECT_DOUBLE_EQ(ps[0].prev_pos.x, 100.0);
    EXPECT_DOUBLE_EQ(ps[0].prev_pos.y, 50.0);
}

TEST(IntegratorTest, DampingScalesImpliedVelocity)
{
    std::vector<Particle> ps{ make_particle({10.0, 0.0}, {0.0, 0.0}) };

    IntegratorParams ip;
    ip.dt = 0.016;
    ip.gravity = 0.0;
    ip.damping = 0.5;
    integrate_verlet(ps, ip);

    EXPECT_DOUBLE_EQ(ps[0].pos.x, 15.0);
    EXPECT_DOUBLE_EQ(ps[0].pos.y, 0.0);
    EXPECT_DOUBLE_EQ(ps[0].prev_pos.x, 10.0);
}

TEST(IntegratorTest, PinnedParticleUntouched)
{
    std::vector<Particle> ps{ make_particle({5.0, 5.0}, {1.0, 2.0}, true) };

    integrate_verlet(ps, default_params());

    EXPECT_DOUBLE_EQ(ps[0].pos.x, 5.0);
    EXPECT_DOUBLE_EQ(ps[0].pos.y, 5.0);
    EXPECT_DOUBLE_EQ(ps[0].prev_pos.x, 1.0);
    EXPECT_DOUBLE_EQ(ps[0].prev_pos.y, 2.0);
}

TEST(IntegratorTest, ExternalOverrideBecomesVelocity)
{
    // particle at rest at (100, 50) was dragged to (110, 50) between ticks
    std::vector<Particle> ps{ make_particle({110.0, 50.0}, {100.0, 50.0}) };

    integrate_verlet(ps, default_params());

    EXPECT_NEAR(ps[0].pos.x, 110.0 + 10.0 * 0.99, 1e-12);
    EXPECT_NEAR(ps[0].pos.y, 50.25088, 1e-9);
    EXPECT_DOUBLE_EQ(ps[0].prev_pos.x, 110.0);
}

TEST(IntegratorTest, OnlyUnpinnedParticlesMove)
{
    std::vector<Particle> ps{
        make_particle({0.0, 0.0}, {0.0, 0.0}, true),
        make_particle({0.0, 20.0}, {0.0, 20.0}),
        make_particle({0.0, 40.0}, {0.0, 40.0}),
    };

    integrate_verlet(ps, default_params());

    EXPECT_DOUBLE_EQ(ps[0].pos.y, 0.0);
    EXPECT_GT(ps[1].pos.y, 20.0);
    EXPECT_GT(ps[2].pos.y, 40.0);
}
