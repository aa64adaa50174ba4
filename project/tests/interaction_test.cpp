#include "input/interaction.hpp"
#include "core/cloth/cloth_builder.hpp"
#include "physics/cpu/cpu_solver.hpp"
#include "sim/simulator.hpp"

#include <gtest/gtest.h>
#include <memory>

class ClothInteractionTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        SolverParams sp;
        sim = std::make_unique<Simulator>(std::make_unique<CpuSolver>(sp), 0.016);

        ClothBuildParams bp;
        bp.rows = 3;
        bp.cols = 3;
        bp.spacing = 20.0;
        bp.origin = Vec2d(100.0, 50.0);

        Scene scene;
        scene.cloth = build_regular_grid(bp);
        sim->init_scene(scene);

        interaction = std::make_unique<ClothInteraction>(*sim, 20.0);
    }

    std::unique_ptr<Simulator> sim;
    std::unique_ptr<ClothInteraction> interaction;
};

TEST_F(ClothInteractionTest, DragMovesSelectedParticle)
{
    interaction->on_pointer_down(Vec2d(121.0, 71.0));
    ASSERT_TRUE(interaction->state().selected.has_value());
    EXPECT_EQ(*interaction->state().selected, 4u);
    EXPECT_TRUE(interaction->state().mouse_down);

    interaction->on_pointer_drag(Vec2d(150.0, 150.0));

    const Particle& p = sim->cloth().particles[4];
    EXPECT_DOUBLE_EQ(p.pos.x, 150.0);
    EXPECT_DOUBLE_EQ(p.pos.y, 150.0);
    EXPECT_DOUBLE_EQ(p.prev_pos.x, 120.0);
    EXPECT_DOUBLE_EQ(p.prev_pos.y, 70.0);
}

TEST_F(ClothInteractionTest, PointerUpEndsDrag)
{
    interaction->on_pointer_down(Vec2d(120.0, 70.0));
    interaction->on_pointer_up();

    EXPECT_FALSE(interaction->state().selected.has_value());
    EXPECT_FALSE(interaction->state().mouse_down);

    interaction->on_pointer_drag(Vec2d(10.0, 10.0));
    EXPECT_DOUBLE_EQ(sim->cloth().particles[4].pos.x, 120.0);
    EXPECT_DOUBLE_EQ(sim->cloth().particles[4].pos.y, 70.0);
}

TEST_F(ClothInteractionTest, PinnedParticleCannotBeGrabbed)
{
    interaction->on_pointer_down(Vec2d(101.0, 51.0));
    EXPECT_FALSE(interaction->state().selected.has_value());

    interaction->on_pointer_drag(Vec2d(300.0, 300.0));

    for (const auto& p : sim->cloth().particles) {
        EXPECT_NE(p.pos.x, 300.0);
    }
    EXPECT_DOUBLE_EQ(sim->cloth().particles[0].pos.x, 100.0);
    EXPECT_DOUBLE_EQ(sim->cloth().particles[0].pos.y, 50.0);
}

TEST_F(ClothInteractionTest, MissLeavesNothingSelected)
{
    interaction->on_pointer_down(Vec2d(500.0, 500.0));
    EXPECT_FALSE(interaction->state().selected.has_value());
    EXPECT_DOUBLE_EQ(interaction->state().mouse.x, 500.0);
}

TEST_F(ClothInteractionTest, TickAdvancesSimulation)
{
    ISimulationDriver& driver = *interaction;
    driver.on_tick();
    driver.on_tick();
    EXPECT_EQ(sim->tick_count(), 2u);
}

TEST_F(ClothInteractionTest, DraggedParticleKeepsMomentum)
{
    interaction->on_pointer_down(Vec2d(120.0, 90.0));
    ASSERT_TRUE(interaction->state().selected.has_value());
    const u32 handle = *interaction->state().selected;

    interaction->on_pointer_drag(Vec2d(130.0, 90.0));
    interaction->on_pointer_up();
    interaction->on_tick();

    // the drag shows up as velocity on the next integration
    EXPECT_GT(sim->cloth().particles[handle].prev_pos.x, 129.0);
    EXPECT_GT(sim->cloth().particles[handle].pos.x, 120.0);
}
