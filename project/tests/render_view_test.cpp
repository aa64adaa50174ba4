#include "render/i_render.hpp"
#include "render/text_renderer.hpp"
#include "core/cloth/cloth_builder.hpp"

#include <gtest/gtest.h>
#include <limits>
#include <sstream>

TEST(RenderViewTest, SnapshotMirrorsCloth)
{
    ClothBuildParams bp;
    bp.rows = 3;
    bp.cols = 4;
    ClothModel c = build_regular_grid(bp);

    RenderView v = make_render_view(c);

    ASSERT_EQ(v.points.size(), c.particles.size());
    ASSERT_EQ(v.segments.size(), c.constraints.size());

    for (size_t k = 0; k < c.particles.size(); ++k) {
        EXPECT_EQ(v.points[k].pos.x, c.particles[k].pos.x);
        EXPECT_EQ(v.points[k].pos.y, c.particles[k].pos.y);
        EXPECT_EQ(v.points[k].pinned, c.particles[k].pinned);
    }
    for (size_t k = 0; k < c.constraints.size(); ++k) {
        EXPECT_EQ(v.segments[k].a.x, c.particles[c.constraints[k].i].pos.x);
        EXPECT_EQ(v.segments[k].b.y, c.particles[c.constraints[k].j].pos.y);
    }
}

TEST(RenderViewTest, AsciiMarksPinnedAndFree)
{
    RenderView v;
    v.points = { { Vec2d(0.0, 0.0), true }, { Vec2d(10.0, 10.0), false } };

    Bounds area{ Vec2d(0.0), Vec2d(10.0) };
    EXPECT_EQ(render_ascii(v, 3, 2, area), "#  \n  o\n");
}

TEST(RenderViewTest, AsciiDropsOutOfAreaAndNonFinite)
{
    const f64 nan = std::numeric_limits<f64>::quiet_NaN();
    RenderView v;
    v.points = { { Vec2d(-5.0, 0.0), false }, { Vec2d(nan, 1.0), false } };

    Bounds area{ Vec2d(0.0), Vec2d(10.0) };
    EXPECT_EQ(render_ascii(v, 2, 1, area), "  \n");
    EXPECT_EQ(render_ascii(v, 0, 4, area), "");
}

TEST(RenderViewTest, TextRendererWritesFrame)
{
    RenderView v;
    v.points = { { Vec2d(5.0, 5.0), false } };
    Bounds area{ Vec2d(0.0), Vec2d(10.0) };

    std::ostringstream out;
    TextRenderer renderer(out, 3, 3, area);
    renderer.draw_frame(v);

    EXPECT_EQ(out.str(), "   \n o \n   \n");
}
