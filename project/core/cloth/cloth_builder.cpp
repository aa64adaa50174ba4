// core/cloth/cloth_builder.cpp
#include "cloth_builder.hpp"

ClothModel build_regular_grid(const ClothBuildParams& p)
{
    ClothModel c;
    if (p.rows == 0 || p.cols == 0) return c;

    c.rows = p.rows;
    c.cols = p.cols;
    c.particles.resize(static_cast<size_t>(p.rows) * p.cols);

    // cloth hangs in screen space, +y is down
    for (u32 row = 0; row < p.rows; ++row) {
        for (u32 col = 0; col < p.cols; ++col) {
            Particle& pt = c.at(row, col);
            pt.pos = Vec2d(p.origin.x + col * p.spacing,
                           p.origin.y + row * p.spacing);
            pt.prev_pos = pt.pos;
        }
    }

    if (p.pin_top_edge) {
        tag_pins_top_edge(c);
    }
    compute_constraints(c);

    c.aabb.min = c.aabb.max = c.particles[0].pos;
    for (auto& pt : c.particles) {
        c.aabb.min = glm::min(c.aabb.min, pt.pos);
        c.aabb.max = glm::max(c.aabb.max, pt.pos);
    }

    return c;
}

void tag_pins_top_edge(ClothModel& c)
{
    for (auto& pt : c.particles) pt.pinned = false;

    if (c.rows == 0 || c.cols == 0) return;

    for (u32 col = 0; col < c.cols; ++col) {
        c.at(0, col).pinned = true;
    }
}

static void add_constraint(ClothModel& c, u32 i, u32 j)
{
    f64 rest = glm::length(c.particles[j].pos - c.particles[i].pos);
    c.constraints.push_back(Constraint{ i, j, rest });
}

void compute_constraints(ClothModel& c)
{
    c.constraints.clear();
    c.constraints.reserve(expected_constraint_count(c.rows, c.cols));

    // per cell: right, down, down-right, down-left.
    // The solver is order sensitive, keep this sequence.
    for (u32 row = 0; row < c.rows; ++row) {
        for (u32 col = 0; col < c.cols; ++col) {
            const u32 i = c.index(row, col);
            const bool has_right = col + 1 < c.cols;
            const bool has_down  = row + 1 < c.rows;

            if (has_right) {
                add_constraint(c, i, c.index(row, col + 1));
            }
            if (has_down) {
                add_constraint(c, i, c.index(row + 1, col));
            }
            if (has_down && has_right) {
                add_constraint(c, i, c.index(row + 1, col + 1));
            }
            if (has_down && col > 0) {
                add_constraint(c, i, c.index(row + 1, col - 1));
            }
        }
    }
}

u32 expected_constraint_count(u32 rows, u32 cols)
{
    if (rows == 0 || cols == 0) return 0;
    return rows * (cols - 1) + (rows - 1) * cols + 2 * (rows - 1) * (cols - 1);
}
