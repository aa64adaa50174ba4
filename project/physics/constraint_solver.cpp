// physics/constraint_solver.cpp
#include "constraint_solver.hpp"
#include <algorithm>
#include <cmath>

void relax_constraint(std::vector<Particle>& particles, const Constraint& c)
{
    Particle& p1 = particles[c.i];
    Particle& p2 = particles[c.j];

    const Vec2d d = p2.pos - p1.pos;
    const f64 dist = glm::length(d);

    // prevent division by zero
    if (dist == 0.0) return;

    const f64 diff = (dist - c.rest) / dist;
    const Vec2d offset = d * 0.5 * diff;

    if (!p1.pinned) p1.pos += offset;
    if (!p2.pinned) p2.pos -= offset;
}

void relax_constraints(ClothModel& c, u32 iterations)
{
    for (u32 it = 0; it < iterations; ++it) {
        for (const auto& con : c.constraints) {
            relax_constraint(c.particles, con);
        }
    }
}

f64 max_constraint_stretch(const ClothModel& c)
{
    f64 worst = 0.0;
    for (const auto& con : c.constraints) {
        if (con.rest <= 0.0) continue;
        const f64 dist = glm::length(c.particles[con.j].pos - c.particles[con.i].pos);
        worst = std::max(worst, std::abs(dist - con.rest) / con.rest);
    }
    return worst;
}
