// physics/integrator.cpp
#include "integrator.hpp"

void integrate_verlet(std::vector<Particle>& particles, const IntegratorParams& p)
{
    const f64 gravity_step = p.gravity * p.dt * p.dt;

    for (auto& pt : particles) {
        if (pt.pinned) continue;

        Vec2d v = (pt.pos - pt.prev_pos) * p.damping;
        pt.prev_pos = pt.pos;
        pt.pos += v;
        pt.pos.y += gravity_step;
    }
}
