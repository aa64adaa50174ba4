// physics/integrator.hpp
#pragma once
#include <vector>
#include "../core/common/types.hpp"
#include "../core/cloth/cloth_model.hpp"

struct IntegratorParams {
    f64 dt{0.016};
    f64 gravity{980.0};   // +y
    f64 damping{0.99};
};

// Position Verlet: v = (pos - prev_pos) * damping, gravity on y only.
// Pinned particles are skipped, prev_pos included.
void integrate_verlet(std::vector<Particle>& particles, const IntegratorParams& p);
