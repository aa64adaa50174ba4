#include "cpu_solver.hpp"

#include "../constraint_solver.hpp"
#include "../integrator.hpp"

void CpuSolver::step(ClothModel& cloth, f64 dt, const ExternalForces& f)
{
    IntegratorParams ip;
    ip.dt      = dt;
    ip.gravity = f.gravity;
    ip.damping = params_.damping;

    // 1. verlet integration
    integrate_verlet(cloth.particles, ip);

    // 2. constraint relaxation
    relax_constraints(cloth, params_.iterations);
}
