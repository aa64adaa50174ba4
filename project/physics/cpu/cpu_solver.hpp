#pragma once
#include "../i_physics_solver.hpp"

class CpuSolver : public IPhysicsSolver {
public:
    explicit CpuSolver(const SolverParams& params) : params_(params) {}

    void step(ClothModel& cloth, f64 dt, const ExternalForces& f) override;

    const SolverParams& params() const override { return params_; }

private:
    SolverParams params_;
};
