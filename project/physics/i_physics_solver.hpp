#pragma once
#include "../core/common/types.hpp"
#include "../core/cloth/cloth_model.hpp"

struct ExternalForces {
    f64 gravity{980.0};   // acceleration along +y (screen down)
};

struct SolverParams {
    f64 damping{0.99};
    u32 iterations{5};
};

class IPhysicsSolver {
public:
    virtual ~IPhysicsSolver() = default;

    // One tick: integrate once, then relax. Mutates cloth in place.
    virtual void step(ClothModel& cloth, f64 dt, const ExternalForces& f) = 0;

    virtual const SolverParams& params() const = 0;
};
