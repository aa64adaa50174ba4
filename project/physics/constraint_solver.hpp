// physics/constraint_solver.hpp
#pragma once
#include <vector>
#include "../core/common/types.hpp"
#include "../core/cloth/cloth_model.hpp"

// Moves both free endpoints half way towards the rest length.
// Coincident endpoints are left alone.
void relax_constraint(std::vector<Particle>& particles, const Constraint& c);

// Gauss-Seidel: `iterations` in-place passes over c.constraints in order.
void relax_constraints(ClothModel& c, u32 iterations);

// Largest |dist - rest| / rest over all constraints, 0 for an empty list.
f64 max_constraint_stretch(const ClothModel& c);
