#pragma once
#include <memory>
#include <optional>

#include "../physics/i_physics_solver.hpp"
#include "scene.hpp"

// Owns the scene and drives the solver. Single threaded: rendering must read
// cloth() between ticks, or snapshot it.
class Simulator {
public:
    Simulator(std::unique_ptr<IPhysicsSolver> solver, f64 fixed_dt);

    void init_scene(const Scene& s);
    void reset();

    void update_forces(const ExternalForces& f) { scene_.forces = f; }

    void tick();
    void step(f64 dt);

    // Nearest particle strictly within max_radius, row-major tie break.
    // Empty when nothing is in range or the nearest one is pinned.
    std::optional<u32> find_nearest(const Vec2d& point, f64 max_radius) const;

    // Overwrites pos only, so the move shows up as velocity next tick.
    // Pinned or unknown particles are rejected.
    bool set_position(u32 handle, const Vec2d& point);

    void release(u32 handle);

    const ClothModel& cloth() const { return scene_.cloth; }
    const ExternalForces& forces() const { return scene_.forces; }
    u32 particle_count() const   { return static_cast<u32>(scene_.cloth.particles.size()); }
    u32 constraint_count() const { return static_cast<u32>(scene_.cloth.constraints.size()); }
    u32 tick_count() const { return tick_count_; }
    f64 fixed_dt() const { return fixed_dt_; }

    bool is_finite() const;

private:
    std::unique_ptr<IPhysicsSolver> solver_;
    Scene scene_;
    Scene initial_;
    f64   fixed_dt_;
    u32   tick_count_{0};
    bool  divergence_reported_{false};
};
