#include "simulator.hpp"

#include <cmath>

#include "../core/common/log.hpp"

Simulator::Simulator(std::unique_ptr<IPhysicsSolver> solver, f64 fixed_dt)
    : solver_(std::move(solver)), fixed_dt_(fixed_dt)
{
}

void Simulator::init_scene(const Scene& s)
{
    scene_ = s;
    initial_ = s;
    tick_count_ = 0;
    divergence_reported_ = false;

    logging::sim()->info("scene initialized: {}x{} grid, {} particles, {} constraints",
                         scene_.cloth.rows, scene_.cloth.cols,
                         particle_count(), constraint_count());
    logging::sim()->debug("solver: {} iterations, damping {}, dt {}",
                          solver_->params().iterations, solver_->params().damping, fixed_dt_);
}

void Simulator::reset()
{
    scene_ = initial_;
    tick_count_ = 0;
    divergence_reported_ = false;
    logging::sim()->info("scene reset");
}

void Simulator::tick()
{
    step(fixed_dt_);
}

void Simulator::step(f64 dt)
{
    solver_->step(scene_.cloth, dt, scene_.forces);
    ++tick_count_;

    if (!divergence_reported_ && !is_finite()) {
        divergence_reported_ = true;
        logging::physics()->warn("non-finite particle position at tick {}", tick_count_);
    }
}

std::optional<u32> Simulator::find_nearest(const Vec2d& point, f64 max_radius) const
{
    const auto& particles = scene_.cloth.particles;

    f64 best_dist = max_radius;
    std::optional<u32> best;

    for (u32 i = 0; i < particles.size(); ++i) {
        f64 dist = glm::length(particles[i].pos - point);
        if (dist < best_dist) {
            best_dist = dist;
            best = i;
        }
    }

    // pinned particles are never selectable
    if (best && particles[*best].pinned) {
        return std::nullopt;
    }
    return best;
}

bool Simulator::set_position(u32 handle, const Vec2d& point)
{
    auto& particles = scene_.cloth.particles;
    if (handle >= particles.size() || particles[handle].pinned) {
        return false;
    }
    particles[handle].pos = point;
    return true;
}

void Simulator::release(u32 handle)
{
    logging::sim()->debug("particle {} released", handle);
}

bool Simulator::is_finite() const
{
    for (const auto& pt : scene_.cloth.particles) {
        if (!std::isfinite(pt.pos.x) || !std::isfinite(pt.pos.y)) {
            return false;
        }
    }
    return true;
}
