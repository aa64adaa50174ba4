#include "interaction.hpp"

#include "../core/common/log.hpp"
#include "../sim/simulator.hpp"

ClothInteraction::ClothInteraction(Simulator& sim, f64 pick_radius)
    : sim_(sim), pick_radius_(pick_radius)
{
}

void ClothInteraction::on_tick()
{
    sim_.tick();
}

void ClothInteraction::on_pointer_down(const Vec2d& point)
{
    state_.mouse_down = true;
    state_.mouse = point;
    state_.selected = sim_.find_nearest(point, pick_radius_);

    if (state_.selected) {
        logging::input()->debug("selected particle {} at ({:.1f}, {:.1f})",
                                *state_.selected, point.x, point.y);
    }
}

void ClothInteraction::on_pointer_drag(const Vec2d& point)
{
    state_.mouse = point;
    if (state_.selected) {
        sim_.set_position(*state_.selected, point);
    }
}

void ClothInteraction::on_pointer_up()
{
    if (state_.selected) {
        sim_.release(*state_.selected);
    }
    state_.mouse_down = false;
    state_.selected.reset();
}
