#include "i_render.hpp"

RenderView make_render_view(const ClothModel& cloth)
{
    RenderView v;
    v.points.reserve(cloth.particles.size());
    for (const auto& pt : cloth.particles) {
        v.points.push_back(RenderPoint{ pt.pos, pt.pinned });
    }

    v.segments.reserve(cloth.constraints.size());
    for (const auto& c : cloth.constraints) {
        v.segments.push_back(RenderSegment{ cloth.particles[c.i].pos,
                                            cloth.particles[c.j].pos });
    }
    return v;
}
