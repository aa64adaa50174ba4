#include "scene.hpp"
#include "../core/cloth/cloth_builder.hpp"

Scene make_hanging_cloth_scene(const ClothBuildParams& params, f64 gravity)
{
    Scene s;
    s.type  = SceneType::HangingCloth;
    s.cloth = build_regular_grid(params);
    s.forces.gravity = gravity;
    return s;
}
