#pragma once
#include "../core/cloth/cloth_model.hpp"
#include "../physics/i_physics_solver.hpp"

enum class SceneType { HangingCloth };

struct Scene {
  SceneType type{SceneType::HangingCloth};
  ClothModel cloth;
  ExternalForces forces;
};

// Grid hanging from its pinned top row under `gravity`.
Scene make_hanging_cloth_scene(const ClothBuildParams& params, f64 gravity);
