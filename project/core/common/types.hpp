// core/common/types.hpp
#pragma once
#include <cstdint>
#include <glm/glm.hpp>

using u32 = std::uint32_t;
using i32 = std::int32_t;
using f64 = double;

using Vec2d = glm::dvec2;

struct Bounds {
    Vec2d min{0.0};
    Vec2d max{0.0};
};
