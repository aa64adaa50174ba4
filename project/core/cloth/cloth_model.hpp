// core/cloth/cloth_model.hpp
#pragma once
#include <vector>
#include "../common/types.hpp"

struct Particle {
    Vec2d pos{0.0};
    Vec2d prev_pos{0.0};   // implied velocity = pos - prev_pos
    bool  pinned{false};
};

// Distance constraint between particles[i] and particles[j].
// rest is fixed at construction and never updated.
struct Constraint {
    u32 i;
    u32 j;
    f64 rest;
};

struct ClothModel {
    std::vector<Particle>   particles;    // row-major, rows * cols
    std::vector<Constraint> constraints;  // solve order

    u32 rows{0}, cols{0};

    Bounds aabb{};

    u32 index(u32 row, u32 col) const { return row * cols + col; }
    Particle&       at(u32 row, u32 col)       { return particles[index(row, col)]; }
    const Particle& at(u32 row, u32 col) const { return particles[index(row, col)]; }
};

struct ClothBuildParams {
    u32 rows{20};
    u32 cols{30};
    f64 spacing{20.0};
    Vec2d origin{100.0, 50.0};
    bool pin_top_edge{true};
};
