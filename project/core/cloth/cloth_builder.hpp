// core/cloth/cloth_builder.hpp
#pragma once
#include "cloth_model.hpp"

ClothModel build_regular_grid(const ClothBuildParams& p);
void tag_pins_top_edge(ClothModel& c);
void compute_constraints(ClothModel& c);
u32 expected_constraint_count(u32 rows, u32 cols);
