#pragma once
#include <vector>
#include "../core/common/types.hpp"
#include "../core/cloth/cloth_model.hpp"

struct RenderPoint {
  Vec2d pos;
  bool  pinned;
};
struct RenderSegment {
  Vec2d a, b;
};
// Snapshot of the cloth, safe to hand to another thread.
struct RenderView {
  std::vector<RenderPoint>   points;
  std::vector<RenderSegment> segments;
};

RenderView make_render_view(const ClothModel& cloth);

class IRenderer {
public:
  virtual ~IRenderer() = default;
  virtual void draw_frame(const RenderView& v) = 0;
};
