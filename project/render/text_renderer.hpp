#pragma once
#include <iosfwd>
#include <string>

#include "i_render.hpp"

// Rasterizes particles into a character grid covering `area`:
// '#' pinned, 'o' free. Points outside the area or non-finite are dropped.
std::string render_ascii(const RenderView& v, u32 width, u32 height, const Bounds& area);

class TextRenderer : public IRenderer {
public:
  TextRenderer(std::ostream& out, u32 width, u32 height, const Bounds& area)
      : out_(out), width_(width), height_(height), area_(area) {}

  void draw_frame(const RenderView& v) override;

private:
  std::ostream& out_;
  u32 width_, height_;
  Bounds area_;
};
