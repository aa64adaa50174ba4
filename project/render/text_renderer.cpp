#include "text_renderer.hpp"

#include <cmath>
#include <ostream>

std::string render_ascii(const RenderView& v, u32 width, u32 height, const Bounds& area)
{
    std::string out;
    if (width == 0 || height == 0) return out;

    std::string grid(static_cast<size_t>(width) * height, ' ');
    const Vec2d extent = area.max - area.min;

    for (const auto& p : v.points) {
        if (!std::isfinite(p.pos.x) || !std::isfinite(p.pos.y)) continue;

        f64 u = extent.x > 0.0 ? (p.pos.x - area.min.x) / extent.x : 0.0;
        f64 w = extent.y > 0.0 ? (p.pos.y - area.min.y) / extent.y : 0.0;
        if (u < 0.0 || u > 1.0 || w < 0.0 || w > 1.0) continue;

        u32 cx = static_cast<u32>(std::lround(u * (width - 1)));
        u32 cy = static_cast<u32>(std::lround(w * (height - 1)));
        char& cell = grid[static_cast<size_t>(cy) * width + cx];

        // pinned wins when several particles share a cell
        if (p.pinned) cell = '#';
        else if (cell != '#') cell = 'o';
    }

    out.reserve(grid.size() + height);
    for (u32 row = 0; row < height; ++row) {
        out.append(grid, static_cast<size_t>(row) * width, width);
        out.push_back('\n');
    }
    return out;
}

void TextRenderer::draw_frame(const RenderView& v)
{
    out_ << render_ascii(v, width_, height_, area_);
    out_.flush();
}
