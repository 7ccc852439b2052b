#include "contraption/core/layout.hpp"
#include "contraption/core/state_io.hpp"

#include <algorithm>

namespace Layout {

bool Viewport::operator==(const Viewport& other) const {
    return x == other.x && y == other.y && w == other.w && h == other.h && index == other.index;
}

bool Viewport::overlapsCircle(double cx, double cy, double radius) const {
    return cx + radius > x && cx - radius < x + w &&
           cy + radius > y && cy - radius < y + h;
}

GridShape gridShape(std::size_t count) {
    if (count == 0) {
        return {1, 1};
    }
    if (count <= 3) {
        return {static_cast<int>(count), 1};
    }
    if (count <= 6) {
        return {3, 2};
    }
    int const cols = 4;
    int const rows = static_cast<int>((count + cols - 1) / cols);
    return {cols, rows};
}

bool fitsCount(const GridShape& shape, std::size_t count) {
    if (shape.cols <= 0 || shape.rows <= 0) {
        return false;
    }
    auto const cols = static_cast<std::size_t>(shape.cols);
    auto const rows = static_cast<std::size_t>(shape.rows);
    if (count == 0) {
        return true;
    }
    // Every row must hold at least one chamber.
    return cols * rows >= count && cols * (rows - 1) < count;
}

std::vector<Viewport> computeViewports(std::size_t count, const GridShape& shape,
                                       double canvasWidth, double canvasHeight) {
    std::vector<Viewport> viewports;
    if (count == 0 || !fitsCount(shape, count)) {
        return viewports;
    }

    auto const cols = static_cast<std::size_t>(shape.cols);
    auto const rows = static_cast<std::size_t>(shape.rows);
    double const cellH = canvasHeight / static_cast<double>(rows);

    viewports.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        std::size_t const row = i / cols;
        std::size_t const col = i % cols;
        std::size_t const inRow = std::min(cols, count - row * cols);
        double const cellW = canvasWidth / static_cast<double>(inRow);

        Viewport vp;
        vp.x = static_cast<double>(col) * cellW;
        vp.y = static_cast<double>(row) * cellH;
        vp.w = cellW;
        vp.h = cellH;
        vp.index = i;
        viewports.push_back(vp);
    }
    return viewports;
}

nlohmann::json toJson(const Viewport& viewport) {
    return {
        {"x", viewport.x},
        {"y", viewport.y},
        {"w", viewport.w},
        {"h", viewport.h},
        {"index", viewport.index}
    };
}

Viewport viewportFromJson(const nlohmann::json& j, const Viewport& fallback) {
    Viewport vp;
    vp.x = StateIO::readDouble(j, "x", fallback.x);
    vp.y = StateIO::readDouble(j, "y", fallback.y);
    vp.w = StateIO::readDouble(j, "w", fallback.w);
    vp.h = StateIO::readDouble(j, "h", fallback.h);
    vp.index = static_cast<std::size_t>(StateIO::readUInt(j, "index", fallback.index));
    if (vp.w <= 0.0 || vp.h <= 0.0) {
        return fallback;
    }
    return vp;
}

} // namespace Layout
