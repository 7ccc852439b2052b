/**
 * @file layout.hpp
 * @brief Tiles the canvas into one viewport per chamber
 *
 * Pure functions: the same count and canvas always give the same viewports,
 * so a restored (cols, rows) pair reproduces the saved layout.
 */

#ifndef CONTRAPTION_LAYOUT_HPP
#define CONTRAPTION_LAYOUT_HPP

#include <cstddef>
#include <vector>

#include <nlohmann/json.hpp>

namespace Layout {

/**
 * @brief Axis-aligned chamber rectangle in canvas coordinates
 */
struct Viewport {
    double x = 0.0;
    double y = 0.0;
    double w = 0.0;
    double h = 0.0;
    std::size_t index = 0;  ///< Slot in the grid, row-major

    bool operator==(const Viewport& other) const;

    /** @brief True if the circle's bounding box overlaps this rectangle. */
    bool overlapsCircle(double cx, double cy, double radius) const;
};

/**
 * @brief Grid dimensions
 */
struct GridShape {
    int cols = 1;
    int rows = 1;
};

/**
 * @brief Grid shape for a chamber count
 *
 * Up to three chambers share one row, up to six use 3x2, beyond that four
 * columns and as many rows as needed.
 */
GridShape gridShape(std::size_t count);

/**
 * @brief True if @p shape can hold @p count chambers with no empty row.
 */
bool fitsCount(const GridShape& shape, std::size_t count);

/**
 * @brief Computes one viewport per chamber.
 *
 * Chamber i sits at column i % cols, row i / cols. Cells of a full row are
 * canvas_w / cols wide; a partially filled last row divides the width between
 * the chambers it holds, so the viewports always cover the canvas exactly.
 */
std::vector<Viewport> computeViewports(std::size_t count, const GridShape& shape,
                                       double canvasWidth, double canvasHeight);

nlohmann::json toJson(const Viewport& viewport);

/** @brief Reads a viewport, keeping @p fallback's value for missing fields. */
Viewport viewportFromJson(const nlohmann::json& j, const Viewport& fallback);

} // namespace Layout

#endif
