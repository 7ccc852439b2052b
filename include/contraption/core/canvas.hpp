/**
 * @file canvas.hpp
 * @brief Drawing capability handed to the manager and chambers
 *
 * Physics never reads anything back from a canvas. Coordinates are canvas
 * pixels; chambers add their viewport origin before drawing.
 */

#pragma once

#include <cstdint>
#include <string>

#include "contraption/components/basic.hpp"

class Canvas {
public:
    virtual ~Canvas() = default;

    virtual void clear(const Components::Color& color) = 0;

    virtual void fillCircle(double x, double y, double radius,
                            const Components::Color& color, uint8_t alpha) = 0;
    virtual void strokeCircle(double x, double y, double radius,
                              const Components::Color& color, uint8_t alpha, double thickness) = 0;

    virtual void fillRect(double x, double y, double w, double h,
                          const Components::Color& color, uint8_t alpha) = 0;
    virtual void strokeRect(double x, double y, double w, double h,
                            const Components::Color& color, uint8_t alpha, double thickness) = 0;

    virtual void drawLine(double x1, double y1, double x2, double y2,
                          const Components::Color& color, uint8_t alpha, double thickness) = 0;

    virtual void drawText(double x, double y, const std::string& text, unsigned int size,
                          const Components::Color& color, uint8_t alpha) = 0;

    /**
     * @brief Restricts drawing to a rectangle until the matching popClip().
     *
     * Clips nest; the innermost one wins.
     */
    virtual void pushClip(double x, double y, double w, double h) = 0;
    virtual void popClip() = 0;
};
