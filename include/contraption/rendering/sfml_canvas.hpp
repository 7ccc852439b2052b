/**
 * @file sfml_canvas.hpp
 * @brief Canvas implementation on top of an SFML render target
 *
 * Clipping is done with sf::View: each pushed clip maps the clip rectangle
 * onto the matching part of the target's viewport. Text is skipped when no
 * font is available.
 */

#pragma once

#include <vector>
#include <SFML/Graphics.hpp>

#include "contraption/core/canvas.hpp"

class SfmlCanvas : public Canvas {
public:
    /**
     * @param target Window or texture to draw to; must outlive the canvas
     * @param font Font for drawText(), may be nullptr
     */
    SfmlCanvas(sf::RenderTarget& target, const sf::Font* font);

    void clear(const Components::Color& color) override;

    void fillCircle(double x, double y, double radius,
                    const Components::Color& color, uint8_t alpha) override;
    void strokeCircle(double x, double y, double radius,
                      const Components::Color& color, uint8_t alpha, double thickness) override;

    void fillRect(double x, double y, double w, double h,
                  const Components::Color& color, uint8_t alpha) override;
    void strokeRect(double x, double y, double w, double h,
                    const Components::Color& color, uint8_t alpha, double thickness) override;

    void drawLine(double x1, double y1, double x2, double y2,
                  const Components::Color& color, uint8_t alpha, double thickness) override;

    void drawText(double x, double y, const std::string& text, unsigned int size,
                  const Components::Color& color, uint8_t alpha) override;

    void pushClip(double x, double y, double w, double h) override;
    void popClip() override;

private:
    sf::RenderTarget& target;
    const sf::Font* font;
    std::vector<sf::FloatRect> clipStack;

    void applyClip();
    static sf::Color toSfColor(const Components::Color& color, uint8_t alpha);
};
