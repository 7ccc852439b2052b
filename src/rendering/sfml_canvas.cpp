#include "contraption/rendering/sfml_canvas.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

SfmlCanvas::SfmlCanvas(sf::RenderTarget& target, const sf::Font* font)
    : target(target), font(font) {}

sf::Color SfmlCanvas::toSfColor(const Components::Color& color, uint8_t alpha) {
    return sf::Color(color.r, color.g, color.b, alpha);
}

void SfmlCanvas::clear(const Components::Color& color) {
    target.clear(toSfColor(color, 255));
}

void SfmlCanvas::fillCircle(double x, double y, double radius,
                            const Components::Color& color, uint8_t alpha) {
    sf::CircleShape shape(static_cast<float>(radius));
    shape.setOrigin(static_cast<float>(radius), static_cast<float>(radius));
    shape.setPosition(static_cast<float>(x), static_cast<float>(y));
    shape.setFillColor(toSfColor(color, alpha));
    target.draw(shape);
}

void SfmlCanvas::strokeCircle(double x, double y, double radius,
                              const Components::Color& color, uint8_t alpha, double thickness) {
    sf::CircleShape shape(static_cast<float>(radius));
    shape.setOrigin(static_cast<float>(radius), static_cast<float>(radius));
    shape.setPosition(static_cast<float>(x), static_cast<float>(y));
    shape.setFillColor(sf::Color::Transparent);
    shape.setOutlineColor(toSfColor(color, alpha));
    shape.setOutlineThickness(static_cast<float>(thickness));
    target.draw(shape);
}

void SfmlCanvas::fillRect(double x, double y, double w, double h,
                          const Components::Color& color, uint8_t alpha) {
    sf::RectangleShape shape(sf::Vector2f(static_cast<float>(w), static_cast<float>(h)));
    shape.setPosition(static_cast<float>(x), static_cast<float>(y));
    shape.setFillColor(toSfColor(color, alpha));
    target.draw(shape);
}

void SfmlCanvas::strokeRect(double x, double y, double w, double h,
                            const Components::Color& color, uint8_t alpha, double thickness) {
    // Inset so the outline stays inside the rectangle.
    float const t = static_cast<float>(thickness);
    sf::RectangleShape shape(sf::Vector2f(static_cast<float>(w) - 2.f * t, static_cast<float>(h) - 2.f * t));
    shape.setPosition(static_cast<float>(x) + t, static_cast<float>(y) + t);
    shape.setFillColor(sf::Color::Transparent);
    shape.setOutlineColor(toSfColor(color, alpha));
    shape.setOutlineThickness(t);
    target.draw(shape);
}

void SfmlCanvas::drawLine(double x1, double y1, double x2, double y2,
                          const Components::Color& color, uint8_t alpha, double thickness) {
    double const dx = x2 - x1;
    double const dy = y2 - y1;
    double const length = std::sqrt(dx * dx + dy * dy);
    if (length <= 0.0) {
        return;
    }

    sf::RectangleShape shape(sf::Vector2f(static_cast<float>(length), static_cast<float>(thickness)));
    shape.setOrigin(0.f, static_cast<float>(thickness) * 0.5f);
    shape.setPosition(static_cast<float>(x1), static_cast<float>(y1));
    shape.setRotation(static_cast<float>(std::atan2(dy, dx) * 180.0 / 3.14159265358979323846));
    shape.setFillColor(toSfColor(color, alpha));
    target.draw(shape);
}

void SfmlCanvas::drawText(double x, double y, const std::string& text, unsigned int size,
                          const Components::Color& color, uint8_t alpha) {
    if (!font) {
        return;
    }
    sf::Text label(text, *font, size);
    label.setPosition(static_cast<float>(x), static_cast<float>(y));
    label.setFillColor(toSfColor(color, alpha));
    target.draw(label);
}

void SfmlCanvas::pushClip(double x, double y, double w, double h) {
    sf::FloatRect rect(static_cast<float>(x), static_cast<float>(y), static_cast<float>(w), static_cast<float>(h));
    if (!clipStack.empty()) {
        sf::FloatRect intersection;
        if (!clipStack.back().intersects(rect, intersection)) {
            intersection = sf::FloatRect(rect.left, rect.top, 0.f, 0.f);
        }
        rect = intersection;
    }
    clipStack.push_back(rect);
    applyClip();
}

void SfmlCanvas::popClip() {
    if (clipStack.empty()) {
        std::cerr << "[SfmlCanvas] Warning: popClip() with no clip pushed\n";
        return;
    }
    clipStack.pop_back();
    applyClip();
}

void SfmlCanvas::applyClip() {
    sf::Vector2u const size = target.getSize();
    if (clipStack.empty() || size.x == 0 || size.y == 0) {
        target.setView(target.getDefaultView());
        return;
    }

    const sf::FloatRect& rect = clipStack.back();
    sf::View view(rect);
    view.setViewport(sf::FloatRect(rect.left / size.x, rect.top / size.y,
                                   rect.width / size.x, rect.height / size.y));
    target.setView(view);
}
