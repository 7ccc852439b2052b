#ifndef CONTRAPTION_COMPONENTS_BASIC_HPP
#define CONTRAPTION_COMPONENTS_BASIC_HPP

#include <cstddef>
#include <cstdint>
#include "contraption/math/vector_math.hpp" // for Position, Vector

namespace Components {

    // Use the Position and Vector classes from vector_math.hpp.
    // Both are in global canvas coordinates.
    using Position = ::Position;
    using Velocity = ::Vector;

    struct Radius {
        double value;
    };

    struct Color {
        uint8_t r, g, b;
        Color(uint8_t r = 255, uint8_t g = 255, uint8_t b = 255)
            : r(r), g(g), b(b) {}

        bool operator==(const Color& other) const {
            return r == other.r && g == other.g && b == other.b;
        }
        bool operator!=(const Color& other) const { return !(*this == other); }
    };

    // Stable identity of a ball. Never reused while the ball is alive.
    struct BallId {
        std::uint64_t value;
    };

    // Tag: the ball left the canvas and is removed during cleanup.
    struct Inactive {};

    // A chamber has taken charge of the ball for this frame.
    // Gravity is cancelled by the owner itself; the colour is a draw override.
    struct Possession {
        std::size_t owner;  // index of the owning chamber in the manager's list
        Color colorOverride;
    };

} // namespace Components

#endif
