/**
 * @file chamber_base.hpp
 * @brief Pieces shared by every chamber policy
 *
 * A chamber never sees the ball registry directly. Each frame the routing
 * system hands it LocalBall copies of the balls overlapping its viewport,
 * translated into chamber-local coordinates, and writes the results back
 * afterwards. The only thing a chamber may leave on a ball beyond the frame is
 * a Possession annotation, made through BallAnnotations.
 */

#ifndef CONTRAPTION_CHAMBER_BASE_HPP
#define CONTRAPTION_CHAMBER_BASE_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <vector>

#include <entt/entt.hpp>
#include <nlohmann/json.hpp>

#include "contraption/components/basic.hpp"
#include "contraption/core/layout.hpp"
#include "contraption/math/vector_math.hpp"

class Canvas;

namespace Chambers {

/**
 * @brief Chamber-local copy of one ball, valid for a single update call
 */
struct LocalBall {
    entt::entity entity = entt::null;
    std::uint64_t id = 0;
    double x = 0.0;
    double y = 0.0;
    double vx = 0.0;
    double vy = 0.0;
    double radius = 0.0;
    Components::Color color;
    bool active = true;
};

/**
 * @brief Lets a chamber claim balls for itself
 *
 * Claims are stored as Components::Possession on the ball entity and tagged
 * with the owning chamber's index. A chamber drops its claims with
 * releaseAll(); the manager also drops them when a ball is destroyed.
 */
class BallAnnotations {
public:
    BallAnnotations(entt::registry& registry, std::size_t owner);

    /** @brief Claims @p ball and overrides its draw colour. */
    void possess(const LocalBall& ball, const Components::Color& colorOverride);

    /** @brief Removes every claim held by this chamber. */
    void releaseAll();

    /** @brief True if this chamber currently holds a claim on @p ball. */
    bool isPossessed(const LocalBall& ball) const;

private:
    entt::registry& registry;
    std::size_t owner;
};

/**
 * @brief Per-frame services lent to a chamber by the routing system
 */
struct ChamberContext {
    std::mt19937& rng;
    BallAnnotations& annotations;
    double gravity;            ///< Global gravity in px/s^2, for owners that cancel it
    Layout::Viewport viewport; ///< Where the chamber sits on the canvas
    double canvasWidth;
    double canvasHeight;
};

/**
 * @brief State every chamber carries: local size, scale and clock
 */
class ChamberBase {
public:
    /**
     * @brief Sets the local size and derives the scale factor.
     * @throws std::invalid_argument if either dimension is not positive
     */
    void resize(double w, double h);

    double getWidth() const { return width; }
    double getHeight() const { return height; }
    double getScale() const { return scale; }
    double getTime() const { return t; }

protected:
    double width = 0.0;
    double height = 0.0;
    double scale = 1.0;
    double t = 0.0;

    nlohmann::json saveCommon() const;
    void loadCommon(const nlohmann::json& state);
};

// Random helpers. Ranges are inclusive; an empty range yields its lower end.
double randomUnit(std::mt19937& rng);
double randomRange(std::mt19937& rng, double lo, double hi);
int randomInt(std::mt19937& rng, int lo, int hi);

/**
 * @brief Pushes a ball out of a circular obstacle.
 *
 * @return The unit normal from the obstacle centre to the ball if they
 *         overlapped, after the ball has been moved to the surface.
 */
std::optional<Vector> separateFromCircle(LocalBall& ball, double cx, double cy, double obstacleRadius);

/**
 * @brief Pushes a ball out of a thick line segment.
 *
 * @return The unit normal from the segment to the ball if they overlapped,
 *         after the ball has been moved to distance radius + thickness.
 */
std::optional<Vector> separateFromSegment(LocalBall& ball, const Vector& a, const Vector& b, double thickness);

/** @brief v -= factor * dot(v, n) * n on the ball's velocity. */
void reflectVelocity(LocalBall& ball, const Vector& normal, double factor);

/** @brief True if the ball's bounding box overlaps the rectangle. */
bool circleOverlapsRect(const LocalBall& ball, double x, double y, double w, double h);

/**
 * @brief One-way platform test shared by stairs, trampoline and conveyor.
 *
 * True when the ball is falling, horizontally over the platform, reaches the
 * top face this frame, and its previous position was not already below the
 * platform's bottom face.
 */
bool landsOnPlatform(const LocalBall& ball, double dt, double px, double py,
                     double pw, double ph, double horizontalReach);

} // namespace Chambers

#endif
