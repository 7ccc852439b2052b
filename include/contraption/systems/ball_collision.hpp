/**
 * @file ball_collision.hpp
 * @brief Pairwise ball-ball contacts across the whole canvas
 *
 * Overlapping balls are pushed apart equally along the line of centres. If
 * they are approaching, the normal components of their velocities are
 * exchanged (equal-mass elastic collision). Pairs are visited in ball-id
 * order; the population is capped small, so the O(n^2) sweep is enough.
 *
 * Required components:
 * - Position, Velocity (to modify)
 * - Radius
 */

#ifndef CONTRAPTION_BALL_COLLISION_SYSTEM_HPP
#define CONTRAPTION_BALL_COLLISION_SYSTEM_HPP

#include <entt/entt.hpp>
#include "contraption/systems/i_system.hpp"

namespace Systems {

class BallCollisionSystem : public ISystem {
public:
    BallCollisionSystem() = default;
    ~BallCollisionSystem() override = default;

    void update(entt::registry& registry, double dt) override;
};

} // namespace Systems

#endif
