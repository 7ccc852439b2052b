/**
 * @file gravity.hpp
 * @brief Uniform downward gravity on every active ball
 *
 * Required components:
 * - Velocity (to modify)
 *
 * Skips balls tagged Inactive.
 */

#ifndef CONTRAPTION_GRAVITY_SYSTEM_HPP
#define CONTRAPTION_GRAVITY_SYSTEM_HPP

#include <entt/entt.hpp>
#include "contraption/systems/i_system.hpp"

namespace Systems {

/**
 * @class GravitySystem
 * @brief First half of the semi-implicit Euler step: vy += g * dt
 */
class GravitySystem : public ISystem {
public:
    GravitySystem() = default;
    ~GravitySystem() override = default;

    void update(entt::registry& registry, double dt) override;
};

} // namespace Systems

#endif
