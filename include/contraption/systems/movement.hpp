/**
 * @file movement.hpp
 * @brief Position integration
 *
 * Required components:
 * - Position (to modify)
 * - Velocity (to read)
 */

#ifndef CONTRAPTION_MOVEMENT_SYSTEM_HPP
#define CONTRAPTION_MOVEMENT_SYSTEM_HPP

#include <entt/entt.hpp>
#include "contraption/systems/i_system.hpp"

namespace Systems {

/**
 * @class MovementSystem
 * @brief Second half of the semi-implicit Euler step, using the updated velocity
 */
class MovementSystem : public ISystem {
public:
    MovementSystem() = default;
    ~MovementSystem() override = default;

    void update(entt::registry& registry, double dt) override;
};

} // namespace Systems

#endif
