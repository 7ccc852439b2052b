/**
 * @file boundary.hpp
 * @brief Canvas edges: bounce on the sides and top, despawn at the bottom
 *
 * Required components:
 * - Position (to read/modify)
 * - Velocity (to read/modify)
 * - Radius
 *
 * A ball that falls entirely below the canvas is tagged Inactive; the
 * manager removes it and spawns a replacement.
 */

#ifndef CONTRAPTION_BOUNDARY_SYSTEM_HPP
#define CONTRAPTION_BOUNDARY_SYSTEM_HPP

#include <entt/entt.hpp>
#include "contraption/systems/i_system.hpp"

namespace Systems {

/**
 * @struct BoundaryConfig
 * @brief Configuration parameters specific to the boundary system
 */
struct BoundaryConfig {
    // Fraction of speed kept on bounce (0-1)
    double bounceDamping = 0.8;
};

class BoundarySystem : public ConfigurableSystem<BoundaryConfig> {
public:
    BoundarySystem() = default;
    ~BoundarySystem() override = default;

    void update(entt::registry& registry, double dt) override;
};

} // namespace Systems

#endif
