/**
 * @file chamber_routing.hpp
 * @brief Hands each chamber the balls overlapping its viewport
 *
 * Chambers are visited in list order. For each one, the active balls whose
 * bounding box overlaps the viewport are copied into chamber-local space,
 * the chamber updates them, and position, velocity and the active flag are
 * written back before the next chamber is visited. A ball straddling two
 * chambers is therefore seen by the later chamber with the earlier chamber's
 * changes already applied.
 *
 * Required components:
 * - BallId, Position, Velocity, Radius, Color
 */

#ifndef CONTRAPTION_CHAMBER_ROUTING_SYSTEM_HPP
#define CONTRAPTION_CHAMBER_ROUTING_SYSTEM_HPP

#include <random>
#include <vector>

#include <entt/entt.hpp>

#include "contraption/chambers/chamber.hpp"
#include "contraption/systems/i_system.hpp"

namespace Systems {

class ChamberRoutingSystem : public ISystem {
public:
    /**
     * @param chambers Chamber list owned by the manager; must outlive the system
     * @param rng Generator owned by the manager, lent to chambers per frame
     */
    ChamberRoutingSystem(std::vector<Chambers::Chamber>& chambers, std::mt19937& rng);
    ~ChamberRoutingSystem() override = default;

    void update(entt::registry& registry, double dt) override;

private:
    std::vector<Chambers::Chamber>& chambers;
    std::mt19937& rng;
};

} // namespace Systems

#endif
