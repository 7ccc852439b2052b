#include "contraption/systems/boundary.hpp"
#include "contraption/components/basic.hpp"
#include "contraption/core/profile.hpp"

#include <cmath>
#include <vector>

namespace Systems {

void BoundarySystem::update(entt::registry& registry, double /*dt*/) {
    PROFILE_SCOPE("BoundarySystem");

    const double width = sysConfig.canvasWidth;
    const double height = sysConfig.canvasHeight;
    const double bounceDamping = specificConfig.bounceDamping;

    std::vector<entt::entity> fallen;

    auto view = registry.view<Components::Position, Components::Velocity, Components::Radius>(
        entt::exclude<Components::Inactive>);

    for (auto [entity, pos, vel, radius] : view.each()) {
        const double r = radius.value;

        // Check left boundary
        if (pos.x - r < 0.0) {
            pos.x = r;
            vel.x = std::abs(vel.x) * bounceDamping;
        }
        // Check right boundary
        else if (pos.x + r > width) {
            pos.x = width - r;
            vel.x = -std::abs(vel.x) * bounceDamping;
        }

        // Check top boundary
        if (pos.y - r < 0.0) {
            pos.y = r;
            vel.y = std::abs(vel.y) * bounceDamping;
        }
        // Fully below the bottom edge
        else if (pos.y - r > height) {
            fallen.push_back(entity);
        }
    }

    for (auto entity : fallen) {
        registry.emplace<Components::Inactive>(entity);
    }
}

} // namespace Systems
