#include "contraption/systems/gravity.hpp"
#include "contraption/components/basic.hpp"
#include "contraption/core/profile.hpp"

namespace Systems {

void GravitySystem::update(entt::registry& registry, double dt) {
    PROFILE_SCOPE("GravitySystem");

    auto view = registry.view<Components::Velocity>(entt::exclude<Components::Inactive>);
    for (auto [entity, vel] : view.each()) {
        vel.y += sysConfig.gravity * dt;
    }
}

} // namespace Systems
