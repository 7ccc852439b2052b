#include "contraption/systems/movement.hpp"
#include "contraption/components/basic.hpp"
#include "contraption/core/profile.hpp"

namespace Systems {

void MovementSystem::update(entt::registry& registry, double dt) {
    PROFILE_SCOPE("MovementSystem");

    auto view = registry.view<Components::Position, Components::Velocity>(entt::exclude<Components::Inactive>);
    for (auto [entity, pos, vel] : view.each()) {
        pos.x += vel.x * dt;
        pos.y += vel.y * dt;
    }
}

} // namespace Systems
