#include "contraption/systems/ball_query.hpp"
#include "contraption/components/basic.hpp"

#include <algorithm>

namespace Systems {

namespace {

void sortById(const entt::registry& registry, std::vector<entt::entity>& balls) {
    std::sort(balls.begin(), balls.end(), [&](entt::entity a, entt::entity b) {
        return registry.get<Components::BallId>(a).value < registry.get<Components::BallId>(b).value;
    });
}

} // namespace

std::vector<entt::entity> activeBallsInOrder(const entt::registry& registry) {
    std::vector<entt::entity> balls;
    auto view = registry.view<const Components::BallId>(entt::exclude<Components::Inactive>);
    for (auto entity : view) {
        balls.push_back(entity);
    }
    sortById(registry, balls);
    return balls;
}

std::vector<entt::entity> allBallsInOrder(const entt::registry& registry) {
    std::vector<entt::entity> balls;
    auto view = registry.view<const Components::BallId>();
    for (auto entity : view) {
        balls.push_back(entity);
    }
    sortById(registry, balls);
    return balls;
}

} // namespace Systems
