#include "contraption/systems/ball_collision.hpp"
#include "contraption/components/basic.hpp"
#include "contraption/core/profile.hpp"
#include "contraption/systems/ball_query.hpp"

#include <cmath>

namespace Systems {

void BallCollisionSystem::update(entt::registry& registry, double /*dt*/) {
    PROFILE_SCOPE("BallCollisionSystem");

    auto balls = activeBallsInOrder(registry);

    for (std::size_t i = 0; i < balls.size(); ++i) {
        auto& posA = registry.get<Components::Position>(balls[i]);
        auto& velA = registry.get<Components::Velocity>(balls[i]);
        double const rA = registry.get<Components::Radius>(balls[i]).value;

        for (std::size_t j = i + 1; j < balls.size(); ++j) {
            auto& posB = registry.get<Components::Position>(balls[j]);
            auto& velB = registry.get<Components::Velocity>(balls[j]);
            double const rB = registry.get<Components::Radius>(balls[j]).value;

            Vector const delta(posB.x - posA.x, posB.y - posA.y);
            double const minDist = rA + rB;
            double const distSq = delta.lengthSquared();
            if (distSq >= minDist * minDist) {
                continue;
            }

            // Coincident centres: separate vertically.
            Vector const n = delta.normalizedOr(-FALLBACK_NORMAL);
            double const dist = std::sqrt(distSq);
            double const halfOverlap = (minDist - dist) * 0.5;

            posA -= n * halfOverlap;
            posB += n * halfOverlap;

            double const approach = (velA - velB).dotProduct(n);
            if (approach > 0.0) {
                velA -= n * approach;
                velB += n * approach;
            }
        }
    }
}

} // namespace Systems
