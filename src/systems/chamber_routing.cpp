#include "contraption/systems/chamber_routing.hpp"
#include "contraption/components/basic.hpp"
#include "contraption/core/debug.hpp"
#include "contraption/core/profile.hpp"
#include "contraption/systems/ball_query.hpp"

namespace Systems {

ChamberRoutingSystem::ChamberRoutingSystem(std::vector<Chambers::Chamber>& chambers, std::mt19937& rng)
    : chambers(chambers), rng(rng) {}

void ChamberRoutingSystem::update(entt::registry& registry, double dt) {
    PROFILE_SCOPE("ChamberRoutingSystem");

    std::vector<Chambers::LocalBall> local;

    for (std::size_t index = 0; index < chambers.size(); ++index) {
        auto& chamber = chambers[index];
        const Layout::Viewport& vp = chamber.getViewport();

        local.clear();
        for (auto entity : activeBallsInOrder(registry)) {
            const auto& pos = registry.get<Components::Position>(entity);
            const auto& radius = registry.get<Components::Radius>(entity);
            if (!vp.overlapsCircle(pos.x, pos.y, radius.value)) {
                continue;
            }

            const auto& vel = registry.get<Components::Velocity>(entity);
            Chambers::LocalBall ball;
            ball.entity = entity;
            ball.id = registry.get<Components::BallId>(entity).value;
            ball.x = pos.x - vp.x;
            ball.y = pos.y - vp.y;
            ball.vx = vel.x;
            ball.vy = vel.y;
            ball.radius = radius.value;
            ball.color = registry.get<Components::Color>(entity);
            ball.active = true;
            local.push_back(ball);
        }

        DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "[Routing] " << chamber.getName() << " <- " << local.size() << " balls\n");

        Chambers::BallAnnotations annotations(registry, index);
        Chambers::ChamberContext ctx{rng, annotations, sysConfig.gravity, vp,
                                     sysConfig.canvasWidth, sysConfig.canvasHeight};
        chamber.update(dt, local, ctx);

        for (const auto& ball : local) {
            if (!registry.valid(ball.entity)) {
                continue;
            }
            auto& pos = registry.get<Components::Position>(ball.entity);
            auto& vel = registry.get<Components::Velocity>(ball.entity);
            pos.x = ball.x + vp.x;
            pos.y = ball.y + vp.y;
            vel.x = ball.vx;
            vel.y = ball.vy;
            if (!ball.active) {
                registry.emplace_or_replace<Components::Inactive>(ball.entity);
            }
        }
    }
}

} // namespace Systems
