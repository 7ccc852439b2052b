#include "contraption/chambers/chamber_base.hpp"
#include "contraption/core/constants.hpp"
#include "contraption/core/state_io.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace Chambers {

// BallAnnotations

BallAnnotations::BallAnnotations(entt::registry& registry, std::size_t owner)
    : registry(registry), owner(owner) {}

void BallAnnotations::possess(const LocalBall& ball, const Components::Color& colorOverride) {
    if (!registry.valid(ball.entity)) {
        return;
    }
    registry.emplace_or_replace<Components::Possession>(ball.entity, owner, colorOverride);
}

void BallAnnotations::releaseAll() {
    std::vector<entt::entity> claimed;
    auto view = registry.view<Components::Possession>();
    for (auto [entity, possession] : view.each()) {
        if (possession.owner == owner) {
            claimed.push_back(entity);
        }
    }
    for (auto entity : claimed) {
        registry.remove<Components::Possession>(entity);
    }
}

bool BallAnnotations::isPossessed(const LocalBall& ball) const {
    if (!registry.valid(ball.entity)) {
        return false;
    }
    const auto* possession = registry.try_get<Components::Possession>(ball.entity);
    return possession && possession->owner == owner;
}

// ChamberBase

void ChamberBase::resize(double w, double h) {
    if (!(w > 0.0) || !(h > 0.0)) {
        throw std::invalid_argument("chamber viewport must have a positive size");
    }
    width = w;
    height = h;
    scale = std::min(w / SimulatorConstants::ReferenceChamberWidth,
                     h / SimulatorConstants::ReferenceChamberHeight);
}

nlohmann::json ChamberBase::saveCommon() const {
    return {{"t", t}};
}

void ChamberBase::loadCommon(const nlohmann::json& state) {
    t = StateIO::readDouble(state, "t", t);
}

// Random helpers

double randomUnit(std::mt19937& rng) {
    return std::uniform_real_distribution<double>(0.0, 1.0)(rng);
}

double randomRange(std::mt19937& rng, double lo, double hi) {
    if (!(hi > lo)) {
        return lo;
    }
    return std::uniform_real_distribution<double>(lo, hi)(rng);
}

int randomInt(std::mt19937& rng, int lo, int hi) {
    if (hi <= lo) {
        return lo;
    }
    return std::uniform_int_distribution<int>(lo, hi)(rng);
}

// Contact helpers

std::optional<Vector> separateFromCircle(LocalBall& ball, double cx, double cy, double obstacleRadius) {
    Vector const delta(ball.x - cx, ball.y - cy);
    double const minDist = obstacleRadius + ball.radius;
    if (delta.lengthSquared() >= minDist * minDist) {
        return std::nullopt;
    }

    Vector const normal = delta.normalizedOr(FALLBACK_NORMAL);
    ball.x = cx + normal.x * minDist;
    ball.y = cy + normal.y * minDist;
    return normal;
}

std::optional<Vector> separateFromSegment(LocalBall& ball, const Vector& a, const Vector& b, double thickness) {
    Vector const p(ball.x, ball.y);
    SegmentProjection const proj = closestPointOnSegment(a, b, p);
    Vector const delta = p - proj.closest;
    double const minDist = ball.radius + thickness;
    if (delta.lengthSquared() >= minDist * minDist) {
        return std::nullopt;
    }

    Vector const normal = delta.normalizedOr(FALLBACK_NORMAL);
    ball.x = proj.closest.x + normal.x * minDist;
    ball.y = proj.closest.y + normal.y * minDist;
    return normal;
}

void reflectVelocity(LocalBall& ball, const Vector& normal, double factor) {
    Vector const v = Vector(ball.vx, ball.vy).reflect(normal, factor);
    ball.vx = v.x;
    ball.vy = v.y;
}

bool circleOverlapsRect(const LocalBall& ball, double x, double y, double w, double h) {
    return ball.x + ball.radius > x && ball.x - ball.radius < x + w &&
           ball.y + ball.radius > y && ball.y - ball.radius < y + h;
}

bool landsOnPlatform(const LocalBall& ball, double dt, double px, double py,
                     double pw, double ph, double horizontalReach) {
    if (ball.x + horizontalReach < px || ball.x - horizontalReach > px + pw) {
        return false;
    }
    if (ball.vy <= 0.0) {
        return false;
    }
    double const prevY = ball.y - ball.vy * dt;
    return ball.y + ball.radius >= py && prevY + ball.radius <= py + ph;
}

} // namespace Chambers
