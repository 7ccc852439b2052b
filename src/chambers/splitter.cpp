#include "contraption/chambers/splitter.hpp"
#include "contraption/core/canvas.hpp"
#include "contraption/core/profile.hpp"
#include "contraption/core/state_io.hpp"

#include <algorithm>
#include <cmath>

namespace Chambers {

namespace {
    constexpr double Restitution = 1.5;
    constexpr double WallThickness = 5.0;

    nlohmann::json pointToJson(const Vector& p) {
        return {{"x", p.x}, {"y", p.y}};
    }

    Vector pointFromJson(const nlohmann::json& state, const char* key, const Vector& fallback) {
        const nlohmann::json* obj = StateIO::findObject(state, key);
        if (!obj) {
            return fallback;
        }
        return {StateIO::readDouble(*obj, "x", fallback.x), StateIO::readDouble(*obj, "y", fallback.y)};
    }
}

void SplitterChamber::init(double w, double h, std::mt19937& rng) {
    resize(w, h);
    t = 0.0;

    double const topX = w * (0.5 + randomUnit(rng) * 0.1);
    double const topY = h * (0.15 + randomUnit(rng) * 0.1);
    double const spread = w * (0.2 + randomUnit(rng) * 0.1);
    double const baseY = h * 0.6;

    wedge.top = Vector(topX, topY);
    wedge.left = Vector(topX - spread, baseY);
    wedge.right = Vector(topX + spread, baseY);
}

void SplitterChamber::collideWall(LocalBall& ball, const Vector& p1, const Vector& p2, const Vector& normal) const {
    double const minDist = ball.radius + std::max(2.0, std::floor(WallThickness * scale));
    Vector const p(ball.x, ball.y);

    SegmentProjection const proj = closestPointOnSegment(p1, p2, p);
    if ((p - proj.closest).lengthSquared() >= minDist * minDist) {
        return;
    }

    double const signedDist = (p - p1).dotProduct(normal);
    if (signedDist >= minDist) {
        return;
    }

    double const penetration = minDist - signedDist;
    ball.x += normal.x * penetration;
    ball.y += normal.y * penetration;

    if (Vector(ball.vx, ball.vy).dotProduct(normal) < 0.0) {
        reflectVelocity(ball, normal, Restitution);
    }
}

void SplitterChamber::update(double dt, std::vector<LocalBall>& balls, ChamberContext& /*ctx*/) {
    PROFILE_SCOPE("SplitterChamber");
    t += dt;

    // Outward normals: up-left for the left wall, up-right for the right one.
    Vector const leftDir = wedge.left - wedge.top;
    Vector const rightDir = wedge.right - wedge.top;
    Vector const leftNormal = Vector(-leftDir.y, leftDir.x).normalizedOr(FALLBACK_NORMAL);
    Vector const rightNormal = Vector(rightDir.y, -rightDir.x).normalizedOr(FALLBACK_NORMAL);

    for (auto& ball : balls) {
        if (!ball.active) {
            continue;
        }
        collideWall(ball, wedge.top, wedge.left, leftNormal);
        collideWall(ball, wedge.top, wedge.right, rightNormal);
    }
}

void SplitterChamber::draw(Canvas& canvas, const Layout::Viewport& vp) const {
    const Components::Color wedgeColor(230, 140, 90);
    double const thickness = std::max(2.0, std::floor(WallThickness * scale)) * 2.0;
    canvas.drawLine(vp.x + wedge.top.x, vp.y + wedge.top.y, vp.x + wedge.left.x, vp.y + wedge.left.y,
                    wedgeColor, 255, thickness);
    canvas.drawLine(vp.x + wedge.top.x, vp.y + wedge.top.y, vp.x + wedge.right.x, vp.y + wedge.right.y,
                    wedgeColor, 255, thickness);
}

nlohmann::json SplitterChamber::saveState() const {
    nlohmann::json state = saveCommon();
    state["wedge"] = {
        {"top", pointToJson(wedge.top)},
        {"left", pointToJson(wedge.left)},
        {"right", pointToJson(wedge.right)}
    };
    return state;
}

void SplitterChamber::loadState(const nlohmann::json& state) {
    loadCommon(state);
    if (const nlohmann::json* w = StateIO::findObject(state, "wedge")) {
        wedge.top = pointFromJson(*w, "top", wedge.top);
        wedge.left = pointFromJson(*w, "left", wedge.left);
        wedge.right = pointFromJson(*w, "right", wedge.right);
    }
}

} // namespace Chambers
