#include "contraption/chambers/antigravity.hpp"
#include "contraption/core/canvas.hpp"
#include "contraption/core/profile.hpp"
#include "contraption/core/state_io.hpp"

#include <cmath>

namespace Chambers {

namespace {
    constexpr int MinZones = 2;
    constexpr int MaxZones = 3;
    constexpr double LiftForce = -600.0;
    constexpr double FallDampingSpeed = 100.0;
    constexpr double FallDamping = 0.9;
    constexpr double DriftAcceleration = 20.0;
    constexpr double WallInset = 10.0;
    constexpr double WallBounce = 0.5;
}

void AntigravityChamber::init(double w, double h, std::mt19937& rng) {
    resize(w, h);
    t = 0.0;
    zones.clear();

    int const count = randomInt(rng, MinZones, MaxZones);
    for (int i = 1; i <= count; ++i) {
        double const zw = w * (0.3 + randomUnit(rng) * 0.3);
        double const zh = h * (0.2 + randomUnit(rng) * 0.2);
        double const zx = w * (0.1 + randomUnit(rng) * (0.8 - zw / w));
        double const zy = h * ((i - 0.5) / count) - zh * 0.5;
        zones.push_back(AntigravityZone{zx, zy, zw, zh, LiftForce * scale});
    }
}

void AntigravityChamber::update(double dt, std::vector<LocalBall>& balls, ChamberContext& ctx) {
    PROFILE_SCOPE("AntigravityChamber");
    t += dt;

    bool const leftIsCanvasEdge = ctx.viewport.x <= EPSILON;
    bool const rightIsCanvasEdge = ctx.viewport.x + ctx.viewport.w >= ctx.canvasWidth - EPSILON;
    double const inset = WallInset * scale;
    double const fallDampingSpeed = FallDampingSpeed * scale;

    for (auto& ball : balls) {
        if (!ball.active) {
            continue;
        }

        for (const auto& zone : zones) {
            bool const inside = ball.x > zone.x && ball.x < zone.x + zone.w &&
                                ball.y > zone.y && ball.y < zone.y + zone.h;
            if (!inside) {
                continue;
            }
            ball.vy += zone.force * dt;
            if (ball.vy > fallDampingSpeed) {
                ball.vy *= FallDamping;
            }
            ball.vx += std::sin(t * 2.0 + zone.x) * DriftAcceleration * scale * dt;
        }

        if (leftIsCanvasEdge && ball.x < inset) {
            ball.x = inset;
            ball.vx = std::abs(ball.vx) * WallBounce;
        } else if (rightIsCanvasEdge && ball.x > width - inset) {
            ball.x = width - inset;
            ball.vx = -std::abs(ball.vx) * WallBounce;
        }
    }
}

void AntigravityChamber::draw(Canvas& canvas, const Layout::Viewport& vp) const {
    const Components::Color zoneColor(160, 120, 255);
    for (const auto& zone : zones) {
        canvas.fillRect(vp.x + zone.x, vp.y + zone.y, zone.w, zone.h, zoneColor, 35);
        canvas.strokeRect(vp.x + zone.x, vp.y + zone.y, zone.w, zone.h, zoneColor, 120, 1.0);

        // Rising chevrons
        double const spacing = 30.0 * scale;
        double const rise = std::fmod(t * 40.0 * scale, spacing);
        double const cx = vp.x + zone.x + zone.w * 0.5;
        for (double y = zone.h - rise; y > 0.0; y -= spacing) {
            double const py = vp.y + zone.y + y;
            canvas.drawLine(cx - 8.0 * scale, py + 6.0 * scale, cx, py, zoneColor, 140, 2.0);
            canvas.drawLine(cx, py, cx + 8.0 * scale, py + 6.0 * scale, zoneColor, 140, 2.0);
        }
    }
}

nlohmann::json AntigravityChamber::saveState() const {
    nlohmann::json state = saveCommon();
    nlohmann::json list = nlohmann::json::array();
    for (const auto& zone : zones) {
        list.push_back({{"x", zone.x}, {"y", zone.y}, {"w", zone.w}, {"h", zone.h}, {"force", zone.force}});
    }
    state["zones"] = std::move(list);
    return state;
}

void AntigravityChamber::loadState(const nlohmann::json& state) {
    loadCommon(state);
    StateIO::readList(state, "zones", zones, [](const nlohmann::json& j) {
        return AntigravityZone{StateIO::readDouble(j, "x", 0.0), StateIO::readDouble(j, "y", 0.0),
                               StateIO::readDouble(j, "w", 0.0), StateIO::readDouble(j, "h", 0.0),
                               StateIO::readDouble(j, "force", 0.0)};
    });
}

} // namespace Chambers
