#include "contraption/chambers/funnel.hpp"
#include "contraption/core/canvas.hpp"
#include "contraption/core/profile.hpp"
#include "contraption/core/state_io.hpp"

#include <algorithm>
#include <cmath>

namespace Chambers {

namespace {
    constexpr double Restitution = 1.8;
}

void FunnelChamber::init(double w, double h, std::mt19937& /*rng*/) {
    resize(w, h);
    t = 0.0;
    wallThickness = std::max(2.0, std::floor(4.0 * scale));

    walls = {
        // Upper funnel
        {w * 0.05, h * 0.15, w * 0.35, h * 0.55},
        {w * 0.95, h * 0.15, w * 0.65, h * 0.55},
        // Lower funnel
        {w * 0.25, h * 0.60, w * 0.40, h * 0.75},
        {w * 0.75, h * 0.60, w * 0.60, h * 0.75}
    };
}

void FunnelChamber::update(double dt, std::vector<LocalBall>& balls, ChamberContext& /*ctx*/) {
    PROFILE_SCOPE("FunnelChamber");
    t += dt;

    for (auto& ball : balls) {
        if (!ball.active) {
            continue;
        }
        for (const auto& wall : walls) {
            auto normal = separateFromSegment(ball, Vector(wall.x1, wall.y1), Vector(wall.x2, wall.y2), wallThickness);
            if (normal) {
                reflectVelocity(ball, *normal, Restitution);
            }
        }
    }
}

void FunnelChamber::draw(Canvas& canvas, const Layout::Viewport& vp) const {
    const Components::Color wallColor(150, 160, 190);
    for (const auto& wall : walls) {
        canvas.drawLine(vp.x + wall.x1, vp.y + wall.y1, vp.x + wall.x2, vp.y + wall.y2,
                        wallColor, 255, wallThickness * 2.0);
    }
}

nlohmann::json FunnelChamber::saveState() const {
    nlohmann::json state = saveCommon();
    state["wall_thickness"] = wallThickness;
    nlohmann::json list = nlohmann::json::array();
    for (const auto& wall : walls) {
        list.push_back({{"x1", wall.x1}, {"y1", wall.y1}, {"x2", wall.x2}, {"y2", wall.y2}});
    }
    state["walls"] = std::move(list);
    return state;
}

void FunnelChamber::loadState(const nlohmann::json& state) {
    loadCommon(state);
    wallThickness = StateIO::readDouble(state, "wall_thickness", wallThickness);
    StateIO::readList(state, "walls", walls, [](const nlohmann::json& j) {
        return Wall{StateIO::readDouble(j, "x1", 0.0), StateIO::readDouble(j, "y1", 0.0),
                    StateIO::readDouble(j, "x2", 0.0), StateIO::readDouble(j, "y2", 0.0)};
    });
}

} // namespace Chambers
