#include "contraption/chambers/conveyor.hpp"
#include "contraption/core/canvas.hpp"
#include "contraption/core/profile.hpp"
#include "contraption/core/state_io.hpp"

#include <algorithm>
#include <cmath>

namespace Chambers {

namespace {
    constexpr double BeltSpeed = 100.0;
    constexpr double Friction = 5.0;  // 1/s, rate at which a ball matches the belt
}

void ConveyorChamber::init(double w, double h, std::mt19937& /*rng*/) {
    resize(w, h);
    t = 0.0;
    double const beltH = std::max(8.0, std::floor(h * 0.03));
    belts = {
        Belt{w * 0.1, h * 0.3, w * 0.4, beltH, BeltSpeed * scale},
        Belt{w * 0.5, h * 0.6, w * 0.4, beltH, -BeltSpeed * scale}
    };
}

void ConveyorChamber::update(double dt, std::vector<LocalBall>& balls, ChamberContext& /*ctx*/) {
    PROFILE_SCOPE("ConveyorChamber");
    t += dt;
    double const blend = 1.0 - std::exp(-Friction * dt);

    for (auto& ball : balls) {
        if (!ball.active) {
            continue;
        }
        for (const auto& belt : belts) {
            if (!landsOnPlatform(ball, dt, belt.x, belt.y, belt.w, belt.h, ball.radius)) {
                continue;
            }
            ball.y = belt.y - ball.radius;
            ball.vy = 0.0;
            ball.vx = ball.vx * (1.0 - blend) + belt.speed * blend;
        }
    }
}

void ConveyorChamber::draw(Canvas& canvas, const Layout::Viewport& vp) const {
    const Components::Color beltColor(70, 70, 80);
    const Components::Color treadColor(200, 200, 120);
    for (const auto& belt : belts) {
        canvas.fillRect(vp.x + belt.x, vp.y + belt.y, belt.w, belt.h, beltColor, 255);

        double const spacing = 20.0 * scale;
        double const shift = std::fmod(t * belt.speed, spacing);
        for (double tx = 0.0; tx < belt.w; tx += spacing) {
            double x = tx + shift;
            if (x < 0.0) {
                x += spacing;
            }
            if (x > belt.w) {
                continue;
            }
            canvas.drawLine(vp.x + belt.x + x, vp.y + belt.y + 1.0, vp.x + belt.x + x, vp.y + belt.y + belt.h - 1.0,
                            treadColor, 160, 2.0);
        }
    }
}

nlohmann::json ConveyorChamber::saveState() const {
    nlohmann::json state = saveCommon();
    nlohmann::json list = nlohmann::json::array();
    for (const auto& belt : belts) {
        list.push_back({{"x", belt.x}, {"y", belt.y}, {"w", belt.w}, {"h", belt.h}, {"speed", belt.speed}});
    }
    state["belts"] = std::move(list);
    return state;
}

void ConveyorChamber::loadState(const nlohmann::json& state) {
    loadCommon(state);
    StateIO::readList(state, "belts", belts, [](const nlohmann::json& j) {
        return Belt{StateIO::readDouble(j, "x", 0.0), StateIO::readDouble(j, "y", 0.0),
                    StateIO::readDouble(j, "w", 0.0), StateIO::readDouble(j, "h", 0.0),
                    StateIO::readDouble(j, "speed", 0.0)};
    });
}

} // namespace Chambers
