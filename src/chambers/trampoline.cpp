#include "contraption/chambers/trampoline.hpp"
#include "contraption/core/canvas.hpp"
#include "contraption/core/profile.hpp"
#include "contraption/core/state_io.hpp"

#include <algorithm>
#include <cmath>

namespace Chambers {

void TrampolineChamber::init(double w, double h, std::mt19937& /*rng*/) {
    resize(w, h);
    t = 0.0;
    pads = {Pad{w * 0.2, h * 0.7, w * 0.6, std::max(10.0, std::floor(h * 0.035))}};
}

void TrampolineChamber::update(double dt, std::vector<LocalBall>& balls, ChamberContext& /*ctx*/) {
    PROFILE_SCOPE("TrampolineChamber");
    t += dt;

    double const maxSpeed = MaxBounceSpeed * scale;
    double const minSpeed = MinBounceSpeed * scale;
    double const launchSpeed = MinLaunchSpeed * scale;

    for (auto& ball : balls) {
        if (!ball.active) {
            continue;
        }
        for (const auto& pad : pads) {
            if (!landsOnPlatform(ball, dt, pad.x, pad.y, pad.w, pad.h, ball.radius)) {
                continue;
            }
            ball.y = pad.y - ball.radius;
            ball.vy = -ball.vy * Bounce;
            if (ball.vy < -maxSpeed) {
                ball.vy = -maxSpeed;
            }
            if (ball.vy > -minSpeed) {
                ball.vy = -launchSpeed;
            }
        }
    }
}

void TrampolineChamber::draw(Canvas& canvas, const Layout::Viewport& vp) const {
    const Components::Color padColor(90, 200, 120);
    const Components::Color legColor(100, 100, 110);
    for (const auto& pad : pads) {
        canvas.drawLine(vp.x + pad.x + 6.0, vp.y + pad.y + pad.h, vp.x + pad.x + 6.0, vp.y + pad.y + pad.h * 3.0,
                        legColor, 255, 3.0);
        canvas.drawLine(vp.x + pad.x + pad.w - 6.0, vp.y + pad.y + pad.h,
                        vp.x + pad.x + pad.w - 6.0, vp.y + pad.y + pad.h * 3.0, legColor, 255, 3.0);
        canvas.fillRect(vp.x + pad.x, vp.y + pad.y, pad.w, pad.h, padColor, 255);
    }
}

nlohmann::json TrampolineChamber::saveState() const {
    nlohmann::json state = saveCommon();
    nlohmann::json list = nlohmann::json::array();
    for (const auto& pad : pads) {
        list.push_back({{"x", pad.x}, {"y", pad.y}, {"w", pad.w}, {"h", pad.h}});
    }
    state["pads"] = std::move(list);
    return state;
}

void TrampolineChamber::loadState(const nlohmann::json& state) {
    loadCommon(state);
    StateIO::readList(state, "pads", pads, [](const nlohmann::json& j) {
        return Pad{StateIO::readDouble(j, "x", 0.0), StateIO::readDouble(j, "y", 0.0),
                   StateIO::readDouble(j, "w", 0.0), StateIO::readDouble(j, "h", 0.0)};
    });
}

} // namespace Chambers
