#include "contraption/chambers/mixer.hpp"
#include "contraption/core/canvas.hpp"
#include "contraption/core/profile.hpp"
#include "contraption/core/state_io.hpp"

#include <cmath>

namespace Chambers {

namespace {
    constexpr double BladeLength = 60.0;
    constexpr double BladeThickness = 8.0;
    constexpr double NormalKick = 50.0;
    constexpr double SpinTransfer = 100.0;  // tip speed per rad/s of blade speed
}

void MixerChamber::init(double w, double h, std::mt19937& /*rng*/) {
    resize(w, h);
    t = 0.0;
    blades = {
        Blade{w * 0.3, h * 0.5, BladeLength * scale, 3.0},
        Blade{w * 0.7, h * 0.5, BladeLength * scale, -2.5}
    };
}

void MixerChamber::update(double dt, std::vector<LocalBall>& balls, ChamberContext& /*ctx*/) {
    PROFILE_SCOPE("MixerChamber");
    t += dt;
    double const thickness = BladeThickness * scale;

    for (const auto& blade : blades) {
        double const angle = t * blade.speed;
        double const c = std::cos(angle);
        double const s = std::sin(angle);
        Vector const a(blade.cx - c * blade.length, blade.cy - s * blade.length);
        Vector const b(blade.cx + c * blade.length, blade.cy + s * blade.length);
        double const spin = blade.speed * SpinTransfer * scale;

        for (auto& ball : balls) {
            if (!ball.active) {
                continue;
            }
            auto normal = separateFromSegment(ball, a, b, thickness);
            if (!normal) {
                continue;
            }
            ball.vx += normal->x * NormalKick * scale - s * spin * 0.5;
            ball.vy += normal->y * NormalKick * scale + c * spin * 0.5;
        }
    }
}

void MixerChamber::draw(Canvas& canvas, const Layout::Viewport& vp) const {
    const Components::Color bladeColor(120, 200, 200);
    for (const auto& blade : blades) {
        double const angle = t * blade.speed;
        double const c = std::cos(angle);
        double const s = std::sin(angle);
        canvas.drawLine(vp.x + blade.cx - c * blade.length, vp.y + blade.cy - s * blade.length,
                        vp.x + blade.cx + c * blade.length, vp.y + blade.cy + s * blade.length,
                        bladeColor, 255, BladeThickness * scale * 2.0);
        canvas.fillCircle(vp.x + blade.cx, vp.y + blade.cy, 5.0 * scale, Components::Color(80, 80, 90), 255);
    }
}

nlohmann::json MixerChamber::saveState() const {
    nlohmann::json state = saveCommon();
    nlohmann::json list = nlohmann::json::array();
    for (const auto& blade : blades) {
        list.push_back({{"cx", blade.cx}, {"cy", blade.cy}, {"length", blade.length}, {"speed", blade.speed}});
    }
    state["blades"] = std::move(list);
    return state;
}

void MixerChamber::loadState(const nlohmann::json& state) {
    loadCommon(state);
    double const defaultLength = BladeLength * scale;
    StateIO::readList(state, "blades", blades, [&](const nlohmann::json& j) {
        return Blade{StateIO::readDouble(j, "cx", 0.0), StateIO::readDouble(j, "cy", 0.0),
                     StateIO::readDouble(j, "length", defaultLength), StateIO::readDouble(j, "speed", 0.0)};
    });
}

} // namespace Chambers
