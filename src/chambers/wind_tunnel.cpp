#include "contraption/chambers/wind_tunnel.hpp"
#include "contraption/core/canvas.hpp"
#include "contraption/core/profile.hpp"
#include "contraption/core/state_io.hpp"

#include <cmath>

namespace Chambers {

namespace {
    constexpr double WindForce = 1000.0;
}

void WindTunnelChamber::init(double w, double h, std::mt19937& /*rng*/) {
    resize(w, h);
    t = 0.0;
    bands = {
        WindBand{0.0, h * 0.2, w, h * 0.3, 1.0, WindForce * scale},
        WindBand{0.0, h * 0.6, w, h * 0.3, -1.0, WindForce * scale}
    };
}

void WindTunnelChamber::update(double dt, std::vector<LocalBall>& balls, ChamberContext& /*ctx*/) {
    PROFILE_SCOPE("WindTunnelChamber");
    t += dt;

    for (auto& ball : balls) {
        if (!ball.active) {
            continue;
        }
        for (const auto& band : bands) {
            bool const inside = ball.x > band.x && ball.x < band.x + band.w &&
                                ball.y > band.y && ball.y < band.y + band.h;
            if (inside) {
                ball.vx += band.direction * band.force * dt;
            }
        }
    }
}

void WindTunnelChamber::draw(Canvas& canvas, const Layout::Viewport& vp) const {
    const Components::Color bandColor(120, 170, 230);
    for (const auto& band : bands) {
        canvas.fillRect(vp.x + band.x, vp.y + band.y, band.w, band.h, bandColor, 30);

        // Streaks drifting with the wind
        double const spacing = 40.0 * scale;
        double const offset = std::fmod(t * 120.0 * scale, spacing);
        for (double sx = 0.0; sx < band.w; sx += spacing) {
            double const x = band.direction > 0.0 ? sx + offset : band.w - sx - offset;
            double const y = band.y + band.h * 0.5;
            canvas.drawLine(vp.x + band.x + x, vp.y + y, vp.x + band.x + x + band.direction * 12.0 * scale, vp.y + y,
                            bandColor, 120, 2.0);
        }
    }
}

nlohmann::json WindTunnelChamber::saveState() const {
    nlohmann::json state = saveCommon();
    nlohmann::json list = nlohmann::json::array();
    for (const auto& band : bands) {
        list.push_back({{"x", band.x}, {"y", band.y}, {"w", band.w}, {"h", band.h},
                        {"dir", band.direction}, {"force", band.force}});
    }
    state["fans"] = std::move(list);
    return state;
}

void WindTunnelChamber::loadState(const nlohmann::json& state) {
    loadCommon(state);
    StateIO::readList(state, "fans", bands, [](const nlohmann::json& j) {
        return WindBand{StateIO::readDouble(j, "x", 0.0), StateIO::readDouble(j, "y", 0.0),
                        StateIO::readDouble(j, "w", 0.0), StateIO::readDouble(j, "h", 0.0),
                        StateIO::readDouble(j, "dir", 1.0), StateIO::readDouble(j, "force", 0.0)};
    });
}

} // namespace Chambers
