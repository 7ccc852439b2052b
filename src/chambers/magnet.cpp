#include "contraption/chambers/magnet.hpp"
#include "contraption/core/canvas.hpp"
#include "contraption/core/profile.hpp"
#include "contraption/core/state_io.hpp"

#include <algorithm>
#include <cmath>

namespace Chambers {

namespace {
    constexpr double MagnetRadius = 40.0;
    constexpr double FieldStrength = 9e6;
    constexpr double CoreRestitution = 1.5;
}

void MagnetChamber::init(double w, double h, std::mt19937& rng) {
    resize(w, h);
    t = 0.0;
    MagnetPolarity const polarity = randomUnit(rng) > 0.5 ? MagnetPolarity::Pull : MagnetPolarity::Push;
    // Inverse-square field, so the strength carries scale^3.
    magnets = {Magnet{w * 0.5, h * 0.5, MagnetRadius * scale,
                      FieldStrength * scale * scale * scale, polarity}};
}

void MagnetChamber::update(double dt, std::vector<LocalBall>& balls, ChamberContext& /*ctx*/) {
    PROFILE_SCOPE("MagnetChamber");
    t += dt;

    for (auto& ball : balls) {
        if (!ball.active) {
            continue;
        }
        for (const auto& magnet : magnets) {
            Vector const toMagnet(magnet.x - ball.x, magnet.y - ball.y);
            double const dist = toMagnet.length();
            Vector const n = toMagnet.normalizedOr(-FALLBACK_NORMAL);

            double const clamped = std::max(dist, magnet.radius);
            double accel = magnet.strength / (clamped * clamped);
            if (magnet.polarity == MagnetPolarity::Push) {
                accel = -accel;
            }
            ball.vx += n.x * accel * dt;
            ball.vy += n.y * accel * dt;

            double const contact = magnet.radius + ball.radius;
            if (dist <= contact) {
                double const overlap = contact - dist;
                ball.x -= n.x * overlap;
                ball.y -= n.y * overlap;
                reflectVelocity(ball, n, CoreRestitution);
            }
        }
    }
}

void MagnetChamber::draw(Canvas& canvas, const Layout::Viewport& vp) const {
    for (const auto& magnet : magnets) {
        Components::Color const color = magnet.polarity == MagnetPolarity::Pull
            ? Components::Color(230, 70, 70)
            : Components::Color(70, 110, 230);
        double const pulse = 0.5 + 0.5 * std::sin(t * 3.0);
        canvas.strokeCircle(vp.x + magnet.x, vp.y + magnet.y, magnet.radius * (1.8 + pulse * 0.6), color, 60, 2.0);
        canvas.fillCircle(vp.x + magnet.x, vp.y + magnet.y, magnet.radius, color, 255);
        canvas.drawText(vp.x + magnet.x - 6.0, vp.y + magnet.y - 10.0,
                        magnet.polarity == MagnetPolarity::Pull ? "+" : "-", 18,
                        Components::Color(255, 255, 255), 255);
    }
}

nlohmann::json MagnetChamber::saveState() const {
    nlohmann::json state = saveCommon();
    nlohmann::json list = nlohmann::json::array();
    for (const auto& magnet : magnets) {
        list.push_back({{"x", magnet.x}, {"y", magnet.y}, {"radius", magnet.radius}, {"force", magnet.strength},
                        {"type", magnet.polarity == MagnetPolarity::Pull ? "pull" : "push"}});
    }
    state["magnets"] = std::move(list);
    return state;
}

void MagnetChamber::loadState(const nlohmann::json& state) {
    loadCommon(state);
    double const defaultRadius = MagnetRadius * scale;
    StateIO::readList(state, "magnets", magnets, [&](const nlohmann::json& j) {
        return Magnet{StateIO::readDouble(j, "x", 0.0), StateIO::readDouble(j, "y", 0.0),
                      StateIO::readDouble(j, "radius", defaultRadius), StateIO::readDouble(j, "force", 0.0),
                      StateIO::readString(j, "type", "pull") == "push" ? MagnetPolarity::Push
                                                                      : MagnetPolarity::Pull};
    });
}

} // namespace Chambers
