#include "contraption/chambers/tesla_coil.hpp"
#include "contraption/core/canvas.hpp"
#include "contraption/core/profile.hpp"
#include "contraption/core/state_io.hpp"

#include <algorithm>
#include <cmath>

namespace Chambers {

namespace {
    constexpr double ChargeRate = 0.8;
    constexpr double ZapKick = 400.0;
    constexpr double ZapLife = 0.15;
    constexpr double CoreRestitution = 1.5;
}

void TeslaCoilChamber::init(double w, double h, std::mt19937& /*rng*/) {
    resize(w, h);
    t = 0.0;
    zaps.clear();

    double const minDim = std::min(w, h);
    double const radius = minDim * 0.06;
    double const range = minDim * 0.25;
    coils = {
        Coil{w * 0.3, h * 0.5, radius, range, 0.0},
        Coil{w * 0.7, h * 0.5, radius, range, 0.5}
    };
}

void TeslaCoilChamber::update(double dt, std::vector<LocalBall>& balls, ChamberContext& /*ctx*/) {
    PROFILE_SCOPE("TeslaCoilChamber");
    t += dt;

    for (auto& zap : zaps) {
        zap.life -= dt;
    }
    zaps.erase(std::remove_if(zaps.begin(), zaps.end(), [](const Zap& z) { return z.life <= 0.0; }),
               zaps.end());

    for (auto& coil : coils) {
        coil.charge += dt * ChargeRate;
    }

    for (auto& ball : balls) {
        if (!ball.active) {
            continue;
        }
        for (auto& coil : coils) {
            Vector const delta(ball.x - coil.x, ball.y - coil.y);
            double const dist = delta.length();

            if (dist < coil.range && dist > coil.radius && coil.charge >= 1.0) {
                coil.charge = 0.0;
                zaps.push_back(Zap{coil.x, coil.y, ball.x, ball.y, ZapLife});

                Vector const n = delta / dist;
                ball.vx += n.x * ZapKick * scale;
                ball.vy += n.y * ZapKick * scale;
            }

            if (auto normal = separateFromCircle(ball, coil.x, coil.y, coil.radius)) {
                reflectVelocity(ball, *normal, CoreRestitution);
            }
        }
    }
}

void TeslaCoilChamber::draw(Canvas& canvas, const Layout::Viewport& vp) const {
    const Components::Color coilColor(150, 150, 170);
    const Components::Color arcColor(180, 220, 255);
    for (const auto& coil : coils) {
        canvas.strokeCircle(vp.x + coil.x, vp.y + coil.y, coil.range, arcColor, 25, 1.0);
        canvas.fillCircle(vp.x + coil.x, vp.y + coil.y, coil.radius, coilColor, 255);
        auto const glow = static_cast<uint8_t>(std::min(1.0, coil.charge) * 200.0);
        canvas.fillCircle(vp.x + coil.x, vp.y + coil.y, coil.radius * 0.6, arcColor, glow);
    }
    for (const auto& zap : zaps) {
        auto const alpha = static_cast<uint8_t>(std::clamp(zap.life / ZapLife, 0.0, 1.0) * 255.0);
        canvas.drawLine(vp.x + zap.x1, vp.y + zap.y1, vp.x + zap.x2, vp.y + zap.y2, arcColor, alpha, 2.0);
    }
}

nlohmann::json TeslaCoilChamber::saveState() const {
    nlohmann::json state = saveCommon();
    nlohmann::json coilList = nlohmann::json::array();
    for (const auto& coil : coils) {
        coilList.push_back({{"x", coil.x}, {"y", coil.y}, {"radius", coil.radius},
                            {"range", coil.range}, {"charge", coil.charge}});
    }
    nlohmann::json zapList = nlohmann::json::array();
    for (const auto& zap : zaps) {
        zapList.push_back({{"x1", zap.x1}, {"y1", zap.y1}, {"x2", zap.x2}, {"y2", zap.y2}, {"life", zap.life}});
    }
    state["coils"] = std::move(coilList);
    state["zaps"] = std::move(zapList);
    return state;
}

void TeslaCoilChamber::loadState(const nlohmann::json& state) {
    loadCommon(state);
    StateIO::readList(state, "coils", coils, [](const nlohmann::json& j) {
        return Coil{StateIO::readDouble(j, "x", 0.0), StateIO::readDouble(j, "y", 0.0),
                    StateIO::readDouble(j, "radius", 0.0), StateIO::readDouble(j, "range", 0.0),
                    StateIO::readDouble(j, "charge", 0.0)};
    });
    StateIO::readList(state, "zaps", zaps, [](const nlohmann::json& j) {
        return Zap{StateIO::readDouble(j, "x1", 0.0), StateIO::readDouble(j, "y1", 0.0),
                   StateIO::readDouble(j, "x2", 0.0), StateIO::readDouble(j, "y2", 0.0),
                   StateIO::readDouble(j, "life", 0.0)};
    });
}

} // namespace Chambers
