#include "contraption/chambers/accelerator.hpp"
#include "contraption/core/canvas.hpp"
#include "contraption/core/constants.hpp"
#include "contraption/core/profile.hpp"
#include "contraption/core/state_io.hpp"

#include <algorithm>
#include <cmath>

namespace Chambers {

namespace {
    constexpr int MinBoosters = 3;
    constexpr int MaxBoosters = 5;
    constexpr int AttemptsPerBooster = 10;
    constexpr double MinBoosterSize = 40.0;
    constexpr double OverlapMargin = 10.0;
    constexpr double MinForce = 600.0;
    constexpr double MaxForce = 1200.0;
    constexpr double ForceGain = 5.0;
}

void AcceleratorChamber::init(double w, double h, std::mt19937& rng) {
    resize(w, h);
    t = 0.0;
    boosters.clear();

    int const count = randomInt(rng, MinBoosters, MaxBoosters);
    double const margin = OverlapMargin * scale;

    for (int i = 0; i < count; ++i) {
        for (int attempt = 0; attempt < AttemptsPerBooster; ++attempt) {
            double const bw = randomRange(rng, MinBoosterSize * scale, w * 0.3);
            double const bh = randomRange(rng, MinBoosterSize * scale, h * 0.3);
            double const bx = randomRange(rng, w * 0.1, w * 0.9 - bw);
            double const by = randomRange(rng, h * 0.1, h * 0.9 - bh);

            bool overlaps = false;
            for (const auto& other : boosters) {
                if (bx < other.x + other.w + margin && bx + bw + margin > other.x &&
                    by < other.y + other.h + margin && by + bh + margin > other.y) {
                    overlaps = true;
                    break;
                }
            }
            if (overlaps) {
                continue;
            }

            double const angle = randomUnit(rng) * SimulatorConstants::Pi * 2.0;
            boosters.push_back(Booster{bx, by, bw, bh, std::cos(angle), std::sin(angle),
                                       randomRange(rng, MinForce, MaxForce) * scale});
            break;
        }
    }
}

void AcceleratorChamber::update(double dt, std::vector<LocalBall>& balls, ChamberContext& /*ctx*/) {
    PROFILE_SCOPE("AcceleratorChamber");
    t += dt;

    for (auto& ball : balls) {
        if (!ball.active) {
            continue;
        }
        for (const auto& booster : boosters) {
            if (circleOverlapsRect(ball, booster.x, booster.y, booster.w, booster.h)) {
                ball.vx += booster.dirX * booster.force * ForceGain * dt;
                ball.vy += booster.dirY * booster.force * ForceGain * dt;
            }
        }
    }
}

void AcceleratorChamber::draw(Canvas& canvas, const Layout::Viewport& vp) const {
    const Components::Color fieldColor(240, 120, 200);
    for (const auto& booster : boosters) {
        canvas.fillRect(vp.x + booster.x, vp.y + booster.y, booster.w, booster.h, fieldColor, 40);
        canvas.strokeRect(vp.x + booster.x, vp.y + booster.y, booster.w, booster.h, fieldColor, 160, 1.0);

        double const cx = vp.x + booster.x + booster.w * 0.5;
        double const cy = vp.y + booster.y + booster.h * 0.5;
        double const arrow = std::min(booster.w, booster.h) * 0.35;
        canvas.drawLine(cx - booster.dirX * arrow, cy - booster.dirY * arrow,
                        cx + booster.dirX * arrow, cy + booster.dirY * arrow, fieldColor, 220, 3.0);
        canvas.fillCircle(cx + booster.dirX * arrow, cy + booster.dirY * arrow, 4.0, fieldColor, 220);
    }
}

nlohmann::json AcceleratorChamber::saveState() const {
    nlohmann::json state = saveCommon();
    nlohmann::json list = nlohmann::json::array();
    for (const auto& booster : boosters) {
        list.push_back({{"x", booster.x}, {"y", booster.y}, {"w", booster.w}, {"h", booster.h},
                        {"dir_x", booster.dirX}, {"dir_y", booster.dirY}, {"force", booster.force}});
    }
    state["boosters"] = std::move(list);
    return state;
}

void AcceleratorChamber::loadState(const nlohmann::json& state) {
    loadCommon(state);
    StateIO::readList(state, "boosters", boosters, [](const nlohmann::json& j) {
        return Booster{StateIO::readDouble(j, "x", 0.0), StateIO::readDouble(j, "y", 0.0),
                       StateIO::readDouble(j, "w", 0.0), StateIO::readDouble(j, "h", 0.0),
                       StateIO::readDouble(j, "dir_x", 1.0), StateIO::readDouble(j, "dir_y", 0.0),
                       StateIO::readDouble(j, "force", 0.0)};
    });
}

} // namespace Chambers
