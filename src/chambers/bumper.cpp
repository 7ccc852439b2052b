#include "contraption/chambers/bumper.hpp"
#include "contraption/core/canvas.hpp"
#include "contraption/core/profile.hpp"
#include "contraption/core/state_io.hpp"

#include <algorithm>

namespace Chambers {

namespace {
    constexpr int MinBumpers = 2;
    constexpr int MaxBumpers = 4;
    constexpr int MaxPlacementAttempts = 100;
    constexpr int MinRadius = 20;
    constexpr int MaxRadius = 35;
    constexpr double EdgeMargin = 20.0;
    constexpr double Gap = 20.0;
}

void BumperChamber::init(double w, double h, std::mt19937& rng) {
    resize(w, h);
    t = 0.0;
    bumpers.clear();

    int const target = randomInt(rng, MinBumpers, MaxBumpers);
    int attempts = 0;
    while (static_cast<int>(bumpers.size()) < target && attempts < MaxPlacementAttempts) {
        ++attempts;
        double const radius = randomInt(rng, MinRadius, MaxRadius) * scale;
        double const margin = EdgeMargin * scale;
        Bumper candidate{randomRange(rng, radius + margin, w - radius - margin),
                         randomRange(rng, h * 0.15, h * 0.85),
                         radius, 0.0};

        bool clear = true;
        for (const auto& b : bumpers) {
            double const dx = candidate.x - b.x;
            double const dy = candidate.y - b.y;
            double const minDist = candidate.radius + b.radius + Gap * scale;
            if (dx * dx + dy * dy < minDist * minDist) {
                clear = false;
                break;
            }
        }
        if (clear) {
            bumpers.push_back(candidate);
        }
    }
}

void BumperChamber::update(double dt, std::vector<LocalBall>& balls, ChamberContext& /*ctx*/) {
    PROFILE_SCOPE("BumperChamber");
    t += dt;

    for (auto& bumper : bumpers) {
        bumper.hitTimer = std::max(0.0, bumper.hitTimer - dt);
    }

    for (auto& ball : balls) {
        if (!ball.active) {
            continue;
        }
        for (auto& bumper : bumpers) {
            if (auto normal = separateFromCircle(ball, bumper.x, bumper.y, bumper.radius)) {
                reflectVelocity(ball, *normal, 1.0 + Restitution);
                bumper.hitTimer = FlashTime;
            }
        }
    }
}

void BumperChamber::draw(Canvas& canvas, const Layout::Viewport& vp) const {
    const Components::Color idle(220, 60, 140);
    const Components::Color lit(255, 230, 120);
    for (const auto& bumper : bumpers) {
        bool const flashing = bumper.hitTimer > 0.0;
        double const grow = flashing ? 1.0 + bumper.hitTimer / FlashTime * 0.15 : 1.0;
        canvas.fillCircle(vp.x + bumper.x, vp.y + bumper.y, bumper.radius * grow, flashing ? lit : idle, 255);
        canvas.strokeCircle(vp.x + bumper.x, vp.y + bumper.y, bumper.radius * 0.6, Components::Color(255, 255, 255),
                            180, 2.0);
    }
}

nlohmann::json BumperChamber::saveState() const {
    nlohmann::json state = saveCommon();
    nlohmann::json list = nlohmann::json::array();
    for (const auto& bumper : bumpers) {
        list.push_back({{"x", bumper.x}, {"y", bumper.y}, {"radius", bumper.radius}, {"hit_timer", bumper.hitTimer}});
    }
    state["bumpers"] = std::move(list);
    return state;
}

void BumperChamber::loadState(const nlohmann::json& state) {
    loadCommon(state);
    StateIO::readList(state, "bumpers", bumpers, [](const nlohmann::json& j) {
        return Bumper{StateIO::readDouble(j, "x", 0.0), StateIO::readDouble(j, "y", 0.0),
                      StateIO::readDouble(j, "radius", 0.0), StateIO::readDouble(j, "hit_timer", 0.0)};
    });
}

} // namespace Chambers
