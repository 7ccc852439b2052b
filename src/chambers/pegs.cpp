#include "contraption/chambers/pegs.hpp"
#include "contraption/core/canvas.hpp"
#include "contraption/core/profile.hpp"
#include "contraption/core/state_io.hpp"

namespace Chambers {

namespace {
    constexpr int MinPegs = 15;
    constexpr int MaxPegs = 25;
    constexpr int MaxPlacementAttempts = 1000;
    constexpr double PegRadius = 12.0;
    constexpr double EdgeMargin = 40.0;
    constexpr double PegGap = 22.0;       // clear space kept between two pegs
    constexpr double Restitution = 1.5;
    constexpr double JitterSpeed = 30.0;
}

void PegsChamber::init(double w, double h, std::mt19937& rng) {
    resize(w, h);
    t = 0.0;
    pegs.clear();

    int const target = randomInt(rng, MinPegs, MaxPegs);
    double const radius = PegRadius * scale;
    double const margin = EdgeMargin * scale;
    double const minSeparation = 2.0 * radius + PegGap * scale;

    int attempts = 0;
    while (static_cast<int>(pegs.size()) < target && attempts < MaxPlacementAttempts) {
        ++attempts;
        Peg candidate{randomRange(rng, margin, w - margin),
                      randomRange(rng, h * 0.15, h * 0.85),
                      radius};

        bool clear = true;
        for (const auto& peg : pegs) {
            double const dx = candidate.x - peg.x;
            double const dy = candidate.y - peg.y;
            if (dx * dx + dy * dy < minSeparation * minSeparation) {
                clear = false;
                break;
            }
        }
        if (clear) {
            pegs.push_back(candidate);
        }
    }
}

void PegsChamber::update(double dt, std::vector<LocalBall>& balls, ChamberContext& ctx) {
    PROFILE_SCOPE("PegsChamber");
    t += dt;

    for (auto& ball : balls) {
        if (!ball.active) {
            continue;
        }
        for (const auto& peg : pegs) {
            if (auto normal = separateFromCircle(ball, peg.x, peg.y, peg.radius)) {
                reflectVelocity(ball, *normal, Restitution);
                ball.vx += (randomUnit(ctx.rng) - 0.5) * JitterSpeed * scale;
            }
        }
    }
}

void PegsChamber::draw(Canvas& canvas, const Layout::Viewport& vp) const {
    const Components::Color pegColor(200, 200, 220);
    for (const auto& peg : pegs) {
        canvas.fillCircle(vp.x + peg.x, vp.y + peg.y, peg.radius, pegColor, 255);
        canvas.strokeCircle(vp.x + peg.x, vp.y + peg.y, peg.radius, Components::Color(255, 255, 255), 120, 1.0);
    }
}

nlohmann::json PegsChamber::saveState() const {
    nlohmann::json state = saveCommon();
    nlohmann::json list = nlohmann::json::array();
    for (const auto& peg : pegs) {
        list.push_back({{"x", peg.x}, {"y", peg.y}, {"radius", peg.radius}});
    }
    state["pegs"] = std::move(list);
    return state;
}

void PegsChamber::loadState(const nlohmann::json& state) {
    loadCommon(state);
    double const defaultRadius = PegRadius * scale;
    StateIO::readList(state, "pegs", pegs, [&](const nlohmann::json& j) {
        return Peg{StateIO::readDouble(j, "x", 0.0),
                   StateIO::readDouble(j, "y", 0.0),
                   StateIO::readDouble(j, "radius", defaultRadius)};
    });
}

} // namespace Chambers
