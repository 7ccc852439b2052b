#include "contraption/chambers/stairs.hpp"
#include "contraption/core/canvas.hpp"
#include "contraption/core/constants.hpp"
#include "contraption/core/profile.hpp"
#include "contraption/core/state_io.hpp"

#include <cmath>

namespace Chambers {

namespace {
    constexpr int MinSteps = 6;
    constexpr int MaxSteps = 9;
    constexpr double StepThickness = 12.0;
    constexpr double StepOverhang = 5.0;
    constexpr double BoosterChance = 0.2;
    constexpr double StepBounce = 0.8;
    constexpr double BoosterBounce = 1.8;
    constexpr double NudgeAcceleration = 60.0;
    constexpr double MinRollSpeed = 30.0;
    constexpr double PhaseWobble = 5.0;

    StepMotion motionFromInt(int value) {
        switch (value) {
            case 2: return StepMotion::Horizontal;
            case 3: return StepMotion::Vertical;
            case 4: return StepMotion::Phase;
            default: return StepMotion::Static;
        }
    }
}

void StairsChamber::init(double w, double h, std::mt19937& rng) {
    resize(w, h);
    t = 0.0;
    steps.clear();

    direction = randomUnit(rng) < 0.5 ? 1 : -1;
    int const count = randomInt(rng, MinSteps, MaxSteps);
    double const stepW = w * 0.9 / count;
    double const stepH = h * 0.7 / count;

    for (int i = 1; i <= count; ++i) {
        Step step;
        step.x = direction == 1 ? (i - 1) * stepW : w - i * stepW;
        step.y = h * 0.15 + (i - 1) * stepH;
        step.w = stepW + StepOverhang * scale;
        step.h = StepThickness * scale;
        step.originX = step.x;
        step.originY = step.y;
        step.booster = randomUnit(rng) < BoosterChance;
        step.motion = motionFromInt(randomInt(rng, 1, 4));
        step.offset = randomUnit(rng) * SimulatorConstants::Pi * 2.0;
        step.range = randomInt(rng, 10, 30) * scale;
        step.speed = randomUnit(rng) * 2.0 + 1.0;
        steps.push_back(step);
    }
}

void StairsChamber::update(double dt, std::vector<LocalBall>& balls, ChamberContext& /*ctx*/) {
    PROFILE_SCOPE("StairsChamber");
    t += dt;

    for (auto& step : steps) {
        switch (step.motion) {
            case StepMotion::Horizontal:
                step.x = step.originX + std::sin(t * step.speed + step.offset) * step.range;
                break;
            case StepMotion::Vertical:
                step.y = step.originY + std::cos(t * step.speed + step.offset) * step.range;
                break;
            case StepMotion::Phase:
                step.x = step.originX + std::sin(t * step.speed) * PhaseWobble * scale;
                break;
            case StepMotion::Static:
                break;
        }
    }

    double const nudge = NudgeAcceleration * scale;
    double const minRoll = MinRollSpeed * scale;

    for (auto& ball : balls) {
        if (!ball.active) {
            continue;
        }
        for (const auto& step : steps) {
            if (!landsOnPlatform(ball, dt, step.x, step.y, step.w, step.h, ball.radius * 0.5)) {
                continue;
            }
            ball.y = step.y - ball.radius;
            ball.vy = -ball.vy * (step.booster ? BoosterBounce : StepBounce);
            ball.vx += direction * nudge * dt;
            if (std::abs(ball.vx) < minRoll) {
                ball.vx = direction * minRoll;
            }
        }
    }
}

void StairsChamber::draw(Canvas& canvas, const Layout::Viewport& vp) const {
    const Components::Color stepColor(140, 150, 170);
    const Components::Color boosterColor(240, 200, 60);
    for (const auto& step : steps) {
        canvas.fillRect(vp.x + step.x, vp.y + step.y, step.w, step.h,
                        step.booster ? boosterColor : stepColor, 255);
    }
}

nlohmann::json StairsChamber::saveState() const {
    nlohmann::json state = saveCommon();
    state["dir"] = direction;
    nlohmann::json list = nlohmann::json::array();
    for (const auto& step : steps) {
        list.push_back({
            {"x", step.x}, {"y", step.y}, {"w", step.w}, {"h", step.h},
            {"x_orig", step.originX}, {"y_orig", step.originY},
            {"is_booster", step.booster}, {"move_type", static_cast<int>(step.motion)},
            {"offset", step.offset}, {"range", step.range}, {"speed", step.speed}
        });
    }
    state["steps"] = std::move(list);
    return state;
}

void StairsChamber::loadState(const nlohmann::json& state) {
    loadCommon(state);
    direction = StateIO::readInt(state, "dir", direction) < 0 ? -1 : 1;
    StateIO::readList(state, "steps", steps, [](const nlohmann::json& j) {
        Step step;
        step.x = StateIO::readDouble(j, "x", 0.0);
        step.y = StateIO::readDouble(j, "y", 0.0);
        step.w = StateIO::readDouble(j, "w", 0.0);
        step.h = StateIO::readDouble(j, "h", 0.0);
        step.originX = StateIO::readDouble(j, "x_orig", step.x);
        step.originY = StateIO::readDouble(j, "y_orig", step.y);
        step.booster = StateIO::readBool(j, "is_booster", false);
        step.motion = motionFromInt(StateIO::readInt(j, "move_type", 1));
        step.offset = StateIO::readDouble(j, "offset", 0.0);
        step.range = StateIO::readDouble(j, "range", 0.0);
        step.speed = StateIO::readDouble(j, "speed", 1.0);
        return step;
    });
}

} // namespace Chambers
