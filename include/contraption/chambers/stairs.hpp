/**
 * @file stairs.hpp
 * @brief A staircase of one-way steps, some of which move
 *
 * The staircase runs left-to-right or right-to-left. Balls landing on a step
 * lose some vertical speed (boosters add some instead) and are nudged along
 * the staircase direction.
 */

#ifndef CONTRAPTION_CHAMBERS_STAIRS_HPP
#define CONTRAPTION_CHAMBERS_STAIRS_HPP

#include <vector>
#include "contraption/chambers/chamber_base.hpp"

namespace Chambers {

enum class StepMotion {
    Static = 1,
    Horizontal = 2,
    Vertical = 3,
    Phase = 4
};

struct Step {
    double x = 0.0;
    double y = 0.0;
    double w = 0.0;
    double h = 0.0;
    double originX = 0.0;
    double originY = 0.0;
    bool booster = false;
    StepMotion motion = StepMotion::Static;
    double offset = 0.0;  ///< Motion phase, radians
    double range = 0.0;   ///< Motion amplitude, px
    double speed = 1.0;   ///< Motion rate, rad/s
};

class StairsChamber : public ChamberBase {
public:
    void init(double w, double h, std::mt19937& rng);
    void update(double dt, std::vector<LocalBall>& balls, ChamberContext& ctx);
    void draw(Canvas& canvas, const Layout::Viewport& vp) const;
    nlohmann::json saveState() const;
    void loadState(const nlohmann::json& state);

    const std::vector<Step>& getSteps() const { return steps; }
    int getDirection() const { return direction; }

private:
    std::vector<Step> steps;
    int direction = 1;
};

} // namespace Chambers

#endif
