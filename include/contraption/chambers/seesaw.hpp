/**
 * @file seesaw.hpp
 * @brief A pivoting plank that tips under the balls landing on it
 *
 * The plank is a damped angular spring around its centre, clamped to
 * +/-0.4 rad. A ball resting on the plank applies a torque proportional to
 * its lever arm.
 */

#ifndef CONTRAPTION_CHAMBERS_SEESAW_HPP
#define CONTRAPTION_CHAMBERS_SEESAW_HPP

#include <vector>
#include "contraption/chambers/chamber_base.hpp"

namespace Chambers {

struct Plank {
    double cx = 0.0;
    double cy = 0.0;
    double length = 0.0;
    double angle = 0.0;
    double angularVelocity = 0.0;
};

class SeesawChamber : public ChamberBase {
public:
    static constexpr double MaxAngle = 0.4;

    void init(double w, double h, std::mt19937& rng);
    void update(double dt, std::vector<LocalBall>& balls, ChamberContext& ctx);
    void draw(Canvas& canvas, const Layout::Viewport& vp) const;
    nlohmann::json saveState() const;
    void loadState(const nlohmann::json& state);

    const std::vector<Plank>& getPlanks() const { return planks; }

private:
    std::vector<Plank> planks;
};

} // namespace Chambers

#endif
