/**
 * @file conveyor.hpp
 * @brief Moving belts that carry balls sideways
 */

#ifndef CONTRAPTION_CHAMBERS_CONVEYOR_HPP
#define CONTRAPTION_CHAMBERS_CONVEYOR_HPP

#include <vector>
#include "contraption/chambers/chamber_base.hpp"

namespace Chambers {

struct Belt {
    double x = 0.0;
    double y = 0.0;
    double w = 0.0;
    double h = 0.0;
    double speed = 0.0;  ///< Surface speed, px/s, positive moves right
};

class ConveyorChamber : public ChamberBase {
public:
    void init(double w, double h, std::mt19937& rng);
    void update(double dt, std::vector<LocalBall>& balls, ChamberContext& ctx);
    void draw(Canvas& canvas, const Layout::Viewport& vp) const;
    nlohmann::json saveState() const;
    void loadState(const nlohmann::json& state);

    const std::vector<Belt>& getBelts() const { return belts; }

private:
    std::vector<Belt> belts;
};

} // namespace Chambers

#endif
