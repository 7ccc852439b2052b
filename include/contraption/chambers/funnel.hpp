/**
 * @file funnel.hpp
 * @brief Two stacked V-shaped funnels built from four thick walls
 */

#ifndef CONTRAPTION_CHAMBERS_FUNNEL_HPP
#define CONTRAPTION_CHAMBERS_FUNNEL_HPP

#include <vector>
#include "contraption/chambers/chamber_base.hpp"

namespace Chambers {

struct Wall {
    double x1 = 0.0;
    double y1 = 0.0;
    double x2 = 0.0;
    double y2 = 0.0;
};

class FunnelChamber : public ChamberBase {
public:
    void init(double w, double h, std::mt19937& rng);
    void update(double dt, std::vector<LocalBall>& balls, ChamberContext& ctx);
    void draw(Canvas& canvas, const Layout::Viewport& vp) const;
    nlohmann::json saveState() const;
    void loadState(const nlohmann::json& state);

    const std::vector<Wall>& getWalls() const { return walls; }
    double getWallThickness() const { return wallThickness; }

private:
    std::vector<Wall> walls;
    double wallThickness = 4.0;
};

} // namespace Chambers

#endif
