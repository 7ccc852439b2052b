/**
 * @file antigravity.hpp
 * @brief Stacked zones where gravity is overpowered and balls float upward
 *
 * Inside a zone a ball gets an upward push, fast downward motion is damped,
 * and a slow sideways drift keeps floating balls moving. Chamber edges that
 * lie on the canvas' left or right border act as soft walls.
 */

#ifndef CONTRAPTION_CHAMBERS_ANTIGRAVITY_HPP
#define CONTRAPTION_CHAMBERS_ANTIGRAVITY_HPP

#include <vector>
#include "contraption/chambers/chamber_base.hpp"

namespace Chambers {

struct AntigravityZone {
    double x = 0.0;
    double y = 0.0;
    double w = 0.0;
    double h = 0.0;
    double force = 0.0;  ///< Vertical acceleration, negative is up
};

class AntigravityChamber : public ChamberBase {
public:
    void init(double w, double h, std::mt19937& rng);
    void update(double dt, std::vector<LocalBall>& balls, ChamberContext& ctx);
    void draw(Canvas& canvas, const Layout::Viewport& vp) const;
    nlohmann::json saveState() const;
    void loadState(const nlohmann::json& state);

    const std::vector<AntigravityZone>& getZones() const { return zones; }

private:
    std::vector<AntigravityZone> zones;
};

} // namespace Chambers

#endif
