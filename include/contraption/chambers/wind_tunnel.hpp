/**
 * @file wind_tunnel.hpp
 * @brief Horizontal wind bands blowing in opposite directions
 *
 * A ball whose centre is inside a band is accelerated along the band's
 * direction for as long as it stays there.
 */

#ifndef CONTRAPTION_CHAMBERS_WIND_TUNNEL_HPP
#define CONTRAPTION_CHAMBERS_WIND_TUNNEL_HPP

#include <vector>
#include "contraption/chambers/chamber_base.hpp"

namespace Chambers {

struct WindBand {
    double x = 0.0;
    double y = 0.0;
    double w = 0.0;
    double h = 0.0;
    double direction = 1.0;  ///< +1 blows right, -1 blows left
    double force = 0.0;      ///< px/s^2
};

class WindTunnelChamber : public ChamberBase {
public:
    void init(double w, double h, std::mt19937& rng);
    void update(double dt, std::vector<LocalBall>& balls, ChamberContext& ctx);
    void draw(Canvas& canvas, const Layout::Viewport& vp) const;
    nlohmann::json saveState() const;
    void loadState(const nlohmann::json& state);

    const std::vector<WindBand>& getBands() const { return bands; }

private:
    std::vector<WindBand> bands;
};

} // namespace Chambers

#endif
