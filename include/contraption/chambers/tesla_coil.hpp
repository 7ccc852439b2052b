/**
 * @file tesla_coil.hpp
 * @brief Charging coils that zap nearby balls away
 *
 * Each coil accumulates charge at 0.8 per second. Once fully charged, the
 * first ball found inside its range (but outside its core) receives a radial
 * kick and the charge resets. Balls touching the core bounce off it.
 */

#ifndef CONTRAPTION_CHAMBERS_TESLA_COIL_HPP
#define CONTRAPTION_CHAMBERS_TESLA_COIL_HPP

#include <vector>
#include "contraption/chambers/chamber_base.hpp"

namespace Chambers {

struct Coil {
    double x = 0.0;
    double y = 0.0;
    double radius = 0.0;
    double range = 0.0;
    double charge = 0.0;  ///< Fires at 1.0
};

/// Short-lived arc drawn after a discharge
struct Zap {
    double x1 = 0.0;
    double y1 = 0.0;
    double x2 = 0.0;
    double y2 = 0.0;
    double life = 0.0;
};

class TeslaCoilChamber : public ChamberBase {
public:
    void init(double w, double h, std::mt19937& rng);
    void update(double dt, std::vector<LocalBall>& balls, ChamberContext& ctx);
    void draw(Canvas& canvas, const Layout::Viewport& vp) const;
    nlohmann::json saveState() const;
    void loadState(const nlohmann::json& state);

    const std::vector<Coil>& getCoils() const { return coils; }
    const std::vector<Zap>& getZaps() const { return zaps; }

private:
    std::vector<Coil> coils;
    std::vector<Zap> zaps;
};

} // namespace Chambers

#endif
