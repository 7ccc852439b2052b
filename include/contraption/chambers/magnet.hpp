/**
 * @file magnet.hpp
 * @brief A central magnet that either attracts or repels every ball
 *
 * The field follows an inverse-square law, with the distance clamped to the
 * magnet's radius so the force stays finite near the core. Balls touching
 * the core are pushed out and bounced.
 */

#ifndef CONTRAPTION_CHAMBERS_MAGNET_HPP
#define CONTRAPTION_CHAMBERS_MAGNET_HPP

#include <vector>
#include "contraption/chambers/chamber_base.hpp"

namespace Chambers {

enum class MagnetPolarity {
    Pull,
    Push
};

struct Magnet {
    double x = 0.0;
    double y = 0.0;
    double radius = 0.0;
    double strength = 0.0;  ///< px^3/s^2
    MagnetPolarity polarity = MagnetPolarity::Pull;
};

class MagnetChamber : public ChamberBase {
public:
    void init(double w, double h, std::mt19937& rng);
    void update(double dt, std::vector<LocalBall>& balls, ChamberContext& ctx);
    void draw(Canvas& canvas, const Layout::Viewport& vp) const;
    nlohmann::json saveState() const;
    void loadState(const nlohmann::json& state);

    const std::vector<Magnet>& getMagnets() const { return magnets; }

private:
    std::vector<Magnet> magnets;
};

} // namespace Chambers

#endif
