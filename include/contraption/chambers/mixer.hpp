/**
 * @file mixer.hpp
 * @brief Two counter-rotating blades that bat balls around
 */

#ifndef CONTRAPTION_CHAMBERS_MIXER_HPP
#define CONTRAPTION_CHAMBERS_MIXER_HPP

#include <vector>
#include "contraption/chambers/chamber_base.hpp"

namespace Chambers {

struct Blade {
    double cx = 0.0;
    double cy = 0.0;
    double length = 0.0;  ///< Half-length, centre to tip
    double speed = 0.0;   ///< rad/s, sign gives the spin direction
};

class MixerChamber : public ChamberBase {
public:
    void init(double w, double h, std::mt19937& rng);
    void update(double dt, std::vector<LocalBall>& balls, ChamberContext& ctx);
    void draw(Canvas& canvas, const Layout::Viewport& vp) const;
    nlohmann::json saveState() const;
    void loadState(const nlohmann::json& state);

    const std::vector<Blade>& getBlades() const { return blades; }

private:
    std::vector<Blade> blades;
};

} // namespace Chambers

#endif
