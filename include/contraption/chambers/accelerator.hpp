/**
 * @file accelerator.hpp
 * @brief Randomly placed booster fields that push balls in a fixed direction
 */

#ifndef CONTRAPTION_CHAMBERS_ACCELERATOR_HPP
#define CONTRAPTION_CHAMBERS_ACCELERATOR_HPP

#include <vector>
#include "contraption/chambers/chamber_base.hpp"

namespace Chambers {

struct Booster {
    double x = 0.0;
    double y = 0.0;
    double w = 0.0;
    double h = 0.0;
    double dirX = 1.0;   ///< Unit push direction
    double dirY = 0.0;
    double force = 0.0;
};

class AcceleratorChamber : public ChamberBase {
public:
    void init(double w, double h, std::mt19937& rng);
    void update(double dt, std::vector<LocalBall>& balls, ChamberContext& ctx);
    void draw(Canvas& canvas, const Layout::Viewport& vp) const;
    nlohmann::json saveState() const;
    void loadState(const nlohmann::json& state);

    const std::vector<Booster>& getBoosters() const { return boosters; }

private:
    std::vector<Booster> boosters;
};

} // namespace Chambers

#endif
