/**
 * @file trampoline.hpp
 * @brief A springy pad that launches falling balls back up
 *
 * Landing is one-way: only a ball moving down onto the top face bounces.
 * The rebound speed is 1.5x the landing speed, held between a minimum launch
 * speed and a maximum bounce speed.
 */

#ifndef CONTRAPTION_CHAMBERS_TRAMPOLINE_HPP
#define CONTRAPTION_CHAMBERS_TRAMPOLINE_HPP

#include <vector>
#include "contraption/chambers/chamber_base.hpp"

namespace Chambers {

struct Pad {
    double x = 0.0;
    double y = 0.0;
    double w = 0.0;
    double h = 0.0;
};

class TrampolineChamber : public ChamberBase {
public:
    static constexpr double Bounce = 1.5;
    static constexpr double MaxBounceSpeed = 800.0;  ///< Scaled by the chamber scale
    static constexpr double MinBounceSpeed = 200.0;
    static constexpr double MinLaunchSpeed = 350.0;

    void init(double w, double h, std::mt19937& rng);
    void update(double dt, std::vector<LocalBall>& balls, ChamberContext& ctx);
    void draw(Canvas& canvas, const Layout::Viewport& vp) const;
    nlohmann::json saveState() const;
    void loadState(const nlohmann::json& state);

    const std::vector<Pad>& getPads() const { return pads; }

private:
    std::vector<Pad> pads;
};

} // namespace Chambers

#endif
