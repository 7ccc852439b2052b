/**
 * @file pegs.hpp
 * @brief Pachinko field of round pegs
 *
 * Between 15 and 25 pegs are scattered with a minimum separation wide enough
 * for a ball to pass. Balls reflect off pegs with a restitution of 1.5 and get
 * a small random sideways jitter so stacks never settle.
 */

#ifndef CONTRAPTION_CHAMBERS_PEGS_HPP
#define CONTRAPTION_CHAMBERS_PEGS_HPP

#include <vector>
#include "contraption/chambers/chamber_base.hpp"

namespace Chambers {

struct Peg {
    double x = 0.0;
    double y = 0.0;
    double radius = 0.0;
};

class PegsChamber : public ChamberBase {
public:
    void init(double w, double h, std::mt19937& rng);
    void update(double dt, std::vector<LocalBall>& balls, ChamberContext& ctx);
    void draw(Canvas& canvas, const Layout::Viewport& vp) const;
    nlohmann::json saveState() const;
    void loadState(const nlohmann::json& state);

    const std::vector<Peg>& getPegs() const { return pegs; }

private:
    std::vector<Peg> pegs;
};

} // namespace Chambers

#endif
