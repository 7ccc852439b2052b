/**
 * @file splitter.hpp
 * @brief A single wedge that splits the stream of falling balls in two
 *
 * The apex sits at a random point near the top centre and the two walls fan
 * out to a common base height. Each wall is one-sided: the ball is measured
 * by signed distance along the wall's outward normal and only bounces when
 * it is moving into the wall.
 */

#ifndef CONTRAPTION_CHAMBERS_SPLITTER_HPP
#define CONTRAPTION_CHAMBERS_SPLITTER_HPP

#include <vector>
#include "contraption/chambers/chamber_base.hpp"

namespace Chambers {

struct Wedge {
    Vector top;
    Vector left;
    Vector right;
};

class SplitterChamber : public ChamberBase {
public:
    void init(double w, double h, std::mt19937& rng);
    void update(double dt, std::vector<LocalBall>& balls, ChamberContext& ctx);
    void draw(Canvas& canvas, const Layout::Viewport& vp) const;
    nlohmann::json saveState() const;
    void loadState(const nlohmann::json& state);

    const Wedge& getWedge() const { return wedge; }

private:
    Wedge wedge;

    void collideWall(LocalBall& ball, const Vector& p1, const Vector& p2, const Vector& normal) const;
};

} // namespace Chambers

#endif
