/**
 * @file bumper.hpp
 * @brief Pinball bumpers that kick balls away harder than they arrived
 */

#ifndef CONTRAPTION_CHAMBERS_BUMPER_HPP
#define CONTRAPTION_CHAMBERS_BUMPER_HPP

#include <vector>
#include "contraption/chambers/chamber_base.hpp"

namespace Chambers {

struct Bumper {
    double x = 0.0;
    double y = 0.0;
    double radius = 0.0;
    double hitTimer = 0.0;  ///< Flash time left after a hit, seconds
};

class BumperChamber : public ChamberBase {
public:
    static constexpr double Restitution = 2.0;
    static constexpr double FlashTime = 0.2;

    void init(double w, double h, std::mt19937& rng);
    void update(double dt, std::vector<LocalBall>& balls, ChamberContext& ctx);
    void draw(Canvas& canvas, const Layout::Viewport& vp) const;
    nlohmann::json saveState() const;
    void loadState(const nlohmann::json& state);

    const std::vector<Bumper>& getBumpers() const { return bumpers; }

private:
    std::vector<Bumper> bumpers;
};

} // namespace Chambers

#endif
