/**
 * @file teleporter.hpp
 * @brief Linked portal pairs
 *
 * A ball whose centre enters a portal reappears just outside the partner
 * portal, offset along its direction of travel (or straight down when it is
 * nearly at rest). Each ball then ignores all portals for a short cooldown,
 * keyed by ball id, so it cannot bounce straight back.
 */

#ifndef CONTRAPTION_CHAMBERS_TELEPORTER_HPP
#define CONTRAPTION_CHAMBERS_TELEPORTER_HPP

#include <cstdint>
#include <map>
#include <vector>
#include "contraption/chambers/chamber_base.hpp"

namespace Chambers {

struct Portal {
    double x = 0.0;
    double y = 0.0;
    double radius = 0.0;
    int target = -1;  ///< Index of the partner portal
    Components::Color color;
};

class TeleporterChamber : public ChamberBase {
public:
    static constexpr double Cooldown = 0.2;

    void init(double w, double h, std::mt19937& rng);
    void update(double dt, std::vector<LocalBall>& balls, ChamberContext& ctx);
    void draw(Canvas& canvas, const Layout::Viewport& vp) const;
    nlohmann::json saveState() const;
    void loadState(const nlohmann::json& state);

    const std::vector<Portal>& getPortals() const { return portals; }

    /** @brief Remaining cooldown for a ball, 0 if none. */
    double getCooldown(std::uint64_t ballId) const;

private:
    std::vector<Portal> portals;
    std::map<std::uint64_t, double> cooldowns;
};

} // namespace Chambers

#endif
