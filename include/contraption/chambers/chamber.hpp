/**
 * @file chamber.hpp
 * @brief The closed set of chamber policies behind one interface
 *
 * A Chamber pairs one policy with its place on the canvas. The policies share
 * the lifecycle init -> update/draw -> saveState/loadState; dispatch is a
 * std::visit over the variant.
 */

#ifndef CONTRAPTION_CHAMBER_HPP
#define CONTRAPTION_CHAMBER_HPP

#include <optional>
#include <random>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "contraption/chambers/accelerator.hpp"
#include "contraption/chambers/antigravity.hpp"
#include "contraption/chambers/bumper.hpp"
#include "contraption/chambers/chamber_base.hpp"
#include "contraption/chambers/conveyor.hpp"
#include "contraption/chambers/funnel.hpp"
#include "contraption/chambers/magnet.hpp"
#include "contraption/chambers/mixer.hpp"
#include "contraption/chambers/pegs.hpp"
#include "contraption/chambers/pong.hpp"
#include "contraption/chambers/seesaw.hpp"
#include "contraption/chambers/splitter.hpp"
#include "contraption/chambers/stairs.hpp"
#include "contraption/chambers/teleporter.hpp"
#include "contraption/chambers/tesla_coil.hpp"
#include "contraption/chambers/trampoline.hpp"
#include "contraption/chambers/wind_tunnel.hpp"
#include "contraption/core/constants.hpp"
#include "contraption/core/layout.hpp"

class Canvas;

namespace Chambers {

using ChamberPolicy = std::variant<
    AntigravityChamber,
    TeslaCoilChamber,
    WindTunnelChamber,
    SeesawChamber,
    PegsChamber,
    FunnelChamber,
    StairsChamber,
    TrampolineChamber,
    MixerChamber,
    AcceleratorChamber,
    SplitterChamber,
    ConveyorChamber,
    TeleporterChamber,
    MagnetChamber,
    BumperChamber,
    PongChamber>;

class Chamber {
public:
    /**
     * @brief Builds an uninitialized chamber of the given type.
     */
    explicit Chamber(SimulatorConstants::ChamberType type);

    /**
     * @brief Builds a chamber from its snapshot name.
     * @return std::nullopt (and a log line) if the name is unknown
     */
    static std::optional<Chamber> create(const std::string& name);

    SimulatorConstants::ChamberType getType() const { return type; }
    std::string getName() const;

    const Layout::Viewport& getViewport() const { return viewport; }
    void setViewport(const Layout::Viewport& vp) { viewport = vp; }

    /**
     * @brief Generates the obstacle layout for the current viewport size.
     * @throws std::invalid_argument if the viewport is empty
     */
    void init(std::mt19937& rng);

    /**
     * @brief Adopts the current viewport size without touching obstacles.
     *
     * Used on restore, where the geometry comes from the snapshot.
     * @throws std::invalid_argument if the viewport is empty
     */
    void resize();

    /**
     * @brief Advances the policy on balls already in chamber-local space.
     */
    void update(double dt, std::vector<LocalBall>& balls, ChamberContext& ctx);

    /**
     * @brief Draws obstacles at the chamber's canvas position.
     */
    void draw(Canvas& canvas) const;

    nlohmann::json saveState() const;
    void loadState(const nlohmann::json& state);

    double getScale() const;

    /** @brief Typed access to the policy, nullptr if it is another type. */
    template <typename Policy>
    Policy* as() { return std::get_if<Policy>(&policy); }

    template <typename Policy>
    const Policy* as() const { return std::get_if<Policy>(&policy); }

private:
    SimulatorConstants::ChamberType type;
    ChamberPolicy policy;
    Layout::Viewport viewport;
};

} // namespace Chambers

#endif
