#include "contraption/chambers/chamber.hpp"
#include "contraption/core/canvas.hpp"

#include <iostream>

namespace Chambers {

namespace {

using SimulatorConstants::ChamberType;

ChamberPolicy makePolicy(ChamberType type) {
    switch (type) {
        case ChamberType::ANTIGRAVITY:  return AntigravityChamber{};
        case ChamberType::TESLA_COIL:   return TeslaCoilChamber{};
        case ChamberType::WIND_TUNNEL:  return WindTunnelChamber{};
        case ChamberType::SEESAW:       return SeesawChamber{};
        case ChamberType::PEGS:         return PegsChamber{};
        case ChamberType::FUNNEL:       return FunnelChamber{};
        case ChamberType::STAIRS:       return StairsChamber{};
        case ChamberType::TRAMPOLINE:   return TrampolineChamber{};
        case ChamberType::MIXER:        return MixerChamber{};
        case ChamberType::ACCELERATOR:  return AcceleratorChamber{};
        case ChamberType::SPLITTER:     return SplitterChamber{};
        case ChamberType::CONVEYOR:     return ConveyorChamber{};
        case ChamberType::TELEPORTER:   return TeleporterChamber{};
        case ChamberType::MAGNET:       return MagnetChamber{};
        case ChamberType::BUMPER:       return BumperChamber{};
        case ChamberType::PONG:         return PongChamber{};
    }
    return PegsChamber{};
}

} // namespace

Chamber::Chamber(SimulatorConstants::ChamberType type)
    : type(type), policy(makePolicy(type)) {}

std::optional<Chamber> Chamber::create(const std::string& name) {
    auto type = SimulatorConstants::chamberTypeFromName(name);
    if (!type) {
        std::cerr << "[Chamber] Unknown chamber '" << name << "', skipping\n";
        return std::nullopt;
    }
    return Chamber(*type);
}

std::string Chamber::getName() const {
    return SimulatorConstants::getChamberName(type);
}

void Chamber::init(std::mt19937& rng) {
    std::visit([&](auto& p) { p.init(viewport.w, viewport.h, rng); }, policy);
}

void Chamber::resize() {
    std::visit([&](auto& p) { p.resize(viewport.w, viewport.h); }, policy);
}

void Chamber::update(double dt, std::vector<LocalBall>& balls, ChamberContext& ctx) {
    std::visit([&](auto& p) { p.update(dt, balls, ctx); }, policy);
}

void Chamber::draw(Canvas& canvas) const {
    std::visit([&](const auto& p) { p.draw(canvas, viewport); }, policy);
}

nlohmann::json Chamber::saveState() const {
    return std::visit([](const auto& p) { return p.saveState(); }, policy);
}

void Chamber::loadState(const nlohmann::json& state) {
    std::visit([&](auto& p) { p.loadState(state); }, policy);
}

double Chamber::getScale() const {
    return std::visit([](const auto& p) { return p.getScale(); }, policy);
}

} // namespace Chambers
