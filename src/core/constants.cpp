#include "contraption/core/constants.hpp"

namespace SimulatorConstants {

    const double Pi = 3.14159265358979323846;

    const double ReferenceChamberWidth  = 480.0;
    const double ReferenceChamberHeight = 270.0;

    // Display
    const unsigned int DefaultCanvasWidth  = 1920;
    const unsigned int DefaultCanvasHeight = 1080;
    const unsigned int StepsPerSecond      = 60;
    const unsigned int MaxStepsPerFrame    = 5;

    std::vector<ChamberType> getAllChambers() {
        return {
            ChamberType::ANTIGRAVITY,
            ChamberType::TESLA_COIL,
            ChamberType::WIND_TUNNEL,
            ChamberType::SEESAW,
            ChamberType::PEGS,
            ChamberType::FUNNEL,
            ChamberType::STAIRS,
            ChamberType::TRAMPOLINE,
            ChamberType::MIXER,
            ChamberType::ACCELERATOR,
            ChamberType::SPLITTER,
            ChamberType::CONVEYOR,
            ChamberType::TELEPORTER,
            ChamberType::MAGNET,
            ChamberType::BUMPER,
            ChamberType::PONG
        };
    }

    std::string getChamberName(ChamberType chamber) {
        switch (chamber) {
            case ChamberType::ANTIGRAVITY:  return "antigravity";
            case ChamberType::TESLA_COIL:   return "tesla_coil";
            case ChamberType::WIND_TUNNEL:  return "wind_tunnel";
            case ChamberType::SEESAW:       return "seesaw";
            case ChamberType::PEGS:         return "pegs";
            case ChamberType::FUNNEL:       return "funnel";
            case ChamberType::STAIRS:       return "stairs";
            case ChamberType::TRAMPOLINE:   return "trampoline";
            case ChamberType::MIXER:        return "mixer";
            case ChamberType::ACCELERATOR:  return "accelerator";
            case ChamberType::SPLITTER:     return "splitter";
            case ChamberType::CONVEYOR:     return "conveyor";
            case ChamberType::TELEPORTER:   return "teleporter";
            case ChamberType::MAGNET:       return "magnet";
            case ChamberType::BUMPER:       return "bumper";
            case ChamberType::PONG:         return "pong";
            default: return "unknown";
        }
    }

    std::optional<ChamberType> chamberTypeFromName(const std::string& name) {
        for (ChamberType type : getAllChambers()) {
            if (getChamberName(type) == name) {
                return type;
            }
        }
        return std::nullopt;
    }

} // namespace SimulatorConstants
