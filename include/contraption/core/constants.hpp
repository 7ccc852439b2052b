#ifndef CONTRAPTION_CONSTANTS_HPP
#define CONTRAPTION_CONSTANTS_HPP

#include <optional>
#include <string>
#include <vector>

namespace SimulatorConstants {

    /**
     * @brief The chamber policies a canvas can be tiled with.
     *
     * Adding a chamber means adding it here, to the name table in
     * constants.cpp, and to the Chamber variant.
     */
    enum class ChamberType {
        ANTIGRAVITY,
        TESLA_COIL,
        WIND_TUNNEL,
        SEESAW,
        PEGS,
        FUNNEL,
        STAIRS,
        TRAMPOLINE,
        MIXER,
        ACCELERATOR,
        SPLITTER,
        CONVEYOR,
        TELEPORTER,
        MAGNET,
        BUMPER,
        PONG
    };

    // Truly global constants
    extern const double Pi;

    // Chamber constants are authored against this reference size and scaled
    // by min(w / ReferenceWidth, h / ReferenceHeight).
    extern const double ReferenceChamberWidth;
    extern const double ReferenceChamberHeight;

    // Display constants
    extern const unsigned int DefaultCanvasWidth;
    extern const unsigned int DefaultCanvasHeight;
    extern const unsigned int StepsPerSecond;
    extern const unsigned int MaxStepsPerFrame;

    /** @brief Every chamber type, in the canonical discovery order. */
    std::vector<ChamberType> getAllChambers();

    /** @brief Stable snake_case name used in snapshots and on the command line. */
    std::string getChamberName(ChamberType chamber);

    /** @brief Reverse lookup of getChamberName(); empty for unknown names. */
    std::optional<ChamberType> chamberTypeFromName(const std::string& name);
}

#endif // CONTRAPTION_CONSTANTS_HPP
