/**
 * @fileoverview host_options.hpp
 * @brief Command line settings for the window host.
 *
 * Usage: contraption [--state FILE] [--seed N] [--chambers a,b,c] [--size WxH]
 */

#pragma once

#include <string>

#include "contraption/core/constants.hpp"
#include "contraption/core/simulation_config.hpp"

/**
 * @struct HostOptions
 * @brief Command line settings for the window host
 */
struct HostOptions {
    unsigned int windowWidth = SimulatorConstants::DefaultCanvasWidth;
    unsigned int windowHeight = SimulatorConstants::DefaultCanvasHeight;
    std::string statePath = "contraption_state.json";
    bool persistState = false;  // --state given: load on start, save on exit
    SimulationConfig simConfig;
};

/**
 * @brief Fills @p options from the command line.
 *
 * Prints the problem and the usage line to stderr on bad input.
 * @return false if the arguments could not be parsed
 */
bool parseHostArgs(int argc, const char* const* argv, HostOptions& options);
