#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * @struct SimulationConfig
 * @brief Tunables of the simulation manager.
 *
 * Defaults reproduce the stock toy: sixteen shuffled chambers on a 1920x1080
 * canvas, a ball every half second, at most fifty balls alive.
 */
struct SimulationConfig {
    double gravity = 400.0;          // px/s^2, positive is down
    double spawnInterval = 0.5;      // seconds between timed spawns
    std::size_t maxBalls = 50;
    double ballRadius = 10.0;
    int initialBalls = 3;            // burst spawned by init()
    double boundaryDamping = 0.8;

    // Spawn velocity ranges, px/s
    double spawnSpeedX = 100.0;      // vx in [-spawnSpeedX, spawnSpeedX]
    double spawnSpeedY = 50.0;       // vy in [0, spawnSpeedY]

    // 0 seeds the generator from std::random_device
    std::uint32_t seed = 0;

    // Explicit chamber names, in order, used as given. Unset means every
    // known chamber, shuffled once at init().
    std::optional<std::vector<std::string>> chamberOrder;
};
