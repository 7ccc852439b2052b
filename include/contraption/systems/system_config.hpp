#pragma once

/**
 * @struct SystemConfig
 * @brief Parameters every system shares, refreshed by the manager on init/restore.
 */
struct SystemConfig {
    double canvasWidth = 0.0;
    double canvasHeight = 0.0;
    double gravity = 400.0;  // px/s^2, positive is down
};
