/**
 * @fileoverview presentation_manager.hpp
 * @brief Owns the application window and runs the fixed-timestep loop.
 *
 * Holds the SFML window, the optional font and the current SimManager.
 * Keyboard:
 *  - Esc: quit
 *  - P: pause / resume
 *  - Space: single step while paused
 *  - F5: hot reload (snapshot, fresh manager, restore)
 *  - S / L: write / read the snapshot file
 */

#pragma once

#include <memory>
#include <string>
#include <SFML/Graphics.hpp>

#include "contraption/app/host_options.hpp"
#include "contraption/core/sim_manager.hpp"

class PresentationManager {
public:
    explicit PresentationManager(HostOptions options);

    PresentationManager(const PresentationManager&) = delete;
    PresentationManager& operator=(const PresentationManager&) = delete;

    /** @brief Opens the window, loads the font and builds the simulation. */
    bool init();

    /** @brief Main loop; returns when the window closes. */
    void run();

private:
    HostOptions options;
    sf::RenderWindow window;
    sf::Font font;
    bool fontLoaded = false;
    std::unique_ptr<SimManager> sim;

    bool paused = false;
    bool stepFrame = false;

    const sf::Time profilerPrintInterval = sf::seconds(5.0f);

    void handleEvents();
    void handleKeyPressed(sf::Keyboard::Key key);
    void tick(double dt);
    void render();

    void hotReload();
    bool saveSnapshot() const;
    bool loadSnapshot();
};
