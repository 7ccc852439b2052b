/**
 * @fileoverview presentation_manager.cpp
 * @brief Implementation of PresentationManager.
 */

#include <iostream>
#include <utility>
#include <SFML/System/Clock.hpp>
#include <SFML/Window/Event.hpp>

#include "contraption/app/presentation_manager.hpp"
#include "contraption/core/constants.hpp"
#include "contraption/core/profile.hpp"
#include "contraption/core/state_io.hpp"
#include "contraption/rendering/sfml_canvas.hpp"

PresentationManager::PresentationManager(HostOptions opts)
    : options(std::move(opts))
{
}

bool PresentationManager::init() {
    window.create(sf::VideoMode(options.windowWidth, options.windowHeight), "Contraption");
    if (!window.isOpen()) {
        std::cerr << "[PresentationManager] Failed to create window" << std::endl;
        return false;
    }
    window.setFramerateLimit(60);

    if (font.loadFromFile("assets/fonts/arial.ttf")) {
        fontLoaded = true;
    } else {
        std::cerr << "[PresentationManager] Warning: font not found, chamber labels disabled" << std::endl;
    }

    if (!options.persistState || !loadSnapshot()) {
        sim = std::make_unique<SimManager>(options.simConfig);
        sim->init(options.windowWidth, options.windowHeight);
    }
    return true;
}

void PresentationManager::run() {
    if (!init()) {
        return;
    }

    sf::Clock frameClock;
    sf::Time simulationAccumulator = sf::Time::Zero;
    sf::Time timeSinceLastProfilerPrint = sf::Time::Zero;
    const sf::Time fixedTickDt = sf::seconds(1.f / static_cast<float>(SimulatorConstants::StepsPerSecond));

    while (window.isOpen()) {
        sf::Time dt = frameClock.restart();
        simulationAccumulator += dt;
        timeSinceLastProfilerPrint += dt;

        handleEvents();
        if (!window.isOpen()) {
            break;
        }

        unsigned int ticksThisFrame = 0;
        while (simulationAccumulator >= fixedTickDt &&
               ticksThisFrame < SimulatorConstants::MaxStepsPerFrame) {
            if (paused && !stepFrame) {
                break;
            }
            tick(fixedTickDt.asSeconds());
            ticksThisFrame++;
            stepFrame = false;
            simulationAccumulator -= fixedTickDt;
        }
        // Drop the backlog instead of spiralling.
        if (simulationAccumulator >= fixedTickDt) {
            simulationAccumulator = sf::Time::Zero;
        }

        render();

        if (timeSinceLastProfilerPrint >= profilerPrintInterval) {
            Profiling::Profiler::printStats();
            Profiling::Profiler::reset();
            timeSinceLastProfilerPrint = sf::Time::Zero;
        }
    }

    if (options.persistState) {
        saveSnapshot();
    }
}

void PresentationManager::handleEvents() {
    sf::Event event;
    while (window.pollEvent(event)) {
        switch (event.type) {
            case sf::Event::Closed:
                window.close();
                break;
            case sf::Event::KeyPressed:
                handleKeyPressed(event.key.code);
                break;
            default:
                break;
        }
    }
}

void PresentationManager::handleKeyPressed(sf::Keyboard::Key key) {
    switch (key) {
        case sf::Keyboard::Escape: window.close(); break;
        case sf::Keyboard::P: paused = !paused; break;
        case sf::Keyboard::Space: stepFrame = true; break;
        case sf::Keyboard::F5: hotReload(); break;
        case sf::Keyboard::S: saveSnapshot(); break;
        case sf::Keyboard::L: loadSnapshot(); break;
        default: break;
    }
}

void PresentationManager::tick(double dt) {
    PROFILE_SCOPE("PresentationManager::tick");
    sim->update(dt);
}

void PresentationManager::render() {
    PROFILE_SCOPE("PresentationManager::render");
    SfmlCanvas canvas(window, fontLoaded ? &font : nullptr);
    sim->draw(canvas);
    window.display();
}

void PresentationManager::hotReload() {
    nlohmann::json state = sim->saveState();

    // The new manager starts with no chambers, so it rebuilds them from the
    // snapshot's order rather than shuffling.
    auto fresh = std::make_unique<SimManager>(options.simConfig);
    fresh->loadState(state);
    sim = std::move(fresh);

    std::cout << "[PresentationManager] Hot reload: " << sim->getChambers().size()
              << " chambers, " << sim->getBallCount() << " balls" << std::endl;
}

bool PresentationManager::saveSnapshot() const {
    if (!StateIO::writeFile(options.statePath, sim->saveState())) {
        return false;
    }
    std::cout << "[PresentationManager] Saved state to " << options.statePath << std::endl;
    return true;
}

bool PresentationManager::loadSnapshot() {
    auto state = StateIO::readFile(options.statePath);
    if (!state) {
        return false;
    }

    // Same path as hotReload(): a manager with no chambers takes the saved
    // order verbatim.
    auto fresh = std::make_unique<SimManager>(options.simConfig);
    fresh->loadState(*state);
    if (fresh->getChambers().empty()) {
        std::cerr << "[PresentationManager] No chambers in " << options.statePath
                  << ", keeping the current simulation" << std::endl;
        return false;
    }
    sim = std::move(fresh);
    std::cout << "[PresentationManager] Loaded state from " << options.statePath << std::endl;
    return true;
}
