/**
 * @file sim_manager.hpp
 * @brief Owner of the balls and chambers, and driver of the frame pipeline
 *
 * One update(dt) runs, in order:
 *  1. timed spawning into a top-row chamber
 *  2. gravity and position integration
 *  3. chamber routing (list order, sequential)
 *  4. ball-ball contacts
 *  5. canvas boundary
 *  6. cleanup of fallen balls, with one replacement spawn per removed ball
 *
 * The manager is the only owner of ball storage. Chambers only ever see
 * per-frame copies, plus the Possession annotations they place.
 */

#ifndef CONTRAPTION_SIM_MANAGER_HPP
#define CONTRAPTION_SIM_MANAGER_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include <entt/entt.hpp>
#include <nlohmann/json.hpp>

#include "contraption/chambers/chamber.hpp"
#include "contraption/components/basic.hpp"
#include "contraption/core/simulation_config.hpp"
#include "contraption/systems/i_system.hpp"

class Canvas;

/**
 * @brief Plain copy of a ball, for callers outside the registry
 */
struct BallState {
    std::uint64_t id = 0;
    double x = 0.0;
    double y = 0.0;
    double vx = 0.0;
    double vy = 0.0;
    double radius = 0.0;
    Components::Color color;
    bool active = true;
};

class SimManager {
public:
    explicit SimManager(SimulationConfig config = SimulationConfig());

    // Systems hold references into this object.
    SimManager(const SimManager&) = delete;
    SimManager& operator=(const SimManager&) = delete;

    /**
     * @brief Builds the chamber set for a canvas and spawns the initial burst.
     *
     * Chambers come from the configured order, or every known chamber in a
     * shuffled order. A chamber that fails to build is logged and left out.
     */
    void init(double canvasWidth, double canvasHeight);

    /**
     * @brief Advances the whole simulation by @p dt seconds.
     */
    void update(double dt);

    /**
     * @brief Draws chamber panels, obstacles and balls.
     */
    void draw(Canvas& canvas) const;

    /**
     * @brief Serializes everything needed to resume the simulation.
     */
    nlohmann::json saveState() const;

    /**
     * @brief Restores a snapshot produced by saveState().
     *
     * With no chambers yet, or a saved order that differs from the current
     * one, the chambers are rebuilt from the saved order (no shuffle) and laid
     * out again; chamber geometry comes from the snapshot, not from new random
     * placement. A chamber that fails to restore is dropped and the survivors
     * are laid out and generated afresh. A chamber with no saved blob is only
     * re-initialized when it was rebuilt or its viewport moved. Balls are
     * replaced wholesale. Missing or mistyped fields keep their current value.
     * Never throws.
     */
    void loadState(const nlohmann::json& state);

    /**
     * @brief Spawns one ball at a random point near the top of a random
     *        top-row chamber.
     * @return The new ball's id, or std::nullopt if there is no chamber
     */
    std::optional<std::uint64_t> spawnRandomBall();

    /**
     * @brief Adds a ball at an explicit position. Ignores the population cap.
     * @return The new ball's id
     */
    std::uint64_t addBall(double x, double y, double vx, double vy, double radius,
                          const Components::Color& color);

    /** @brief Active balls, oldest first. */
    std::vector<BallState> getBalls() const;
    std::size_t getBallCount() const;
    std::optional<BallState> findBall(std::uint64_t id) const;

    std::vector<Chambers::Chamber>& getChambers() { return chambers; }
    const std::vector<Chambers::Chamber>& getChambers() const { return chambers; }

    /** @brief Requested chamber names, unknown ones included. */
    const std::vector<std::string>& getChamberOrder() const { return chamberOrder; }

    entt::registry& getRegistry() { return registry; }
    const entt::registry& getRegistry() const { return registry; }

    const SimulationConfig& getConfig() const { return config; }
    double getTime() const { return t; }
    double getWidth() const { return width; }
    double getHeight() const { return height; }
    int getCols() const { return cols; }
    int getRows() const { return rows; }
    std::uint64_t getNextBallId() const { return nextBallId; }
    double getSpawnTimer() const { return spawnTimer; }

private:
    SimulationConfig config;
    std::mt19937 rng;
    entt::registry registry;
    std::vector<Chambers::Chamber> chambers;
    std::vector<std::string> chamberOrder;

    std::vector<std::unique_ptr<Systems::ISystem>> integrationSystems;
    std::vector<std::unique_ptr<Systems::ISystem>> resolutionSystems;
    std::unique_ptr<Systems::ISystem> routingSystem;

    double t = 0.0;
    double width = 0.0;
    double height = 0.0;
    double spawnTimer = 0.0;
    std::uint64_t nextBallId = 1;
    int cols = 1;
    int rows = 1;

    void loadChambers(const std::vector<std::string>& names);
    void layoutChambers(bool keepGridShape);
    void initChambers();
    void restoreChambers(const nlohmann::json& state, bool rebuilt);
    void restoreBalls(const nlohmann::json& list);
    void updateSystemConfigs();
    std::size_t cleanup();
    std::uint64_t createBall(std::uint64_t id, const BallState& ball);
    BallState snapshotBall(entt::entity entity) const;
};

#endif
