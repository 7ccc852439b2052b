#include "contraption/core/sim_manager.hpp"
#include "contraption/core/canvas.hpp"
#include "contraption/core/constants.hpp"
#include "contraption/core/debug.hpp"
#include "contraption/core/layout.hpp"
#include "contraption/core/profile.hpp"
#include "contraption/core/state_io.hpp"
#include "contraption/systems/ball_collision.hpp"
#include "contraption/systems/ball_query.hpp"
#include "contraption/systems/boundary.hpp"
#include "contraption/systems/chamber_routing.hpp"
#include "contraption/systems/gravity.hpp"
#include "contraption/systems/movement.hpp"

#include <algorithm>
#include <iostream>
#include <set>
#include <stdexcept>
#include <utility>

namespace {
    const Components::Color BallPalette[] = {
        {220, 80, 80},
        {80, 180, 220},
        {80, 220, 120},
        {220, 180, 80},
        {180, 80, 220}
    };

    constexpr double SpawnMargin = 30.0;
    constexpr double SpawnDepthMin = 30.0;
    constexpr double SpawnDepthMax = 80.0;

    std::uint32_t seedFor(const SimulationConfig& config) {
        if (config.seed != 0) {
            return config.seed;
        }
        std::random_device device;
        return device();
    }
}

SimManager::SimManager(SimulationConfig cfg)
    : config(std::move(cfg)),
      rng(seedFor(config))
{
    integrationSystems.push_back(std::make_unique<Systems::GravitySystem>());
    integrationSystems.push_back(std::make_unique<Systems::MovementSystem>());

    routingSystem = std::make_unique<Systems::ChamberRoutingSystem>(chambers, rng);

    auto boundary = std::make_unique<Systems::BoundarySystem>();
    Systems::BoundaryConfig boundaryConfig;
    boundaryConfig.bounceDamping = config.boundaryDamping;
    boundary->setSpecificConfig(boundaryConfig);

    resolutionSystems.push_back(std::make_unique<Systems::BallCollisionSystem>());
    resolutionSystems.push_back(std::move(boundary));

    updateSystemConfigs();
}

void SimManager::updateSystemConfigs() {
    SystemConfig sysConfig;
    sysConfig.canvasWidth = width;
    sysConfig.canvasHeight = height;
    sysConfig.gravity = config.gravity;

    for (auto& system : integrationSystems) {
        system->setSystemConfig(sysConfig);
    }
    routingSystem->setSystemConfig(sysConfig);
    for (auto& system : resolutionSystems) {
        system->setSystemConfig(sysConfig);
    }
}

void SimManager::init(double canvasWidth, double canvasHeight) {
    width = canvasWidth;
    height = canvasHeight;
    t = 0.0;
    spawnTimer = 0.0;
    nextBallId = 1;
    registry.clear();
    chambers.clear();

    if (config.chamberOrder) {
        chamberOrder = *config.chamberOrder;
    } else {
        chamberOrder.clear();
        for (auto type : SimulatorConstants::getAllChambers()) {
            chamberOrder.push_back(SimulatorConstants::getChamberName(type));
        }
        std::shuffle(chamberOrder.begin(), chamberOrder.end(), rng);
    }

    loadChambers(chamberOrder);
    layoutChambers(false);
    initChambers();
    updateSystemConfigs();

    std::cout << "[SimManager] " << chambers.size() << " chambers in a "
              << cols << "x" << rows << " grid on " << width << "x" << height << "\n";

    for (int i = 0; i < config.initialBalls; ++i) {
        spawnRandomBall();
    }
}

void SimManager::loadChambers(const std::vector<std::string>& names) {
    chambers.clear();
    for (const auto& name : names) {
        if (auto chamber = Chambers::Chamber::create(name)) {
            chambers.push_back(std::move(*chamber));
        } else {
            std::cerr << "[SimManager] Failed to load chamber: " << name << "\n";
        }
    }
}

void SimManager::layoutChambers(bool keepGridShape) {
    Layout::GridShape shape{cols, rows};
    if (!keepGridShape || !Layout::fitsCount(shape, chambers.size())) {
        shape = Layout::gridShape(chambers.size());
    }
    cols = shape.cols;
    rows = shape.rows;

    auto viewports = Layout::computeViewports(chambers.size(), shape, width, height);
    for (std::size_t i = 0; i < chambers.size() && i < viewports.size(); ++i) {
        chambers[i].setViewport(viewports[i]);
    }
}

void SimManager::initChambers() {
    bool failed = true;
    while (failed && !chambers.empty()) {
        failed = false;
        for (auto it = chambers.begin(); it != chambers.end();) {
            try {
                it->init(rng);
                ++it;
            } catch (const std::exception& e) {
                std::cerr << "[SimManager] Failed to initialize chamber " << it->getName()
                          << ": " << e.what() << "\n";
                it = chambers.erase(it);
                failed = true;
            }
        }
        // Survivors take over the freed space and regenerate for their new size.
        if (failed) {
            layoutChambers(false);
        }
    }
}

std::optional<std::uint64_t> SimManager::spawnRandomBall() {
    std::vector<const Chambers::Chamber*> topRow;
    for (const auto& chamber : chambers) {
        if (cols > 0 && chamber.getViewport().index < static_cast<std::size_t>(cols)) {
            topRow.push_back(&chamber);
        }
    }
    if (topRow.empty()) {
        return std::nullopt;
    }

    int const pick = Chambers::randomInt(rng, 0, static_cast<int>(topRow.size()) - 1);
    const Layout::Viewport& vp = topRow[static_cast<std::size_t>(pick)]->getViewport();

    double const x = vp.x + Chambers::randomRange(rng, SpawnMargin, vp.w - SpawnMargin);
    double const y = vp.y + Chambers::randomRange(rng, SpawnDepthMin, SpawnDepthMax);
    double const vx = Chambers::randomRange(rng, -config.spawnSpeedX, config.spawnSpeedX);
    double const vy = Chambers::randomRange(rng, 0.0, config.spawnSpeedY);
    const Components::Color& color = BallPalette[Chambers::randomInt(rng, 0, 4)];

    return addBall(x, y, vx, vy, config.ballRadius, color);
}

std::uint64_t SimManager::addBall(double x, double y, double vx, double vy, double radius,
                                  const Components::Color& color) {
    BallState ball;
    ball.x = x;
    ball.y = y;
    ball.vx = vx;
    ball.vy = vy;
    ball.radius = radius;
    ball.color = color;
    return createBall(nextBallId++, ball);
}

std::uint64_t SimManager::createBall(std::uint64_t id, const BallState& ball) {
    auto entity = registry.create();
    registry.emplace<Components::BallId>(entity, id);
    registry.emplace<Components::Position>(entity, ball.x, ball.y);
    registry.emplace<Components::Velocity>(entity, ball.vx, ball.vy);
    registry.emplace<Components::Radius>(entity, ball.radius);
    registry.emplace<Components::Color>(entity, ball.color);
    if (!ball.active) {
        registry.emplace<Components::Inactive>(entity);
    }
    return id;
}

void SimManager::update(double dt) {
    PROFILE_SCOPE("SimManager::update");
    if (!(dt >= 0.0)) {
        return;
    }

    t += dt;
    spawnTimer += dt;
    if (spawnTimer >= config.spawnInterval && getBallCount() < config.maxBalls) {
        spawnTimer = 0.0;
        spawnRandomBall();
    }

    for (auto& system : integrationSystems) {
        system->update(registry, dt);
    }
    routingSystem->update(registry, dt);
    for (auto& system : resolutionSystems) {
        system->update(registry, dt);
    }

    std::size_t const removed = cleanup();
    for (std::size_t i = 0; i < removed; ++i) {
        if (getBallCount() < config.maxBalls) {
            spawnRandomBall();
        }
    }
}

std::size_t SimManager::cleanup() {
    auto view = registry.view<Components::Inactive>();
    std::vector<entt::entity> fallen(view.begin(), view.end());
    for (auto entity : fallen) {
        DEBUG_MSG(DEBUG_LEVEL_BASIC, "[SimManager] ball " << registry.get<Components::BallId>(entity).value
                                     << " left the canvas\n");
        registry.destroy(entity);
    }
    return fallen.size();
}

BallState SimManager::snapshotBall(entt::entity entity) const {
    BallState ball;
    const auto& pos = registry.get<Components::Position>(entity);
    const auto& vel = registry.get<Components::Velocity>(entity);
    ball.id = registry.get<Components::BallId>(entity).value;
    ball.x = pos.x;
    ball.y = pos.y;
    ball.vx = vel.x;
    ball.vy = vel.y;
    ball.radius = registry.get<Components::Radius>(entity).value;
    ball.color = registry.get<Components::Color>(entity);
    ball.active = !registry.all_of<Components::Inactive>(entity);
    return ball;
}

std::vector<BallState> SimManager::getBalls() const {
    std::vector<BallState> balls;
    for (auto entity : Systems::activeBallsInOrder(registry)) {
        balls.push_back(snapshotBall(entity));
    }
    return balls;
}

std::size_t SimManager::getBallCount() const {
    auto view = registry.view<const Components::BallId>(entt::exclude<Components::Inactive>);
    std::size_t count = 0;
    for ([[maybe_unused]] auto entity : view) {
        ++count;
    }
    return count;
}

std::optional<BallState> SimManager::findBall(std::uint64_t id) const {
    for (auto entity : Systems::allBallsInOrder(registry)) {
        if (registry.get<Components::BallId>(entity).value == id) {
            return snapshotBall(entity);
        }
    }
    return std::nullopt;
}

void SimManager::draw(Canvas& canvas) const {
    PROFILE_SCOPE("SimManager::draw");

    canvas.clear(Components::Color(16, 18, 24));

    const Components::Color panel(26, 29, 38);
    const Components::Color border(60, 66, 84);
    const Components::Color label(140, 146, 170);

    for (const auto& chamber : chambers) {
        const Layout::Viewport& vp = chamber.getViewport();
        canvas.fillRect(vp.x, vp.y, vp.w, vp.h, panel, 255);
        canvas.pushClip(vp.x, vp.y, vp.w, vp.h);
        chamber.draw(canvas);
        canvas.popClip();
        canvas.strokeRect(vp.x, vp.y, vp.w, vp.h, border, 255, 1.0);
        canvas.drawText(vp.x + 6.0, vp.y + 4.0, chamber.getName(), 12, label, 180);
    }

    for (auto entity : Systems::activeBallsInOrder(registry)) {
        const auto& pos = registry.get<Components::Position>(entity);
        double const r = registry.get<Components::Radius>(entity).value;
        Components::Color color = registry.get<Components::Color>(entity);
        if (const auto* possession = registry.try_get<Components::Possession>(entity)) {
            color = possession->colorOverride;
        }

        canvas.fillCircle(pos.x + 2.0, pos.y + 3.0, r, Components::Color(0, 0, 0), 70);
        canvas.fillCircle(pos.x, pos.y, r, color, 255);
        canvas.fillCircle(pos.x - r * 0.3, pos.y - r * 0.3, r * 0.35, Components::Color(255, 255, 255), 90);
        canvas.strokeCircle(pos.x, pos.y, r, Components::Color(255, 255, 255), 60, 1.0);
    }
}

nlohmann::json SimManager::saveState() const {
    nlohmann::json balls = nlohmann::json::array();
    for (auto entity : Systems::allBallsInOrder(registry)) {
        BallState const b = snapshotBall(entity);
        balls.push_back({
            {"id", b.id},
            {"x", b.x}, {"y", b.y},
            {"vx", b.vx}, {"vy", b.vy},
            {"radius", b.radius},
            {"color", StateIO::writeColor(b.color)},
            {"active", b.active}
        });
    }

    nlohmann::json chamberStates = nlohmann::json::array();
    for (const auto& chamber : chambers) {
        chamberStates.push_back({
            {"name", chamber.getName()},
            {"viewport", Layout::toJson(chamber.getViewport())},
            {"state", chamber.saveState()}
        });
    }

    return {
        {"t", t},
        {"w", width},
        {"h", height},
        {"balls", std::move(balls)},
        {"next_ball_id", nextBallId},
        {"spawn_timer", spawnTimer},
        {"chamber_order", chamberOrder},
        {"cols", cols},
        {"rows", rows},
        {"chamber_states", std::move(chamberStates)}
    };
}

void SimManager::loadState(const nlohmann::json& state) {
    if (!state.is_object()) {
        std::cerr << "[SimManager] Ignoring snapshot: not a JSON object\n";
        return;
    }

    t = StateIO::readDouble(state, "t", t);
    width = StateIO::readDouble(state, "w", width);
    height = StateIO::readDouble(state, "h", height);
    spawnTimer = StateIO::readDouble(state, "spawn_timer", spawnTimer);
    nextBallId = std::max<std::uint64_t>(1, StateIO::readUInt(state, "next_ball_id", nextBallId));

    Layout::GridShape const savedShape{StateIO::readInt(state, "cols", cols),
                                       StateIO::readInt(state, "rows", rows)};

    std::optional<std::vector<std::string>> savedOrder;
    if (const nlohmann::json* order = StateIO::findArray(state, "chamber_order")) {
        savedOrder.emplace();
        for (const auto& name : *order) {
            if (name.is_string()) {
                savedOrder->push_back(name.get<std::string>());
            }
        }
    }

    // A different saved order means a different chamber list; rebuild it
    // verbatim so routing order and blobs line up with the saved run.
    if (savedOrder && (chambers.empty() || *savedOrder != chamberOrder)) {
        chamberOrder = *savedOrder;
        loadChambers(chamberOrder);
        cols = savedShape.cols;
        rows = savedShape.rows;
        layoutChambers(true);
        restoreChambers(state, true);
    } else if (!chambers.empty()) {
        if (Layout::fitsCount(savedShape, chambers.size())) {
            cols = savedShape.cols;
            rows = savedShape.rows;
        }
        restoreChambers(state, false);
    }

    updateSystemConfigs();

    if (const nlohmann::json* balls = StateIO::findArray(state, "balls")) {
        restoreBalls(*balls);
    }

    std::cout << "[SimManager] Restored " << chambers.size() << " chambers and "
              << getBallCount() << " balls at t=" << t << "\n";
}

void SimManager::restoreChambers(const nlohmann::json& state, bool rebuilt) {
    const nlohmann::json* blobs = StateIO::findArray(state, "chamber_states");
    std::size_t const blobCount = blobs ? blobs->size() : 0;
    std::vector<bool> used(blobCount, false);

    auto matches = [&](std::size_t j, const std::string& name) {
        const nlohmann::json& blob = (*blobs)[j];
        return !used[j] && blob.is_object() && StateIO::readString(blob, "name", name) == name;
    };

    std::vector<std::size_t> failed;

    for (std::size_t i = 0; i < chambers.size(); ++i) {
        auto& chamber = chambers[i];
        std::string const name = chamber.getName();

        const nlohmann::json* blob = nullptr;
        if (i < blobCount && matches(i, name)) {
            blob = &(*blobs)[i];
            used[i] = true;
        } else {
            for (std::size_t j = 0; j < blobCount; ++j) {
                if (matches(j, name)) {
                    blob = &(*blobs)[j];
                    used[j] = true;
                    break;
                }
            }
        }

        const nlohmann::json* saved = nullptr;
        Layout::Viewport const previous = chamber.getViewport();
        if (blob) {
            if (const nlohmann::json* vp = StateIO::findObject(*blob, "viewport")) {
                chamber.setViewport(Layout::viewportFromJson(*vp, chamber.getViewport()));
            }
            saved = StateIO::findObject(*blob, "state");
        }

        try {
            if (saved) {
                chamber.resize();
                chamber.loadState(*saved);
            } else if (rebuilt || !(chamber.getViewport() == previous)) {
                // No saved geometry, and none that fits the current viewport.
                std::cerr << "[SimManager] No saved state for chamber " << name << ", regenerating\n";
                chamber.init(rng);
            }
        } catch (const std::exception& e) {
            std::cerr << "[SimManager] Failed to restore chamber " << name << ": " << e.what() << "\n";
            failed.push_back(i);
        }
    }

    if (failed.empty()) {
        return;
    }
    for (auto it = failed.rbegin(); it != failed.rend(); ++it) {
        chambers.erase(chambers.begin() + static_cast<std::ptrdiff_t>(*it));
    }

    // Owner indices shifted with the erase.
    registry.clear<Components::Possession>();

    // Survivors retile the canvas and regenerate for their new size.
    layoutChambers(false);
    initChambers();
}

void SimManager::restoreBalls(const nlohmann::json& list) {
    registry.clear();

    struct Pending {
        std::uint64_t id;
        BallState ball;
    };
    std::vector<Pending> pending;
    std::set<std::uint64_t> seen;
    std::uint64_t maxId = 0;

    for (const auto& entry : list) {
        if (!entry.is_object()) {
            continue;
        }
        BallState ball;
        ball.x = StateIO::readDouble(entry, "x", 0.0);
        ball.y = StateIO::readDouble(entry, "y", 0.0);
        ball.vx = StateIO::readDouble(entry, "vx", 0.0);
        ball.vy = StateIO::readDouble(entry, "vy", 0.0);
        ball.radius = StateIO::readDouble(entry, "radius", config.ballRadius);
        if (!(ball.radius > 0.0)) {
            ball.radius = config.ballRadius;
        }
        ball.color = StateIO::readColor(entry, "color", BallPalette[0]);
        ball.active = StateIO::readBool(entry, "active", true);

        // Ids that are missing or repeated get fresh ones below.
        std::uint64_t id = StateIO::readUInt(entry, "id", 0);
        if (id == 0 || !seen.insert(id).second) {
            id = 0;
        }
        maxId = std::max(maxId, id);
        pending.push_back({id, ball});
    }

    nextBallId = std::max(nextBallId, maxId + 1);
    for (auto& p : pending) {
        createBall(p.id != 0 ? p.id : nextBallId++, p.ball);
    }
}
