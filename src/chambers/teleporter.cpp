#include "contraption/chambers/teleporter.hpp"
#include "contraption/core/canvas.hpp"
#include "contraption/core/debug.hpp"
#include "contraption/core/profile.hpp"
#include "contraption/core/state_io.hpp"

#include <cmath>
#include <exception>
#include <iostream>
#include <string>

namespace Chambers {

namespace {
    constexpr int MinPairs = 2;
    constexpr int MaxPairs = 3;
    constexpr int AttemptsPerPair = 100;
    constexpr double PortalRadius = 22.0;
    constexpr double EdgeMargin = 15.0;
    constexpr double ExitGap = 2.0;
    constexpr double RestSpeed = 0.1;

    const Components::Color PairColors[] = {
        {255, 100, 100},
        {100, 255, 100},
        {100, 100, 255},
        {255, 255, 100}
    };
}

void TeleporterChamber::init(double w, double h, std::mt19937& rng) {
    resize(w, h);
    t = 0.0;
    portals.clear();
    cooldowns.clear();

    int const pairs = randomInt(rng, MinPairs, MaxPairs);
    double const radius = PortalRadius * scale;
    double const margin = EdgeMargin * scale;
    double const minSeparation = radius * 4.0;

    auto farFromAll = [&](double x, double y) {
        for (const auto& p : portals) {
            double const dx = x - p.x;
            double const dy = y - p.y;
            if (dx * dx + dy * dy < minSeparation * minSeparation) {
                return false;
            }
        }
        return true;
    };

    for (int i = 0; i < pairs; ++i) {
        Components::Color const color = PairColors[i % 4];
        for (int attempt = 0; attempt < AttemptsPerPair; ++attempt) {
            double const x1 = randomRange(rng, radius + margin, w - radius - margin);
            double const y1 = randomRange(rng, h * 0.1, h * 0.9);
            double const x2 = randomRange(rng, radius + margin, w - radius - margin);
            double const y2 = randomRange(rng, h * 0.1, h * 0.9);

            double const dx = x1 - x2;
            double const dy = y1 - y2;
            if (dx * dx + dy * dy < minSeparation * minSeparation) {
                continue;
            }
            if (!farFromAll(x1, y1) || !farFromAll(x2, y2)) {
                continue;
            }

            int const first = static_cast<int>(portals.size());
            portals.push_back(Portal{x1, y1, radius, first + 1, color});
            portals.push_back(Portal{x2, y2, radius, first, color});
            break;
        }
    }
}

double TeleporterChamber::getCooldown(std::uint64_t ballId) const {
    auto it = cooldowns.find(ballId);
    return it == cooldowns.end() ? 0.0 : it->second;
}

void TeleporterChamber::update(double dt, std::vector<LocalBall>& balls, ChamberContext& /*ctx*/) {
    PROFILE_SCOPE("TeleporterChamber");
    t += dt;

    for (auto it = cooldowns.begin(); it != cooldowns.end();) {
        it->second -= dt;
        if (it->second <= 0.0) {
            it = cooldowns.erase(it);
        } else {
            ++it;
        }
    }

    for (auto& ball : balls) {
        if (!ball.active || cooldowns.count(ball.id) > 0) {
            continue;
        }

        for (const auto& portal : portals) {
            double const dx = ball.x - portal.x;
            double const dy = ball.y - portal.y;
            if (dx * dx + dy * dy >= portal.radius * portal.radius) {
                continue;
            }
            if (portal.target < 0 || portal.target >= static_cast<int>(portals.size())) {
                continue;
            }

            const Portal& exit = portals[static_cast<std::size_t>(portal.target)];
            double const offset = exit.radius + ball.radius + ExitGap * scale;
            double const speed = std::sqrt(ball.vx * ball.vx + ball.vy * ball.vy);

            if (speed > RestSpeed) {
                ball.x = exit.x + (ball.vx / speed) * offset;
                ball.y = exit.y + (ball.vy / speed) * offset;
            } else {
                ball.x = exit.x;
                ball.y = exit.y + offset;
            }

            cooldowns[ball.id] = Cooldown;
            DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "[Teleporter] ball " << ball.id << " -> portal "
                                           << portal.target << "\n");
            break;
        }
    }
}

void TeleporterChamber::draw(Canvas& canvas, const Layout::Viewport& vp) const {
    for (const auto& portal : portals) {
        double const pulse = 0.5 + 0.5 * std::sin(t * 4.0);
        canvas.fillCircle(vp.x + portal.x, vp.y + portal.y, portal.radius, portal.color, 60);
        canvas.strokeCircle(vp.x + portal.x, vp.y + portal.y, portal.radius, portal.color,
                            static_cast<uint8_t>(150 + 100 * pulse), 3.0);
        canvas.strokeCircle(vp.x + portal.x, vp.y + portal.y, portal.radius * (0.4 + 0.3 * pulse),
                            portal.color, 120, 1.0);
    }
}

nlohmann::json TeleporterChamber::saveState() const {
    nlohmann::json state = saveCommon();
    nlohmann::json list = nlohmann::json::array();
    for (const auto& portal : portals) {
        list.push_back({{"x", portal.x}, {"y", portal.y}, {"radius", portal.radius},
                        {"target", portal.target}, {"color", StateIO::writeColor(portal.color)}});
    }
    state["portals"] = std::move(list);

    nlohmann::json cd = nlohmann::json::object();
    for (const auto& [id, remaining] : cooldowns) {
        cd[std::to_string(id)] = remaining;
    }
    state["cooldowns"] = std::move(cd);
    return state;
}

void TeleporterChamber::loadState(const nlohmann::json& state) {
    loadCommon(state);
    double const defaultRadius = PortalRadius * scale;
    StateIO::readList(state, "portals", portals, [&](const nlohmann::json& j) {
        return Portal{StateIO::readDouble(j, "x", 0.0), StateIO::readDouble(j, "y", 0.0),
                      StateIO::readDouble(j, "radius", defaultRadius), StateIO::readInt(j, "target", -1),
                      StateIO::readColor(j, "color", PairColors[0])};
    });

    if (const nlohmann::json* cd = StateIO::findObject(state, "cooldowns")) {
        cooldowns.clear();
        for (auto it = cd->begin(); it != cd->end(); ++it) {
            if (!it.value().is_number()) {
                continue;
            }
            try {
                cooldowns[std::stoull(it.key())] = it.value().get<double>();
            } catch (const std::exception& e) {
                std::cerr << "[Teleporter] Ignoring cooldown for malformed ball id '" << it.key()
                          << "': " << e.what() << "\n";
            }
        }
    }
}

} // namespace Chambers
