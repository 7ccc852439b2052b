#include <gtest/gtest.h>
#include <cmath>
#include <random>
#include <stdexcept>
#include <vector>

#include "contraption/chambers/chamber.hpp"
#include "contraption/core/constants.hpp"

using namespace Chambers;

class ChamberTest : public ::testing::Test {
protected:
    entt::registry registry;
    std::mt19937 rng{1234};
    Layout::Viewport viewport{0.0, 0.0, 480.0, 270.0, 0};

    Chamber makeChamber(SimulatorConstants::ChamberType type) {
        Chamber chamber(type);
        chamber.setViewport(viewport);
        chamber.init(rng);
        return chamber;
    }

    void step(Chamber& chamber, std::vector<LocalBall>& balls, double dt) {
        BallAnnotations annotations(registry, 0);
        ChamberContext ctx{rng, annotations, 400.0, viewport, viewport.w, viewport.h};
        chamber.update(dt, balls, ctx);
    }

    static LocalBall ballAt(std::uint64_t id, double x, double y, double vx, double vy) {
        LocalBall ball;
        ball.id = id;
        ball.x = x;
        ball.y = y;
        ball.vx = vx;
        ball.vy = vy;
        ball.radius = 10.0;
        return ball;
    }

    // A ball on every 12px of the chamber, moving in a random direction.
    std::vector<LocalBall> scatterBalls() {
        std::vector<LocalBall> balls;
        std::uniform_real_distribution<double> speed(-300.0, 300.0);
        std::uint64_t id = 1;
        for (double y = 12.0; y < viewport.h; y += 12.0) {
            for (double x = 12.0; x < viewport.w; x += 12.0) {
                LocalBall ball;
                ball.id = id++;
                ball.x = x;
                ball.y = y;
                ball.vx = speed(rng);
                ball.vy = speed(rng);
                ball.radius = 10.0;
                balls.push_back(ball);
            }
        }
        return balls;
    }
};

TEST_F(ChamberTest, CreateByName) {
    auto pegs = Chamber::create("pegs");
    ASSERT_TRUE(pegs.has_value());
    EXPECT_EQ(pegs->getType(), SimulatorConstants::ChamberType::PEGS);
    EXPECT_EQ(pegs->getName(), "pegs");
    EXPECT_NE(pegs->as<PegsChamber>(), nullptr);
    EXPECT_EQ(pegs->as<BumperChamber>(), nullptr);

    EXPECT_FALSE(Chamber::create("black_hole").has_value());
    EXPECT_FALSE(Chamber::create("").has_value());
}

TEST_F(ChamberTest, EveryNameMapsBackToItsType) {
    auto all = SimulatorConstants::getAllChambers();
    EXPECT_EQ(all.size(), 16u);
    for (auto type : all) {
        auto chamber = Chamber::create(SimulatorConstants::getChamberName(type));
        ASSERT_TRUE(chamber.has_value());
        EXPECT_EQ(chamber->getType(), type);
    }
}

TEST_F(ChamberTest, InitRejectsEmptyViewport) {
    Chamber chamber(SimulatorConstants::ChamberType::FUNNEL);
    chamber.setViewport(Layout::Viewport{0.0, 0.0, 0.0, 270.0, 0});
    EXPECT_THROW(chamber.init(rng), std::invalid_argument);
}

TEST_F(ChamberTest, ScaleFollowsViewport) {
    viewport = Layout::Viewport{0.0, 0.0, 960.0, 270.0, 0};
    Chamber chamber = makeChamber(SimulatorConstants::ChamberType::PEGS);
    EXPECT_DOUBLE_EQ(chamber.getScale(), 1.0);

    viewport = Layout::Viewport{0.0, 0.0, 960.0, 540.0, 0};
    Chamber larger = makeChamber(SimulatorConstants::ChamberType::PEGS);
    EXPECT_DOUBLE_EQ(larger.getScale(), 2.0);
}

TEST_F(ChamberTest, PegsLeaveNoPenetration) {
    Chamber chamber = makeChamber(SimulatorConstants::ChamberType::PEGS);
    const auto& pegs = chamber.as<PegsChamber>()->getPegs();
    ASSERT_GE(pegs.size(), 1u);
    EXPECT_LE(pegs.size(), 25u);

    auto balls = scatterBalls();
    step(chamber, balls, 1.0 / 60.0);

    for (const auto& ball : balls) {
        for (const auto& peg : pegs) {
            double const dist = std::hypot(ball.x - peg.x, ball.y - peg.y);
            EXPECT_GE(dist, ball.radius + peg.radius - 1e-6);
        }
    }
}

TEST_F(ChamberTest, BumpersLeaveNoPenetrationAndFlash) {
    Chamber chamber = makeChamber(SimulatorConstants::ChamberType::BUMPER);
    const auto& bumpers = chamber.as<BumperChamber>()->getBumpers();
    ASSERT_GE(bumpers.size(), 1u);

    auto balls = scatterBalls();
    step(chamber, balls, 1.0 / 60.0);

    for (const auto& ball : balls) {
        for (const auto& bumper : bumpers) {
            double const dist = std::hypot(ball.x - bumper.x, ball.y - bumper.y);
            EXPECT_GE(dist, ball.radius + bumper.radius - 1e-6);
        }
    }
    // The scatter covers every bumper, so all of them were hit
    for (const auto& bumper : bumpers) {
        EXPECT_DOUBLE_EQ(bumper.hitTimer, BumperChamber::FlashTime);
    }
}

TEST_F(ChamberTest, BumperKicksHarderThanArrival) {
    Chamber chamber = makeChamber(SimulatorConstants::ChamberType::BUMPER);
    const Bumper bumper = chamber.as<BumperChamber>()->getBumpers().front();

    LocalBall ball;
    ball.id = 1;
    ball.radius = 10.0;
    ball.x = bumper.x;
    ball.y = bumper.y - bumper.radius - 5.0;
    ball.vy = 100.0;
    std::vector<LocalBall> balls{ball};
    step(chamber, balls, 1.0 / 60.0);

    EXPECT_DOUBLE_EQ(balls[0].vy, -200.0);
}

TEST_F(ChamberTest, FunnelLeavesNoPenetration) {
    Chamber chamber = makeChamber(SimulatorConstants::ChamberType::FUNNEL);
    const auto* funnel = chamber.as<FunnelChamber>();
    ASSERT_EQ(funnel->getWalls().size(), 4u);

    auto balls = scatterBalls();
    step(chamber, balls, 1.0 / 60.0);

    for (const auto& ball : balls) {
        for (const auto& wall : funnel->getWalls()) {
            SegmentProjection const proj = closestPointOnSegment(
                Vector(wall.x1, wall.y1), Vector(wall.x2, wall.y2), Vector(ball.x, ball.y));
            double const dist = (Vector(ball.x, ball.y) - proj.closest).length();
            EXPECT_GE(dist, ball.radius + funnel->getWallThickness() - 1e-6);
        }
    }
}

TEST_F(ChamberTest, TrampolineBounceIsClampedToMaxSpeed) {
    Chamber chamber = makeChamber(SimulatorConstants::ChamberType::TRAMPOLINE);
    const Pad pad = chamber.as<TrampolineChamber>()->getPads().front();

    LocalBall ball;
    ball.id = 1;
    ball.radius = 10.0;
    ball.x = pad.x + pad.w * 0.5;
    ball.y = pad.y - ball.radius + 5.0;
    ball.vy = 1000.0;
    std::vector<LocalBall> balls{ball};
    step(chamber, balls, 1.0 / 60.0);

    EXPECT_DOUBLE_EQ(balls[0].vy, -TrampolineChamber::MaxBounceSpeed);
    EXPECT_DOUBLE_EQ(balls[0].y, pad.y - ball.radius);
}

TEST_F(ChamberTest, TrampolineSlowLandingGetsMinimumLaunch) {
    Chamber chamber = makeChamber(SimulatorConstants::ChamberType::TRAMPOLINE);
    const Pad pad = chamber.as<TrampolineChamber>()->getPads().front();

    LocalBall ball;
    ball.id = 1;
    ball.radius = 10.0;
    ball.x = pad.x + pad.w * 0.5;
    ball.y = pad.y - ball.radius + 0.5;
    ball.vy = 60.0;
    std::vector<LocalBall> balls{ball};
    step(chamber, balls, 1.0 / 60.0);

    EXPECT_DOUBLE_EQ(balls[0].vy, -TrampolineChamber::MinLaunchSpeed);
}

TEST_F(ChamberTest, TrampolineIgnoresBallsRisingFromBelow) {
    Chamber chamber = makeChamber(SimulatorConstants::ChamberType::TRAMPOLINE);
    const Pad pad = chamber.as<TrampolineChamber>()->getPads().front();

    LocalBall ball;
    ball.id = 1;
    ball.radius = 10.0;
    ball.x = pad.x + pad.w * 0.5;
    ball.y = pad.y + pad.h + 5.0;
    ball.vy = -200.0;
    std::vector<LocalBall> balls{ball};
    step(chamber, balls, 1.0 / 60.0);

    EXPECT_DOUBLE_EQ(balls[0].vy, -200.0);
    EXPECT_DOUBLE_EQ(balls[0].y, ball.y);
}

TEST_F(ChamberTest, TeleporterRelocatesAndHonoursCooldown) {
    Chamber chamber = makeChamber(SimulatorConstants::ChamberType::TELEPORTER);
    chamber.loadState({
        {"portals", {
            {{"x", 100.0}, {"y", 100.0}, {"radius", 22.0}, {"target", 1}},
            {{"x", 350.0}, {"y", 150.0}, {"radius", 22.0}, {"target", 0}}
        }},
        {"cooldowns", nlohmann::json::object()}
    });
    const auto* teleporter = chamber.as<TeleporterChamber>();
    ASSERT_EQ(teleporter->getPortals().size(), 2u);

    LocalBall ball;
    ball.id = 7;
    ball.radius = 10.0;
    ball.x = 100.0;
    ball.y = 100.0;
    ball.vx = 100.0;
    std::vector<LocalBall> balls{ball};
    step(chamber, balls, 1.0 / 60.0);

    // Exit offset is partner radius + ball radius + 2, along the velocity
    EXPECT_DOUBLE_EQ(balls[0].x, 350.0 + 34.0);
    EXPECT_DOUBLE_EQ(balls[0].y, 150.0);
    EXPECT_DOUBLE_EQ(balls[0].vx, 100.0);
    EXPECT_DOUBLE_EQ(teleporter->getCooldown(7), TeleporterChamber::Cooldown);

    // Dropped straight into the partner while cooling down: nothing happens
    balls[0].x = 350.0;
    balls[0].y = 150.0;
    step(chamber, balls, 1.0 / 60.0);
    EXPECT_DOUBLE_EQ(balls[0].x, 350.0);
    EXPECT_DOUBLE_EQ(balls[0].y, 150.0);

    // Once the cooldown has run out the partner sends it back
    for (int i = 0; i < 5; ++i) {
        balls[0].x = 350.0;
        balls[0].y = 150.0;
        step(chamber, balls, 0.05);
        if (balls[0].x != 350.0) {
            break;
        }
    }
    EXPECT_DOUBLE_EQ(balls[0].x, 100.0 + 34.0);
    EXPECT_DOUBLE_EQ(balls[0].y, 100.0);
}

TEST_F(ChamberTest, TeleporterDropsRestingBallsBelowExit) {
    Chamber chamber = makeChamber(SimulatorConstants::ChamberType::TELEPORTER);
    chamber.loadState({
        {"portals", {
            {{"x", 100.0}, {"y", 100.0}, {"radius", 20.0}, {"target", 1}},
            {{"x", 300.0}, {"y", 100.0}, {"radius", 20.0}, {"target", 0}}
        }}
    });

    LocalBall ball;
    ball.id = 3;
    ball.radius = 10.0;
    ball.x = 100.0;
    ball.y = 100.0;
    std::vector<LocalBall> balls{ball};
    step(chamber, balls, 1.0 / 60.0);

    EXPECT_DOUBLE_EQ(balls[0].x, 300.0);
    EXPECT_DOUBLE_EQ(balls[0].y, 100.0 + 32.0);
}

TEST_F(ChamberTest, TeleporterPortalsArePairedAndApart) {
    Chamber chamber = makeChamber(SimulatorConstants::ChamberType::TELEPORTER);
    const auto& portals = chamber.as<TeleporterChamber>()->getPortals();
    ASSERT_GE(portals.size(), 2u);
    EXPECT_EQ(portals.size() % 2, 0u);

    for (std::size_t i = 0; i < portals.size(); ++i) {
        ASSERT_GE(portals[i].target, 0);
        EXPECT_EQ(portals[static_cast<std::size_t>(portals[i].target)].target, static_cast<int>(i));
        for (std::size_t j = i + 1; j < portals.size(); ++j) {
            double const dist = std::hypot(portals[i].x - portals[j].x, portals[i].y - portals[j].y);
            EXPECT_GE(dist, portals[i].radius * 4.0);
        }
    }
}

TEST_F(ChamberTest, AllChambersStayFinite) {
    for (auto type : SimulatorConstants::getAllChambers()) {
        Chamber chamber = makeChamber(type);
        auto balls = scatterBalls();

        for (int frame = 0; frame < 120; ++frame) {
            double const dt = 1.0 / 60.0;
            for (auto& ball : balls) {
                ball.vy += 400.0 * dt;
                ball.x += ball.vx * dt;
                ball.y += ball.vy * dt;
            }
            step(chamber, balls, dt);
        }

        for (const auto& ball : balls) {
            ASSERT_TRUE(std::isfinite(ball.x)) << chamber.getName();
            ASSERT_TRUE(std::isfinite(ball.y)) << chamber.getName();
            ASSERT_TRUE(std::isfinite(ball.vx)) << chamber.getName();
            ASSERT_TRUE(std::isfinite(ball.vy)) << chamber.getName();
        }
    }
}

TEST_F(ChamberTest, RestoreKeepsGeometry) {
    Chamber original = makeChamber(SimulatorConstants::ChamberType::STAIRS);
    nlohmann::json const saved = original.saveState();

    Chamber restored(SimulatorConstants::ChamberType::STAIRS);
    restored.setViewport(viewport);
    restored.resize();
    restored.loadState(saved);

    EXPECT_EQ(restored.saveState(), saved);
}

TEST_F(ChamberTest, MalformedStateKeepsCurrentValues) {
    Chamber chamber = makeChamber(SimulatorConstants::ChamberType::PEGS);
    nlohmann::json const before = chamber.saveState();

    chamber.loadState({{"pegs", "not a list"}, {"t", "soon"}});
    EXPECT_EQ(chamber.saveState(), before);

    chamber.loadState(nlohmann::json::array({1, 2, 3}));
    EXPECT_EQ(chamber.saveState(), before);
}

TEST_F(ChamberTest, SplitterOnlyBouncesBallsMovingIntoTheWall) {
    Chamber chamber = makeChamber(SimulatorConstants::ChamberType::SPLITTER);
    chamber.loadState({
        {"wedge", {
            {"top", {{"x", 240.0}, {"y", 50.0}}},
            {"left", {{"x", 140.0}, {"y", 150.0}}},
            {"right", {{"x", 340.0}, {"y", 150.0}}}
        }}
    });

    // 10px off the middle of the left wall, along its up-left normal
    double const offset = 10.0 / std::sqrt(2.0);
    std::vector<LocalBall> balls{
        ballAt(1, 190.0 - offset, 100.0 - offset, 0.0, 100.0),
        ballAt(2, 190.0 - offset, 100.0 - offset, -50.0, -50.0)
    };
    step(chamber, balls, 1.0 / 60.0);

    // Both are pushed out to radius + wall thickness
    double const expectedOffset = 15.0 / std::sqrt(2.0);
    for (const auto& ball : balls) {
        EXPECT_NEAR(ball.x, 190.0 - expectedOffset, 1e-9);
        EXPECT_NEAR(ball.y, 100.0 - expectedOffset, 1e-9);
    }

    // Falling into the wall: v -= 1.5 * dot(v, n) * n
    EXPECT_NEAR(balls[0].vx, -75.0, 1e-9);
    EXPECT_NEAR(balls[0].vy, 25.0, 1e-9);

    // Already leaving: velocity untouched
    EXPECT_DOUBLE_EQ(balls[1].vx, -50.0);
    EXPECT_DOUBLE_EQ(balls[1].vy, -50.0);
}

TEST_F(ChamberTest, SeesawAngleIsClamped) {
    Chamber chamber = makeChamber(SimulatorConstants::ChamberType::SEESAW);
    chamber.loadState({
        {"planks", {
            {{"cx", 240.0}, {"cy", 108.0}, {"length", 336.0}, {"angle", 0.39}, {"ang_vel", 100.0}},
            {{"cx", 240.0}, {"cy", 200.0}, {"length", 336.0}, {"angle", -0.39}, {"ang_vel", -100.0}}
        }}
    });
    std::vector<LocalBall> balls;
    step(chamber, balls, 1.0 / 60.0);

    const auto& planks = chamber.as<SeesawChamber>()->getPlanks();
    ASSERT_EQ(planks.size(), 2u);
    EXPECT_DOUBLE_EQ(planks[0].angle, SeesawChamber::MaxAngle);
    EXPECT_DOUBLE_EQ(planks[0].angularVelocity, 0.0);
    EXPECT_DOUBLE_EQ(planks[1].angle, -SeesawChamber::MaxAngle);
    EXPECT_DOUBLE_EQ(planks[1].angularVelocity, 0.0);
}

TEST_F(ChamberTest, SeesawTipsTowardsTheLoadedSide) {
    Chamber chamber = makeChamber(SimulatorConstants::ChamberType::SEESAW);
    const Plank plank = chamber.as<SeesawChamber>()->getPlanks().front();
    ASSERT_DOUBLE_EQ(plank.angle, 0.0);

    // Resting 2px into the top face, 100px right of the pivot
    std::vector<LocalBall> right{ballAt(1, plank.cx + 100.0, plank.cy - 16.0, 0.0, 50.0)};
    step(chamber, right, 1.0 / 60.0);
    EXPECT_NEAR(chamber.as<SeesawChamber>()->getPlanks().front().angularVelocity, 0.05, 1e-9);
    EXPECT_DOUBLE_EQ(right[0].y, plank.cy - 18.0);
    EXPECT_NEAR(right[0].vy, -25.0, 1e-9);

    Chamber other = makeChamber(SimulatorConstants::ChamberType::SEESAW);
    std::vector<LocalBall> left{ballAt(2, plank.cx - 100.0, plank.cy - 16.0, 0.0, 50.0)};
    step(other, left, 1.0 / 60.0);
    EXPECT_NEAR(other.as<SeesawChamber>()->getPlanks().front().angularVelocity, -0.05, 1e-9);
}

TEST_F(ChamberTest, SeesawPushesCentredBallOutOfTheTopFace) {
    Chamber chamber = makeChamber(SimulatorConstants::ChamberType::SEESAW);
    const Plank plank = chamber.as<SeesawChamber>()->getPlanks().front();

    std::vector<LocalBall> balls{ballAt(1, plank.cx + 100.0, plank.cy, 0.0, 50.0)};
    step(chamber, balls, 1.0 / 60.0);

    EXPECT_DOUBLE_EQ(balls[0].y, plank.cy - 18.0);
    EXPECT_NEAR(balls[0].vy, -25.0, 1e-9);
}

TEST_F(ChamberTest, TeslaCoilFiresOnlyWhenCharged) {
    Chamber chamber = makeChamber(SimulatorConstants::ChamberType::TESLA_COIL);
    chamber.loadState({
        {"coils", nlohmann::json::array({
            {{"x", 100.0}, {"y", 100.0}, {"radius", 15.0}, {"range", 80.0}, {"charge", 0.5}}
        })},
        {"zaps", nlohmann::json::array()}
    });
    const auto* tesla = chamber.as<TeslaCoilChamber>();

    std::vector<LocalBall> balls{ballAt(1, 150.0, 100.0, 0.0, 0.0)};
    step(chamber, balls, 0.1);
    EXPECT_DOUBLE_EQ(balls[0].vx, 0.0);
    EXPECT_NEAR(tesla->getCoils().front().charge, 0.58, 1e-12);
    EXPECT_TRUE(tesla->getZaps().empty());

    step(chamber, balls, 1.0);
    EXPECT_DOUBLE_EQ(balls[0].vx, 400.0);
    EXPECT_DOUBLE_EQ(balls[0].vy, 0.0);
    EXPECT_DOUBLE_EQ(tesla->getCoils().front().charge, 0.0);
    EXPECT_EQ(tesla->getZaps().size(), 1u);

    // Drained: the next frame does not fire again
    step(chamber, balls, 0.1);
    EXPECT_DOUBLE_EQ(balls[0].vx, 400.0);
}

TEST_F(ChamberTest, MagnetPullAndPushAreOpposite) {
    auto magnetChamber = [&](const char* polarity) {
        Chamber chamber = makeChamber(SimulatorConstants::ChamberType::MAGNET);
        chamber.loadState({
            {"magnets", nlohmann::json::array({
                {{"x", 240.0}, {"y", 135.0}, {"radius", 40.0}, {"force", 9e6}, {"type", polarity}}
            })}
        });
        return chamber;
    };

    Chamber pull = magnetChamber("pull");
    std::vector<LocalBall> pulled{ballAt(1, 340.0, 135.0, 0.0, 0.0)};
    step(pull, pulled, 0.01);

    Chamber push = magnetChamber("push");
    std::vector<LocalBall> pushed{ballAt(1, 340.0, 135.0, 0.0, 0.0)};
    step(push, pushed, 0.01);

    // 9e6 / 100^2 = 900 px/s^2 for 0.01 s
    EXPECT_NEAR(pulled[0].vx, -9.0, 1e-9);
    EXPECT_NEAR(pushed[0].vx, 9.0, 1e-9);
    EXPECT_DOUBLE_EQ(pulled[0].vy, 0.0);
}

TEST_F(ChamberTest, MagnetForceIsClampedInsideTheCore) {
    Chamber chamber = makeChamber(SimulatorConstants::ChamberType::MAGNET);
    chamber.loadState({
        {"magnets", nlohmann::json::array({
            {{"x", 240.0}, {"y", 135.0}, {"radius", 40.0}, {"force", 9e6}, {"type", "pull"}}
        })}
    });

    // 20px and 30px from the centre, both well inside the 40px core
    std::vector<LocalBall> balls{
        ballAt(1, 260.0, 135.0, 0.0, 0.0),
        ballAt(2, 210.0, 135.0, 0.0, 0.0)
    };
    step(chamber, balls, 0.01);

    // Same clamped pull (9e6 / 40^2 * 0.01 = 56.25), then a 1.5 core bounce
    EXPECT_NEAR(balls[0].vx, 28.125, 1e-9);
    EXPECT_NEAR(balls[1].vx, -28.125, 1e-9);
    EXPECT_DOUBLE_EQ(balls[0].x, 290.0);
    EXPECT_DOUBLE_EQ(balls[1].x, 190.0);
}

TEST_F(ChamberTest, ConveyorCarriesLandingBalls) {
    Chamber chamber = makeChamber(SimulatorConstants::ChamberType::CONVEYOR);
    const Belt belt = chamber.as<ConveyorChamber>()->getBelts().front();
    ASSERT_GT(belt.speed, 0.0);

    double const dt = 1.0 / 60.0;
    double const mid = belt.x + belt.w * 0.5;
    std::vector<LocalBall> balls{
        ballAt(1, mid, belt.y - 7.0, 0.0, 100.0),
        ballAt(2, mid, belt.y - 7.0, 300.0, 100.0),
        ballAt(3, mid, belt.y - 60.0, 0.0, 100.0)
    };
    step(chamber, balls, dt);

    double const blend = 1.0 - std::exp(-5.0 * dt);
    EXPECT_DOUBLE_EQ(balls[0].vy, 0.0);
    EXPECT_DOUBLE_EQ(balls[0].y, belt.y - 10.0);
    EXPECT_NEAR(balls[0].vx, belt.speed * blend, 1e-9);

    // Faster than the belt: slowed towards it
    EXPECT_NEAR(balls[1].vx, 300.0 * (1.0 - blend) + belt.speed * blend, 1e-9);
    EXPECT_LT(balls[1].vx, 300.0);
    EXPECT_GT(balls[1].vx, belt.speed);

    // Still in the air
    EXPECT_DOUBLE_EQ(balls[2].vx, 0.0);
    EXPECT_DOUBLE_EQ(balls[2].vy, 100.0);
}

TEST_F(ChamberTest, WindOnlyBlowsInsideItsBands) {
    Chamber chamber = makeChamber(SimulatorConstants::ChamberType::WIND_TUNNEL);
    const auto& bands = chamber.as<WindTunnelChamber>()->getBands();
    ASSERT_EQ(bands.size(), 2u);

    double const dt = 0.01;
    double const x = viewport.w * 0.5;
    std::vector<LocalBall> balls{
        ballAt(1, x, bands[0].y + bands[0].h * 0.5, 0.0, 0.0),
        ballAt(2, x, bands[1].y + bands[1].h * 0.5, 0.0, 0.0),
        ballAt(3, x, (bands[0].y + bands[0].h + bands[1].y) * 0.5, 0.0, 0.0)
    };
    step(chamber, balls, dt);

    EXPECT_NEAR(balls[0].vx, bands[0].force * dt, 1e-9);
    EXPECT_NEAR(balls[1].vx, -bands[1].force * dt, 1e-9);
    EXPECT_DOUBLE_EQ(balls[2].vx, 0.0);
}

TEST_F(ChamberTest, AcceleratorPushesOnlyInsideBoosters) {
    Chamber chamber = makeChamber(SimulatorConstants::ChamberType::ACCELERATOR);
    const auto& boosters = chamber.as<AcceleratorChamber>()->getBoosters();
    ASSERT_GE(boosters.size(), 1u);
    const Booster booster = boosters.front();

    double const dt = 0.01;
    std::vector<LocalBall> balls{
        ballAt(1, booster.x + booster.w * 0.5, booster.y + booster.h * 0.5, 0.0, 0.0),
        ballAt(2, 5.0, 5.0, 0.0, 0.0)
    };
    balls[1].radius = 2.0;
    step(chamber, balls, dt);

    EXPECT_NEAR(balls[0].vx, booster.dirX * booster.force * 5.0 * dt, 1e-9);
    EXPECT_NEAR(balls[0].vy, booster.dirY * booster.force * 5.0 * dt, 1e-9);
    EXPECT_DOUBLE_EQ(balls[1].vx, 0.0);
    EXPECT_DOUBLE_EQ(balls[1].vy, 0.0);
}

TEST_F(ChamberTest, AntigravityLiftsOnlyInsideZones) {
    Chamber chamber = makeChamber(SimulatorConstants::ChamberType::ANTIGRAVITY);
    chamber.loadState({
        {"zones", nlohmann::json::array({
            {{"x", 100.0}, {"y", 50.0}, {"w", 200.0}, {"h", 80.0}, {"force", -600.0}}
        })}
    });

    double const dt = 0.01;
    std::vector<LocalBall> balls{
        ballAt(1, 200.0, 90.0, 0.0, 50.0),
        ballAt(2, 200.0, 90.0, 0.0, 300.0),
        ballAt(3, 200.0, 200.0, 0.0, 50.0)
    };
    step(chamber, balls, dt);

    EXPECT_NEAR(balls[0].vy, 44.0, 1e-9);
    EXPECT_LE(std::abs(balls[0].vx), 20.0 * dt + 1e-12);

    // Fast fallers are also damped
    EXPECT_NEAR(balls[1].vy, 294.0 * 0.9, 1e-9);

    EXPECT_DOUBLE_EQ(balls[2].vy, 50.0);
    EXPECT_DOUBLE_EQ(balls[2].vx, 0.0);
}

TEST_F(ChamberTest, StairsBoostersBounceHarder) {
    Chamber chamber = makeChamber(SimulatorConstants::ChamberType::STAIRS);
    chamber.loadState({
        {"dir", 1},
        {"steps", {
            {{"x", 50.0}, {"y", 100.0}, {"w", 100.0}, {"h", 12.0}, {"is_booster", false}, {"move_type", 1}},
            {{"x", 250.0}, {"y", 100.0}, {"w", 100.0}, {"h", 12.0}, {"is_booster", true}, {"move_type", 1}}
        }}
    });

    std::vector<LocalBall> balls{
        ballAt(1, 100.0, 95.0, 0.0, 200.0),
        ballAt(2, 300.0, 95.0, 0.0, 200.0)
    };
    step(chamber, balls, 1.0 / 60.0);

    EXPECT_DOUBLE_EQ(balls[0].vy, -200.0 * 0.8);
    EXPECT_DOUBLE_EQ(balls[1].vy, -200.0 * 1.8);
    for (const auto& ball : balls) {
        EXPECT_DOUBLE_EQ(ball.y, 90.0);
        // The nudge alone is below the minimum roll speed
        EXPECT_DOUBLE_EQ(ball.vx, 30.0);
    }
}

TEST_F(ChamberTest, MixerKickFollowsSpinDirection) {
    auto mixerChamber = [&](double speed) {
        Chamber chamber = makeChamber(SimulatorConstants::ChamberType::MIXER);
        chamber.loadState({
            {"t", 0.0},
            {"blades", nlohmann::json::array({
                {{"cx", 240.0}, {"cy", 135.0}, {"length", 60.0}, {"speed", speed}}
            })}
        });
        return chamber;
    };

    // A short step keeps the blade level; the ball sits 15px above it
    double const dt = 1e-6;
    Chamber clockwise = mixerChamber(3.0);
    std::vector<LocalBall> a{ballAt(1, 280.0, 120.0, 0.0, 0.0)};
    step(clockwise, a, dt);

    Chamber counter = mixerChamber(-3.0);
    std::vector<LocalBall> b{ballAt(1, 280.0, 120.0, 0.0, 0.0)};
    step(counter, b, dt);

    // Normal kick of 50 upwards plus half the tip speed (3 * 100) along the spin
    EXPECT_NEAR(a[0].vy, -50.0 + 150.0, 1e-3);
    EXPECT_NEAR(b[0].vy, -50.0 - 150.0, 1e-3);
    EXPECT_NEAR(a[0].vx, 0.0, 1e-3);
    EXPECT_NEAR(b[0].vx, 0.0, 1e-3);
    EXPECT_NEAR(a[0].y, 135.0 - 18.0, 1e-3);
}
