#include <gtest/gtest.h>
#include <random>
#include <vector>

#include "contraption/chambers/chamber.hpp"
#include "contraption/components/basic.hpp"

using namespace Chambers;

class PongTest : public ::testing::Test {
protected:
    entt::registry registry;
    std::mt19937 rng{99};
    Layout::Viewport viewport{0.0, 0.0, 480.0, 270.0, 3};
    std::size_t owner = 3;
    Chamber chamber{SimulatorConstants::ChamberType::PONG};

    void SetUp() override {
        chamber.setViewport(viewport);
        chamber.init(rng);
    }

    LocalBall makeBall(std::uint64_t id, double x, double y, double vx, double vy) {
        LocalBall ball;
        ball.entity = registry.create();
        registry.emplace<Components::BallId>(ball.entity, id);
        ball.id = id;
        ball.x = x;
        ball.y = y;
        ball.vx = vx;
        ball.vy = vy;
        ball.radius = 10.0;
        return ball;
    }

    void step(std::vector<LocalBall>& balls, double dt = 1.0 / 60.0) {
        BallAnnotations annotations(registry, owner);
        ChamberContext ctx{rng, annotations, 400.0, viewport, 1920.0, 1080.0};
        chamber.update(dt, balls, ctx);
    }

    const PongChamber& pong() const { return *chamber.as<PongChamber>(); }
};

TEST_F(PongTest, TracksBallClosestToCentre) {
    std::vector<LocalBall> balls{
        makeBall(1, 100.0, 60.0, 0.0, 0.0),
        makeBall(2, 235.0, 140.0, 0.0, 0.0),
    };
    step(balls);

    ASSERT_TRUE(pong().getTrackedBallId().has_value());
    EXPECT_EQ(*pong().getTrackedBallId(), 2u);

    const auto* possession = registry.try_get<Components::Possession>(balls[1].entity);
    ASSERT_NE(possession, nullptr);
    EXPECT_EQ(possession->owner, owner);
    EXPECT_EQ(possession->colorOverride, Components::Color(255, 255, 255));
    EXPECT_FALSE(registry.all_of<Components::Possession>(balls[0].entity));
}

TEST_F(PongTest, KeepsTrackingWhileBallStaysInside) {
    std::vector<LocalBall> balls{makeBall(5, 240.0, 135.0, 0.0, 0.0)};
    step(balls);
    ASSERT_EQ(pong().getTrackedBallId(), std::optional<std::uint64_t>(5));

    // A newcomer closer to the centre does not steal the tracking
    balls[0].x = 300.0;
    balls.push_back(makeBall(6, 240.0, 135.0, 0.0, 0.0));
    step(balls);
    EXPECT_EQ(pong().getTrackedBallId(), std::optional<std::uint64_t>(5));
    EXPECT_TRUE(registry.all_of<Components::Possession>(balls[0].entity));
    EXPECT_FALSE(registry.all_of<Components::Possession>(balls[1].entity));
}

TEST_F(PongTest, ReleasesPossessionWhenBallLeaves) {
    std::vector<LocalBall> balls{makeBall(1, 240.0, 135.0, 0.0, 0.0)};
    step(balls);
    entt::entity const entity = balls[0].entity;
    ASSERT_TRUE(registry.all_of<Components::Possession>(entity));

    // Next frame the ball is no longer routed to this chamber
    std::vector<LocalBall> empty;
    step(empty);
    EXPECT_FALSE(registry.all_of<Components::Possession>(entity));
    EXPECT_FALSE(pong().getTrackedBallId().has_value());
}

TEST_F(PongTest, LeavesOtherOwnersClaimsAlone) {
    std::vector<LocalBall> balls{makeBall(1, 240.0, 135.0, 0.0, 0.0)};
    LocalBall other = makeBall(2, 10.0, 10.0, 0.0, 0.0);
    registry.emplace<Components::Possession>(other.entity, std::size_t{7}, Components::Color(1, 2, 3));

    step(balls);
    std::vector<LocalBall> empty;
    step(empty);

    ASSERT_TRUE(registry.all_of<Components::Possession>(other.entity));
    EXPECT_EQ(registry.get<Components::Possession>(other.entity).owner, 7u);
}

TEST_F(PongTest, CancelsGravityOnTrackedBall) {
    double const dt = 1.0 / 60.0;
    // Velocity and position as gravity and movement left them this frame
    std::vector<LocalBall> balls{makeBall(1, 240.0, 135.0 + 400.0 * dt * dt, 0.0, 400.0 * dt)};
    step(balls, dt);

    EXPECT_NEAR(balls[0].vy, 0.0, 1e-9);
    EXPECT_NEAR(balls[0].y, 135.0, 1e-9);
}

TEST_F(PongTest, PaddleSendsBallBack) {
    const Paddle left = pong().getLeftPaddle();
    double const dt = 1.0 / 60.0;
    double const faceX = left.x + left.w;
    double const centreY = left.y + left.h * 0.5;

    // Crossing the face this frame, level with the paddle centre
    std::vector<LocalBall> balls{makeBall(1, faceX + 5.0, centreY, -600.0, 0.0)};
    // Tracking this ball moves the paddle; a second ball at the centre takes the tracking instead
    balls.push_back(makeBall(2, 240.0, 135.0, 0.0, 0.0));
    step(balls, dt);

    EXPECT_GT(balls[0].vx, 0.0);
    EXPECT_GE(balls[0].vx, 600.0 * PongChamber::PaddleSpeedUp - 1e-9);
    EXPECT_GE(balls[0].x, faceX + balls[0].radius);
}

TEST_F(PongTest, ScoringServesFromCentre) {
    std::vector<LocalBall> balls{makeBall(1, 240.0, 135.0, 0.0, 0.0)};
    step(balls);
    ASSERT_EQ(pong().getTrackedBallId(), std::optional<std::uint64_t>(1));

    // Past the left paddle, at the goal line and level with nothing
    balls[0].x = 10.0;
    balls[0].y = 5.0;
    balls[0].vx = -200.0;
    balls[0].vy = 0.0;
    step(balls);

    EXPECT_EQ(pong().getScoreRight(), 1);
    EXPECT_EQ(pong().getScoreLeft(), 0);
    EXPECT_DOUBLE_EQ(balls[0].x, 240.0);
    EXPECT_DOUBLE_EQ(balls[0].y, 135.0);
}

TEST_F(PongTest, StateRoundTripsTrackingAndScores) {
    std::vector<LocalBall> balls{makeBall(9, 240.0, 135.0, 0.0, 0.0)};
    step(balls);

    nlohmann::json state = chamber.saveState();
    state["score_left"] = 4;
    state["score_right"] = 2;

    Chamber restored(SimulatorConstants::ChamberType::PONG);
    restored.setViewport(viewport);
    restored.resize();
    restored.loadState(state);

    const auto* pongRestored = restored.as<PongChamber>();
    EXPECT_EQ(pongRestored->getTrackedBallId(), std::optional<std::uint64_t>(9));
    EXPECT_EQ(pongRestored->getScoreLeft(), 4);
    EXPECT_EQ(pongRestored->getScoreRight(), 2);
    EXPECT_DOUBLE_EQ(pongRestored->getLeftPaddle().y, pong().getLeftPaddle().y);
    EXPECT_DOUBLE_EQ(pongRestored->getRightPaddle().x, pong().getRightPaddle().x);
}
