/**
 * @file pong.hpp
 * @brief Two AI paddles playing pong with whichever ball wanders in
 *
 * Every frame the chamber tracks one ball (the previous one while it stays
 * in the chamber, otherwise the ball closest to the centre). The tracked ball
 * is possessed: gravity is cancelled on it, it is drawn white, it bounces off
 * the chamber's top and bottom, and it is served again from the centre when
 * one side scores. Possession is dropped at the start of every update, so a
 * ball that leaves the chamber gets its normal behaviour back immediately.
 *
 * Paddles react only every 0.1-0.25 s and aim with a random error, so they
 * miss from time to time. All balls in the chamber collide with the paddles.
 */

#ifndef CONTRAPTION_CHAMBERS_PONG_HPP
#define CONTRAPTION_CHAMBERS_PONG_HPP

#include <cstdint>
#include <optional>
#include <vector>
#include "contraption/chambers/chamber_base.hpp"

namespace Chambers {

struct Paddle {
    double x = 0.0;
    double y = 0.0;
    double w = 0.0;
    double h = 0.0;
    double speed = 0.0;          ///< px/s
    double targetY = 0.0;        ///< Top edge the AI is steering towards
    double reactionTimer = 0.0;  ///< Time until the AI looks at the ball again
    Components::Color color;
};

class PongChamber : public ChamberBase {
public:
    static constexpr double MinBallSpeedX = 300.0;
    static constexpr double MaxBallSpeed = 1000.0;
    static constexpr double SpinSpeed = 400.0;
    static constexpr double PaddleSpeedUp = 1.05;

    void init(double w, double h, std::mt19937& rng);
    void update(double dt, std::vector<LocalBall>& balls, ChamberContext& ctx);
    void draw(Canvas& canvas, const Layout::Viewport& vp) const;
    nlohmann::json saveState() const;
    void loadState(const nlohmann::json& state);

    const Paddle& getLeftPaddle() const { return left; }
    const Paddle& getRightPaddle() const { return right; }
    std::optional<std::uint64_t> getTrackedBallId() const { return trackedBallId; }
    int getScoreLeft() const { return scoreLeft; }
    int getScoreRight() const { return scoreRight; }

private:
    Paddle left;
    Paddle right;
    std::optional<std::uint64_t> trackedBallId;
    int scoreLeft = 0;
    int scoreRight = 0;

    LocalBall* selectTarget(std::vector<LocalBall>& balls);
    void steerPaddle(Paddle& paddle, bool isLeft, const LocalBall* target, double dt, std::mt19937& rng);
    bool collidePaddle(LocalBall& ball, const Paddle& paddle, bool isLeft, double dt) const;
    void serve(LocalBall& ball, std::mt19937& rng) const;
};

} // namespace Chambers

#endif
