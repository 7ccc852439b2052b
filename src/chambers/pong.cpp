#include "contraption/chambers/pong.hpp"
#include "contraption/core/canvas.hpp"
#include "contraption/core/debug.hpp"
#include "contraption/core/profile.hpp"
#include "contraption/core/state_io.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

namespace Chambers {

namespace {
    constexpr double PaddleWidth = 15.0;
    constexpr double PaddleMargin = 20.0;
    constexpr double PaddleSpeed = 300.0;
    constexpr double MinReaction = 0.1;
    constexpr double ReactionSpread = 0.15;
    constexpr double AimError = 50.0;
    constexpr double WallBounce = 0.9;
    constexpr double GoalDepth = 5.0;
    constexpr double ServeSpeed = 300.0;
    constexpr double ServeSpread = 100.0;

    const Components::Color TrackedColor(255, 255, 255);

    nlohmann::json paddleToJson(const Paddle& p) {
        return {
            {"x", p.x}, {"y", p.y}, {"w", p.w}, {"h", p.h},
            {"speed", p.speed}, {"target_y", p.targetY}, {"reaction_timer", p.reactionTimer},
            {"color", StateIO::writeColor(p.color)}
        };
    }

    Paddle paddleFromJson(const nlohmann::json& j, const Paddle& fallback) {
        Paddle p;
        p.x = StateIO::readDouble(j, "x", fallback.x);
        p.y = StateIO::readDouble(j, "y", fallback.y);
        p.w = StateIO::readDouble(j, "w", fallback.w);
        p.h = StateIO::readDouble(j, "h", fallback.h);
        p.speed = StateIO::readDouble(j, "speed", fallback.speed);
        p.targetY = StateIO::readDouble(j, "target_y", fallback.targetY);
        p.reactionTimer = StateIO::readDouble(j, "reaction_timer", fallback.reactionTimer);
        p.color = StateIO::readColor(j, "color", fallback.color);
        return p;
    }
}

void PongChamber::init(double w, double h, std::mt19937& /*rng*/) {
    resize(w, h);
    t = 0.0;
    trackedBallId.reset();
    scoreLeft = 0;
    scoreRight = 0;

    double const paddleW = PaddleWidth * scale;
    double const paddleH = h * 0.25;
    double const margin = PaddleMargin * scale;
    double const startY = h * 0.5 - paddleH * 0.5;

    left = Paddle{margin, startY, paddleW, paddleH, PaddleSpeed * scale, startY, 0.0,
                  Components::Color(100, 200, 255)};
    right = Paddle{w - margin - paddleW, startY, paddleW, paddleH, PaddleSpeed * scale, startY, 0.0,
                   Components::Color(255, 150, 100)};
}

LocalBall* PongChamber::selectTarget(std::vector<LocalBall>& balls) {
    if (trackedBallId) {
        for (auto& ball : balls) {
            if (ball.active && ball.id == *trackedBallId) {
                return &ball;
            }
        }
    }

    LocalBall* closest = nullptr;
    double bestDistSq = std::numeric_limits<double>::max();
    for (auto& ball : balls) {
        if (!ball.active) {
            continue;
        }
        double const dx = ball.x - width * 0.5;
        double const dy = ball.y - height * 0.5;
        double const distSq = dx * dx + dy * dy;
        if (distSq < bestDistSq) {
            bestDistSq = distSq;
            closest = &ball;
        }
    }
    return closest;
}

void PongChamber::steerPaddle(Paddle& paddle, bool isLeft, const LocalBall* target, double dt, std::mt19937& rng) {
    paddle.reactionTimer -= dt;
    if (paddle.reactionTimer <= 0.0) {
        paddle.reactionTimer = MinReaction + randomUnit(rng) * ReactionSpread;

        if (target) {
            double const faceX = isLeft ? paddle.x + paddle.w : paddle.x;
            double timeToPaddle = -1.0;
            if (std::abs(target->vx) > EPSILON) {
                timeToPaddle = (faceX - target->x) / target->vx;
            }

            if (timeToPaddle < 0.0) {
                paddle.targetY = height * 0.5 - paddle.h * 0.5;
            } else {
                double const predictedY = target->y + target->vy * timeToPaddle;
                double const error = randomRange(rng, -AimError * scale, AimError * scale);
                paddle.targetY = predictedY + error - paddle.h * 0.5;
            }
            paddle.targetY = clampValue(paddle.targetY, 0.0, std::max(0.0, height - paddle.h));
        }
    }

    double const diff = paddle.targetY - paddle.y;
    double const step = paddle.speed * dt;
    if (std::abs(diff) <= step) {
        paddle.y = paddle.targetY;
    } else {
        paddle.y += diff > 0.0 ? step : -step;
    }
    paddle.y = clampValue(paddle.y, 0.0, std::max(0.0, height - paddle.h));
}

bool PongChamber::collidePaddle(LocalBall& ball, const Paddle& paddle, bool isLeft, double dt) const {
    double const r = ball.radius;
    double const faceX = isLeft ? paddle.x + paddle.w : paddle.x;
    double const prevX = ball.x - ball.vx * dt;
    double const prevY = ball.y - ball.vy * dt;
    bool const approaching = isLeft ? ball.vx < 0.0 : ball.vx > 0.0;

    bool hit = false;

    // Swept test against the paddle's face: did the leading edge cross it
    // this frame, and was the ball level with the paddle when it did?
    if (approaching && std::abs(ball.x - prevX) > EPSILON) {
        bool const crossed = isLeft
            ? (prevX >= faceX - r && ball.x <= faceX + r)
            : (prevX <= faceX + r && ball.x >= faceX - r);
        if (crossed) {
            double const contactX = isLeft ? faceX + r : faceX - r;
            double const s = clampValue((contactX - prevX) / (ball.x - prevX), 0.0, 1.0);
            double const yAtContact = prevY + (ball.y - prevY) * s;
            hit = yAtContact + r >= paddle.y && yAtContact - r <= paddle.y + paddle.h;
        }
    }

    // Resting or slow contact: plain circle/rectangle overlap.
    if (!hit) {
        double const closestX = clampValue(ball.x, paddle.x, paddle.x + paddle.w);
        double const closestY = clampValue(ball.y, paddle.y, paddle.y + paddle.h);
        double const dx = ball.x - closestX;
        double const dy = ball.y - closestY;
        hit = dx * dx + dy * dy < r * r;
    }

    if (!hit) {
        return false;
    }

    ball.x = isLeft ? faceX + r + 1.0 : faceX - r - 1.0;

    double const centre = paddle.y + paddle.h * 0.5;
    double const hitPos = clampValue((ball.y - centre) / (paddle.h * 0.5), -1.0, 1.0);
    double const speedX = std::max(std::abs(ball.vx) * PaddleSpeedUp, MinBallSpeedX * scale);
    ball.vx = isLeft ? speedX : -speedX;
    ball.vy = hitPos * SpinSpeed * scale;

    double const speed = std::sqrt(ball.vx * ball.vx + ball.vy * ball.vy);
    double const maxSpeed = MaxBallSpeed * scale;
    if (speed > maxSpeed) {
        ball.vx = ball.vx / speed * maxSpeed;
        ball.vy = ball.vy / speed * maxSpeed;
    }
    return true;
}

void PongChamber::serve(LocalBall& ball, std::mt19937& rng) const {
    ball.x = width * 0.5;
    ball.y = height * 0.5;
    double const direction = randomUnit(rng) > 0.5 ? 1.0 : -1.0;
    ball.vx = direction * (ServeSpeed + randomUnit(rng) * ServeSpread) * scale;
    ball.vy = (randomUnit(rng) * 200.0 - 100.0) * scale;
}

void PongChamber::update(double dt, std::vector<LocalBall>& balls, ChamberContext& ctx) {
    PROFILE_SCOPE("PongChamber");
    t += dt;

    ctx.annotations.releaseAll();

    LocalBall* target = selectTarget(balls);
    trackedBallId = target ? std::optional<std::uint64_t>(target->id) : std::nullopt;

    if (target) {
        // Undo this frame's gravity step.
        target->vy -= ctx.gravity * dt;
        target->y -= ctx.gravity * dt * dt;
        ctx.annotations.possess(*target, TrackedColor);
    }

    steerPaddle(left, true, target, dt, ctx.rng);
    steerPaddle(right, false, target, dt, ctx.rng);

    for (auto& ball : balls) {
        if (!ball.active) {
            continue;
        }
        collidePaddle(ball, left, true, dt);
        collidePaddle(ball, right, false, dt);
    }

    if (!target) {
        return;
    }

    if (target->y - target->radius < 0.0) {
        target->y = target->radius;
        target->vy = std::abs(target->vy) * WallBounce;
    } else if (target->y + target->radius > height) {
        target->y = height - target->radius;
        target->vy = -std::abs(target->vy) * WallBounce;
    }

    double const goal = GoalDepth * scale;
    if (target->x - target->radius <= goal) {
        ++scoreRight;
        DEBUG_MSG(DEBUG_LEVEL_BASIC, "[Pong] right scores " << scoreLeft << ":" << scoreRight << "\n");
        serve(*target, ctx.rng);
    } else if (target->x + target->radius >= width - goal) {
        ++scoreLeft;
        DEBUG_MSG(DEBUG_LEVEL_BASIC, "[Pong] left scores " << scoreLeft << ":" << scoreRight << "\n");
        serve(*target, ctx.rng);
    }
}

void PongChamber::draw(Canvas& canvas, const Layout::Viewport& vp) const {
    const Components::Color lineColor(255, 255, 255);
    for (double y = 0.0; y < height; y += 20.0 * scale) {
        canvas.fillRect(vp.x + width * 0.5 - 1.0, vp.y + y, 2.0, 10.0 * scale, lineColor, 50);
    }

    for (const Paddle* paddle : {&left, &right}) {
        canvas.fillRect(vp.x + paddle->x, vp.y + paddle->y, paddle->w, paddle->h, paddle->color, 255);
    }

    auto const textSize = static_cast<unsigned int>(std::max(12.0, 24.0 * scale));
    canvas.drawText(vp.x + width * 0.5 - 40.0 * scale, vp.y + 8.0 * scale, std::to_string(scoreLeft),
                    textSize, left.color, 200);
    canvas.drawText(vp.x + width * 0.5 + 28.0 * scale, vp.y + 8.0 * scale, std::to_string(scoreRight),
                    textSize, right.color, 200);
}

nlohmann::json PongChamber::saveState() const {
    nlohmann::json state = saveCommon();
    state["paddles"] = nlohmann::json::array({paddleToJson(left), paddleToJson(right)});
    state["target_ball_id"] = trackedBallId ? nlohmann::json(*trackedBallId) : nlohmann::json(nullptr);
    state["score_left"] = scoreLeft;
    state["score_right"] = scoreRight;
    return state;
}

void PongChamber::loadState(const nlohmann::json& state) {
    loadCommon(state);
    if (const nlohmann::json* paddles = StateIO::findArray(state, "paddles")) {
        if (paddles->size() >= 1 && (*paddles)[0].is_object()) {
            left = paddleFromJson((*paddles)[0], left);
        }
        if (paddles->size() >= 2 && (*paddles)[1].is_object()) {
            right = paddleFromJson((*paddles)[1], right);
        }
    }

    if (state.is_object() && state.contains("target_ball_id")) {
        const nlohmann::json& id = state["target_ball_id"];
        if (id.is_null()) {
            trackedBallId.reset();
        } else if (id.is_number_unsigned()) {
            trackedBallId = id.get<std::uint64_t>();
        }
    }
    scoreLeft = StateIO::readInt(state, "score_left", scoreLeft);
    scoreRight = StateIO::readInt(state, "score_right", scoreRight);
}

} // namespace Chambers
