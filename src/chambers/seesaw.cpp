#include "contraption/chambers/seesaw.hpp"
#include "contraption/core/canvas.hpp"
#include "contraption/core/profile.hpp"
#include "contraption/core/state_io.hpp"

#include <cmath>

namespace Chambers {

namespace {
    constexpr double SpringStiffness = 2.0;
    constexpr double AngularDamping = 0.98;
    constexpr double PlankThickness = 8.0;
    constexpr double Restitution = 1.5;
    constexpr double TorqueFactor = 0.0005;
}

void SeesawChamber::init(double w, double h, std::mt19937& /*rng*/) {
    resize(w, h);
    t = 0.0;
    planks = {Plank{w * 0.5, h * 0.4, w * 0.7, 0.0, 0.0}};
}

void SeesawChamber::update(double dt, std::vector<LocalBall>& balls, ChamberContext& /*ctx*/) {
    PROFILE_SCOPE("SeesawChamber");
    t += dt;
    double const thickness = PlankThickness * scale;

    for (auto& plank : planks) {
        plank.angularVelocity -= plank.angle * SpringStiffness * dt;
        plank.angularVelocity *= AngularDamping;
        plank.angle += plank.angularVelocity * dt;

        if (plank.angle > MaxAngle) {
            plank.angle = MaxAngle;
            plank.angularVelocity = 0.0;
        } else if (plank.angle < -MaxAngle) {
            plank.angle = -MaxAngle;
            plank.angularVelocity = 0.0;
        }

        double const c = std::cos(plank.angle);
        double const s = std::sin(plank.angle);
        double const halfLen = plank.length * 0.5;
        Vector const a(plank.cx - c * halfLen, plank.cy - s * halfLen);
        Vector const b(plank.cx + c * halfLen, plank.cy + s * halfLen);

        for (auto& ball : balls) {
            if (!ball.active) {
                continue;
            }

            SegmentProjection const proj = closestPointOnSegment(a, b, Vector(ball.x, ball.y));
            Vector const delta = Vector(ball.x, ball.y) - proj.closest;
            double const dist = delta.length();
            double const minDist = ball.radius + thickness;
            if (dist >= minDist) {
                continue;
            }

            // Plank normal, flipped towards the side the ball is on. A centre
            // on the plank itself goes out the upper face.
            Vector normal(-s, c);
            if (dist > EPSILON) {
                if (delta.dotProduct(normal) < 0.0) {
                    normal = -normal;
                }
            } else if (normal.dotProduct(FALLBACK_NORMAL) < 0.0) {
                normal = -normal;
            }

            double const overlap = minDist - dist;
            ball.x += normal.x * overlap;
            ball.y += normal.y * overlap;

            if (Vector(ball.vx, ball.vy).dotProduct(normal) < 0.0) {
                reflectVelocity(ball, normal, Restitution);
            }

            double const leverArm = (proj.t - 0.5) * plank.length;
            plank.angularVelocity += leverArm * TorqueFactor;
        }
    }
}

void SeesawChamber::draw(Canvas& canvas, const Layout::Viewport& vp) const {
    const Components::Color plankColor(180, 130, 80);
    const Components::Color pivotColor(110, 110, 120);
    for (const auto& plank : planks) {
        double const c = std::cos(plank.angle);
        double const s = std::sin(plank.angle);
        double const halfLen = plank.length * 0.5;
        canvas.drawLine(vp.x + plank.cx - c * halfLen, vp.y + plank.cy - s * halfLen,
                        vp.x + plank.cx + c * halfLen, vp.y + plank.cy + s * halfLen,
                        plankColor, 255, PlankThickness * scale * 2.0);
        canvas.fillCircle(vp.x + plank.cx, vp.y + plank.cy, 6.0 * scale, pivotColor, 255);
    }
}

nlohmann::json SeesawChamber::saveState() const {
    nlohmann::json state = saveCommon();
    nlohmann::json list = nlohmann::json::array();
    for (const auto& plank : planks) {
        list.push_back({
            {"cx", plank.cx}, {"cy", plank.cy}, {"length", plank.length},
            {"angle", plank.angle}, {"ang_vel", plank.angularVelocity}
        });
    }
    state["planks"] = std::move(list);
    return state;
}

void SeesawChamber::loadState(const nlohmann::json& state) {
    loadCommon(state);
    StateIO::readList(state, "planks", planks, [](const nlohmann::json& j) {
        return Plank{StateIO::readDouble(j, "cx", 0.0), StateIO::readDouble(j, "cy", 0.0),
                     StateIO::readDouble(j, "length", 0.0), StateIO::readDouble(j, "angle", 0.0),
                     StateIO::readDouble(j, "ang_vel", 0.0)};
    });
}

} // namespace Chambers
