#include "vault/core/Autopilot.hh"

#include "vault/core/Log.hh"

#include <cmath>
#include <numbers>

namespace vault {

namespace {

constexpr float kPi = std::numbers::pi_v<float>;

float wrapAngle(float radians) {
    while (radians > kPi)
        radians -= 2.0f * kPi;
    while (radians < -kPi)
        radians += 2.0f * kPi;
    return radians;
}

// Yaw that faces (dx, dz); yaw 0 looks down -Z
float yawToward(float dx, float dz) {
    return std::atan2(-dx, -dz);
}

Autopilot::Step moveTo(float x, float z) {
    Autopilot::Step step;
    step.kind = Autopilot::Step::Kind::MoveTo;
    step.x = x;
    step.z = z;
    return step;
}

Autopilot::Step interactWith(std::string id) {
    Autopilot::Step step;
    step.kind = Autopilot::Step::Kind::Interact;
    step.targetId = std::move(id);
    return step;
}

} // namespace

Autopilot::Autopilot(std::vector<Step> route) : route_(std::move(route)) {}

Autopilot Autopilot::defaultRoute() {
    return Autopilot({
        moveTo(3.0f, 4.3f),
        interactWith("Desk_Mesh"),
        moveTo(1.2f, 4.3f),
        moveTo(-3.4f, -1.5f),
        interactWith("Bookshelf_Mesh"),
        moveTo(4.0f, -2.2f),
        interactWith("ControlPanel_Mesh"),
        moveTo(-3.0f, -4.3f),
        interactWith("Distortion_Mesh"),
        moveTo(0.0f, 4.5f),
        interactWith("Door_Mesh"),
    });
}

void Autopilot::advance() {
    ++current_;
    stepTicks_ = 0;
    aimed_ = false;
}

void Autopilot::lookToward(Game& game, float targetYaw, float targetPitch) {
    const auto& pose = game.pose();
    const float sensitivity = game.config().player.lookSensitivity;
    // Inverse of PlayerPose::applyLook
    float dx = -wrapAngle(targetYaw - pose.yaw()) / sensitivity;
    float dy = -(targetPitch - pose.pitch()) / sensitivity;
    game.input().addLook(dx, dy);
}

void Autopilot::update(Game& game) {
    if (finished() || game.state() != SessionState::Running)
        return;

    const auto& step = route_[current_];
    const Vec3f eye = game.pose().position();
    ++stepTicks_;

    if (step.kind == Step::Kind::MoveTo) {
        float dx = step.x - eye.x;
        float dz = step.z - eye.z;
        if (std::sqrt(dx * dx + dz * dz) < kArrivalDistance) {
            game.input().forward = false;
            advance();
            return;
        }
        if (stepTicks_ > kMaxMoveTicks) {
            VAULT_LOG_WARN("Autopilot stuck short of ({:.1f}, {:.1f}) at ({:.2f}, {:.2f})", step.x, step.z, eye.x,
                           eye.z);
            game.input().forward = false;
            ++failed_;
            advance();
            return;
        }
        lookToward(game, yawToward(dx, dz), 0.0f);
        game.input().forward = true;
        return;
    }

    // Interact: aim at the bounds centre, then act once the crosshair confirms it
    const auto* target = game.level().find(step.targetId);
    if (target == nullptr) {
        VAULT_LOG_WARN("Autopilot target '{}' does not exist", step.targetId);
        ++failed_;
        advance();
        return;
    }

    if (aimed_ && game.hoverTarget() == step.targetId) {
        auto outcome = game.interact();
        VAULT_LOG_INFO("Autopilot used '{}': {}", step.targetId, outcomeKindToString(outcome.kind));
        advance();
        return;
    }

    if (stepTicks_ > kMaxAimTicks) {
        VAULT_LOG_WARN("Autopilot could not target '{}'", step.targetId);
        ++failed_;
        advance();
        return;
    }

    Vec3f toTarget = target->bounds.center() - eye;
    float horizontal = std::sqrt(toTarget.x * toTarget.x + toTarget.z * toTarget.z);
    lookToward(game, yawToward(toTarget.x, toTarget.z), std::atan2(toTarget.y, horizontal));
    aimed_ = true;
}

} // namespace vault
