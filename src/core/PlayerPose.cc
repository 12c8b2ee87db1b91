#include "vault/core/PlayerPose.hh"

#include <algorithm>
#include <numbers>

namespace vault {

namespace {

constexpr float kHalfPi = std::numbers::pi_v<float> / 2.0f;

const Vec3f kUnitX(1.0f, 0.0f, 0.0f);
const Vec3f kUnitY(0.0f, 1.0f, 0.0f);

} // namespace

PlayerPose::PlayerPose(const Vec3f& position, float yaw, float pitch) : position_(position), yaw_(yaw), pitch_(pitch) {
    clampPitch();
}

void PlayerPose::applyLook(float deltaX, float deltaY, float sensitivity) {
    yaw_ -= deltaX * sensitivity;
    pitch_ -= deltaY * sensitivity;
    clampPitch();
}

void PlayerPose::setPitch(float radians) {
    pitch_ = radians;
    clampPitch();
}

Quaternion<float> PlayerPose::yawRotation() const {
    return Quaternion<float>::fromAxisAngle(kUnitY, yaw_);
}

Quaternion<float> PlayerPose::rotation() const {
    return yawRotation() * Quaternion<float>::fromAxisAngle(kUnitX, pitch_);
}

Vec3f PlayerPose::forward() const {
    return rotation().rotateVector(Vec3f(0.0f, 0.0f, -1.0f)).normalized();
}

void PlayerPose::clampPitch() {
    pitch_ = std::clamp(pitch_, -kHalfPi, kHalfPi);
}

} // namespace vault
