#pragma once

#include "vault/core/Spatial.hh"

namespace vault {

// First-person pose. `position` is the eye point; y stays at eye height.
// Yaw and pitch are radians; yaw 0 faces -Z, yaw pi faces +Z.
class PlayerPose {
  public:
    PlayerPose() = default;
    PlayerPose(const Vec3f& position, float yaw, float pitch = 0.0f);

    // Raw look input: positive dx turns right, positive dy looks down
    void applyLook(float deltaX, float deltaY, float sensitivity);

    const Vec3f& position() const { return position_; }
    void setPosition(const Vec3f& position) { position_ = position; }

    float yaw() const { return yaw_; }
    float pitch() const { return pitch_; }
    void setYaw(float radians) { yaw_ = radians; }
    void setPitch(float radians);

    // Derived each step by the solver; not part of the persistent state
    const Vec3f& velocity() const { return velocity_; }
    void setVelocity(const Vec3f& velocity) { velocity_ = velocity; }

    Quaternion<float> rotation() const;
    Quaternion<float> yawRotation() const;

    // Camera look direction (unit length)
    Vec3f forward() const;

  private:
    void clampPitch();

    Vec3f position_;
    float yaw_ = 0.0f;
    float pitch_ = 0.0f;
    Vec3f velocity_;
};

} // namespace vault
