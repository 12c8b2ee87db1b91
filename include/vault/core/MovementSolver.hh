#pragma once

#include "vault/core/Bounds.hh"
#include "vault/core/InputState.hh"
#include "vault/core/PlayerPose.hh"

#include <vector>

namespace vault {

// Walks the player through static collision volumes. X and Z are resolved
// independently so a blocked axis never cancels motion along the other.
class MovementSolver {
  public:
    struct CollisionResult {
        bool hitX = false;
        bool hitZ = false;
        bool moved = false; // a direction was held, whether or not the pose changed
        Vec3f resolvedPosition;
    };

    MovementSolver(float moveSpeed, float height, float radius);

    // Updates pose position and velocity in place
    CollisionResult step(PlayerPose& pose, const std::vector<AABB>& volumes, const InputState& input,
                         float deltaTime) const;

    // Box of `height` centred on the eye point
    AABB playerBounds(const Vec3f& eyePosition) const;

    // Yaw-rotated, speed-scaled displacement for the held directions
    Vec3f desiredDisplacement(const PlayerPose& pose, const InputState& input, float deltaTime) const;

    float moveSpeed() const { return moveSpeed_; }

  private:
    bool overlapsAny(const Vec3f& position, const std::vector<AABB>& volumes) const;

    float moveSpeed_;
    float height_;
    float radius_;
};

} // namespace vault
