#include "vault/core/MovementSolver.hh"

#include "vault/utils/Profiler.hh"

namespace vault {

MovementSolver::MovementSolver(float moveSpeed, float height, float radius)
    : moveSpeed_(moveSpeed), height_(height), radius_(radius) {}

AABB MovementSolver::playerBounds(const Vec3f& eyePosition) const {
    return AABB::fromCenterHalfExtents(eyePosition, Vec3f(radius_, height_ * 0.5f, radius_));
}

bool MovementSolver::overlapsAny(const Vec3f& position, const std::vector<AABB>& volumes) const {
    AABB box = playerBounds(position);
    for (const auto& volume : volumes) {
        if (box.intersects(volume))
            return true;
    }
    return false;
}

Vec3f MovementSolver::desiredDisplacement(const PlayerPose& pose, const InputState& input, float deltaTime) const {
    LocalVec3f local;
    if (input.forward)
        local = local + LocalVec3f(0.0f, 0.0f, -1.0f);
    if (input.backward)
        local = local + LocalVec3f(0.0f, 0.0f, 1.0f);
    if (input.left)
        local = local + LocalVec3f(-1.0f, 0.0f, 0.0f);
    if (input.right)
        local = local + LocalVec3f(1.0f, 0.0f, 0.0f);

    // Opposing keys cancel to zero; normalized() leaves that alone
    local = local.normalized() * (moveSpeed_ * deltaTime);
    return pose.yawRotation().rotateVector(local).as<Space::World>();
}

MovementSolver::CollisionResult MovementSolver::step(PlayerPose& pose, const std::vector<AABB>& volumes,
                                                     const InputState& input, float deltaTime) const {
    VAULT_ZONE_SCOPED;

    CollisionResult result;
    result.moved = input.anyDirection();

    Vec3f start = pose.position();
    Vec3f pos = start;

    if (result.moved && deltaTime > 0.0f) {
        Vec3f displacement = desiredDisplacement(pose, input, deltaTime);

        // Resolve X axis
        {
            Vec3f candidate(pos.x + displacement.x, pos.y, pos.z);
            if (overlapsAny(candidate, volumes)) {
                result.hitX = true;
            } else {
                pos = candidate;
            }
        }

        // Resolve Z axis
        {
            Vec3f candidate(pos.x, pos.y, pos.z + displacement.z);
            if (overlapsAny(candidate, volumes)) {
                result.hitZ = true;
            } else {
                pos = candidate;
            }
        }
    }

    pose.setPosition(pos);
    pose.setVelocity(deltaTime > 0.0f ? (pos - start) / deltaTime : Vec3f());
    result.resolvedPosition = pos;
    return result;
}

} // namespace vault
