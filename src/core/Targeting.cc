#include "vault/core/Targeting.hh"

#include "vault/utils/Profiler.hh"

namespace vault {

Ray aimRay(const PlayerPose& pose) {
    return Ray{pose.position(), pose.forward()};
}

std::optional<TargetHit> findTarget(const PlayerPose& pose, const std::vector<WorldObject>& objects, float maxRange) {
    VAULT_ZONE_SCOPED;

    const Ray ray = aimRay(pose);
    std::optional<TargetHit> best;

    for (std::size_t i = 0; i < objects.size(); ++i) {
        const auto& obj = objects[i];
        if (obj.kind != ObjectKind::Interactable)
            continue;

        auto t = intersectRay(ray, obj.bounds, maxRange);
        if (!t)
            continue;

        // Strict comparison keeps the first object on a tie
        if (!best || *t < best->distance) {
            best = TargetHit{obj.id, i, *t};
        }
    }
    return best;
}

} // namespace vault
