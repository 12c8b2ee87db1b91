#pragma once

#include "vault/core/Bounds.hh"
#include "vault/core/PlayerPose.hh"
#include "vault/core/World.hh"

#include <optional>
#include <string>
#include <vector>

namespace vault {

struct TargetHit {
    std::string objectId;
    std::size_t objectIndex = 0; // position in Level::objects
    float distance = 0.0f;
};

// Ray from the eye along the look direction
Ray aimRay(const PlayerPose& pose);

// Nearest interactable whose bounds the aim ray enters within maxRange.
// Collision volumes are ignored; equal distances go to the earlier object.
std::optional<TargetHit> findTarget(const PlayerPose& pose, const std::vector<WorldObject>& objects, float maxRange);

} // namespace vault
