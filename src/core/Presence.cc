#include "vault/core/Presence.hh"

#include <algorithm>

namespace vault {

PresenceModel::PresenceModel(float maxLevel, float decayRate, float moveCost)
    : maxLevel_(maxLevel), decayRate_(decayRate), moveCost_(moveCost) {}

void PresenceModel::store(float value) {
    level_ = std::clamp(value, 0.0f, maxLevel_);
    if (level_ >= maxLevel_)
        exhausted_ = true;
}

float PresenceModel::tick(float deltaTime, bool moved) {
    float next = std::max(0.0f, level_ - decayRate_ * deltaTime);
    if (moved)
        next += moveCost_;
    store(next);
    return level_;
}

float PresenceModel::applyCost(float amount) {
    store(level_ + amount);
    return level_;
}

void PresenceModel::reset() {
    level_ = 0.0f;
    exhausted_ = false;
}

} // namespace vault
