#pragma once

namespace vault {

// The bounded tension resource. Level stays within [0, max]. Touching max
// latches the exhausted flag until reset(); later decay does not clear it.
class PresenceModel {
  public:
    PresenceModel(float maxLevel, float decayRate, float moveCost);

    // Decay toward zero, then add the movement cost if the player moved
    float tick(float deltaTime, bool moved);

    // Interaction costs; negative amounts are clamped the same way
    float applyCost(float amount);

    float level() const { return level_; }
    float maxLevel() const { return maxLevel_; }
    float normalized() const { return level_ / maxLevel_; }
    bool isExhausted() const { return exhausted_; }

    void reset();

  private:
    void store(float value);

    float maxLevel_;
    float decayRate_;
    float moveCost_;
    float level_ = 0.0f;
    bool exhausted_ = false;
};

} // namespace vault
