#pragma once

#include "vault/core/Game.hh"

#include <string>
#include <vector>

namespace vault {

// Scripted player for the headless driver: walks a waypoint route and
// interacts with named objects. Drives the game only through its input
// state and discrete events, like a human at the controls would.
class Autopilot {
  public:
    struct Step {
        enum class Kind { MoveTo, Interact } kind = Kind::MoveTo;
        float x = 0.0f; // MoveTo destination
        float z = 0.0f;
        std::string targetId; // Interact target
    };

    explicit Autopilot(std::vector<Step> route);

    // Route through every item in the default vault and out the door
    static Autopilot defaultRoute();

    // Call before each Game::tick
    void update(Game& game);

    bool finished() const { return current_ >= route_.size(); }
    std::size_t failedSteps() const { return failed_; }

  private:
    void lookToward(Game& game, float targetYaw, float targetPitch);
    void advance();

    std::vector<Step> route_;
    std::size_t current_ = 0;
    int stepTicks_ = 0;
    bool aimed_ = false;
    std::size_t failed_ = 0;

    static constexpr float kArrivalDistance = 0.1f;
    static constexpr int kMaxMoveTicks = 900;
    static constexpr int kMaxAimTicks = 30;
};

} // namespace vault
